//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <iostream>
#include <stdexcept>

#include "database.hpp"
#include "database/sqlite.hpp"
#include "error.hpp"
#include "fixture_impl.hpp"

#include <boost/filesystem/operations.hpp>

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE database_test

#include <boost/test/unit_test.hpp>

typedef mwn::Database database_type;
typedef mwn::Query    query_type;

BOOST_FIXTURE_TEST_CASE(query, mwn::Fixture)
{
  const database_type& db = database();
  database_type::row_set_type rows;
  
  BOOST_CHECK(db.exists("english", "synset"));
  BOOST_CHECK(db.exists("common", "semfield_hierarchy"));
  BOOST_CHECK(! db.exists("spanish", "synset"));
  
  BOOST_REQUIRE(db.query("english", "synset", query_type().select("word").select("gloss").where("id", "n#00003000"), rows));
  BOOST_REQUIRE_EQUAL(rows.size(), 1u);
  BOOST_REQUIRE_EQUAL(rows.front().size(), 2u);
  BOOST_CHECK_EQUAL(rows.front()[0], "animal");
  BOOST_CHECK_EQUAL(rows.front()[1], "a living organism");
  
  // NULL reads as empty
  BOOST_REQUIRE(db.query("english", "synset", query_type().select("phrase").where("id", "n#00003000"), rows));
  BOOST_CHECK_EQUAL(rows.front().front(), "");
  
  // an absent table is reported, never thrown
  rows.push_back(database_type::row_type(1));
  BOOST_CHECK(! db.query("spanish", "synset", query_type().where("id", "n#00003000"), rows));
  BOOST_CHECK(rows.empty());
}

BOOST_FIXTURE_TEST_CASE(conditions, mwn::Fixture)
{
  const database_type& db = database();
  database_type::row_set_type rows;
  
  BOOST_REQUIRE(db.query("english", "lemma", query_type().select("lemma").like("lemma", "%" + query_type::escape("dog")), rows));
  BOOST_CHECK_EQUAL(rows.size(), 4u);
  
  BOOST_REQUIRE(db.query("english", "lemma", query_type().select("lemma").like("lemma", "%" + query_type::escape("dog")).unique(), rows));
  BOOST_CHECK_EQUAL(rows.size(), 3u);
  
  // '_' is a literal
  BOOST_REQUIRE(db.query("english", "index", query_type().select("lemma").like("lemma", "%" + query_type::escape("_") + "%"), rows));
  BOOST_CHECK_EQUAL(rows.size(), 2u);
  
  const char* ids[] = {"n#00001740", "n#00003000", "n#09999999"};
  BOOST_REQUIRE(db.query("english", "synset", query_type().select("id").in("id", ids, ids + 3), rows));
  BOOST_CHECK_EQUAL(rows.size(), 2u);
  
  // values are bound, never spliced
  BOOST_REQUIRE(db.query("english", "synset", query_type().where("id", "x' OR '1'='1"), rows));
  BOOST_CHECK(rows.empty());
  
  BOOST_CHECK_THROW(db.query("english", "synset", query_type().select("id; DROP TABLE x"), rows), mwn::store_error);
  BOOST_CHECK_THROW(db.query("english", "synset", query_type().select("no_such_column"), rows), mwn::store_error);
}

BOOST_FIXTURE_TEST_CASE(layout, mwn::Fixture)
{
  // one file per table, a bare table name is accepted
  boost::filesystem::create_directories(directory / "english");
  boost::filesystem::copy_file(file, directory / "english" / "english_synset.db");
  
  const mwn::database::SQLite db(directory, mwn::database::SQLite::DIRECTORY);
  database_type::row_set_type rows;
  
  BOOST_CHECK(db.exists("english", "synset"));
  BOOST_CHECK(! db.exists("english", "relation"));
  BOOST_CHECK(! db.exists("italian", "synset"));
  BOOST_REQUIRE(db.query("english", "synset", query_type().select("word").where("id", "n#00001740"), rows));
  BOOST_CHECK_EQUAL(rows.front().front(), "entity");
}

BOOST_AUTO_TEST_CASE(create)
{
  BOOST_CHECK_THROW(database_type::create("mysql:file=wordnet.db"), std::runtime_error);
  BOOST_CHECK_THROW(database_type::create("sqlite"), std::runtime_error);
  BOOST_CHECK_THROW(database_type::create("sqlite:path=a,file=b"), std::runtime_error);
  
  const database_type& db = database_type::create("sqlite:file=/nonexistent/wordnet.db,debug=1");
  BOOST_CHECK_EQUAL(db.debug, 1);
  BOOST_CHECK(! db.exists("english", "synset"));
  BOOST_CHECK_EQUAL(&db, &database_type::create("sqlite:file=/nonexistent/wordnet.db,debug=1"));
}
