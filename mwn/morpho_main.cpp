//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <iostream>
#include <sstream>

#include "morpho.hpp"
#include "error.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE morpho_test

#include <boost/test/unit_test.hpp>

typedef mwn::Morpho morpho_type;

morpho_type latin(const std::string& lemma,
		  const std::string& pos,
		  const std::string& principal_parts,
		  const std::string& tag,
		  const std::string& irregular_forms=std::string())
{
  morpho_type::row_type row;
  row.push_back("1");
  row.push_back(lemma);
  row.push_back(pos);
  row.push_back(principal_parts);
  row.push_back(irregular_forms);
  row.push_back("");
  row.push_back("");
  row.push_back(tag);
  
  return morpho_type(row, "latin");
}

BOOST_AUTO_TEST_CASE(verb)
{
  const morpho_type amo = latin("amo", "v", "am amav amat", "v1spia--1-");
  
  BOOST_CHECK_EQUAL(*amo.code(morpho_type::PART_OF_SPEECH), 'v');
  BOOST_CHECK_EQUAL(*amo.code(morpho_type::PERSON), '1');
  BOOST_CHECK_EQUAL(*amo.code(morpho_type::NUMBER), 's');
  BOOST_CHECK_EQUAL(*amo.code(morpho_type::TENSE), 'p');
  BOOST_CHECK_EQUAL(*amo.code(morpho_type::MOOD), 'i');
  BOOST_CHECK_EQUAL(*amo.code(morpho_type::VOICE), 'a');
  BOOST_CHECK(! amo.code(morpho_type::GENDER));
  BOOST_CHECK(! amo.code(morpho_type::CASE));
  BOOST_CHECK(! amo.code(morpho_type::DEGREE));
  BOOST_CHECK_EQUAL(*amo.code(morpho_type::GROUP), '1');
  
  BOOST_CHECK_EQUAL(amo.meaning(morpho_type::PERSON), "1st person");
  BOOST_CHECK_EQUAL(amo.meaning(morpho_type::GROUP), "1st conjugation");
  BOOST_CHECK_EQUAL(amo.meaning(morpho_type::CASE), "");
  
  const morpho_type::string_set_type entry = amo.dictionary_form();
  BOOST_REQUIRE_EQUAL(entry.size(), 5u);
  BOOST_CHECK_EQUAL(entry[0], "amo");
  BOOST_CHECK_EQUAL(entry[1], "amare");
  BOOST_CHECK_EQUAL(entry[2], "amavisse");
  BOOST_CHECK_EQUAL(entry[3], "amatum");
  BOOST_CHECK_EQUAL(entry[4], "1");
  
  std::ostringstream stream;
  stream << amo;
  BOOST_CHECK_EQUAL(stream.str(), "v1spia--1-");
}

BOOST_AUTO_TEST_CASE(noun)
{
  const morpho_type rosa = latin("rosa", "n", "ros", "n-s---fn1-");
  
  BOOST_CHECK_EQUAL(rosa.meaning(morpho_type::GENDER), "feminine");
  BOOST_CHECK_EQUAL(rosa.meaning(morpho_type::CASE), "nominative");
  BOOST_CHECK_EQUAL(rosa.meaning(morpho_type::GROUP), "1st declension");
  BOOST_CHECK(! rosa.code(morpho_type::PERSON));
  BOOST_CHECK(! rosa.is_istem());
  
  const morpho_type::string_set_type entry = rosa.dictionary_form();
  BOOST_REQUIRE_EQUAL(entry.size(), 3u);
  BOOST_CHECK_EQUAL(entry[1], "rosae");
  BOOST_CHECK_EQUAL(entry[2], "f.");
  
  const morpho_type turris = latin("turris", "n", "turr", "n-s---fn3i", "turrim=turrem");
  
  BOOST_CHECK(turris.is_istem());
  BOOST_CHECK_EQUAL(turris.meaning(morpho_type::STEM), "i-stem");
  BOOST_REQUIRE_EQUAL(turris.irregular_forms().size(), 1u);
  BOOST_CHECK_EQUAL(turris.irregular_forms().front().first, "turrim");
  BOOST_CHECK_EQUAL(turris.irregular_forms().front().second, "turrem");
}

BOOST_AUTO_TEST_CASE(noun_plural)
{
  // only a singular number takes the singular genitive
  const morpho_type divitiae = latin("divitiae", "n", "diviti", "n-p---fn1-");
  
  BOOST_REQUIRE_EQUAL(divitiae.dictionary_form().size(), 3u);
  BOOST_CHECK_EQUAL(divitiae.dictionary_form()[1], "divitiarum");
  
  const morpho_type castra = latin("castra", "n", "castr", "n-----nn2-");
  
  BOOST_CHECK(! castra.code(morpho_type::NUMBER));
  BOOST_REQUIRE_EQUAL(castra.dictionary_form().size(), 3u);
  BOOST_CHECK_EQUAL(castra.dictionary_form()[1], "castrorum");
  BOOST_CHECK_EQUAL(castra.dictionary_form()[2], "n.");
}

BOOST_AUTO_TEST_CASE(malformed)
{
  // a short tag and a code outside the layout
  BOOST_CHECK_THROW(latin("amo", "v", "am amav amat", "v1spia").code(morpho_type::PERSON), mwn::decoding_error);
  BOOST_CHECK_THROW(latin("amo", "v", "am amav amat", "v7spia--1-").code(morpho_type::PERSON), mwn::decoding_error);
  BOOST_CHECK_THROW(latin("amo", "v", "am amav amat", "v1 pia--1-").code(morpho_type::PERSON), mwn::decoding_error);
  
  // an empty tag decodes nothing
  BOOST_CHECK(! latin("amo", "v", "", "").code(morpho_type::PERSON));
  
  BOOST_CHECK_THROW(morpho_type(morpho_type::row_type(3), "latin"), mwn::decoding_error);
}

BOOST_AUTO_TEST_CASE(hebrew)
{
  morpho_type::row_type row;
  row.push_back("7");
  row.push_back("yad");
  row.push_back("n");
  row.push_back("");
  row.push_back("");
  row.push_back("");
  row.push_back("yad");
  row.push_back("undotted");
  row.push_back("dotted");
  row.push_back("");
  row.push_back("yād");
  row.push_back("yd");
  row.push_back("n-p---fn--");
  
  const morpho_type yad(row, "hebrew");
  
  BOOST_CHECK_EQUAL(yad.undotted(), "undotted");
  BOOST_CHECK_EQUAL(yad.dotted_without_dots(), "dotted");
  BOOST_CHECK_EQUAL(yad.translit_undotted(), "yd");
  BOOST_CHECK_EQUAL(yad.pronunciation(), "yad");
  BOOST_CHECK_EQUAL(yad.meaning(morpho_type::NUMBER), "plural");
  BOOST_CHECK_EQUAL(yad.meaning(morpho_type::GENDER), "feminine");
  BOOST_CHECK_EQUAL(yad.meaning(morpho_type::CASE), "nominative");
  BOOST_CHECK(! yad.code(morpho_type::STEM));
  
  // the positions and codes are the latin ones
  row.back() = "n-d---f---";
  BOOST_CHECK_THROW(morpho_type(row, "hebrew").code(morpho_type::NUMBER), mwn::decoding_error);
}
