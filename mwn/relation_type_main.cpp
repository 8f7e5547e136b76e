//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <iostream>
#include <algorithm>

#include "relation_type.hpp"
#include "error.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE relation_type_test

#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_CASE(names)
{
  BOOST_CHECK_EQUAL(std::string(mwn::RelationType::name('n', "@")), "hypernym");
  BOOST_CHECK_EQUAL(std::string(mwn::RelationType::name('n', "#p")), "part-of");
  BOOST_CHECK_EQUAL(std::string(mwn::RelationType::name('v', "*")), "entailment");
  BOOST_CHECK_EQUAL(std::string(mwn::RelationType::name('a', "&")), "similar-to");
  BOOST_CHECK_EQUAL(std::string(mwn::RelationType::name('a', "\\")), "pertains-to (lexical)");
  BOOST_CHECK_EQUAL(std::string(mwn::RelationType::name('r', "\\")), "derived-from (lexical)");
}

BOOST_AUTO_TEST_CASE(domain)
{
  // nouns, not verbs, define part-of
  BOOST_CHECK(mwn::RelationType::valid('n', "#p"));
  BOOST_CHECK(! mwn::RelationType::valid('v', "#p"));
  BOOST_CHECK_THROW(mwn::RelationType::validate('v', "#p"), mwn::domain_error);
  
  BOOST_CHECK(! mwn::RelationType::valid('n', "&"));
  BOOST_CHECK(! mwn::RelationType::valid('n', "<"));
  BOOST_CHECK(mwn::RelationType::valid('a', "<"));
  BOOST_CHECK(! mwn::RelationType::valid('r', "&"));
  BOOST_CHECK_THROW(mwn::RelationType::name('*', "@"), mwn::domain_error);
  
  BOOST_CHECK_NO_THROW(mwn::RelationType::validate('r', "@"));
}

BOOST_AUTO_TEST_CASE(lexical)
{
  BOOST_CHECK(mwn::RelationType::is_lexical("!"));
  BOOST_CHECK(mwn::RelationType::is_lexical("\\"));
  BOOST_CHECK(mwn::RelationType::is_lexical("/"));
  BOOST_CHECK(mwn::RelationType::is_lexical("+c"));
  BOOST_CHECK(mwn::RelationType::is_lexical("-c"));
  BOOST_CHECK(! mwn::RelationType::is_lexical("@"));
  BOOST_CHECK(! mwn::RelationType::is_lexical("#p"));
}

BOOST_AUTO_TEST_CASE(types)
{
  const mwn::RelationType::type_set_type nouns = mwn::RelationType::types('n');
  const mwn::RelationType::type_set_type verbs = mwn::RelationType::types('v');
  
  BOOST_CHECK_EQUAL(nouns.size(), 17u);
  BOOST_CHECK_EQUAL(verbs.size(), 12u);
  BOOST_CHECK(std::find(nouns.begin(), nouns.end(), "%s") != nouns.end());
  BOOST_CHECK(std::find(verbs.begin(), verbs.end(), "%s") == verbs.end());
  BOOST_CHECK(mwn::RelationType::types('x').empty());
}
