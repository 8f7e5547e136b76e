//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <iostream>
#include <sstream>
#include <stdexcept>

#include "parameter.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE parameter_test

#include <boost/test/unit_test.hpp>

typedef mwn::Parameter parameter_type;

BOOST_AUTO_TEST_CASE(parse)
{
  const parameter_type parameter("sqlite:path=/usr/share/mwn,debug=2,name=\"bad, morning\"");
  
  BOOST_CHECK_EQUAL(parameter.name(), "sqlite");
  BOOST_REQUIRE_EQUAL(parameter.size(), 3u);
  
  BOOST_CHECK_EQUAL(parameter.find("path")->second, "/usr/share/mwn");
  BOOST_CHECK_EQUAL(parameter.find("debug")->second, "2");
  BOOST_CHECK_EQUAL(parameter.find("name")->second, "bad, morning");
  BOOST_CHECK(parameter.find("file") == parameter.end());
}

BOOST_AUTO_TEST_CASE(name_only)
{
  const parameter_type parameter("sqlite");
  
  BOOST_CHECK_EQUAL(parameter.name(), "sqlite");
  BOOST_CHECK(parameter.empty());
}

BOOST_AUTO_TEST_CASE(generate)
{
  parameter_type parameter;
  parameter.name() = "sqlite";
  parameter.push_back(std::make_pair("file", "/tmp/a b/wordnet.db"));
  
  std::ostringstream stream;
  stream << parameter;
  
  BOOST_CHECK_EQUAL(stream.str(), "\"sqlite\":\"file\"=\"/tmp/a b/wordnet.db\"");
  
  const parameter_type parsed(stream.str());
  BOOST_CHECK_EQUAL(parsed.name(), "sqlite");
  BOOST_CHECK_EQUAL(parsed.find("file")->second, "/tmp/a b/wordnet.db");
}

BOOST_AUTO_TEST_CASE(generate_escaped)
{
  parameter_type parameter;
  parameter.name() = "sqlite";
  parameter.push_back(std::make_pair("file", "C:\\mwn\\\"word,net\".db"));
  parameter.push_back(std::make_pair("debug", "1"));
  
  std::ostringstream stream;
  stream << parameter;
  
  BOOST_CHECK_EQUAL(stream.str(), "\"sqlite\":\"file\"=\"C:\\\\mwn\\\\\\\"word,net\\\".db\",\"debug\"=\"1\"");
  
  const parameter_type parsed(stream.str());
  BOOST_REQUIRE_EQUAL(parsed.size(), 2u);
  BOOST_CHECK_EQUAL(parsed.find("file")->second, "C:\\mwn\\\"word,net\".db");
  BOOST_CHECK_EQUAL(parsed.find("debug")->second, "1");
  
  // printing is stable
  std::ostringstream again;
  again << parsed;
  BOOST_CHECK_EQUAL(again.str(), stream.str());
}

BOOST_AUTO_TEST_CASE(malformed)
{
  BOOST_CHECK_THROW(parameter_type("sqlite:path"), std::runtime_error);
  BOOST_CHECK_THROW(parameter_type("sqlite:path=a,"), std::runtime_error);
}
