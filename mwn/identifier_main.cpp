//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <iostream>

#include "identifier.hpp"
#include "language.hpp"
#include "error.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE identifier_test

#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_CASE(origin)
{
  BOOST_CHECK_EQUAL(mwn::Identifier::language("n#00001740"), "english");
  BOOST_CHECK_EQUAL(mwn::Identifier::language("v#00010000"), "english");
  BOOST_CHECK_EQUAL(mwn::Identifier::language("n#N0000001"), "italian");
  BOOST_CHECK_EQUAL(mwn::Identifier::language("n#W0000001"), "italian");
  BOOST_CHECK_EQUAL(mwn::Identifier::language("a#Y0000001"), "italian");
  BOOST_CHECK_EQUAL(mwn::Identifier::language("n#H0000001"), "hebrew");
  BOOST_CHECK_EQUAL(mwn::Identifier::language("r#S0000001"), "spanish");
  BOOST_CHECK_EQUAL(mwn::Identifier::language("v#L0000001"), "latin");
  BOOST_CHECK_EQUAL(mwn::Identifier::language("n#R0000001"), "romanian");
  BOOST_CHECK_EQUAL(mwn::Identifier::language("n#P0000001"), "english");
  BOOST_CHECK_EQUAL(mwn::Identifier::language("n#P0000001"), mwn::Language::reference());
  
  // same id, same language
  BOOST_CHECK_EQUAL(mwn::Identifier::language("n#N0000001"), mwn::Identifier::language("n#N0000001"));
}

BOOST_AUTO_TEST_CASE(malformed)
{
  BOOST_CHECK_THROW(mwn::Identifier::language(""), mwn::decoding_error);
  BOOST_CHECK_THROW(mwn::Identifier::language("n#"), mwn::decoding_error);
  BOOST_CHECK_THROW(mwn::Identifier::language("x#00001740"), mwn::decoding_error);
  BOOST_CHECK_THROW(mwn::Identifier::language("n-00001740"), mwn::decoding_error);
  BOOST_CHECK_THROW(mwn::Identifier::language("n#Q0000001"), mwn::decoding_error);
  
  BOOST_CHECK(mwn::Identifier::valid("n#00001740"));
  BOOST_CHECK(! mwn::Identifier::valid("n#Q0000001"));
}

BOOST_AUTO_TEST_CASE(fields)
{
  BOOST_CHECK_EQUAL(mwn::Identifier::pos("a#00020000"), 'a');
  BOOST_CHECK_EQUAL(mwn::Identifier::offset("a#00020000"), "00020000");
  BOOST_CHECK_EQUAL(mwn::Identifier::offset("n#N0000001"), "N0000001");
}

BOOST_AUTO_TEST_CASE(model)
{
  BOOST_CHECK(mwn::Language::is_morphology("latin"));
  BOOST_CHECK(! mwn::Language::is_morphology("english"));
  BOOST_CHECK(! mwn::Language::is_morphology("italian"));
}
