//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <iostream>
#include <vector>
#include <string>

#include "traversal.hpp"
#include "resolver.hpp"
#include "error.hpp"
#include "fixture_impl.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE traversal_test

#include <boost/test/unit_test.hpp>

typedef mwn::Synset  synset_type;
typedef mwn::Closure closure_type;

typedef std::vector<std::string, std::allocator<std::string> > id_set_type;

struct TraversalFixture : public mwn::Fixture
{
  TraversalFixture() : resolver(database()) {}
  
  synset_type synset(const std::string& id, const std::string& language="english") const
  {
    return *resolver.synset(id, language);
  }
  
  mwn::Resolver resolver;
};

id_set_type walk(const closure_type& closure)
{
  id_set_type ids;
  
  closure_type::const_iterator iter_end = closure.end();
  for (closure_type::const_iterator iter = closure.begin(); iter != iter_end; ++ iter)
    ids.push_back(iter->id());
  
  return ids;
}

BOOST_FIXTURE_TEST_SUITE(traversal, TraversalFixture)

BOOST_AUTO_TEST_CASE(closure_downward)
{
  const synset_type entity = synset("n#00001740");
  
  const id_set_type ids = walk(entity.closure("~"));
  
  BOOST_REQUIRE_EQUAL(ids.size(), 4u);
  BOOST_CHECK_EQUAL(ids[0], "n#00002000");
  BOOST_CHECK_EQUAL(ids[1], "n#00005000");
  BOOST_CHECK_EQUAL(ids[2], "n#00003000");
  BOOST_CHECK_EQUAL(ids[3], "n#00004000");
  
  const id_set_type shallow = walk(entity.closure("~", 1));
  BOOST_REQUIRE_EQUAL(shallow.size(), 2u);
  BOOST_CHECK_EQUAL(shallow[0], "n#00002000");
  BOOST_CHECK_EQUAL(shallow[1], "n#00005000");
  
  BOOST_CHECK(walk(entity.closure("~", 0)).empty());
}

BOOST_AUTO_TEST_CASE(closure_upward)
{
  const closure_type closure = synset("n#00004000").closure("@");
  
  // absent targets are skipped, entity is reached twice but reported once
  const id_set_type ids = walk(closure);
  BOOST_REQUIRE_EQUAL(ids.size(), 4u);
  BOOST_CHECK_EQUAL(ids[0], "n#00003000");
  BOOST_CHECK_EQUAL(ids[1], "n#00005000");
  BOOST_CHECK_EQUAL(ids[2], "n#00002000");
  BOOST_CHECK_EQUAL(ids[3], "n#00001740");
  
  // restartable
  BOOST_CHECK(walk(closure) == ids);
  
  // lazy
  closure_type::const_iterator iter = closure.begin();
  BOOST_REQUIRE(iter != closure.end());
  BOOST_CHECK_EQUAL(iter->id(), "n#00003000");
}

BOOST_AUTO_TEST_CASE(closure_cycle)
{
  const id_set_type ids = walk(synset("n#00030000").closure("@"));
  
  BOOST_REQUIRE_EQUAL(ids.size(), 2u);
  BOOST_CHECK_EQUAL(ids[0], "n#00031000");
  BOOST_CHECK_EQUAL(ids[1], "n#00032000");
}

BOOST_AUTO_TEST_CASE(closure_domain)
{
  BOOST_CHECK_THROW(synset("v#00010000").closure("#p"), mwn::domain_error);
  BOOST_CHECK_THROW(synset("n#00004000").closure("?"), mwn::domain_error);
  
  const id_set_type ids = walk(synset("v#00010000").closure("@"));
  BOOST_REQUIRE_EQUAL(ids.size(), 1u);
  BOOST_CHECK_EQUAL(ids[0], "v#00011000");
}

BOOST_AUTO_TEST_CASE(depth)
{
  const synset_type entity = synset("n#00001740");
  const synset_type dog    = synset("n#00004000");
  
  BOOST_CHECK_EQUAL(entity.max_depth(), 0);
  BOOST_CHECK_EQUAL(entity.min_depth(), 0);
  
  BOOST_CHECK_EQUAL(dog.max_depth(), 3);
  BOOST_CHECK_EQUAL(dog.min_depth(), 2);
  
  BOOST_CHECK_EQUAL(synset("v#00010000").max_depth(), 1);
  BOOST_CHECK_EQUAL(synset("a#00020000").max_depth(), 0);
  
  // one step above the english dog
  BOOST_CHECK_EQUAL(synset("n#N0000001", "italian").max_depth(), 4);
  BOOST_CHECK_EQUAL(synset("n#N0000001", "italian").min_depth(), 3);
}

BOOST_AUTO_TEST_CASE(depth_shared_ancestor)
{
  // puppy -> dog -> animal and puppy -> young_mammal -> animal
  const synset_type puppy = synset("n#00050000");
  
  BOOST_CHECK_EQUAL(puppy.max_depth(), 4);
  
  // animal is entered through dog first, young_mammal counts it as 0
  BOOST_CHECK_EQUAL(puppy.min_depth(), 2);
  BOOST_CHECK_EQUAL(synset("n#00051000").min_depth(), 3);
  
  // each call starts a fresh walk
  BOOST_CHECK_EQUAL(puppy.min_depth(), 2);
  
  BOOST_CHECK_EQUAL(puppy.paths_to_root().size(), 3u);
  BOOST_REQUIRE_EQUAL(puppy.roots().size(), 1u);
  BOOST_CHECK_EQUAL(puppy.roots().front().id(), "n#00001740");
}

BOOST_AUTO_TEST_CASE(depth_cycle)
{
  resolver.debug = 1;
  
  const synset_type alpha = synset("n#00030000");
  
  BOOST_CHECK_EQUAL(alpha.max_depth(), 3);
  BOOST_CHECK_EQUAL(alpha.min_depth(), 3);
  BOOST_CHECK(alpha.roots().empty());
  
  const synset_type::path_set_type paths = alpha.paths_to_root();
  BOOST_REQUIRE_EQUAL(paths.size(), 1u);
  BOOST_CHECK_EQUAL(paths.front().front().id(), "n#00032000");
  BOOST_CHECK_EQUAL(paths.front().back().id(), "n#00030000");
}

BOOST_AUTO_TEST_CASE(roots)
{
  const synset_type entity = synset("n#00001740");
  
  const synset_type::synset_set_type roots = synset("n#00004000").roots();
  BOOST_REQUIRE_EQUAL(roots.size(), 1u);
  BOOST_CHECK(roots.front() == entity);
  
  BOOST_REQUIRE_EQUAL(entity.roots().size(), 1u);
  BOOST_CHECK(entity.roots().front() == entity);
}

BOOST_AUTO_TEST_CASE(paths)
{
  const synset_type entity = synset("n#00001740");
  const synset_type dog    = synset("n#00004000");
  
  const synset_type::path_set_type paths = dog.paths_to_root();
  
  BOOST_REQUIRE_EQUAL(paths.size(), 2u);
  BOOST_CHECK_EQUAL(paths[0].size(), 4u);
  BOOST_CHECK_EQUAL(paths[1].size(), 3u);
  
  synset_type::path_set_type::const_iterator piter_end = paths.end();
  for (synset_type::path_set_type::const_iterator piter = paths.begin(); piter != piter_end; ++ piter) {
    BOOST_CHECK(piter->front() == entity);
    BOOST_CHECK(piter->back() == dog);
  }
  
  const synset_type::path_set_type self = entity.paths_to_root();
  BOOST_REQUIRE_EQUAL(self.size(), 1u);
  BOOST_REQUIRE_EQUAL(self.front().size(), 1u);
  BOOST_CHECK(self.front().front() == entity);
  
  BOOST_CHECK_EQUAL(synset("n#N0000001", "italian").paths_to_root().size(), 2u);
}

BOOST_AUTO_TEST_SUITE_END()
