//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <iostream>
#include <stdexcept>
#include <algorithm>

#include "wordnet.hpp"
#include "error.hpp"
#include "fixture_impl.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE wordnet_test

#include <boost/test/unit_test.hpp>

typedef mwn::WordNet  wordnet_type;
typedef mwn::Synset   synset_type;
typedef mwn::Lemma    lemma_type;
typedef mwn::Relation relation_type;
typedef mwn::Semfield semfield_type;
typedef mwn::Morpho   morpho_type;

struct WordNetFixture : public mwn::Fixture
{
  WordNetFixture()
    : resolver(database()),
      english(resolver, "english"),
      italian(resolver, "italian"),
      latin(resolver, "latin") {}
  
  mwn::Resolver resolver;
  wordnet_type  english;
  wordnet_type  italian;
  wordnet_type  latin;
};

template <typename Container>
bool contains(const Container& x, const typename Container::value_type& value)
{
  return std::find(x.begin(), x.end(), value) != x.end();
}

BOOST_FIXTURE_TEST_SUITE(wordnet, WordNetFixture)

BOOST_AUTO_TEST_CASE(synset_lookup)
{
  const boost::optional<synset_type> dog = english.synset("n#00004000");
  
  BOOST_REQUIRE(dog);
  BOOST_CHECK_EQUAL(dog->gloss(), "a domesticated canid");
  BOOST_CHECK_EQUAL(dog->language(), "english");
  BOOST_CHECK_EQUAL(dog->pos(), 'n');
  BOOST_CHECK_EQUAL(dog->offset(), "00004000");
  
  BOOST_CHECK(! english.synset("n#09999999"));
  BOOST_CHECK_THROW(english.synset("n#Q0000001"), mwn::decoding_error);
}

BOOST_AUTO_TEST_CASE(synset_fallback)
{
  // the origin store is consulted first
  const boost::optional<synset_type> hound = english.synset("n#N0000001");
  
  BOOST_REQUIRE(hound);
  BOOST_CHECK_EQUAL(hound->origin(), "italian");
  BOOST_CHECK_EQUAL(hound->language(), "english");
  BOOST_CHECK_EQUAL(hound->gloss(), "cane addestrato alla caccia");
  
  // italian keeps the english synset without gloss
  const boost::optional<synset_type> cane = italian.synset("n#00004000");
  
  BOOST_REQUIRE(cane);
  BOOST_CHECK_EQUAL(cane->gloss(), "a domesticated canid");
  BOOST_CHECK_EQUAL(cane->language(), "italian");
  BOOST_CHECK(*cane == *english.synset("n#00004000"));
}

BOOST_AUTO_TEST_CASE(synset_lemmas)
{
  const synset_type dog = *english.synset("n#00004000");
  
  BOOST_REQUIRE_EQUAL(dog.lemmas().size(), 2u);
  BOOST_CHECK_EQUAL(dog.lemmas()[0].form(), "dog");
  BOOST_CHECK_EQUAL(dog.lemmas()[1].form(), "domestic_dog");
  BOOST_CHECK_EQUAL(dog.lemmas()[1].text(), "domestic dog");
  BOOST_CHECK(dog.phrases().empty());
  
  const synset_type object = *english.synset("n#00002000");
  
  BOOST_REQUIRE_EQUAL(object.lemmas().size(), 2u);
  BOOST_REQUIRE_EQUAL(object.phrases().size(), 1u);
  BOOST_CHECK_EQUAL(object.phrases().front().form(), "physical_object");
  
  BOOST_REQUIRE_EQUAL(italian.synset("n#00004000")->lemmas().size(), 1u);
  BOOST_CHECK_EQUAL(italian.synset("n#00004000")->lemmas().front().form(), "cane");
  
  // no italian synset row, the index lists the synset
  const synset_type::lemma_set_type& animale = italian.synset("n#00003000")->lemmas();
  BOOST_REQUIRE_EQUAL(animale.size(), 2u);
  BOOST_CHECK_EQUAL(animale[0].form(), "animale");
  BOOST_CHECK_EQUAL(animale[1].form(), "bestia");
  BOOST_CHECK_EQUAL(animale[1].language(), "italian");
  
  // a lexical gap has no lemma
  BOOST_CHECK(english.synset("n#00040000")->lemmas().empty());
}

BOOST_AUTO_TEST_CASE(synset_relations)
{
  const synset_type dog = *english.synset("n#00004000");
  const synset_type::relation_set_type& relations = dog.relations();
  
  BOOST_REQUIRE_EQUAL(relations.size(), 6u);
  BOOST_CHECK_EQUAL(relations.front().language(), "common");
  BOOST_CHECK_EQUAL(relations.back().language(), "english");
  
  BOOST_CHECK_EQUAL(dog.relations("@").size(), 3u);
  BOOST_CHECK(dog.relations("#p").empty());
  
  const synset_type::synset_set_type hypernyms = dog.hypernyms();
  BOOST_REQUIRE_EQUAL(hypernyms.size(), 2u);
  BOOST_CHECK_EQUAL(hypernyms[0].id(), "n#00003000");
  BOOST_CHECK_EQUAL(hypernyms[1].id(), "n#00005000");
  
  const synset_type::relation_set_type parts = dog.relations("%p");
  BOOST_REQUIRE_EQUAL(parts.size(), 1u);
  BOOST_CHECK_EQUAL(parts.front().status(), "new");
  BOOST_CHECK(parts.front().is_new());
  BOOST_CHECK(! parts.front().is_lexical());
  BOOST_CHECK_EQUAL(std::string(parts.front().type_name()), "has-part");
  BOOST_CHECK_EQUAL(parts.front().target()->lemmas().front().form(), "tail");
  BOOST_CHECK(! parts.front().w_source());
  
  const synset_type::relation_set_type related = dog.relations("/");
  BOOST_REQUIRE_EQUAL(related.size(), 1u);
  BOOST_CHECK(related.front().is_lexical());
  BOOST_CHECK(! related.front().is_new());
  BOOST_CHECK(*related.front().w_source() == lemma_type("dog", 'n', "english", &resolver));
  BOOST_CHECK(*related.front().w_target() == lemma_type("dog", 'v', "english", &resolver));
  BOOST_CHECK_EQUAL(related.front().source()->id(), "n#00004000");
  
  BOOST_REQUIRE(dog.relation_to(hypernyms[0]));
  BOOST_CHECK_EQUAL(*dog.relation_to(hypernyms[0]), "@");
  BOOST_CHECK(! hypernyms[0].relation_to(dog) || *hypernyms[0].relation_to(dog) == "~");
  
  // verbs define no part-of
  BOOST_CHECK_THROW(english.synset("v#00010000")->relations("#p"), mwn::domain_error);
  
  const synset_type::relation_set_type& minted = english.synset("n#N0000001")->relations();
  BOOST_CHECK(minted.empty());
  
  const synset_type::relation_set_type& hound = italian.synset("n#N0000001")->relations();
  BOOST_REQUIRE_EQUAL(hound.size(), 1u);
  BOOST_CHECK_EQUAL(hound.front().language(), "italian");
  BOOST_CHECK_EQUAL(hound.front().target()->language(), "italian");
}

BOOST_AUTO_TEST_CASE(lemma_lookup)
{
  // present as a noun only
  const boost::optional<lemma_type> animal = english.lemma("animal");
  BOOST_REQUIRE(animal);
  BOOST_CHECK_EQUAL(animal->pos(), 'n');
  
  try {
    english.lemma("dog");
    BOOST_FAIL("dog is a noun and a verb");
  }
  catch (const mwn::disambiguation_error& error) {
    BOOST_REQUIRE_EQUAL(error.candidates().size(), 2u);
    BOOST_CHECK_EQUAL(error.candidates()[0], "n");
    BOOST_CHECK_EQUAL(error.candidates()[1], "v");
    BOOST_CHECK_EQUAL(error.key(), "dog");
  }
  
  BOOST_CHECK_THROW(english.lemma("run"), mwn::disambiguation_error);
  
  // an explicit part-of-speech is never ambiguous
  BOOST_REQUIRE(english.lemma("dog", 'n'));
  BOOST_CHECK_EQUAL(english.lemma("dog", 'v')->pos(), 'v');
  BOOST_CHECK(! english.lemma("move", 'n'));
  BOOST_CHECK(! english.lemma("nothing"));
  
  BOOST_REQUIRE(english.lemma("domestic dog", 'n'));
  BOOST_CHECK_EQUAL(english.lemma("domestic dog", 'n')->form(), "domestic_dog");
  
  BOOST_REQUIRE(english[std::make_pair(std::string("animal"), '*')]);
  
  // identity ignores the language
  BOOST_CHECK(*english.lemma("dog", 'n') == lemma_type("dog", 'n', "italian", &resolver));
  BOOST_CHECK(*english.lemma("dog", 'n') != *english.lemma("dog", 'v'));
  BOOST_CHECK(*english.lemma("dog", 'n') < *english.lemma("dog", 'v'));
  BOOST_CHECK_EQUAL(hash_value(*english.lemma("dog", 'n')), hash_value(lemma_type("dog", 'n', "italian", 0)));
}

BOOST_AUTO_TEST_CASE(lemma_relations)
{
  const lemma_type dog = *english.lemma("dog", 'n');
  
  BOOST_REQUIRE_EQUAL(dog.synsets().size(), 1u);
  BOOST_CHECK_EQUAL(dog.synsets().front().id(), "n#00004000");
  
  BOOST_REQUIRE_EQUAL(dog.synonyms().size(), 1u);
  BOOST_CHECK_EQUAL(dog.synonyms().front().form(), "domestic_dog");
  
  // no synonyms table rows, the synset members are used
  BOOST_CHECK(english.lemma("animal")->synonyms().empty());
  BOOST_REQUIRE_EQUAL(english.lemma("object")->synonyms().size(), 1u);
  BOOST_CHECK_EQUAL(english.lemma("object")->synonyms().front().form(), "physical_object");
  
  BOOST_REQUIRE_EQUAL(dog.relatives().size(), 1u);
  BOOST_CHECK(dog.relatives().front() == lemma_type("dog", 'v', "english", 0));
  BOOST_CHECK(dog.relatives("n").empty());
  BOOST_CHECK(english.lemma("dog", 'v')->relatives().empty());
  
  const lemma_type::lemma_set_type derivates = english.lemma("bigness")->derivates();
  BOOST_REQUIRE_EQUAL(derivates.size(), 1u);
  BOOST_CHECK_EQUAL(derivates.front().form(), "big");
  BOOST_CHECK_EQUAL(derivates.front().pos(), 'a');
  BOOST_CHECK(english.lemma("bigness")->derivates("nv").empty());
  
  BOOST_REQUIRE_EQUAL(english.lemma("big")->antonyms().size(), 1u);
  BOOST_CHECK_EQUAL(english.lemma("big")->antonyms().front().form(), "small");
  BOOST_CHECK_EQUAL(english.lemma("small")->antonyms().front().form(), "big");
  
  BOOST_REQUIRE_EQUAL(english.lemma("doghouse")->composed_of().size(), 1u);
  BOOST_CHECK_EQUAL(english.lemma("doghouse")->composed_of().front().form(), "dog");
  BOOST_REQUIRE_EQUAL(dog.composes().size(), 1u);
  BOOST_CHECK_EQUAL(dog.composes().front().form(), "doghouse");
  BOOST_CHECK_EQUAL(dog.compounds().size(), 1u);
  BOOST_CHECK_EQUAL(english.lemma("doghouse")->compounds().size(), 1u);
  
  BOOST_CHECK(! dog.morpho());
}

BOOST_AUTO_TEST_CASE(morphology)
{
  const boost::optional<lemma_type> amo = latin.lemma("amo");
  
  BOOST_REQUIRE(amo);
  BOOST_CHECK_EQUAL(amo->pos(), 'v');
  BOOST_CHECK_EQUAL(amo->id(), "1");
  BOOST_CHECK_EQUAL(amo->miscellanea(), "v1spia--1-");
  
  const boost::optional<morpho_type> morpho = amo->morpho();
  BOOST_REQUIRE(morpho);
  BOOST_CHECK_EQUAL(morpho->dictionary_form()[1], "amare");
  BOOST_REQUIRE_EQUAL(morpho->alternative_forms().size(), 1u);
  BOOST_CHECK_EQUAL(morpho->alternative_forms().front().second, "amavero");
  
  BOOST_REQUIRE_EQUAL(amo->synsets().size(), 1u);
  BOOST_CHECK_EQUAL(amo->synsets().front().gloss(), "to love");
  
  // never the first of several records
  try {
    latin.lemma("rosa");
    BOOST_FAIL("rosa has two records");
  }
  catch (const mwn::disambiguation_error& error) {
    BOOST_REQUIRE_EQUAL(error.candidates().size(), 2u);
    BOOST_CHECK_EQUAL(error.candidates()[0], "2");
    BOOST_CHECK_EQUAL(error.candidates()[1], "3");
  }
  
  const boost::optional<lemma_type> vocative = latin.lemma("rosa", 'n', "n-s---fv1-");
  BOOST_REQUIRE(vocative);
  BOOST_CHECK_EQUAL(vocative->id(), "3");
  BOOST_CHECK_EQUAL(vocative->morpho()->meaning(morpho_type::CASE), "vocative");
  
  BOOST_CHECK(! latin.lemma("rosa", 'v'));
  
  BOOST_CHECK_EQUAL(latin.search("ros", '*', "", wordnet_type::STARTSWITH).size(), 2u);
  BOOST_CHECK_EQUAL(latin.search("rosa").size(), 2u);
  
  const wordnet_type::row_set_type raw = latin.raw("rosa");
  BOOST_REQUIRE_EQUAL(raw.size(), 2u);
  BOOST_CHECK_EQUAL(raw.front().size(), 3u);
  BOOST_CHECK_EQUAL(raw.front()[1], "n");
  
  BOOST_CHECK_EQUAL(latin.lemmas().size(), 4u);
}

BOOST_AUTO_TEST_CASE(search)
{
  BOOST_CHECK_EQUAL(english.search("dog").size(), 2u);
  BOOST_CHECK_EQUAL(english.search("dog", 'n').size(), 1u);
  BOOST_CHECK_EQUAL(english.search("dog", '*', "", wordnet_type::STARTSWITH).size(), 3u);
  BOOST_CHECK_EQUAL(english.search("dog", '*', "", wordnet_type::ENDSWITH).size(), 4u);
  BOOST_CHECK_EQUAL(english.search("og", '*', "", wordnet_type::CONTAINS).size(), 5u);
  BOOST_CHECK(english.search("cat").empty());
  
  BOOST_CHECK_EQUAL(wordnet_type::mode("contains"), wordnet_type::CONTAINS);
  BOOST_CHECK_THROW(wordnet_type::mode("fuzzy"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(collections)
{
  const wordnet_type::lemma_set_type& lemmas = english.lemmas();
  BOOST_CHECK_EQUAL(lemmas.size(), 19u);
  BOOST_CHECK_EQUAL(&lemmas, &english.lemmas());
  
  BOOST_CHECK_EQUAL(english.synsets().size(), 20u);
  BOOST_CHECK_EQUAL(english.synsets("n").size(), 15u);
  BOOST_CHECK_EQUAL(english.synsets("v").size(), 3u);
  BOOST_CHECK_EQUAL(english.synsets("nv").size(), 18u);
  BOOST_CHECK_EQUAL(&english.synsets("n"), &english.synsets("n"));
  
  BOOST_CHECK_EQUAL(english.relations().size(), 25u);
  BOOST_CHECK_EQUAL(english.semfields().size(), 6u);
  
  BOOST_CHECK_EQUAL(english.max_depth('n'), 4);
  BOOST_CHECK_EQUAL(english.max_depth('v'), 1);
  BOOST_CHECK_EQUAL(english.max_depth('a'), 0);
}

BOOST_AUTO_TEST_CASE(semfields)
{
  try {
    english.semfield("Animals");
    BOOST_FAIL("Animals has two codes");
  }
  catch (const mwn::disambiguation_error& error) {
    BOOST_REQUIRE_EQUAL(error.candidates().size(), 2u);
    BOOST_CHECK(contains(error.candidates(), "2.1.2"));
    BOOST_CHECK(contains(error.candidates(), "3.4"));
  }
  
  BOOST_REQUIRE(english.semfield("Animals", "3.4"));
  BOOST_CHECK(! english.semfield("Nothing"));
  
  const boost::optional<semfield_type> science = english.semfield("Pure Science");
  BOOST_REQUIRE(science);
  BOOST_CHECK_EQUAL(science->english(), "Pure_Science");
  BOOST_CHECK_EQUAL(science->name(), "Pure Science");
  BOOST_REQUIRE_EQUAL(science->synsets().size(), 1u);
  BOOST_CHECK_EQUAL(science->synsets().front().id(), "n#00002000");
  
  const semfield_type zoology = *english.semfield("Zoology");
  BOOST_CHECK_EQUAL(zoology.code(), "2.1.1");
  BOOST_REQUIRE_EQUAL(zoology.synsets().size(), 1u);
  BOOST_CHECK_EQUAL(zoology.synsets().front().id(), "n#00004000");
  
  // the normal field of the same branch
  BOOST_REQUIRE(zoology.normal());
  BOOST_CHECK_EQUAL(zoology.normal()->code(), "2.1.2");
  BOOST_CHECK(! english.semfield("Biology")->normal());
  
  const semfield_type animals = *english.semfield("Animals", "2.1.2");
  BOOST_CHECK_EQUAL(animals.synsets().size(), 2u);
  
  BOOST_CHECK_EQUAL(english.synset("n#00004000")->semfields().size(), 3u);
  BOOST_CHECK_EQUAL(english.semfields_by_code("2.1").size(), 1u);
  BOOST_CHECK_EQUAL(english.semfields_by_english("Animals").size(), 2u);
}

BOOST_AUTO_TEST_CASE(semfield_hierarchy)
{
  // every hypon lists us among its hypers and the other way around
  const semfield_type::semfield_set_type fields = english.semfields();
  
  for (semfield_type::semfield_set_type::const_iterator fiter = fields.begin(); fiter != fields.end(); ++ fiter) {
    const semfield_type::semfield_set_type& hypons = fiter->hypons();
    for (semfield_type::semfield_set_type::const_iterator hiter = hypons.begin(); hiter != hypons.end(); ++ hiter)
      BOOST_CHECK(contains(hiter->hypers(), *fiter));
    
    const semfield_type::semfield_set_type& hypers = fiter->hypers();
    for (semfield_type::semfield_set_type::const_iterator hiter = hypers.begin(); hiter != hypers.end(); ++ hiter)
      BOOST_CHECK(contains(hiter->hypons(), *fiter));
  }
  
  const semfield_type::semfield_set_type& hobbies = english.semfield("Hobbies")->hypons();
  BOOST_REQUIRE_EQUAL(hobbies.size(), 1u);
  BOOST_CHECK_EQUAL(hobbies.front().code(), "3.4");
  
  const semfield_type::semfield_set_type& biology = english.semfield("Biology")->hypons();
  BOOST_REQUIRE_EQUAL(biology.size(), 2u);
  BOOST_CHECK_EQUAL(biology[1].code(), "2.1.2");
}

BOOST_AUTO_TEST_CASE(find_relations)
{
  wordnet_type::relation_filter_type filter;
  
  filter.source = english.synset("n#00004000");
  filter.type = "@";
  BOOST_CHECK_EQUAL(english.find_relations(filter).size(), 3u);
  
  filter = wordnet_type::relation_filter_type();
  filter.w_source = english.lemma("dog", 'n');
  BOOST_CHECK_EQUAL(english.find_relations(filter).size(), 6u);
  
  filter = wordnet_type::relation_filter_type();
  filter.type = "\\";
  BOOST_CHECK_THROW(english.find_relations(filter), std::invalid_argument);
  
  filter = wordnet_type::relation_filter_type();
  filter.lexical = true;
  filter.w_source = english.lemma("big");
  BOOST_CHECK_THROW(english.find_relations(filter), std::invalid_argument);
  
  filter.w_target = english.lemma("small");
  filter.type = "!";
  const wordnet_type::relation_set_type antonyms = english.find_relations(filter);
  BOOST_REQUIRE_EQUAL(antonyms.size(), 1u);
  BOOST_CHECK_EQUAL(antonyms.front().id_target(), "a#00021000");
  
  filter = wordnet_type::relation_filter_type();
  filter.type = "+c";
  filter.w_source = english.lemma("doghouse");
  filter.w_target = english.lemma("dog", 'n');
  BOOST_CHECK_EQUAL(english.find_relations(filter).size(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
