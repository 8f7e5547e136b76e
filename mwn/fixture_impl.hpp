// -*- mode: c++ -*-
//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __MWN__FIXTURE_IMPL__HPP__
#define __MWN__FIXTURE_IMPL__HPP__ 1

//
// a small multilingual store in a temporary sqlite file, shared by the tests.
//
// english taxonomy (common_relation):
//
//   entity <- object <- animal <- dog
//   entity <- pet    <---------- dog
//   animal <- young_mammal <- puppy -> dog
//   move <- run (verb)
//   alpha <- beta <-> gamma (cycle)
//
// italian mints n#N0000001 (cane_da_caccia) under dog, latin keeps a morphology table.
//

#include <string>
#include <sstream>
#include <stdexcept>

#include <sqlite3.h>

#include <mwn/database.hpp>
#include <mwn/resolver.hpp>
#include <mwn/parameter.hpp>

#include <utils/tempfile.hpp>

namespace mwn
{
  struct Fixture
  {
    typedef utils::tempfile::path_type path_type;
    
    Fixture()
      : directory(utils::tempfile::directory_name(utils::tempfile::tmp_dir() / "mwn.XXXXXX")),
	file(directory / "wordnet.db")
    {
      // removed at exit, the database registry keeps the file open
      utils::tempfile::insert(directory);
      
      populate(file);
      
      Parameter param;
      param.name() = "sqlite";
      param.push_back(std::make_pair("file", file.string()));
      
      std::ostringstream stream;
      stream << param;
      parameter = stream.str();
    }
    
    const Database& database() const { return Database::create(parameter); }
    
    static void populate(const path_type& path)
    {
      sqlite3* db = 0;
      if (sqlite3_open_v2(path.string().c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, 0) != SQLITE_OK) {
	sqlite3_close(db);
	throw std::runtime_error("cannot create " + path.string());
      }
      
      char* error = 0;
      if (sqlite3_exec(db, script(), 0, 0, &error) != SQLITE_OK) {
	const std::string message(error ? error : "unknown error");
	sqlite3_free(error);
	sqlite3_close(db);
	throw std::runtime_error("cannot populate " + path.string() + ": " + message);
      }
      
      sqlite3_close(db);
    }
    
    static const char* script()
    {
      return "\
CREATE TABLE english_synset (id TEXT, word TEXT, phrase TEXT, gloss TEXT);\n\
INSERT INTO english_synset VALUES ('n#00001740', 'entity', NULL, 'that which is perceived to have its own existence');\n\
INSERT INTO english_synset VALUES ('n#00002000', 'object', 'physical_object', 'a tangible thing');\n\
INSERT INTO english_synset VALUES ('n#00003000', 'animal', NULL, 'a living organism');\n\
INSERT INTO english_synset VALUES ('n#00004000', 'Dog domestic_dog', NULL, 'a domesticated canid');\n\
INSERT INTO english_synset VALUES ('n#00005000', 'pet', NULL, 'a domesticated animal kept for companionship');\n\
INSERT INTO english_synset VALUES ('n#00006000', 'tail', NULL, 'the posterior part of an animal');\n\
INSERT INTO english_synset VALUES ('n#00007000', 'doghouse', NULL, 'outbuilding that serves as a shelter for a dog');\n\
INSERT INTO english_synset VALUES ('n#00008000', 'run', NULL, 'a score in baseball');\n\
INSERT INTO english_synset VALUES ('n#00009000', 'bigness', NULL, 'the property of being big');\n\
INSERT INTO english_synset VALUES ('n#00030000', 'alpha', NULL, 'first of a cycle');\n\
INSERT INTO english_synset VALUES ('n#00031000', 'beta', NULL, 'second of a cycle');\n\
INSERT INTO english_synset VALUES ('n#00032000', 'gamma', NULL, 'third of a cycle');\n\
INSERT INTO english_synset VALUES ('n#00050000', 'puppy', NULL, 'a young dog');\n\
INSERT INTO english_synset VALUES ('n#00051000', 'young_mammal', NULL, 'any immature mammal');\n\
INSERT INTO english_synset VALUES ('n#00040000', ' GAP! ', NULL, 'a concept without an english word');\n\
INSERT INTO english_synset VALUES ('v#00010000', 'run', NULL, 'move fast by using the legs');\n\
INSERT INTO english_synset VALUES ('v#00011000', 'move', NULL, 'change location');\n\
INSERT INTO english_synset VALUES ('v#00012000', 'dog', NULL, 'go after with the intent to catch');\n\
INSERT INTO english_synset VALUES ('a#00020000', 'big', NULL, 'above average in size');\n\
INSERT INTO english_synset VALUES ('a#00021000', 'small', NULL, 'limited in size');\n\
\n\
CREATE TABLE english_lemma (lemma TEXT, pos TEXT);\n\
INSERT INTO english_lemma VALUES ('entity', 'n');\n\
INSERT INTO english_lemma VALUES ('object', 'n');\n\
INSERT INTO english_lemma VALUES ('animal', 'n');\n\
INSERT INTO english_lemma VALUES ('dog', 'n');\n\
INSERT INTO english_lemma VALUES ('dog', 'v');\n\
INSERT INTO english_lemma VALUES ('domestic_dog', 'n');\n\
INSERT INTO english_lemma VALUES ('doghouse', 'n');\n\
INSERT INTO english_lemma VALUES ('run', 'n');\n\
INSERT INTO english_lemma VALUES ('run', 'v');\n\
INSERT INTO english_lemma VALUES ('hotdog', 'n');\n\
\n\
CREATE TABLE english_index (lemma TEXT, id_n TEXT, id_v TEXT, id_a TEXT, id_r TEXT);\n\
INSERT INTO english_index VALUES ('entity', 'n#00001740', NULL, NULL, NULL);\n\
INSERT INTO english_index VALUES ('object', 'n#00002000', NULL, NULL, NULL);\n\
INSERT INTO english_index VALUES ('physical_object', 'n#00002000', NULL, NULL, NULL);\n\
INSERT INTO english_index VALUES ('animal', 'n#00003000', NULL, NULL, NULL);\n\
INSERT INTO english_index VALUES ('dog', 'n#00004000', 'v#00012000', NULL, NULL);\n\
INSERT INTO english_index VALUES ('domestic_dog', 'n#00004000', NULL, NULL, NULL);\n\
INSERT INTO english_index VALUES ('pet', 'n#00005000', NULL, NULL, NULL);\n\
INSERT INTO english_index VALUES ('tail', 'n#00006000', NULL, NULL, NULL);\n\
INSERT INTO english_index VALUES ('doghouse', 'n#00007000', NULL, NULL, NULL);\n\
INSERT INTO english_index VALUES ('run', 'n#00008000', 'v#00010000', NULL, NULL);\n\
INSERT INTO english_index VALUES ('move', NULL, 'v#00011000', NULL, NULL);\n\
INSERT INTO english_index VALUES ('big', NULL, NULL, 'a#00020000', NULL);\n\
INSERT INTO english_index VALUES ('small', NULL, NULL, 'a#00021000', NULL);\n\
INSERT INTO english_index VALUES ('bigness', 'n#00009000', NULL, NULL, NULL);\n\
INSERT INTO english_index VALUES ('alpha', 'n#00030000', NULL, NULL, NULL);\n\
INSERT INTO english_index VALUES ('beta', 'n#00031000', NULL, NULL, NULL);\n\
INSERT INTO english_index VALUES ('gamma', 'n#00032000', NULL, NULL, NULL);\n\
\n\
CREATE TABLE english_synonyms (pos TEXT, syn TEXT, lemma TEXT);\n\
INSERT INTO english_synonyms VALUES ('n', '00004000', 'dog');\n\
INSERT INTO english_synonyms VALUES ('n', '00004000', 'domestic_dog');\n\
\n\
CREATE TABLE english_relation (type TEXT, id_source TEXT, id_target TEXT, w_source TEXT, w_target TEXT, status TEXT);\n\
INSERT INTO english_relation VALUES ('!', 'a#00020000', 'a#00021000', 'big', 'small', NULL);\n\
INSERT INTO english_relation VALUES ('!', 'a#00021000', 'a#00020000', 'small', 'big', NULL);\n\
INSERT INTO english_relation VALUES ('\\', 'a#00020000', 'n#00009000', 'big', 'bigness', NULL);\n\
INSERT INTO english_relation VALUES ('/', 'n#00004000', 'v#00012000', 'dog', 'dog', NULL);\n\
INSERT INTO english_relation VALUES ('+c', 'n#00007000', 'n#00004000', 'doghouse', 'dog', NULL);\n\
INSERT INTO english_relation VALUES ('-c', 'n#00004000', 'n#00007000', 'dog', 'doghouse', NULL);\n\
\n\
CREATE TABLE common_relation (type TEXT, id_source TEXT, id_target TEXT, w_source TEXT, w_target TEXT, status TEXT);\n\
INSERT INTO common_relation VALUES ('@', 'n#00002000', 'n#00001740', NULL, NULL, NULL);\n\
INSERT INTO common_relation VALUES ('@', 'n#00003000', 'n#00002000', NULL, NULL, NULL);\n\
INSERT INTO common_relation VALUES ('@', 'n#00004000', 'n#00003000', NULL, NULL, NULL);\n\
INSERT INTO common_relation VALUES ('@', 'n#00004000', 'n#00005000', NULL, NULL, NULL);\n\
INSERT INTO common_relation VALUES ('@', 'n#00005000', 'n#00001740', NULL, NULL, NULL);\n\
INSERT INTO common_relation VALUES ('~', 'n#00001740', 'n#00002000', NULL, NULL, NULL);\n\
INSERT INTO common_relation VALUES ('~', 'n#00001740', 'n#00005000', NULL, NULL, NULL);\n\
INSERT INTO common_relation VALUES ('~', 'n#00002000', 'n#00003000', NULL, NULL, NULL);\n\
INSERT INTO common_relation VALUES ('~', 'n#00003000', 'n#00004000', NULL, NULL, NULL);\n\
INSERT INTO common_relation VALUES ('~', 'n#00005000', 'n#00004000', NULL, NULL, NULL);\n\
INSERT INTO common_relation VALUES ('%p', 'n#00004000', 'n#00006000', NULL, NULL, 'NEW');\n\
INSERT INTO common_relation VALUES ('@', 'n#00004000', 'n#09999999', NULL, NULL, NULL);\n\
INSERT INTO common_relation VALUES ('@', 'v#00010000', 'v#00011000', NULL, NULL, NULL);\n\
INSERT INTO common_relation VALUES ('@', 'n#00050000', 'n#00004000', NULL, NULL, NULL);\n\
INSERT INTO common_relation VALUES ('@', 'n#00050000', 'n#00051000', NULL, NULL, NULL);\n\
INSERT INTO common_relation VALUES ('@', 'n#00051000', 'n#00003000', NULL, NULL, NULL);\n\
INSERT INTO common_relation VALUES ('@', 'n#00030000', 'n#00031000', NULL, NULL, NULL);\n\
INSERT INTO common_relation VALUES ('@', 'n#00031000', 'n#00032000', NULL, NULL, NULL);\n\
INSERT INTO common_relation VALUES ('@', 'n#00032000', 'n#00031000', NULL, NULL, NULL);\n\
\n\
CREATE TABLE common_semfield (english TEXT, synset TEXT);\n\
INSERT INTO common_semfield VALUES ('Zoology Animals', 'n#00004000');\n\
INSERT INTO common_semfield VALUES ('Animals', 'n#00003000');\n\
INSERT INTO common_semfield VALUES ('Pure_Science', 'n#00002000');\n\
\n\
CREATE TABLE common_semfield_hierarchy (code TEXT, english TEXT, hypers TEXT, hypons TEXT, normal TEXT);\n\
INSERT INTO common_semfield_hierarchy VALUES ('2', 'Pure_Science', NULL, 'Biology', NULL);\n\
INSERT INTO common_semfield_hierarchy VALUES ('2.1', 'Biology', 'Pure_Science', 'Zoology Animals', NULL);\n\
INSERT INTO common_semfield_hierarchy VALUES ('2.1.1', 'Zoology', 'Biology', NULL, 'Animals');\n\
INSERT INTO common_semfield_hierarchy VALUES ('2.1.2', 'Animals', 'Biology', NULL, NULL);\n\
INSERT INTO common_semfield_hierarchy VALUES ('3', 'Hobbies', NULL, 'Animals', NULL);\n\
INSERT INTO common_semfield_hierarchy VALUES ('3.4', 'Animals', 'Hobbies', NULL, NULL);\n\
\n\
CREATE TABLE italian_synset (id TEXT, word TEXT, phrase TEXT, gloss TEXT);\n\
INSERT INTO italian_synset VALUES ('n#N0000001', 'cane_da_caccia', NULL, 'cane addestrato alla caccia');\n\
INSERT INTO italian_synset VALUES ('n#00004000', 'cane', NULL, NULL);\n\
\n\
CREATE TABLE italian_index (lemma TEXT, id_n TEXT, id_v TEXT, id_a TEXT, id_r TEXT);\n\
INSERT INTO italian_index VALUES ('cane', 'n#00004000', NULL, NULL, NULL);\n\
INSERT INTO italian_index VALUES ('cane_da_caccia', 'n#N0000001', NULL, NULL, NULL);\n\
INSERT INTO italian_index VALUES ('animale', 'n#00003000', NULL, NULL, NULL);\n\
INSERT INTO italian_index VALUES ('bestia', 'n#00003000 n#00001740', NULL, NULL, NULL);\n\
\n\
CREATE TABLE italian_relation (type TEXT, id_source TEXT, id_target TEXT, w_source TEXT, w_target TEXT, status TEXT);\n\
INSERT INTO italian_relation VALUES ('@', 'n#N0000001', 'n#00004000', NULL, NULL, 'new');\n\
\n\
CREATE TABLE latin_synset (id TEXT, word TEXT, phrase TEXT, gloss TEXT);\n\
INSERT INTO latin_synset VALUES ('v#L0000001', 'amo', NULL, 'to love');\n\
\n\
CREATE TABLE latin_index (lemma TEXT, id_n TEXT, id_v TEXT, id_a TEXT, id_r TEXT);\n\
INSERT INTO latin_index VALUES ('amo', NULL, 'v#L0000001', NULL, NULL);\n\
\n\
CREATE TABLE latin_morpho (id TEXT, lemma TEXT, pos TEXT, principal_parts TEXT, irregular_forms TEXT, alternative_forms TEXT, pronunciation TEXT, miscellanea TEXT);\n\
INSERT INTO latin_morpho VALUES ('1', 'amo', 'v', 'am amav amat', NULL, 'amasso=amavero', NULL, 'v1spia--1-');\n\
INSERT INTO latin_morpho VALUES ('2', 'rosa', 'n', 'ros', NULL, NULL, NULL, 'n-s---fn1-');\n\
INSERT INTO latin_morpho VALUES ('3', 'rosa', 'n', 'ros', NULL, NULL, NULL, 'n-s---fv1-');\n\
INSERT INTO latin_morpho VALUES ('4', 'turris', 'n', 'turr', 'turrim=turrem', NULL, NULL, 'n-s---fn3i');\n\
";
    }
    
    path_type   directory;
    path_type   file;
    std::string parameter;
  };
};

#endif
