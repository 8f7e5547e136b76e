//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>
#include <cstdlib>

#include <boost/program_options.hpp>
#include <boost/optional.hpp>

#include "mwn/wordnet.hpp"
#include "mwn/traversal.hpp"
#include "mwn/relation_type.hpp"

typedef mwn::WordNet  wordnet_type;
typedef mwn::Synset   synset_type;
typedef mwn::Lemma    lemma_type;
typedef mwn::Relation relation_type;
typedef mwn::Semfield semfield_type;
typedef mwn::Morpho   morpho_type;

typedef std::vector<std::string, std::allocator<std::string> > id_set_type;

std::string database_parameter;
std::string language = "english";

std::string lemma;
std::string pos = "*";
std::string miscellanea;
std::string search;
std::string mode = "exact";

id_set_type synsets;

std::string semfield;
std::string code;

std::string closure;
int depth = -1;
bool paths_mode = false;
bool roots_mode = false;
bool depth_mode = false;

std::string max_depth;

bool list_mode = false;

int debug = 0;

void options(int argc, char** argv);

template <typename Container>
std::ostream& print(std::ostream& os, const char* name, const Container& x)
{
  os << name << ':';
  typename Container::const_iterator iter_end = x.end();
  for (typename Container::const_iterator iter = x.begin(); iter != iter_end; ++ iter)
    os << ' ' << *iter;
  os << '\n';
  return os;
}

void print_synset(std::ostream& os, const synset_type& synset)
{
  os << "synset: " << synset << '\n';
  os << "gloss: " << synset.gloss() << '\n';
  print(os, "lemmas", synset.lemmas());
  print(os, "semfields", synset.semfields());
  
  const synset_type::relation_set_type& relations = synset.relations();
  synset_type::relation_set_type::const_iterator riter_end = relations.end();
  for (synset_type::relation_set_type::const_iterator riter = relations.begin(); riter != riter_end; ++ riter) {
    if (! mwn::RelationType::valid(synset.pos(), riter->type())) continue;
    
    os << "relation: " << riter->type_name() << ' ' << riter->id_target();
    if (riter->is_lexical())
      os << ' ' << riter->form_source() << ' ' << riter->form_target();
    os << '\n';
  }
  
  if (! closure.empty()) {
    const mwn::Closure walk = synset.closure(closure, depth);
    
    os << "closure:";
    for (mwn::Closure::const_iterator citer = walk.begin(); citer != walk.end(); ++ citer)
      os << ' ' << *citer;
    os << '\n';
  }
  
  if (depth_mode) {
    os << "max-depth: " << synset.max_depth() << '\n';
    os << "min-depth: " << synset.min_depth() << '\n';
  }
  
  if (roots_mode)
    print(os, "roots", synset.roots());
  
  if (paths_mode) {
    const synset_type::path_set_type paths = synset.paths_to_root();
    
    synset_type::path_set_type::const_iterator piter_end = paths.end();
    for (synset_type::path_set_type::const_iterator piter = paths.begin(); piter != piter_end; ++ piter)
      print(os, "path", *piter);
  }
}

void print_lemma(std::ostream& os, const lemma_type& lemma)
{
  os << "lemma: " << lemma << ' ' << lemma.pos() << '\n';
  
  const boost::optional<morpho_type> morpho = lemma.morpho();
  if (morpho) {
    os << "morpho: " << *morpho << '\n';
    
    for (int feature = morpho_type::PART_OF_SPEECH; feature != morpho_type::FEATURE_SIZE; ++ feature) {
      const std::string meaning = morpho->meaning(morpho_type::feature_type(feature));
      if (! meaning.empty())
	os << "  " << morpho_type::feature_name(morpho_type::feature_type(feature)) << ": " << meaning << '\n';
    }
  }
  
  print(os, "synsets", lemma.synsets());
  print(os, "synonyms", lemma.synonyms());
  print(os, "derivates", lemma.derivates());
  print(os, "relatives", lemma.relatives());
  print(os, "antonyms", lemma.antonyms());
  print(os, "compounds", lemma.compounds());
}

int main(int argc, char** argv)
{
  try {
    options(argc, argv);
    
    if (list_mode) {
      std::cout << mwn::Database::lists();
      return 0;
    }
    
    if (database_parameter.empty())
      throw std::runtime_error("no database? use --database");
    
    if (pos.size() != 1)
      throw std::runtime_error("invalid part-of-speech: " + pos);
    
    mwn::Resolver& resolver = mwn::Resolver::create(database_parameter);
    if (debug)
      resolver.debug = debug;
    
    const wordnet_type wordnet(resolver, language);
    
    if (! lemma.empty()) {
      const boost::optional<lemma_type> found = wordnet.lemma(lemma, pos[0], miscellanea);
      
      if (found)
	print_lemma(std::cout, *found);
      else
	std::cout << "no lemma: " << lemma << '\n';
    }
    
    if (! search.empty())
      print(std::cout, "search", wordnet.search(search, pos[0], miscellanea, wordnet_type::mode(mode)));
    
    for (id_set_type::const_iterator iter = synsets.begin(); iter != synsets.end(); ++ iter) {
      const boost::optional<synset_type> found = wordnet.synset(*iter);
      
      if (found)
	print_synset(std::cout, *found);
      else
	std::cout << "no synset: " << *iter << '\n';
    }
    
    if (! semfield.empty()) {
      const boost::optional<semfield_type> found = wordnet.semfield(semfield, code);
      
      if (found) {
	std::cout << "semfield: " << *found << ' ' << found->code() << '\n';
	print(std::cout, "hypers", found->hypers());
	print(std::cout, "hypons", found->hypons());
	
	const boost::optional<semfield_type> normal = found->normal();
	if (normal)
	  std::cout << "normal: " << *normal << '\n';
	
	print(std::cout, "synsets", found->synsets());
      } else
	std::cout << "no semfield: " << semfield << '\n';
    }
    
    for (std::string::const_iterator piter = max_depth.begin(); piter != max_depth.end(); ++ piter)
      std::cout << "max-depth " << *piter << ": " << wordnet.max_depth(*piter) << '\n';
  }
  catch (const std::exception& err) {
    std::cerr << "error: " << err.what() << std::endl;
    return 1;
  }
  return 0;
}

void options(int argc, char** argv)
{
  namespace po = boost::program_options;
  
  po::options_description desc("options");
  desc.add_options()
    ("database", po::value<std::string>(&database_parameter), "database parameter, e.g. sqlite:path=/path/to/db")
    ("language", po::value<std::string>(&language)->default_value(language), "wordnet language")
    
    ("lemma",       po::value<std::string>(&lemma),                                "lemma lookup")
    ("pos",         po::value<std::string>(&pos)->default_value(pos),              "part-of-speech (n, v, a, r or *)")
    ("miscellanea", po::value<std::string>(&miscellanea),                          "morphological tag")
    ("search",      po::value<std::string>(&search),                               "lemma search")
    ("mode",        po::value<std::string>(&mode)->default_value(mode),            "search mode (exact, startswith, endswith, contains)")
    
    ("synset",   po::value<id_set_type>(&synsets)->composing(), "synset lookup")
    ("semfield", po::value<std::string>(&semfield),             "semantic field lookup")
    ("code",     po::value<std::string>(&code),                 "semantic field code")
    
    ("closure",   po::value<std::string>(&closure),                   "transitive closure of a relation type")
    ("depth",     po::value<int>(&depth)->default_value(depth),       "closure depth, negative for unbounded")
    ("paths",     po::bool_switch(&paths_mode),                       "paths to root")
    ("roots",     po::bool_switch(&roots_mode),                       "roots")
    ("metrics",   po::bool_switch(&depth_mode),                       "max and min depth")
    ("max-depth", po::value<std::string>(&max_depth),                 "max depth of the parts-of-speech, e.g. nv")
    
    ("list", po::bool_switch(&list_mode), "list databases")
    
    ("debug", po::value<int>(&debug)->implicit_value(1), "debug level")
    ("help", "help message");
  
  po::variables_map vm;
  po::store(po::parse_command_line(argc, argv, desc, po::command_line_style::unix_style & (~po::command_line_style::allow_guessing)), vm);
  po::notify(vm);
  
  if (vm.count("help")) {
    std::cout << argv[0] << " [options]" << '\n' << desc << '\n';
    exit(0);
  }
}
