// -*- mode: c++ -*-
//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __MWN__WORDNET__HPP__
#define __MWN__WORDNET__HPP__ 1

//
// a wordnet of one language over a resolver.
//
// The collections are materialized on first access and replayed afterwards.
//

#include <string>
#include <vector>
#include <utility>

#include <mwn/database.hpp>
#include <mwn/resolver.hpp>
#include <mwn/synset.hpp>
#include <mwn/lemma.hpp>
#include <mwn/relation.hpp>
#include <mwn/semfield.hpp>
#include <mwn/pos.hpp>
#include <mwn/language.hpp>

#include <boost/optional.hpp>

#include <utils/unordered_map.hpp>

namespace mwn
{
  class WordNet
  {
  public:
    typedef Resolver resolver_type;
    
    typedef std::string language_type;
    typedef std::string form_type;
    typedef std::string id_type;
    typedef std::string type_type;
    typedef char        pos_type;
    
    typedef Resolver::lemma_set_type    lemma_set_type;
    typedef Resolver::synset_set_type   synset_set_type;
    typedef Resolver::relation_set_type relation_set_type;
    typedef Resolver::semfield_set_type semfield_set_type;
    
    typedef Database::row_type     row_type;
    typedef Database::row_set_type row_set_type;
    
    typedef std::pair<form_type, pos_type> key_type;
    
    enum mode_type {
      EXACT,
      STARTSWITH,
      ENDSWITH,
      CONTAINS,
    };
    
    // conjunction of the fields which are set
    struct RelationFilter
    {
      boost::optional<Synset> source;
      boost::optional<Synset> target;
      boost::optional<Lemma>  w_source;
      boost::optional<Lemma>  w_target;
      type_type               type;
      bool                    lexical;
      
      RelationFilter() : source(), target(), w_source(), w_target(), type(), lexical(false) {}
    };
    
    typedef RelationFilter relation_filter_type;
    
  public:
    WordNet(const resolver_type& resolver, const language_type& language=Language::reference())
      : __resolver(&resolver), __language(language) {}
    
    // database parameter, see Database::lists()
    WordNet(const std::string& parameter, const language_type& language=Language::reference())
      : __resolver(&Resolver::create(parameter)), __language(language) {}
    
  public:
    const language_type& language() const { return __language; }
    const resolver_type& resolver() const { return *__resolver; }
    
    boost::optional<Synset> synset(const id_type& id) const
    {
      return __resolver->synset(id, __language);
    }
    
    // throws disambiguation_error, see Resolver::lemma
    boost::optional<Lemma> lemma(const form_type& form,
				 const pos_type& pos=POS::WILDCARD,
				 const std::string& miscellanea=std::string()) const
    {
      return __resolver->lemma(form, pos, __language, miscellanea);
    }
    
    boost::optional<Lemma> operator[](const key_type& key) const
    {
      return lemma(key.first, key.second);
    }
    
    boost::optional<Semfield> semfield(const std::string& english, const std::string& code=std::string()) const
    {
      return __resolver->semfield(english, code, __language);
    }
    
    // every lemma matching form under mode, never ambiguous. empty form matches all
    lemma_set_type search(const form_type& form,
			  const pos_type& pos=POS::WILDCARD,
			  const std::string& miscellanea=std::string(),
			  const mode_type mode=EXACT) const;
    
    // (lemma, pos, miscellanea) of the morphology table
    row_set_type raw(const form_type& form,
		     const pos_type& pos=POS::WILDCARD,
		     const std::string& miscellanea=std::string(),
		     const mode_type mode=EXACT) const;
    
    // throws invalid_argument for a lexical filter without both lemmas
    relation_set_type find_relations(const relation_filter_type& filter) const;
    
    semfield_set_type semfields_by_code(const std::string& code) const;
    semfield_set_type semfields_by_english(const std::string& english) const;
    
  public:
    const lemma_set_type&    lemmas() const;
    // synsets of the parts-of-speech in pos
    const synset_set_type&   synsets(const std::string& pos=POS::all()) const;
    const relation_set_type& relations() const;
    const semfield_set_type& semfields() const;
    
    // the deepest hypernym path of the synsets of pos
    int max_depth(const pos_type& pos) const;
    
    static mode_type mode(const std::string& name);
    
  private:
    typedef utils::unordered_map<std::string, synset_set_type, boost::hash<std::string>, std::equal_to<std::string>,
				 std::allocator<std::pair<const std::string, synset_set_type> > >::type synset_map_type;
    typedef utils::unordered_map<pos_type, int, boost::hash<pos_type>, std::equal_to<pos_type>,
				 std::allocator<std::pair<const pos_type, int> > >::type depth_map_type;
    
    const resolver_type* __resolver;
    language_type        __language;
    
    mutable boost::optional<lemma_set_type>    __lemmas;
    mutable synset_map_type                    __synsets;
    mutable boost::optional<relation_set_type> __relations;
    mutable boost::optional<semfield_set_type> __semfields;
    mutable depth_map_type                     __depths;
  };
};

#endif
