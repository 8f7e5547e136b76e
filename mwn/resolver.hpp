// -*- mode: c++ -*-
//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __MWN__RESOLVER__HPP__
#define __MWN__RESOLVER__HPP__ 1

//
// lookup layer shared by all the entities fetched from one database.
//
// Entities are values keeping a pointer to their resolver. Every store-backed property
// is computed here and memoized by (language, key), so that a property is queried at
// most once per resolver and copies of an entity share it.
//

#include <string>
#include <vector>

#include <mwn/database.hpp>
#include <mwn/synset.hpp>
#include <mwn/lemma.hpp>
#include <mwn/relation.hpp>
#include <mwn/semfield.hpp>
#include <mwn/morpho.hpp>

#include <boost/optional.hpp>

#include <utils/unordered_map.hpp>

namespace mwn
{
  class Resolver
  {
  public:
    typedef Database database_type;
    
    typedef std::string id_type;
    typedef std::string form_type;
    typedef std::string type_type;
    typedef std::string language_type;
    typedef std::string english_type;
    typedef std::string code_type;
    typedef char        pos_type;
    
    typedef std::vector<Lemma, std::allocator<Lemma> >       lemma_set_type;
    typedef std::vector<Synset, std::allocator<Synset> >     synset_set_type;
    typedef std::vector<Relation, std::allocator<Relation> > relation_set_type;
    typedef std::vector<Semfield, std::allocator<Semfield> > semfield_set_type;
    
    typedef std::vector<std::string, std::allocator<std::string> > token_set_type;
    
  public:
    Resolver(const database_type& database, const int __debug=0)
      : debug(__debug), __database(&database) {}
    
  private:
    Resolver(const Resolver& x) {}
    Resolver& operator=(const Resolver& x) { return *this; }
    
  public:
    // shared by all the callers with the same database parameter
    static Resolver& create(const std::string& parameter);
    
    const database_type& database() const { return *__database; }
    
  public:
    // origin, requested language and the reference wordnet, in this order.
    // none if no store knows the id, throws decoding_error for malformed ids
    boost::optional<Synset> synset(const id_type& id, const language_type& language) const;
    
    // throws disambiguation_error if pos is a wildcard matching several parts-of-speech,
    // or several morphological records match
    boost::optional<Lemma> lemma(const form_type& form,
				 const pos_type& pos,
				 const language_type& language,
				 const std::string& miscellanea=std::string(),
				 const std::string& id=std::string()) const;
    
    // throws disambiguation_error if code is empty and several codes match english
    boost::optional<Semfield> semfield(const english_type& english, const code_type& code, const language_type& language) const;
    
    // every field named english
    semfield_set_type semfields(const english_type& english, const language_type& language) const;
    
  public:
    const lemma_set_type&    lemmas(const Synset& synset) const;
    const lemma_set_type&    phrases(const Synset& synset) const;
    const semfield_set_type& semfields(const Synset& synset) const;
    const relation_set_type& relations(const Synset& synset) const;
    
    const synset_set_type& synsets(const Lemma& lemma) const;
    const lemma_set_type&  synonyms(const Lemma& lemma) const;
    
    // lemmas connected to lemma by lexical edges of type. forward follows w_source -> w_target,
    // otherwise w_target -> w_source
    const lemma_set_type& lexical(const Lemma& lemma, const type_type& type, const bool forward) const;
    
    boost::optional<Morpho> morpho(const Lemma& lemma) const;
    
    const synset_set_type&   synsets(const Semfield& semfield) const;
    const semfield_set_type& hypers(const Semfield& semfield) const;
    const semfield_set_type& hypons(const Semfield& semfield) const;
    boost::optional<Semfield> normal(const Semfield& semfield) const;
    
  public:
    // whitespace separated tokens of a multi-valued column
    static void split(const std::string& x, token_set_type& tokens);
    
  public:
    int debug;
    
  private:
    const semfield_set_type& neighbours(const Semfield& semfield, const bool upward) const;
    
    template <typename Tp>
    struct memo
    {
      typedef typename utils::unordered_map<std::string, Tp, boost::hash<std::string>, std::equal_to<std::string>,
					    std::allocator<std::pair<const std::string, Tp> > >::type type;
    };
    
    typedef memo<boost::optional<Synset> >::type   synset_memo_type;
    typedef memo<boost::optional<Lemma> >::type    lemma_memo_type;
    typedef memo<boost::optional<Semfield> >::type semfield_memo_type;
    typedef memo<boost::optional<Morpho> >::type   morpho_memo_type;
    
    typedef memo<lemma_set_type>::type    lemma_set_memo_type;
    typedef memo<synset_set_type>::type   synset_set_memo_type;
    typedef memo<relation_set_type>::type relation_set_memo_type;
    typedef memo<semfield_set_type>::type semfield_set_memo_type;
    
  private:
    const database_type* __database;
    
    mutable synset_memo_type   __synset;
    mutable lemma_memo_type    __lemma;
    mutable semfield_memo_type __semfield;
    mutable morpho_memo_type   __morpho;
    
    mutable lemma_set_memo_type    __synset_lemmas;
    mutable lemma_set_memo_type    __synset_phrases;
    mutable semfield_set_memo_type __synset_semfields;
    mutable relation_set_memo_type __synset_relations;
    
    mutable synset_set_memo_type __lemma_synsets;
    mutable lemma_set_memo_type  __lemma_synonyms;
    mutable lemma_set_memo_type  __lemma_lexical;
    
    mutable synset_set_memo_type   __semfield_synsets;
    mutable semfield_set_memo_type __semfield_hypers;
    mutable semfield_set_memo_type __semfield_hypons;
    mutable semfield_memo_type     __semfield_normal;
  };
};

#endif
