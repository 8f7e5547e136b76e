// -*- mode: c++ -*-
//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __MWN__LEMMA__HPP__
#define __MWN__LEMMA__HPP__ 1

//
// a word or phrase form. Identity is (form, pos), the language is not a part of it.
// Forms keep the store's '_' for spaces.
//

#include <string>
#include <vector>
#include <iostream>

#include <mwn/pos.hpp>
#include <mwn/morpho.hpp>

#include <boost/optional.hpp>
#include <boost/functional/hash.hpp>

namespace mwn
{
  class Resolver;
  class Synset;
  
  class Lemma
  {
  public:
    typedef std::string form_type;
    typedef std::string language_type;
    typedef char        pos_type;
    
    typedef Resolver resolver_type;
    typedef Morpho   morpho_type;
    
    typedef std::vector<Synset, std::allocator<Synset> > synset_set_type;
    typedef std::vector<Lemma, std::allocator<Lemma> >   lemma_set_type;
    
  public:
    Lemma() : __form(), __pos(POS::WILDCARD), __language(), __id(), __miscellanea(), __resolver(0) {}
    Lemma(const form_type& form,
	  const pos_type& pos,
	  const language_type& language,
	  const resolver_type* resolver,
	  const std::string& id=std::string(),
	  const std::string& miscellanea=std::string())
      : __form(form), __pos(pos), __language(language), __id(id), __miscellanea(miscellanea), __resolver(resolver) {}
    
  public:
    const form_type& form() const { return __form; }
    const pos_type& pos() const { return __pos; }
    const language_type& language() const { return __language; }
    
    // morphological record id and tag, empty for index-model wordnets
    const std::string& id() const { return __id; }
    const std::string& miscellanea() const { return __miscellanea; }
    
    // form with spaces
    std::string text() const;
    
    const synset_set_type& synsets() const;
    const lemma_set_type&  synonyms() const;
    
    // lemmas with a derived-from edge to this lemma, restricted to the parts-of-speech in pos
    lemma_set_type derivates(const std::string& pos=POS::all()) const;
    // lemmas this lemma has a related-to edge to
    lemma_set_type relatives(const std::string& pos=POS::all()) const;
    
    const lemma_set_type& antonyms() const;
    const lemma_set_type& composed_of() const;
    const lemma_set_type& composes() const;
    lemma_set_type compounds() const;
    
    boost::optional<morpho_type> morpho() const;
    
    const resolver_type* resolver() const { return __resolver; }
    
  public:
    friend
    size_t hash_value(const Lemma& x)
    {
      size_t seed = 0;
      boost::hash_combine(seed, x.__form);
      boost::hash_combine(seed, x.__pos);
      return seed;
    }
    
    friend
    std::ostream& operator<<(std::ostream& os, const Lemma& x)
    {
      os << x.text();
      return os;
    }
    
  private:
    form_type     __form;
    pos_type      __pos;
    language_type __language;
    std::string   __id;
    std::string   __miscellanea;
    
    const resolver_type* __resolver;
  };
  
  inline
  bool operator==(const Lemma& x, const Lemma& y)
  {
    return x.form() == y.form() && x.pos() == y.pos();
  }
  
  inline
  bool operator!=(const Lemma& x, const Lemma& y)
  {
    return x.form() != y.form() || x.pos() != y.pos();
  }
  
  inline
  bool operator<(const Lemma& x, const Lemma& y)
  {
    return (x.form() < y.form() || (!(y.form() < x.form()) && x.pos() < y.pos()));
  }
};

#endif
