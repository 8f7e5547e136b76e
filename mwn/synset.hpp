// -*- mode: c++ -*-
//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __MWN__SYNSET__HPP__
#define __MWN__SYNSET__HPP__ 1

#include <string>
#include <vector>
#include <iostream>

#include <boost/optional.hpp>
#include <boost/functional/hash.hpp>

namespace mwn
{
  class Resolver;
  class Lemma;
  class Relation;
  class Semfield;
  class Closure;
  
  class Synset
  {
  public:
    typedef std::string id_type;
    typedef std::string language_type;
    typedef std::string type_type;
    typedef char        pos_type;
    
    typedef Resolver resolver_type;
    
    typedef std::vector<Lemma, std::allocator<Lemma> >       lemma_set_type;
    typedef std::vector<Relation, std::allocator<Relation> > relation_set_type;
    typedef std::vector<Semfield, std::allocator<Semfield> > semfield_set_type;
    typedef std::vector<Synset, std::allocator<Synset> >     synset_set_type;
    typedef synset_set_type                                  path_type;
    typedef std::vector<path_type, std::allocator<path_type> > path_set_type;
    
  public:
    Synset() : __id(), __language(), __gloss(), __resolver(0) {}
    Synset(const id_type& id, const language_type& language, const std::string& gloss, const resolver_type* resolver)
      : __id(id), __language(language), __gloss(gloss), __resolver(resolver) {}
    
  public:
    const id_type& id() const { return __id; }
    
    // the wordnet view this synset was fetched through
    const language_type& language() const { return __language; }
    
    // the wordnet which minted the synset
    language_type origin() const;
    
    pos_type    pos() const { return __id[0]; }
    std::string offset() const { return __id.substr(2); }
    
    const std::string& gloss() const { return __gloss; }
    
    // words followed by phrases
    const lemma_set_type&    lemmas() const;
    const lemma_set_type&    phrases() const;
    const semfield_set_type& semfields() const;
    
    // edges from this synset, common relations first
    const relation_set_type& relations() const;
    
    // edges of one type, throws domain_error if pos does not define type
    relation_set_type relations(const type_type& type) const;
    
    boost::optional<type_type> relation_to(const Synset& target) const;
    
    // resolvable targets of the hypernym edges
    synset_set_type hypernyms() const;
    
  public:
    Closure closure(const type_type& type, const int depth=-1) const;
    
    int max_depth() const;
    int min_depth() const;
    
    synset_set_type roots() const;
    path_set_type   paths_to_root() const;
    
  public:
    const resolver_type* resolver() const { return __resolver; }
    
  public:
    friend
    size_t hash_value(const Synset& x)
    {
      size_t seed = 0;
      boost::hash_combine(seed, x.__id);
      return seed;
    }
    
    friend
    std::ostream& operator<<(std::ostream& os, const Synset& x)
    {
      os << x.__id;
      return os;
    }
    
  private:
    id_type              __id;
    language_type        __language;
    std::string          __gloss;
    const resolver_type* __resolver;
  };

  inline
  bool operator==(const Synset& x, const Synset& y)
  {
    return x.id() == y.id();
  }
  
  inline
  bool operator!=(const Synset& x, const Synset& y)
  {
    return x.id() != y.id();
  }
  
  inline
  bool operator<(const Synset& x, const Synset& y)
  {
    return x.id() < y.id();
  }
  
};

#endif
