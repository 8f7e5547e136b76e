// -*- mode: c++ -*-
//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __MWN__RELATION__HPP__
#define __MWN__RELATION__HPP__ 1

#include <string>
#include <iostream>

#include <boost/optional.hpp>

namespace mwn
{
  class Resolver;
  class Synset;
  class Lemma;
  
  class Relation
  {
  public:
    typedef std::string id_type;
    typedef std::string type_type;
    typedef std::string form_type;
    typedef std::string language_type;
    
    typedef Resolver resolver_type;
    
  public:
    Relation() : __resolver(0) {}
    // language is the table the edge was read from, "common" or a wordnet.
    // view is the wordnet through which source and target synsets are resolved
    Relation(const type_type& type,
	     const id_type& id_source,
	     const id_type& id_target,
	     const form_type& w_source,
	     const form_type& w_target,
	     const std::string& status,
	     const language_type& language,
	     const language_type& view,
	     const resolver_type* resolver);
    
  public:
    const type_type& type() const { return __type; }
    const id_type& id_source() const { return __id_source; }
    const id_type& id_target() const { return __id_target; }
    
    // empty for conceptual relations
    const form_type& form_source() const { return __w_source; }
    const form_type& form_target() const { return __w_target; }
    
    const language_type& language() const { return __language; }
    const language_type& view() const { return __view; }
    
    // "new" for edges added by the wordnet, empty otherwise
    const std::string& status() const { return __status; }
    bool is_new() const { return ! __status.empty(); }
    
    bool is_lexical() const { return ! __w_source.empty() && ! __w_target.empty(); }
    
    // throws domain_error if the type is not defined for the source part-of-speech
    const char* type_name() const;
    
    boost::optional<Synset> source() const;
    boost::optional<Synset> target() const;
    
    boost::optional<Lemma> w_source() const;
    boost::optional<Lemma> w_target() const;
    
  public:
    friend
    std::ostream& operator<<(std::ostream& os, const Relation& x)
    {
      os << x.__type << ' ' << x.__id_source << ' ' << x.__id_target;
      if (x.is_lexical())
	os << ' ' << x.__w_source << ' ' << x.__w_target;
      if (x.is_new())
	os << ' ' << x.__status;
      return os;
    }
    
  private:
    type_type     __type;
    id_type       __id_source;
    id_type       __id_target;
    form_type     __w_source;
    form_type     __w_target;
    std::string   __status;
    language_type __language;
    language_type __view;
    
    const resolver_type* __resolver;
  };
  
  inline
  bool operator==(const Relation& x, const Relation& y)
  {
    return (x.type() == y.type()
	    && x.id_source() == y.id_source()
	    && x.id_target() == y.id_target()
	    && x.form_source() == y.form_source()
	    && x.form_target() == y.form_target());
  }
  
  inline
  bool operator!=(const Relation& x, const Relation& y)
  {
    return ! (x == y);
  }
};

#endif
