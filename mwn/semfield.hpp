// -*- mode: c++ -*-
//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __MWN__SEMFIELD__HPP__
#define __MWN__SEMFIELD__HPP__ 1

//
// a node of the semantic field hierarchy shared by all wordnets.
// (english, code) identifies a field, english alone may be ambiguous.
//

#include <string>
#include <vector>
#include <iostream>

#include <boost/optional.hpp>
#include <boost/functional/hash.hpp>

namespace mwn
{
  class Resolver;
  class Synset;
  
  class Semfield
  {
  public:
    typedef std::string english_type;
    typedef std::string code_type;
    typedef std::string language_type;
    
    typedef Resolver resolver_type;
    
    typedef std::vector<Synset, std::allocator<Synset> >     synset_set_type;
    typedef std::vector<Semfield, std::allocator<Semfield> > semfield_set_type;
    
  public:
    Semfield() : __resolver(0) {}
    Semfield(const english_type& english, const code_type& code, const language_type& language, const resolver_type* resolver)
      : __english(english), __code(code), __language(language), __resolver(resolver) {}
    
  public:
    const english_type& english() const { return __english; }
    const code_type& code() const { return __code; }
    const language_type& language() const { return __language; }
    
    // english name with spaces
    std::string name() const;
    
    const synset_set_type&   synsets() const;
    const semfield_set_type& hypers() const;
    const semfield_set_type& hypons() const;
    
    // the basic level category
    boost::optional<Semfield> normal() const;
    
    const resolver_type* resolver() const { return __resolver; }
    
  public:
    friend
    size_t hash_value(const Semfield& x)
    {
      size_t seed = 0;
      boost::hash_combine(seed, x.__english);
      boost::hash_combine(seed, x.__code);
      return seed;
    }
    
    friend
    std::ostream& operator<<(std::ostream& os, const Semfield& x)
    {
      os << x.__english;
      return os;
    }
    
  private:
    english_type  __english;
    code_type     __code;
    language_type __language;
    
    const resolver_type* __resolver;
  };
  
  inline
  bool operator==(const Semfield& x, const Semfield& y)
  {
    return x.english() == y.english() && x.code() == y.code();
  }
  
  inline
  bool operator!=(const Semfield& x, const Semfield& y)
  {
    return ! (x == y);
  }
  
  inline
  bool operator<(const Semfield& x, const Semfield& y)
  {
    return (x.english() < y.english() || (!(y.english() < x.english()) && x.code() < y.code()));
  }
};

#endif
