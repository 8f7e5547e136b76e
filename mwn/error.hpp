// -*- mode: c++ -*-
//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __MWN__ERROR__HPP__
#define __MWN__ERROR__HPP__ 1

#include <string>
#include <vector>
#include <stdexcept>

namespace mwn
{
  // a uniqueness-required lookup matched more than one candidate
  class disambiguation_error : public std::runtime_error
  {
  public:
    typedef std::vector<std::string, std::allocator<std::string> > candidate_set_type;
    
  public:
    disambiguation_error(const std::string& key, const candidate_set_type& candidates)
      : std::runtime_error(message(key, candidates)), __key(key), __candidates(candidates) {}
    virtual ~disambiguation_error() throw() {}
    
    const std::string& key() const { return __key; }
    const candidate_set_type& candidates() const { return __candidates; }
    
  private:
    static std::string message(const std::string& key, const candidate_set_type& candidates)
    {
      std::string msg = "cannot disambiguate \"" + key + "\" between ";
      
      candidate_set_type::const_iterator citer_end = candidates.end();
      for (candidate_set_type::const_iterator citer = candidates.begin(); citer != citer_end; ++ citer) {
	if (citer != candidates.begin())
	  msg += ", ";
	msg += '"' + *citer + '"';
      }
      return msg;
    }
    
  private:
    std::string        __key;
    candidate_set_type __candidates;
  };

  // malformed identifier or tag string
  class decoding_error : public std::runtime_error
  {
  public:
    decoding_error(const std::string& x) : std::runtime_error(x) {}
  };

  // relation type requested for a part-of-speech which does not define it
  class domain_error : public std::domain_error
  {
  public:
    domain_error(const std::string& x) : std::domain_error(x) {}
  };
  
  // storage engine faults, never retried
  class store_error : public std::runtime_error
  {
  public:
    store_error(const std::string& x) : std::runtime_error(x) {}
  };
};

#endif
