// -*- mode: c++ -*-
//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __MWN__PARAMETER__HPP__
#define __MWN__PARAMETER__HPP__ 1

//
// name:key=value,key="quoted value"
//

#include <string>
#include <vector>
#include <iostream>

namespace mwn
{
  struct Parameter
  {
  public:
    typedef std::string attribute_type;
    typedef std::string key_type;
    typedef std::pair<std::string, std::string> value_type;

  private:
    typedef std::vector<value_type, std::allocator<value_type> > value_set_type;

  public:
    typedef value_set_type::size_type      size_type;
    typedef value_set_type::const_iterator const_iterator;
      
  public:
    Parameter() : __attr(), __values() {}
    explicit Parameter(const std::string& parameter) : __attr(), __values() { parse(parameter); }
    
    const attribute_type& name() const { return __attr; }
    attribute_type& name() { return __attr; }
    
    void push_back(const value_type& x) { __values.push_back(x); }
    
    const_iterator begin() const { return __values.begin(); }
    const_iterator end() const { return __values.end(); }
    
    bool empty() const { return __values.empty(); }
    size_type size() const { return __values.size(); }
    
    const_iterator find(const key_type& key) const
    {
      for (const_iterator iter = begin(); iter != end(); ++ iter)
	if (iter->first == key)
	  return iter;
      return end();
    }
    
  public:
    // every field is printed quoted
    friend
    std::ostream& operator<<(std::ostream& os, const Parameter& x);
    
  private:
    void parse(const std::string& parameter);
    
  private:
    attribute_type __attr;
    value_set_type __values;
  };
};

#endif
