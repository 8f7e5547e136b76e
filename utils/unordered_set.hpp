// -*- mode: c++ -*-
//
//  Copyright(C) 2012-2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __UTILS__UNORDERED_SET__HPP__
#define __UTILS__UNORDERED_SET__HPP__ 1

#include <boost/functional/hash.hpp>
#include <boost/unordered_set.hpp>

namespace utils
{
  template <typename _Value,
	    typename _Hash=boost::hash<_Value>,
	    typename _Pred=std::equal_to<_Value>,
	    typename _Alloc=std::allocator<_Value > >
  struct unordered_set
  {
    typedef boost::unordered_set<_Value,_Hash,_Pred,_Alloc> type;
  };
};

#endif
