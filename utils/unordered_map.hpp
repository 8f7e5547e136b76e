// -*- mode: c++ -*-
//
//  Copyright(C) 2012 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __UTILS__UNORDERED_MAP__HPP__
#define __UTILS__UNORDERED_MAP__HPP__ 1

#include <boost/functional/hash.hpp>
#include <boost/unordered_map.hpp>

namespace utils
{
  template <typename _Key, typename _Tp,
	    typename _Hash=boost::hash<_Key>,
	    typename _Pred=std::equal_to<_Key>,
	    typename _Alloc=std::allocator<std::pair<const _Key, _Tp> > >
  struct unordered_map
  {
    typedef boost::unordered_map<_Key,_Tp,_Hash,_Pred,_Alloc> type;
  };
};

#endif
