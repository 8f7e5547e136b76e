//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "semfield.hpp"
#include "resolver.hpp"

#include <boost/algorithm/string/replace.hpp>

namespace mwn
{
  std::string Semfield::name() const
  {
    return boost::algorithm::replace_all_copy(__english, "_", " ");
  }
  
  const Semfield::synset_set_type& Semfield::synsets() const
  {
    return __resolver->synsets(*this);
  }
  
  const Semfield::semfield_set_type& Semfield::hypers() const
  {
    return __resolver->hypers(*this);
  }
  
  const Semfield::semfield_set_type& Semfield::hypons() const
  {
    return __resolver->hypons(*this);
  }
  
  boost::optional<Semfield> Semfield::normal() const
  {
    return __resolver->normal(*this);
  }
};
