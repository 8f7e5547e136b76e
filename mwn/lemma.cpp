//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <algorithm>
#include <iterator>

#include "lemma.hpp"
#include "synset.hpp"
#include "relation_type.hpp"
#include "resolver.hpp"

#include <boost/algorithm/string/replace.hpp>

namespace mwn
{
  namespace impl
  {
    inline
    Lemma::lemma_set_type filter(const Lemma::lemma_set_type& lemmas, const std::string& pos)
    {
      Lemma::lemma_set_type filtered;
      
      Lemma::lemma_set_type::const_iterator liter_end = lemmas.end();
      for (Lemma::lemma_set_type::const_iterator liter = lemmas.begin(); liter != liter_end; ++ liter)
	if (pos.find(liter->pos()) != std::string::npos)
	  filtered.push_back(*liter);
      
      return filtered;
    }
  };
  
  std::string Lemma::text() const
  {
    return boost::algorithm::replace_all_copy(__form, "_", " ");
  }
  
  const Lemma::synset_set_type& Lemma::synsets() const
  {
    return __resolver->synsets(*this);
  }
  
  const Lemma::lemma_set_type& Lemma::synonyms() const
  {
    return __resolver->synonyms(*this);
  }
  
  Lemma::lemma_set_type Lemma::derivates(const std::string& pos) const
  {
    return impl::filter(__resolver->lexical(*this, RelationType::DERIVED_FROM, false), pos);
  }
  
  Lemma::lemma_set_type Lemma::relatives(const std::string& pos) const
  {
    return impl::filter(__resolver->lexical(*this, RelationType::RELATED_TO, true), pos);
  }
  
  const Lemma::lemma_set_type& Lemma::antonyms() const
  {
    return __resolver->lexical(*this, RelationType::ANTONYM, true);
  }
  
  const Lemma::lemma_set_type& Lemma::composed_of() const
  {
    return __resolver->lexical(*this, RelationType::COMPOSED_OF, true);
  }
  
  const Lemma::lemma_set_type& Lemma::composes() const
  {
    return __resolver->lexical(*this, RelationType::COMPOSES, true);
  }
  
  Lemma::lemma_set_type Lemma::compounds() const
  {
    const lemma_set_type& composed_of = this->composed_of();
    const lemma_set_type& composes = this->composes();
    
    lemma_set_type compounds;
    std::set_union(composed_of.begin(), composed_of.end(), composes.begin(), composes.end(), std::back_inserter(compounds));
    
    return compounds;
  }
  
  boost::optional<Lemma::morpho_type> Lemma::morpho() const
  {
    return __resolver->morpho(*this);
  }
};
