//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <algorithm>

#include "synset.hpp"
#include "identifier.hpp"
#include "relation_type.hpp"
#include "resolver.hpp"
#include "traversal.hpp"

namespace mwn
{
  Synset::language_type Synset::origin() const
  {
    return Identifier::language(__id);
  }
  
  const Synset::lemma_set_type& Synset::lemmas() const
  {
    return __resolver->lemmas(*this);
  }

  const Synset::lemma_set_type& Synset::phrases() const
  {
    return __resolver->phrases(*this);
  }
  
  const Synset::semfield_set_type& Synset::semfields() const
  {
    return __resolver->semfields(*this);
  }
  
  const Synset::relation_set_type& Synset::relations() const
  {
    return __resolver->relations(*this);
  }
  
  Synset::relation_set_type Synset::relations(const type_type& type) const
  {
    RelationType::validate(pos(), type);
    
    const relation_set_type& relations = this->relations();
    
    relation_set_type typed;
    relation_set_type::const_iterator riter_end = relations.end();
    for (relation_set_type::const_iterator riter = relations.begin(); riter != riter_end; ++ riter)
      if (riter->type() == type)
	typed.push_back(*riter);
    
    return typed;
  }
  
  boost::optional<Synset::type_type> Synset::relation_to(const Synset& target) const
  {
    const relation_set_type& relations = this->relations();
    
    relation_set_type::const_iterator riter_end = relations.end();
    for (relation_set_type::const_iterator riter = relations.begin(); riter != riter_end; ++ riter)
      if (riter->id_target() == target.id())
	return riter->type();
    
    return boost::optional<type_type>();
  }
  
  Synset::synset_set_type Synset::hypernyms() const
  {
    const relation_set_type& relations = this->relations();
    
    synset_set_type hypernyms;
    relation_set_type::const_iterator riter_end = relations.end();
    for (relation_set_type::const_iterator riter = relations.begin(); riter != riter_end; ++ riter) {
      if (riter->type() != RelationType::HYPERNYM) continue;
      
      const boost::optional<Synset> target = riter->target();
      
      if (target && std::find(hypernyms.begin(), hypernyms.end(), *target) == hypernyms.end())
	hypernyms.push_back(*target);
    }
    
    return hypernyms;
  }
  
  Closure Synset::closure(const type_type& type, const int depth) const
  {
    return Closure(*this, type, depth);
  }
  
  int Synset::max_depth() const
  {
    return mwn::max_depth(*this);
  }
  
  int Synset::min_depth() const
  {
    return mwn::min_depth(*this);
  }
  
  Synset::synset_set_type Synset::roots() const
  {
    return mwn::roots(*this);
  }
  
  Synset::path_set_type Synset::paths_to_root() const
  {
    return mwn::paths_to_root(*this);
  }
};
