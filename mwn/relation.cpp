//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "relation.hpp"
#include "relation_type.hpp"
#include "identifier.hpp"
#include "resolver.hpp"

namespace mwn
{
  Relation::Relation(const type_type& type,
		     const id_type& id_source,
		     const id_type& id_target,
		     const form_type& w_source,
		     const form_type& w_target,
		     const std::string& status,
		     const language_type& language,
		     const language_type& view,
		     const resolver_type* resolver)
    : __type(type),
      __id_source(id_source),
      __id_target(id_target),
      __w_source(w_source),
      __w_target(w_target),
      __status(status == "new" || status == "NEW" ? "new" : ""),
      __language(language),
      __view(view),
      __resolver(resolver) {}
  
  const char* Relation::type_name() const
  {
    return RelationType::name(Identifier::pos(__id_source), __type);
  }
  
  boost::optional<Synset> Relation::source() const
  {
    return __resolver->synset(__id_source, __view);
  }
  
  boost::optional<Synset> Relation::target() const
  {
    return __resolver->synset(__id_target, __view);
  }
  
  boost::optional<Lemma> Relation::w_source() const
  {
    if (__w_source.empty())
      return boost::optional<Lemma>();
    
    return Lemma(__w_source, Identifier::pos(__id_source), __view, __resolver);
  }
  
  boost::optional<Lemma> Relation::w_target() const
  {
    if (__w_target.empty())
      return boost::optional<Lemma>();
    
    return Lemma(__w_target, Identifier::pos(__id_target), __view, __resolver);
  }
};
