//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "relation_type.hpp"
#include "pos.hpp"
#include "error.hpp"

namespace mwn
{
  const char* RelationType::HYPERNYM     = "@";
  const char* RelationType::HYPONYM      = "~";
  const char* RelationType::ANTONYM      = "!";
  const char* RelationType::DERIVED_FROM = "\\";
  const char* RelationType::RELATED_TO   = "/";
  const char* RelationType::COMPOSED_OF  = "+c";
  const char* RelationType::COMPOSES     = "-c";

  const POS::pos_type POS::NOUN;
  const POS::pos_type POS::VERB;
  const POS::pos_type POS::ADJECTIVE;
  const POS::pos_type POS::ADVERB;
  const POS::pos_type POS::WILDCARD;
  
  namespace impl
  {
    struct relation_name_type
    {
      const char* type;
      const char* name;
    };

    static const relation_name_type __noun[] = {
      {"!",  "antonym (lexical)"},
      {"@",  "hypernym"},
      {"~",  "hyponym"},
      {"#m", "member-of"},
      {"#s", "substance-of"},
      {"#p", "part-of"},
      {"%m", "has-member"},
      {"%s", "has-substance"},
      {"%p", "has-part"},
      {"=",  "attribute"},
      {"|",  "nearest"},
      {"+r", "has-role"},
      {"-r", "is-role-of"},
      {"+c", "composed-of (lexical)"},
      {"-c", "composes (lexical)"},
      {"\\", "derived-from (lexical)"},
      {"/",  "related-to (lexical)"},
      {0, 0},
    };
    
    static const relation_name_type __verb[] = {
      {"!",  "antonym (lexical)"},
      {"@",  "hypernym"},
      {"~",  "hyponym"},
      {"*",  "entailment"},
      {">",  "causes"},
      {"^",  "also-see"},
      {"$",  "verb-group"},
      {"|",  "nearest"},
      {"+c", "composed-of (lexical)"},
      {"-c", "composes (lexical)"},
      {"\\", "derived-from (lexical)"},
      {"/",  "related-to (lexical)"},
      {0, 0},
    };

    static const relation_name_type __adjective[] = {
      {"!",  "antonym (lexical)"},
      {"@",  "hypernym"},
      {"~",  "hyponym"},
      {"&",  "similar-to"},
      {"<",  "participle (lexical)"},
      {"\\", "pertains-to (lexical)"},
      {"=",  "is-value-of"},
      {"^",  "also-see"},
      {"|",  "nearest"},
      {"+c", "composed-of (lexical)"},
      {"-c", "composes (lexical)"},
      {"/",  "related-to (lexical)"},
      {0, 0},
    };
    
    static const relation_name_type __adverb[] = {
      {"!",  "antonym (lexical)"},
      {"@",  "hypernym"},
      {"~",  "hyponym"},
      {"\\", "derived-from (lexical)"},
      {"|",  "nearest"},
      {"+c", "composed-of (lexical)"},
      {"-c", "composes (lexical)"},
      {"/",  "related-to (lexical)"},
      {0, 0},
    };

    inline
    const relation_name_type* table(const RelationType::pos_type& pos)
    {
      switch (pos) {
      case POS::NOUN:      return __noun;
      case POS::VERB:      return __verb;
      case POS::ADJECTIVE: return __adjective;
      case POS::ADVERB:    return __adverb;
      default:             return 0;
      }
    }
    
    inline
    const char* find(const RelationType::pos_type& pos, const RelationType::type_type& type)
    {
      const relation_name_type* names = table(pos);
      if (! names) return 0;
      
      for (/**/; names->type; ++ names)
	if (type == names->type)
	  return names->name;
      return 0;
    }
  };
  
  bool RelationType::valid(const pos_type& pos, const type_type& type)
  {
    return impl::find(pos, type) != 0;
  }
  
  const char* RelationType::name(const pos_type& pos, const type_type& type)
  {
    const char* found = impl::find(pos, type);
    if (! found)
      throw domain_error("no relation type '" + type + "' for '" + std::string(1, pos) + "'");
    return found;
  }

  void RelationType::validate(const pos_type& pos, const type_type& type)
  {
    name(pos, type);
  }
  
  bool RelationType::is_lexical(const type_type& type)
  {
    return (type == ANTONYM || type == DERIVED_FROM || type == RELATED_TO
	    || type == COMPOSED_OF || type == COMPOSES || type == "<");
  }
  
  RelationType::type_set_type RelationType::types(const pos_type& pos)
  {
    type_set_type types;
    
    const impl::relation_name_type* names = impl::table(pos);
    if (names)
      for (/**/; names->type; ++ names)
	types.push_back(names->type);
    
    return types;
  }
};
