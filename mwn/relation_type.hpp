// -*- mode: c++ -*-
//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __MWN__RELATION_TYPE__HPP__
#define __MWN__RELATION_TYPE__HPP__ 1

//
// (part-of-speech, type code) -> relation name
//

#include <string>
#include <vector>

namespace mwn
{
  struct RelationType
  {
    typedef char        pos_type;
    typedef std::string type_type;
    
    typedef std::vector<type_type, std::allocator<type_type> > type_set_type;

    static const char* HYPERNYM;
    static const char* HYPONYM;
    static const char* ANTONYM;
    static const char* DERIVED_FROM;
    static const char* RELATED_TO;
    static const char* COMPOSED_OF;
    static const char* COMPOSES;
    
    static bool valid(const pos_type& pos, const type_type& type);
    
    // throws domain_error for a type not defined for pos
    static const char* name(const pos_type& pos, const type_type& type);
    static void validate(const pos_type& pos, const type_type& type);
    
    // types carrying source and target lemmas
    static bool is_lexical(const type_type& type);
    
    static type_set_type types(const pos_type& pos);
  };
};

#endif
