// -*- mode: c++ -*-
//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __MWN__POS__HPP__
#define __MWN__POS__HPP__ 1

#include <string>

namespace mwn
{
  // part-of-speech codes shared by synset identifiers, index columns and relations
  struct POS
  {
    typedef char pos_type;
    
    static const pos_type NOUN      = 'n';
    static const pos_type VERB      = 'v';
    static const pos_type ADJECTIVE = 'a';
    static const pos_type ADVERB    = 'r';
    static const pos_type WILDCARD  = '*';
    
    static const char* all() { return "nvar"; }

    static bool is_concrete(const pos_type& pos)
    {
      return pos == NOUN || pos == VERB || pos == ADJECTIVE || pos == ADVERB;
    }
    
    // position in the n, v, a, r ordering of index columns, -1 for others
    static int index(const pos_type& pos)
    {
      switch (pos) {
      case NOUN:      return 0;
      case VERB:      return 1;
      case ADJECTIVE: return 2;
      case ADVERB:    return 3;
      default:        return -1;
      }
    }

    static std::string column(const pos_type& pos)
    {
      return std::string("id_") + pos;
    }
    
    static const char* name(const pos_type& pos)
    {
      switch (pos) {
      case NOUN:      return "noun";
      case VERB:      return "verb";
      case ADJECTIVE: return "adjective";
      case ADVERB:    return "adverb";
      case WILDCARD:  return "*";
      default:        return "";
      }
    }
  };
};

#endif
