// -*- mode: c++ -*-
//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __MWN__IDENTIFIER__HPP__
#define __MWN__IDENTIFIER__HPP__ 1

//
// synset identifier: [nvar]#<offset>
//
// The leading character of the offset is either a digit, meaning the synset was
// defined in the reference (English) wordnet, or a marker naming the wordnet which
// minted it, e.g. n#N0012345 for an Italian synset.
//

#include <string>

namespace mwn
{
  struct Identifier
  {
    typedef std::string id_type;
    typedef std::string language_type;
    typedef char        pos_type;
    
    static const char separator = '#';

    // pure, throws decoding_error for malformed ids or unknown markers
    static language_type language(const id_type& id);
    
    static pos_type    pos(const id_type& id);
    static std::string offset(const id_type& id);
    
    static bool valid(const id_type& id);
  };
};

#endif
