// -*- mode: c++ -*-
//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __MWN__LANGUAGE__HPP__
#define __MWN__LANGUAGE__HPP__ 1

#include <string>

namespace mwn
{
  // language names are the lower-cased English names used as store prefixes,
  // "english", "italian", "latin" etc. "common" is the shared reference space.
  struct Language
  {
    typedef std::string language_type;

    // how lemmas are stored for a language
    enum model_type {
      INDEX,       // <L>_index rows of synset ids per part-of-speech
      MORPHOLOGY,  // <L>_morpho rows keyed by lemma, id and tag string
    };
    
    static const char* reference() { return "english"; }
    static const char* common() { return "common"; }

    static model_type model(const language_type& language);
    
    static bool is_morphology(const language_type& language)
    {
      return model(language) == MORPHOLOGY;
    }
  };
};

#endif
