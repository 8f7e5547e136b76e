//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "language.hpp"

namespace mwn
{
  Language::model_type Language::model(const language_type& language)
  {
    // latin lemmas are fully inflection-coded, the rest are indexed by synset
    if (language == "latin")
      return MORPHOLOGY;
    else
      return INDEX;
  }
};
