//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <cctype>

#include "identifier.hpp"
#include "language.hpp"
#include "error.hpp"

namespace mwn
{
  namespace impl
  {
    struct marker_type
    {
      char        marker;
      const char* language;
    };
    
    static const marker_type __markers[] = {
      {'N', "italian"},
      {'W', "italian"},
      {'Y', "italian"},
      {'H', "hebrew"},
      {'S', "spanish"},
      {'L', "latin"},
      {'R', "romanian"},
      // portuguese synsets are stored with the english wordnet
      {'P', "english"},
    };

    static const size_t __markers_size = sizeof(__markers) / sizeof(marker_type);
    
    inline
    void check(const Identifier::id_type& id)
    {
      if (id.size() < 3)
	throw decoding_error("synset identifier too short: \"" + id + "\"");
      if (id[0] != 'n' && id[0] != 'v' && id[0] != 'a' && id[0] != 'r')
	throw decoding_error("invalid part-of-speech in synset identifier: \"" + id + "\"");
      if (id[1] != Identifier::separator)
	throw decoding_error("no separator in synset identifier: \"" + id + "\"");
    }
  };
  
  Identifier::language_type Identifier::language(const id_type& id)
  {
    impl::check(id);
    
    const char marker = id[2];
    
    if (std::isdigit(static_cast<unsigned char>(marker)))
      return Language::reference();
    
    for (size_t i = 0; i != impl::__markers_size; ++ i)
      if (impl::__markers[i].marker == marker)
	return impl::__markers[i].language;
    
    throw decoding_error("unknown language marker '" + std::string(1, marker) + "' in synset identifier: \"" + id + "\"");
  }
  
  Identifier::pos_type Identifier::pos(const id_type& id)
  {
    impl::check(id);
    
    return id[0];
  }
  
  std::string Identifier::offset(const id_type& id)
  {
    impl::check(id);
    
    return id.substr(2);
  }
  
  bool Identifier::valid(const id_type& id)
  {
    try {
      language(id);
      return true;
    }
    catch (const decoding_error&) {
      return false;
    }
  }
};
