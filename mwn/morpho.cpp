//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <cctype>

#include "morpho.hpp"
#include "error.hpp"

#include <boost/tokenizer.hpp>

namespace mwn
{
  namespace impl
  {
    struct code_type
    {
      char        code;
      const char* meaning;
    };
    
    struct layout_entry_type
    {
      Morpho::feature_type feature;
      size_t               position;
      const char*          pos;    // parts-of-speech the entry applies to, 0 for all
      const code_type*     codes;
      bool                 open;   // any word character is a code
    };
    
    struct layout_type
    {
      const char*              language;
      const layout_entry_type* entries;
      const char* const*       fields;
    };
    
    static const code_type __pos[] = {
      {'n', "noun"},
      {'v', "verb"},
      {'a', "adjective"},
      {'r', "adverb"},
      {'p', "pronoun"},
      {'u', "punctuation"},
      {'s', "preposition"},
      {'c', "conjunction"},
      {'t', "participle"},
      {0, 0},
    };
    
    static const code_type __person[] = {
      {'1', "1st person"},
      {'2', "2nd person"},
      {'3', "3rd person"},
      {0, 0},
    };
    
    static const code_type __degree[] = {
      {'p', "positive"},
      {'c', "comparative"},
      {'s', "superlative"},
      {0, 0},
    };
    
    static const code_type __number[] = {
      {'s', "singular"},
      {'p', "plural"},
      {0, 0},
    };

    static const code_type __tense[] = {
      {'p', "present"},
      {'f', "future"},
      {'i', "imperfect"},
      {'r', "perfect"},
      {'l', "pluperfect"},
      {'t', "future perfect"},
      {0, 0},
    };

    static const code_type __mood[] = {
      {'n', "infinitive"},
      {'i', "indicative"},
      {'m', "imperative"},
      {'s', "subjunctive"},
      {'p', "participle"},
      {'g', "gerund"},
      {'d', "gerundive"},
      {0, 0},
    };

    static const code_type __voice[] = {
      {'a', "active"},
      {'p', "passive"},
      {'m', "middle"},
      {'d', "deponent"},
      {'s', "semideponent"},
      {0, 0},
    };

    static const code_type __gender[] = {
      {'m', "masculine"},
      {'f', "feminine"},
      {'n', "neuter"},
      {'c', "masculine or feminine"},
      {'a', "masculine or feminine or neuter"},
      {0, 0},
    };
    
    static const code_type __case[] = {
      {'n', "nominative"},
      {'g', "genitive"},
      {'d', "dative"},
      {'a', "accusative"},
      {'b', "ablative"},
      {'v', "vocative"},
      {'l', "locative"},
      {0, 0},
    };

    static const code_type __group_noun[] = {
      {'1', "1st declension"},
      {'2', "2nd declension"},
      {'3', "3rd declension"},
      {'4', "4th declension"},
      {'5', "5th declension"},
      {'-', "indeclinable"},
      {0, 0},
    };

    static const code_type __group_verb[] = {
      {'1', "1st conjugation"},
      {'2', "2nd conjugation"},
      {'3', "3rd conjugation"},
      {'4', "4th conjugation"},
      {0, 0},
    };

    static const code_type __group_adjective[] = {
      {'1', "1st/2nd declension"},
      {'3', "3rd declension"},
      {0, 0},
    };
    
    static const code_type __stem[] = {
      {'i', "i-stem"},
      {0, 0},
    };
    
    static const layout_entry_type __latin[] = {
      {Morpho::PART_OF_SPEECH, 0, 0,    __pos,    false},
      {Morpho::PERSON,         1, "v",  __person, false},
      {Morpho::DEGREE,         1, "ar", __degree, false},
      {Morpho::NUMBER,         2, 0,    __number, false},
      {Morpho::TENSE,          3, 0,    __tense,  false},
      {Morpho::MOOD,           4, 0,    __mood,   false},
      {Morpho::VOICE,          5, 0,    __voice,  false},
      {Morpho::GENDER,         6, 0,    __gender, false},
      {Morpho::CASE,           7, 0,    __case,   false},
      {Morpho::GROUP,          8, "n",  __group_noun, false},
      {Morpho::GROUP,          8, "v",  __group_verb, false},
      {Morpho::GROUP,          8, "a",  __group_adjective, false},
      {Morpho::STEM,           9, 0,    __stem,   true},
      {Morpho::FEATURE_SIZE,   0, 0,    0,        false},
    };
    
    static const char* __fields_none[] = {0};
    static const char* __fields_hebrew[] = {"undotted", "dotted_without_dots", "variants", "translit_dotted", "translit_undotted", 0};
    
    // hebrew tags share the latin positions
    static const layout_type __layouts[] = {
      {"latin",  __latin, __fields_none},
      {"hebrew", __latin, __fields_hebrew},
    };
    
    inline
    const layout_type& layout(const Morpho::language_type& language)
    {
      const size_t size = sizeof(__layouts) / sizeof(layout_type);
      
      for (size_t i = 0; i != size; ++ i)
	if (language == __layouts[i].language)
	  return __layouts[i];
      
      // other wordnets follow the latin conventions
      return __layouts[0];
    }
    
    inline
    const code_type* find(const code_type* codes, const char code)
    {
      for (/**/; codes->code; ++ codes)
	if (codes->code == code)
	  return codes;
      return 0;
    }

    inline
    bool applies(const layout_entry_type& entry, const char pos)
    {
      return ! entry.pos || std::string(entry.pos).find(pos) != std::string::npos;
    }

    inline
    void validate(const std::string& tag)
    {
      bool valid = (tag.size() == Morpho::tag_size);
      for (std::string::const_iterator iter = tag.begin(); valid && iter != tag.end(); ++ iter)
	valid = ! std::isspace(static_cast<unsigned char>(*iter)) && *iter != '\0';
      
      if (! valid)
	throw decoding_error("malformed morphology tag: \"" + tag + "\"");
    }
  };
  
  Morpho::Morpho(const row_type& row, const language_type& language)
    : __language(language)
  {
    if (row.size() < 8)
      throw decoding_error("malformed morphology record for " + language);
    
    __id                = row[0];
    __lemma             = row[1];
    __pos               = row[2];
    __principal_parts   = row[3];
    __irregular_forms   = row[4];
    __alternative_forms = row[5];
    __pronunciation     = row[6];
    __miscellanea       = row.back();
    
    const char* const* names = impl::layout(language).fields;
    for (size_t i = 7; i + 1 < row.size() && *names; ++ i, ++ names)
      __fields.push_back(field_type(*names, row[i]));
  }
  
  Morpho::string_type Morpho::pos() const
  {
    if (! __pos.empty())
      return __pos;
    
    const boost::optional<char> decoded = code(PART_OF_SPEECH);
    return (decoded ? string_type(1, *decoded) : string_type());
  }

  Morpho::string_set_type Morpho::principal_parts() const
  {
    typedef boost::char_separator<char> separator_type;
    typedef boost::tokenizer<separator_type> tokenizer_type;
    
    tokenizer_type tokenizer(__principal_parts, separator_type(" \t"));
    
    return string_set_type(tokenizer.begin(), tokenizer.end());
  }

  Morpho::form_set_type Morpho::forms(const string_type& x)
  {
    typedef boost::char_separator<char> separator_type;
    typedef boost::tokenizer<separator_type> tokenizer_type;
    
    form_set_type forms;
    
    tokenizer_type tokenizer(x, separator_type(" \t"));
    for (tokenizer_type::iterator iter = tokenizer.begin(); iter != tokenizer.end(); ++ iter) {
      const string_type::size_type pos = iter->find('=');
      
      if (pos == string_type::npos)
	forms.push_back(form_type(*iter, string_type()));
      else
	forms.push_back(form_type(iter->substr(0, pos), iter->substr(pos + 1)));
    }
    
    return forms;
  }

  Morpho::string_type Morpho::field(const std::string& name) const
  {
    for (field_set_type::const_iterator fiter = __fields.begin(); fiter != __fields.end(); ++ fiter)
      if (fiter->first == name)
	return fiter->second;
    return string_type();
  }
  
  boost::optional<char> Morpho::code(const feature_type& feature) const
  {
    if (__miscellanea.empty())
      return boost::optional<char>();
    
    impl::validate(__miscellanea);
    
    const char pos = __miscellanea[0];
    
    for (const impl::layout_entry_type* entry = impl::layout(__language).entries; entry->codes; ++ entry) {
      if (entry->feature != feature || ! impl::applies(*entry, pos)) continue;
      
      const char code = __miscellanea[entry->position];
      
      if (impl::find(entry->codes, code))
	return code;
      else if (code == '-')
	return boost::optional<char>();
      else if (entry->open && std::isalnum(static_cast<unsigned char>(code)))
	return code;
      else
	throw decoding_error(std::string("invalid ") + feature_name(feature) + " '" + code + "' in morphology tag: \"" + __miscellanea + "\"");
    }
    
    return boost::optional<char>();
  }
  
  Morpho::string_type Morpho::meaning(const feature_type& feature) const
  {
    const boost::optional<char> decoded = code(feature);
    if (! decoded)
      return string_type();
    
    const char pos = __miscellanea[0];
    
    for (const impl::layout_entry_type* entry = impl::layout(__language).entries; entry->codes; ++ entry)
      if (entry->feature == feature && impl::applies(*entry, pos)) {
	const impl::code_type* found = impl::find(entry->codes, *decoded);
	
	return (found ? string_type(found->meaning) : string_type(1, *decoded));
      }
    
    return string_type();
  }
  
  const char* Morpho::feature_name(const feature_type& feature)
  {
    static const char* names[] = {
      "part-of-speech",
      "person",
      "degree",
      "number",
      "tense",
      "mood",
      "voice",
      "gender",
      "case",
      "group",
      "stem",
    };
    
    return (feature < FEATURE_SIZE ? names[feature] : "");
  }
  
  Morpho::string_set_type Morpho::dictionary_form() const
  {
    string_set_type form(1, __lemma);
    
    if (__language != "latin")
      return form;
    
    const string_set_type parts = principal_parts();
    const string_type     pos   = this->pos();
    
    const boost::optional<char> group  = code(GROUP);
    const boost::optional<char> gender = code(GENDER);
    const string_type group_name(group ? string_type(1, *group) : string_type());
    
    if (pos == "v") {
      if (parts.size() == 3) {
	const char* vowel = (group_name == "1" ? "a" : (group_name == "2" || group_name == "3" ? "e" : "i"));
	const boost::optional<char> voice = code(VOICE);
	
	if (voice && *voice == 'a') {
	  form.push_back(parts[0] + vowel + "re");
	  form.push_back(parts[1] + "isse");
	  form.push_back(parts[2] + "um");
	} else {
	  form.push_back(parts[0] + vowel + "ri");
	  form.push_back(parts[2] + "us sum");
	}
	form.push_back(group_name);
      } else if (parts.size() == 2) {
	form.push_back(parts[0] + "isse");
	form.push_back(parts[1]);
	form.push_back(group_name);
      }
    } else if (pos == "n") {
      if (! parts.empty()) {
	const boost::optional<char> number = code(NUMBER);
	const bool singular = (number && *number == 's');
	
	const char* genitive = 0;
	switch (group ? *group : '5') {
	case '1': genitive = (singular ? "ae" : "arum"); break;
	case '2': genitive = (singular ? "i" : "orum"); break;
	case '3': genitive = (singular ? "is" : "um"); break;
	case '4': genitive = (singular ? "us" : "uum"); break;
	default:  genitive = (singular ? "\xc4\x93i" : "erum"); break;
	}
	
	form.push_back(parts[0] + genitive);
	form.push_back(gender ? string_type(1, *gender) + '.' : string_type());
      }
    } else if (pos == "a") {
      if (! parts.empty()) {
	if (group_name == "1") {
	  form.push_back(parts[0] + "a");
	  form.push_back(parts[0] + "um");
	} else if (group_name == "3" && gender) {
	  switch (*gender) {
	  case 'm': // three terminations
	    form.push_back(parts[0] + "is");
	    form.push_back(parts[0] + "e");
	    form.push_back("m.f.n.");
	    break;
	  case 'c': // two terminations
	    form.push_back(parts[0] + "e");
	    form.push_back("mf.n.");
	    break;
	  case 'a': // one termination
	    form.push_back("mfn.");
	    break;
	  }
	}
      }
    }
    
    return form;
  }
};
