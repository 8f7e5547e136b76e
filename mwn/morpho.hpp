// -*- mode: c++ -*-
//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __MWN__MORPHO__HPP__
#define __MWN__MORPHO__HPP__ 1

//
// morphological record of a lemma in an inflection-coded wordnet.
//
// The miscellanea tag is a fixed layout string of ten characters, one feature per
// position, '-' for not applicable, e.g. "v1spia--1-" for a first person singular
// present indicative active verb of the first conjugation. The layout is declared
// per language and consulted by a single decoder.
//

#include <string>
#include <vector>
#include <iostream>

#include <boost/optional.hpp>

namespace mwn
{
  class Morpho
  {
  public:
    typedef std::string language_type;
    typedef std::string string_type;
    
    typedef std::vector<string_type, std::allocator<string_type> > string_set_type;
    typedef std::pair<string_type, string_type>                    form_type;
    typedef std::vector<form_type, std::allocator<form_type> >     form_set_type;
    typedef std::vector<string_type, std::allocator<string_type> > row_type;
    
    enum feature_type {
      PART_OF_SPEECH = 0,
      PERSON,
      DEGREE,
      NUMBER,
      TENSE,
      MOOD,
      VOICE,
      GENDER,
      CASE,
      GROUP,
      STEM,
      FEATURE_SIZE,
    };
    
    static const size_t tag_size = 10;
    
  public:
    Morpho() {}
    // a row of <language>_morpho: id, lemma, pos, principal_parts, irregular_forms,
    // alternative_forms, pronunciation, [script fields], miscellanea
    Morpho(const row_type& row, const language_type& language);
    
  public:
    const language_type& language() const { return __language; }
    const string_type& id() const { return __id; }
    const string_type& lemma() const { return __lemma; }
    const string_type& miscellanea() const { return __miscellanea; }
    const string_type& pronunciation() const { return __pronunciation; }
    
    // pos column, or the one decoded from the tag
    string_type pos() const;
    
    string_set_type principal_parts() const;
    form_set_type   irregular_forms() const { return forms(__irregular_forms); }
    form_set_type   alternative_forms() const { return forms(__alternative_forms); }
    
    // language specific script fields, e.g. "undotted" for Hebrew. empty if absent
    string_type field(const std::string& name) const;
    
    string_type undotted() const { return field("undotted"); }
    string_type dotted_without_dots() const { return field("dotted_without_dots"); }
    string_type variants() const { return field("variants"); }
    string_type translit_dotted() const { return field("translit_dotted"); }
    string_type translit_undotted() const { return field("translit_undotted"); }
    
  public:
    // decoded code for a feature, none if not applicable.
    // throws decoding_error for a malformed tag or a code outside the layout
    boost::optional<char> code(const feature_type& feature) const;
    
    // verbose meaning of the code, e.g. "1st person", empty if not applicable
    string_type meaning(const feature_type& feature) const;
    
    bool is_istem() const
    {
      const boost::optional<char> stem = code(STEM);
      return stem && *stem == 'i';
    }
    
    // Latin dictionary entry, e.g. "amo", "amare", "amavisse", "amatum", "1"
    string_set_type dictionary_form() const;
    
    static const char* feature_name(const feature_type& feature);
    
  public:
    friend
    std::ostream& operator<<(std::ostream& os, const Morpho& x)
    {
      os << x.__miscellanea;
      return os;
    }

  private:
    static form_set_type forms(const string_type& x);
    
  private:
    typedef std::pair<string_type, string_type> field_type;
    typedef std::vector<field_type, std::allocator<field_type> > field_set_type;
    
    language_type __language;
    string_type   __id;
    string_type   __lemma;
    string_type   __pos;
    string_type   __principal_parts;
    string_type   __irregular_forms;
    string_type   __alternative_forms;
    string_type   __pronunciation;
    field_set_type __fields;
    string_type   __miscellanea;
  };
};

#endif
