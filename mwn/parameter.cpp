//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#define BOOST_SPIRIT_THREADSAFE
#define PHOENIX_THREADSAFE

#include <stdexcept>
#include <iterator>

#include "parameter.hpp"

#include <boost/spirit/include/qi.hpp>
#include <boost/spirit/include/karma.hpp>

#include <boost/fusion/include/std_pair.hpp>

namespace mwn
{
  typedef std::pair<std::string, std::string> value_parsed_type;
  typedef std::vector<value_parsed_type, std::allocator<value_parsed_type> > value_parsed_set_type;
  
  typedef std::pair<std::string, value_parsed_set_type> parameter_parsed_type;

  template <typename Iterator>
  struct parameter_parser : boost::spirit::qi::grammar<Iterator, parameter_parsed_type(), boost::spirit::standard::space_type>
  {
    parameter_parser() : parameter_parser::base_type(parameter)
    {
      namespace qi = boost::spirit::qi;
      namespace standard = boost::spirit::standard;
      
      escaped %= qi::lexeme['\"' >> *(('\\' >> standard::char_) | (standard::char_ - '\"')) >> '\"'];
      
      param %= qi::lexeme[+(standard::char_ - standard::space - ':')];
      key   %= qi::lexeme[+(standard::char_ - standard::space - '=' - ',')];
      value %= qi::lexeme[+(standard::char_ - standard::space - ',')];
      key_values %= ((escaped | key) >> '=' >> (escaped | value)) % ',';
      parameter %= (escaped | param) >> -(':' >> key_values);
    }
    
    typedef boost::spirit::standard::space_type space_type;
    
    boost::spirit::qi::rule<Iterator, std::string(), space_type>           escaped;
    boost::spirit::qi::rule<Iterator, std::string(), space_type>           param;
    boost::spirit::qi::rule<Iterator, std::string(), space_type>           key;
    boost::spirit::qi::rule<Iterator, std::string(), space_type>           value;
    boost::spirit::qi::rule<Iterator, value_parsed_set_type(), space_type> key_values;
    boost::spirit::qi::rule<Iterator, parameter_parsed_type(), space_type> parameter;
  };
  
  void Parameter::parse(const std::string& parameter)
  {
    typedef std::string::const_iterator iter_type;
    typedef parameter_parser<iter_type> parser_type;
    
    __attr.clear();
    __values.clear();
    
    parser_type parser;
    parameter_parsed_type parsed;

    iter_type iter     = parameter.begin();
    iter_type iter_end = parameter.end();
    
    const bool result = boost::spirit::qi::phrase_parse(iter, iter_end, parser, boost::spirit::standard::space, parsed);
    
    if (! result || iter != iter_end)
      throw std::runtime_error(std::string("parameter parsing failed: ") + parameter);
    
    __attr = parsed.first;
    __values.insert(__values.end(), parsed.second.begin(), parsed.second.end());
  }

  template <typename Iterator>
  struct parameter_generator : boost::spirit::karma::grammar<Iterator, std::string()>
  {
    parameter_generator() : parameter_generator::base_type(escaped)
    {
      namespace standard = boost::spirit::standard;
      
      escapes.add('\"', "\\\"")('\\', "\\\\");
      
      escaped %= '\"' << *(escapes | standard::char_) << '\"';
      value   %= escaped << '=' << escaped;
    }
    
    boost::spirit::karma::symbols<char, const char*> escapes;
    
    boost::spirit::karma::rule<Iterator, std::string()>       escaped;
    boost::spirit::karma::rule<Iterator, value_parsed_type()> value;
  };
  
  std::ostream& operator<<(std::ostream& os, const Parameter& x)
  {
    typedef std::ostream_iterator<char> iterator_type;
    typedef parameter_generator<iterator_type> generator_type;
    
    generator_type generator;
    
    iterator_type iter(os);
    if (! boost::spirit::karma::generate(iter, generator.escaped, x.__attr))
      throw std::runtime_error("parameter generation failed");
    
    if (! x.__values.empty()) {
      os << ':';
      if (! boost::spirit::karma::generate(iter, generator.value % ',', x.__values))
	throw std::runtime_error("parameter generation failed");
    }
    
    return os;
  }
};
