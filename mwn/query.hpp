// -*- mode: c++ -*-
//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __MWN__QUERY__HPP__
#define __MWN__QUERY__HPP__ 1

//
// a predicate over a single table: selected columns and a conjunction of conditions.
// values are bound by the store, never spliced into a statement.
//

#include <string>
#include <vector>

namespace mwn
{
  class Query
  {
  public:
    typedef std::string column_type;
    typedef std::string value_type;
    
    typedef std::vector<column_type, std::allocator<column_type> > column_set_type;
    typedef std::vector<value_type, std::allocator<value_type> >   value_set_type;
    
    enum operator_type {
      EQUAL,
      LIKE,
      IN,
    };
    
    struct Condition
    {
      column_type    column;
      operator_type  op;
      value_set_type values;
      
      Condition(const column_type& __column, const operator_type& __op)
	: column(__column), op(__op), values() {}
    };
    
    typedef Condition condition_type;
    typedef std::vector<condition_type, std::allocator<condition_type> > condition_set_type;
    
  public:
    Query() : columns(), conditions(), distinct(false) {}

  public:
    Query& select(const column_type& column)
    {
      columns.push_back(column);
      return *this;
    }
    
    Query& where(const column_type& column, const value_type& value)
    {
      conditions.push_back(condition_type(column, EQUAL));
      conditions.back().values.push_back(value);
      return *this;
    }
    
    Query& like(const column_type& column, const value_type& pattern)
    {
      conditions.push_back(condition_type(column, LIKE));
      conditions.back().values.push_back(pattern);
      return *this;
    }
    
    template <typename Iterator>
    Query& in(const column_type& column, Iterator first, Iterator last)
    {
      conditions.push_back(condition_type(column, IN));
      conditions.back().values.insert(conditions.back().values.end(), first, last);
      return *this;
    }

    Query& unique()
    {
      distinct = true;
      return *this;
    }

    // LIKE patterns for the search modes of lemma lookups
    static value_type escape(const value_type& x)
    {
      value_type escaped;
      for (value_type::const_iterator iter = x.begin(); iter != x.end(); ++ iter) {
	if (*iter == '%' || *iter == '_' || *iter == '\\')
	  escaped += '\\';
	escaped += *iter;
      }
      return escaped;
    }
    
  public:
    column_set_type    columns;
    condition_set_type conditions;
    bool               distinct;
  };
};

#endif
