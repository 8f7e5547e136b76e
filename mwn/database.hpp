// -*- mode: c++ -*-
//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __MWN__DATABASE__HPP__
#define __MWN__DATABASE__HPP__ 1

//
// backing store accessor: (language, table) -> rows or absent.
// Missing tables are never an error, malformed queries or engine faults are.
//

#include <string>
#include <vector>

#include <mwn/query.hpp>

namespace mwn
{
  class Database
  {
  public:
    typedef std::string language_type;
    typedef std::string table_type;
    
    typedef Query query_type;
    
    typedef std::vector<std::string, std::allocator<std::string> > row_type;
    typedef std::vector<row_type, std::allocator<row_type> >       row_set_type;
    
  public:
    Database() : debug(0) {}
    virtual ~Database() {}
    
  private:
    Database(const Database& x) {}
    Database& operator=(const Database& x) { return *this; }
    
  public:
    static Database&   create(const std::string& parameter);
    static const char* lists();
    
  public:
    // true if <language>_<table> is present
    virtual bool exists(const language_type& language, const table_type& table) const = 0;
    
    // false if the table is absent, rows are cleared in any case. NULL columns are empty
    virtual bool query(const language_type& language, const table_type& table, const query_type& query, row_set_type& rows) const = 0;
    
    const std::string& algorithm() const { return __algorithm; }
    
  public:
    int debug;

  private:
    std::string __algorithm;
  };
};

#endif
