// -*- mode: c++ -*-
//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __MWN__DATABASE__SQLITE__HPP__
#define __MWN__DATABASE__SQLITE__HPP__ 1

#include <string>

#include <mwn/database.hpp>

#include <utils/unordered_map.hpp>

#include <boost/filesystem/path.hpp>
#include <boost/shared_ptr.hpp>

struct sqlite3;

namespace mwn
{
  namespace database
  {
    class SQLite : public mwn::Database
    {
    public:
      typedef boost::filesystem::path path_type;
      
      enum layout_type {
	DIRECTORY,
	SINGLE,
      };
      
    private:
      struct Connection
      {
	Connection(const path_type& path);
	~Connection();
	
	sqlite3* db;
      };
      
      typedef Connection connection_type;
      typedef boost::shared_ptr<connection_type> connection_ptr_type;
      
      // resolved table name in a connection, empty name for an absent table
      struct Table
      {
	connection_ptr_type connection;
	std::string         name;
      };
      
      typedef Table table_entry_type;
      
      typedef utils::unordered_map<std::string, connection_ptr_type, boost::hash<std::string>, std::equal_to<std::string>,
				   std::allocator<std::pair<const std::string, connection_ptr_type> > >::type connection_map_type;
      typedef utils::unordered_map<std::string, table_entry_type, boost::hash<std::string>, std::equal_to<std::string>,
				   std::allocator<std::pair<const std::string, table_entry_type> > >::type table_map_type;
      
    public:
      SQLite(const path_type& path, const layout_type layout)
	: __path(path), __layout(layout), connections(), tables() {}
      
    public:
      bool exists(const language_type& language, const table_type& table) const;
      bool query(const language_type& language, const table_type& table, const query_type& query, row_set_type& rows) const;
      
      const path_type& path() const { return __path; }
      
    private:
      const table_entry_type& resolve(const language_type& language, const table_type& table) const;
      connection_ptr_type connect(const path_type& path) const;
      
    private:
      path_type   __path;
      layout_type __layout;
      
      mutable connection_map_type connections;
      mutable table_map_type      tables;
    };
  };
};

#endif
