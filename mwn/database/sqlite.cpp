//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <iostream>

#include <sqlite3.h>

#include "sqlite.hpp"

#include <mwn/error.hpp>

#include <boost/filesystem/operations.hpp>

namespace mwn
{
  namespace database
  {
    struct __sqlite_statement
    {
      __sqlite_statement(sqlite3* db, const std::string& sql) : stmt(0)
      {
	if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, 0) != SQLITE_OK)
	  throw store_error(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db) + ": " + sql);
      }
      ~__sqlite_statement() { sqlite3_finalize(stmt); }

      sqlite3_stmt* operator->() { return stmt; }
      sqlite3_stmt* get() { return stmt; }
      
      sqlite3_stmt* stmt;
    };

    inline
    bool __is_identifier(const std::string& x)
    {
      if (x.empty()) return false;
      
      for (std::string::const_iterator iter = x.begin(); iter != x.end(); ++ iter)
	if (! (('a' <= *iter && *iter <= 'z') || ('A' <= *iter && *iter <= 'Z') || ('0' <= *iter && *iter <= '9') || *iter == '_'))
	  return false;
      return true;
    }

    inline
    const std::string& __identifier(const std::string& x)
    {
      if (! __is_identifier(x))
	throw store_error("invalid identifier in query: \"" + x + "\"");
      return x;
    }

    SQLite::Connection::Connection(const path_type& path) : db(0)
    {
      if (sqlite3_open_v2(path.string().c_str(), &db, SQLITE_OPEN_READONLY, 0) != SQLITE_OK) {
	const std::string error = (db ? sqlite3_errmsg(db) : "out of memory");
	sqlite3_close(db);
	db = 0;
	
	throw store_error("sqlite open failed: " + path.string() + ": " + error);
      }
    }
    
    SQLite::Connection::~Connection()
    {
      if (db)
	sqlite3_close(db);
    }

    SQLite::connection_ptr_type SQLite::connect(const path_type& path) const
    {
      connection_map_type::iterator iter = connections.find(path.string());
      if (iter == connections.end()) {
	connection_ptr_type connection;
	
	if (boost::filesystem::exists(path))
	  connection.reset(new connection_type(path));
	
	iter = connections.insert(std::make_pair(path.string(), connection)).first;
      }
      return iter->second;
    }
    
    const SQLite::table_entry_type& SQLite::resolve(const language_type& language, const table_type& table) const
    {
      const std::string prefixed = __identifier(language) + '_' + __identifier(table);
      
      table_map_type::iterator iter = tables.find(prefixed);
      if (iter != tables.end())
	return iter->second;
      
      table_entry_type entry;
      
      if (__layout == DIRECTORY)
	entry.connection = connect(__path / language / (prefixed + ".db"));
      else
	entry.connection = connect(__path);
      
      if (entry.connection) {
	// stores compiled from the distributed dumps may keep the bare table name
	const char* candidates[] = {prefixed.c_str(), table.c_str()};
	const int candidates_size = (__layout == DIRECTORY ? 2 : 1);
	
	__sqlite_statement stmt(entry.connection->db, "SELECT name FROM sqlite_master WHERE type IN ('table', 'view') AND name=?");
	
	for (int i = 0; i != candidates_size && entry.name.empty(); ++ i) {
	  sqlite3_reset(stmt.get());
	  sqlite3_bind_text(stmt.get(), 1, candidates[i], -1, SQLITE_TRANSIENT);
	  
	  const int result = sqlite3_step(stmt.get());
	  if (result == SQLITE_ROW)
	    entry.name = candidates[i];
	  else if (result != SQLITE_DONE)
	    throw store_error(std::string("sqlite step failed: ") + sqlite3_errmsg(entry.connection->db));
	}
      }
      
      if (debug >= 2 && entry.name.empty())
	std::cerr << "absent table: " << prefixed << std::endl;
      
      return tables.insert(std::make_pair(prefixed, entry)).first->second;
    }
    
    bool SQLite::exists(const language_type& language, const table_type& table) const
    {
      return ! resolve(language, table).name.empty();
    }
    
    bool SQLite::query(const language_type& language, const table_type& table, const query_type& query, row_set_type& rows) const
    {
      rows.clear();
      
      const table_entry_type& entry = resolve(language, table);
      if (entry.name.empty())
	return false;
      
      std::string sql = (query.distinct ? "SELECT DISTINCT " : "SELECT ");
      
      if (query.columns.empty())
	sql += '*';
      else {
	query_type::column_set_type::const_iterator citer_end = query.columns.end();
	for (query_type::column_set_type::const_iterator citer = query.columns.begin(); citer != citer_end; ++ citer) {
	  if (citer != query.columns.begin())
	    sql += ", ";
	  sql += __identifier(*citer);
	}
      }
      
      sql += " FROM " + entry.name;

      query_type::condition_set_type::const_iterator qiter_end = query.conditions.end();
      for (query_type::condition_set_type::const_iterator qiter = query.conditions.begin(); qiter != qiter_end; ++ qiter) {
	sql += (qiter == query.conditions.begin() ? " WHERE " : " AND ");
	sql += __identifier(qiter->column);
	
	switch (qiter->op) {
	case query_type::EQUAL:
	  sql += "=?";
	  break;
	case query_type::LIKE:
	  sql += " LIKE ? ESCAPE '\\'";
	  break;
	case query_type::IN:
	  sql += " IN (";
	  for (size_t i = 0; i != qiter->values.size(); ++ i)
	    sql += (i ? ",?" : "?");
	  sql += ')';
	  break;
	}
      }
      
      if (debug >= 2)
	std::cerr << "query: " << language << '_' << table << ": " << sql << std::endl;
      
      __sqlite_statement stmt(entry.connection->db, sql);
      
      int bind = 1;
      for (query_type::condition_set_type::const_iterator qiter = query.conditions.begin(); qiter != qiter_end; ++ qiter) {
	query_type::value_set_type::const_iterator viter_end = qiter->values.end();
	for (query_type::value_set_type::const_iterator viter = qiter->values.begin(); viter != viter_end; ++ viter, ++ bind)
	  if (sqlite3_bind_text(stmt.get(), bind, viter->c_str(), viter->size(), SQLITE_TRANSIENT) != SQLITE_OK)
	    throw store_error(std::string("sqlite bind failed: ") + sqlite3_errmsg(entry.connection->db));
      }
      
      for (;;) {
	const int result = sqlite3_step(stmt.get());
	
	if (result == SQLITE_DONE)
	  break;
	else if (result != SQLITE_ROW)
	  throw store_error(std::string("sqlite step failed: ") + sqlite3_errmsg(entry.connection->db) + ": " + sql);
	
	const int columns = sqlite3_column_count(stmt.get());
	
	rows.push_back(row_type(columns));
	for (int i = 0; i != columns; ++ i) {
	  const unsigned char* text = sqlite3_column_text(stmt.get(), i);
	  if (text)
	    rows.back()[i].assign(reinterpret_cast<const char*>(text), sqlite3_column_bytes(stmt.get(), i));
	}
      }
      
      return true;
    }
  };
};
