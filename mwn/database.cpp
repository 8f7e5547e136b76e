//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <iostream>
#include <stdexcept>

#include "database.hpp"
#include "database/sqlite.hpp"
#include "parameter.hpp"

#include <boost/shared_ptr.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <utils/unordered_map.hpp>

namespace mwn
{
  const char* Database::lists()
  {
    static const char* desc = "\
sqlite: SQLite3 store\n\
\tpath=[directory] one database per table, <directory>/<language>/<language>_<table>.db\n\
\tfile=[file] all the tables in a single database\n\
\tdebug=[int] debug level\n\
";
    return desc;
  }
  
  typedef boost::shared_ptr<Database> database_ptr_type;
  
  typedef utils::unordered_map<std::string, database_ptr_type, boost::hash<std::string>, std::equal_to<std::string>,
			       std::allocator<std::pair<const std::string, database_ptr_type> > >::type database_map_type;
  
  static database_map_type __databases;
  
  Database& Database::create(const std::string& parameter)
  {
    typedef mwn::Parameter parameter_type;
    
    database_map_type::iterator iter = __databases.find(parameter);
    if (iter != __databases.end())
      return *(iter->second);
    
    const parameter_type param(parameter);
    
    if (boost::algorithm::iequals(param.name(), "sqlite") || boost::algorithm::iequals(param.name(), "sqlite3")) {
      database::SQLite::path_type path;
      database::SQLite::path_type file;
      int debug = 0;
      
      for (parameter_type::const_iterator piter = param.begin(); piter != param.end(); ++ piter) {
	if (boost::algorithm::iequals(piter->first, "path"))
	  path = piter->second;
	else if (boost::algorithm::iequals(piter->first, "file"))
	  file = piter->second;
	else if (boost::algorithm::iequals(piter->first, "debug"))
	  debug = boost::lexical_cast<int>(piter->second);
	else
	  std::cerr << "unsupported parameter for sqlite database: " << piter->first << "=" << piter->second << std::endl;
      }
      
      if (path.empty() == file.empty())
	throw std::runtime_error("sqlite database requires exactly one of path or file: " + parameter);
      
      database_ptr_type database(file.empty()
				 ? new database::SQLite(path, database::SQLite::DIRECTORY)
				 : new database::SQLite(file, database::SQLite::SINGLE));
      database->debug = debug;
      database->__algorithm = parameter;
      
      iter = __databases.insert(std::make_pair(parameter, database)).first;
      
      return *(iter->second);
    } else
      throw std::runtime_error("unknown database: " + parameter);
  }
};
