//
//  Copyright(C) 2010 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <errno.h>
#include <cstdlib>
#include <cstring>

#include <vector>
#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "tempfile.hpp"

namespace utils
{
  namespace tempfile_impl
  {
    struct PathSet
    {
      typedef boost::filesystem::path                            path_type;
      typedef std::vector<path_type, std::allocator<path_type> > path_set_type;
      
      PathSet() {}
      ~PathSet() { clear(); }
      
      void insert(const path_type& path)
      {
	if (path.empty()) return;
	
	if (std::find(paths.begin(), paths.end(), path) == paths.end())
	  paths.push_back(path);
      }
      
      void erase(const path_type& path)
      {
	path_set_type::iterator piter = std::find(paths.begin(), paths.end(), path);
	if (piter != paths.end())
	  paths.erase(piter);
      }
      
      void clear()
      {
	for (path_set_type::const_iterator piter = paths.begin(); piter != paths.end(); ++ piter) {
	  boost::system::error_code error;
	  
	  boost::filesystem::remove_all(*piter, error);
	  if (error)
	    std::cerr << "cannot remove " << piter->string() << ": " << error.message() << std::endl;
	}
	paths.clear();
      }
      
      path_set_type paths;
    };
    
    static PathSet __paths;
  };
  
  void tempfile::insert(const path_type& path)
  {
    tempfile_impl::__paths.insert(path);
  }
  
  void tempfile::erase(const path_type& path)
  {
    tempfile_impl::__paths.erase(path);
  }
  
  tempfile::path_type tempfile::tmp_dir()
  {
    const path_type tmpdir("/tmp");
    
    const char* tmpdir_env = getenv("TMPDIR");
    if (! tmpdir_env)
      return tmpdir;
    
    const path_type tmpdir_env_path(tmpdir_env);
    if (boost::filesystem::exists(tmpdir_env_path) && boost::filesystem::is_directory(tmpdir_env_path))
      return tmpdir_env_path;
    else
      return tmpdir;
  }
  
  tempfile::path_type tempfile::directory_name(const std::string& dir)
  {
    std::vector<char, std::allocator<char> > buffer(dir.size() + 1, 0);
    std::copy(dir.begin(), dir.end(), buffer.begin());
    
    char* tmp = ::mkdtemp(&(*buffer.begin()));
    if (! tmp)
      throw std::runtime_error(std::string("mkdtemp failure: ") + ::strerror(errno));
    
    return path_type(std::string(buffer.begin(), buffer.begin() + dir.size()));
  }
};
