// -*- mode: c++ -*-
//
//  Copyright(C) 2009-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

//
// temporary store management. registered paths are removed at exit
//

#ifndef __UTILS_TEMPFILE__HPP__
#define __UTILS_TEMPFILE__HPP__ 1

#include <string>

#include <boost/filesystem.hpp>

namespace utils
{
  class tempfile
  {
  public:
    typedef boost::filesystem::path path_type;
    
  public:
    static void insert(const path_type& path);
    static void erase(const path_type& path);
    
    // TMPDIR if it names a directory, /tmp otherwise
    static path_type tmp_dir();
    
    // creates a fresh directory from a mkdtemp template, e.g. tmp_dir() / "mwn.XXXXXX"
    static path_type directory_name(const std::string& dir);
    static path_type directory_name(const path_type& dir) { return directory_name(dir.string()); }
  };
};

#endif
