//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <iostream>
#include <algorithm>
#include <vector>

#include "traversal.hpp"
#include "relation.hpp"
#include "relation_type.hpp"
#include "resolver.hpp"

namespace mwn
{
  Closure::Closure(const synset_type& origin, const type_type& type, const int depth)
    : __origin(origin), __type(type), __depth(depth)
  {
    RelationType::validate(origin.pos(), type);
  }
  
  bool Closure::State::next()
  {
    if (queue.empty()) return false;
    
    const int level = queue.front().second;
    current = queue.front().first;
    queue.pop_front();
    
    expand(current, level);
    
    return true;
  }
  
  void Closure::State::expand(const synset_type& synset, const int level)
  {
    if (depth >= 0 && level >= depth) return;
    
    // edges may reach a part-of-speech which does not define type
    if (! RelationType::valid(synset.pos(), type)) return;
    
    const Synset::relation_set_type& relations = synset.relations();
    
    Synset::relation_set_type::const_iterator riter_end = relations.end();
    for (Synset::relation_set_type::const_iterator riter = relations.begin(); riter != riter_end; ++ riter) {
      if (riter->type() != type) continue;
      if (visited.find(riter->id_target()) != visited.end()) continue;
      
      const boost::optional<synset_type> target = riter->target();
      
      if (target && visited.insert(target->id()).second)
	queue.push_back(std::make_pair(*target, level + 1));
    }
  }
  
  namespace impl
  {
    typedef std::vector<std::string, std::allocator<std::string> > path_type;
    
    inline
    void report(const char* what, const Synset& synset, const path_type& path)
    {
      if (synset.resolver() && synset.resolver()->debug) {
	std::cerr << what << " at " << synset.id() << ':';
	for (path_type::const_iterator piter = path.begin(); piter != path.end(); ++ piter)
	  std::cerr << ' ' << *piter;
	std::cerr << std::endl;
      }
    }
    
    // path keeps every synset entered so far, in walk order, and is shared by the sibling
    // branches. A synset entered again, except the first one, counts as 0, so that a shared
    // ancestor reached by a later branch is not walked twice. The first synset is not guarded,
    // a cycle through it stops one lap later.
    struct Depth
    {
      Depth(const bool __maximum) : maximum(__maximum) {}
      
      int operator()(const Synset& synset)
      {
	if (path.size() > 1 && std::find(path.begin() + 1, path.end(), synset.id()) != path.end()) {
	  report("revisit detected", synset, path);
	  return 0;
	}
	
	path.push_back(synset.id());
	
	const Synset::synset_set_type hypernyms = synset.hypernyms();
	
	if (hypernyms.empty()) return 0;
	
	int depth = (maximum ? 0 : -1);
	
	Synset::synset_set_type::const_iterator hiter_end = hypernyms.end();
	for (Synset::synset_set_type::const_iterator hiter = hypernyms.begin(); hiter != hiter_end; ++ hiter) {
	  const int parent = operator()(*hiter);
	  
	  if (maximum)
	    depth = std::max(depth, parent);
	  else
	    depth = (depth < 0 ? parent : std::min(depth, parent));
	}
	
	return depth + 1;
      }
      
      path_type path;
      bool maximum;
    };
    
    struct Paths
    {
      typedef Synset::path_type     synset_path_type;
      typedef Synset::path_set_type path_set_type;
      
      void operator()(const Synset& synset, path_set_type& paths)
      {
	paths.clear();
	
	const Synset::synset_set_type hypernyms = synset.hypernyms();
	
	path.push_back(synset.id());
	
	path_set_type parents;
	
	Synset::synset_set_type::const_iterator hiter_end = hypernyms.end();
	for (Synset::synset_set_type::const_iterator hiter = hypernyms.begin(); hiter != hiter_end; ++ hiter) {
	  if (std::find(path.begin(), path.end(), hiter->id()) != path.end()) {
	    report("cycle detected", *hiter, path);
	    continue;
	  }
	  
	  operator()(*hiter, parents);
	  
	  path_set_type::iterator piter_end = parents.end();
	  for (path_set_type::iterator piter = parents.begin(); piter != piter_end; ++ piter) {
	    piter->push_back(synset);
	    paths.push_back(*piter);
	  }
	}
	
	path.pop_back();
	
	// a root, or every parent is on a cycle
	if (paths.empty())
	  paths.push_back(synset_path_type(1, synset));
      }
      
      path_type path;
    };
  };
  
  int max_depth(const Synset& synset)
  {
    impl::Depth depth(true);
    
    return depth(synset);
  }
  
  int min_depth(const Synset& synset)
  {
    impl::Depth depth(false);
    
    return depth(synset);
  }
  
  Synset::synset_set_type roots(const Synset& synset)
  {
    typedef std::vector<Synset, std::allocator<Synset> > stack_type;
    typedef utils::unordered_set<std::string, boost::hash<std::string>, std::equal_to<std::string>,
				 std::allocator<std::string> >::type visited_type;
    
    Synset::synset_set_type roots;
    stack_type   stack;
    visited_type visited;
    
    stack.push_back(synset);
    visited.insert(synset.id());
    
    while (! stack.empty()) {
      const Synset node = stack.back();
      stack.pop_back();
      
      const Synset::synset_set_type hypernyms = node.hypernyms();
      
      if (hypernyms.empty()) {
	roots.push_back(node);
	continue;
      }
      
      Synset::synset_set_type::const_iterator hiter_end = hypernyms.end();
      for (Synset::synset_set_type::const_iterator hiter = hypernyms.begin(); hiter != hiter_end; ++ hiter)
	if (visited.insert(hiter->id()).second)
	  stack.push_back(*hiter);
    }
    
    return roots;
  }
  
  Synset::path_set_type paths_to_root(const Synset& synset)
  {
    Synset::path_set_type paths;
    
    impl::Paths walker;
    walker(synset, paths);
    
    return paths;
  }
};
