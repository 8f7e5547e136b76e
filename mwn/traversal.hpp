// -*- mode: c++ -*-
//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __MWN__TRAVERSAL__HPP__
#define __MWN__TRAVERSAL__HPP__ 1

//
// walks over the synset graph.
//
// closure is a lazy breadth-first walk over one relation type. The depth metrics follow
// hypernym edges upward and count a synset already entered by the walk as 0. The root
// paths stop at a synset already on the path. Both terminate on cyclic data.
//

#include <string>
#include <deque>
#include <iterator>
#include <cstddef>

#include <mwn/synset.hpp>

#include <boost/shared_ptr.hpp>

#include <utils/unordered_set.hpp>

namespace mwn
{
  class Closure
  {
  public:
    typedef Synset      synset_type;
    typedef std::string type_type;
    typedef std::string id_type;
    
  private:
    struct State
    {
      typedef std::pair<synset_type, int> node_type;
      typedef std::deque<node_type, std::allocator<node_type> > queue_type;
      typedef utils::unordered_set<id_type, boost::hash<id_type>, std::equal_to<id_type>, std::allocator<id_type> >::type visited_type;
      
      State(const synset_type& origin, const type_type& __type, const int __depth)
	: type(__type), depth(__depth)
      {
	visited.insert(origin.id());
	expand(origin, 0);
      }
      
      bool next();
      void expand(const synset_type& synset, const int level);
      
      type_type    type;
      int          depth;
      queue_type   queue;
      visited_type visited;
      synset_type  current;
    };
    
    typedef boost::shared_ptr<State> state_ptr_type;
    
  public:
    // single pass over a walk, copies share the walk
    class iterator
    {
    public:
      typedef std::input_iterator_tag iterator_category;
      typedef synset_type             value_type;
      typedef ptrdiff_t               difference_type;
      typedef const synset_type*      pointer;
      typedef const synset_type&      reference;
      
    public:
      iterator() : state() {}
      iterator(const state_ptr_type& __state) : state(__state) { increment(); }
      
      reference operator*() const { return state->current; }
      pointer operator->() const { return &(state->current); }
      
      iterator& operator++()
      {
	increment();
	return *this;
      }
      
      friend
      bool operator==(const iterator& x, const iterator& y)
      {
	return x.state == y.state;
      }
      
      friend
      bool operator!=(const iterator& x, const iterator& y)
      {
	return x.state != y.state;
      }
      
    private:
      void increment()
      {
	if (state && ! state->next())
	  state.reset();
      }
      
    private:
      state_ptr_type state;
    };
    
    typedef iterator const_iterator;
    
  public:
    // throws domain_error if the pos of origin does not define type. depth < 0 for unbounded
    Closure(const synset_type& origin, const type_type& type, const int depth=-1);
    
    // every begin() starts a new walk
    const_iterator begin() const { return const_iterator(state_ptr_type(new State(__origin, __type, __depth))); }
    const_iterator end() const { return const_iterator(); }
    
  private:
    synset_type __origin;
    type_type   __type;
    int         __depth;
  };
  
  // longest and shortest number of hypernym edges to a root, 0 for a root.
  // a shared ancestor is walked by the first branch reaching it only
  int max_depth(const Synset& synset);
  int min_depth(const Synset& synset);
  
  // synsets without hypernyms reachable upward, the synset itself if it is a root
  Synset::synset_set_type roots(const Synset& synset);
  
  // every path from a root to synset, root first
  Synset::path_set_type paths_to_root(const Synset& synset);
};

#endif
