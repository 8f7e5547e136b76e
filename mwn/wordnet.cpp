//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <stdexcept>
#include <algorithm>

#include "wordnet.hpp"
#include "relation_type.hpp"
#include "identifier.hpp"
#include "traversal.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/replace.hpp>

namespace mwn
{
  namespace impl
  {
    inline
    void condition(Query& query, const std::string& column, const std::string& form, const WordNet::mode_type mode)
    {
      if (form.empty()) return;
      
      const Query::value_type escaped = Query::escape(form);
      
      switch (mode) {
      case WordNet::EXACT:      query.where(column, form); break;
      case WordNet::STARTSWITH: query.like(column, escaped + '%'); break;
      case WordNet::ENDSWITH:   query.like(column, '%' + escaped); break;
      case WordNet::CONTAINS:   query.like(column, '%' + escaped + '%'); break;
      }
    }
    
    inline
    void synset_ids(const Lemma& lemma, Query::value_set_type& ids)
    {
      const Lemma::synset_set_type& synsets = lemma.synsets();
      
      ids.clear();
      for (Lemma::synset_set_type::const_iterator siter = synsets.begin(); siter != synsets.end(); ++ siter)
	ids.push_back(siter->id());
    }
  };

  WordNet::mode_type WordNet::mode(const std::string& name)
  {
    if (boost::algorithm::iequals(name, "exact"))
      return EXACT;
    else if (boost::algorithm::iequals(name, "startswith"))
      return STARTSWITH;
    else if (boost::algorithm::iequals(name, "endswith"))
      return ENDSWITH;
    else if (boost::algorithm::iequals(name, "contains"))
      return CONTAINS;
    else
      throw std::invalid_argument("unknown search mode: " + name);
  }
  
  WordNet::lemma_set_type WordNet::search(const form_type& form,
					  const pos_type& pos,
					  const std::string& miscellanea,
					  const mode_type mode) const
  {
    const form_type normalized = boost::algorithm::replace_all_copy(form, " ", "_");
    
    lemma_set_type lemmas;
    row_set_type rows;
    Query query;
    
    if (Language::is_morphology(__language)) {
      query.select("lemma").select("pos").select("miscellanea").select("id");
      impl::condition(query, "lemma", normalized, mode);
      if (POS::is_concrete(pos))
	query.where("pos", std::string(1, pos));
      if (! miscellanea.empty())
	query.where("miscellanea", miscellanea);
      
      if (__resolver->database().query(__language, "morpho", query, rows)) {
	row_set_type::const_iterator riter_end = rows.end();
	for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter) {
	  const row_type& row = *riter;
	  const pos_type resolved = (! row[1].empty() ? row[1][0] : (! row[2].empty() ? row[2][0] : POS::WILDCARD));
	  
	  lemmas.push_back(Lemma(row[0], resolved, __language, __resolver, row[3], row[2]));
	}
      }
    } else {
      query.select("lemma").select("pos").unique();
      impl::condition(query, "lemma", normalized, mode);
      if (POS::is_concrete(pos))
	query.where("pos", std::string(1, pos));
      
      if (__resolver->database().query(__language, "lemma", query, rows)) {
	row_set_type::const_iterator riter_end = rows.end();
	for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter)
	  lemmas.push_back(Lemma((*riter)[0], ((*riter)[1].empty() ? POS::WILDCARD : (*riter)[1][0]), __language, __resolver));
      }
    }
    
    return lemmas;
  }
  
  WordNet::row_set_type WordNet::raw(const form_type& form,
				     const pos_type& pos,
				     const std::string& miscellanea,
				     const mode_type mode) const
  {
    Query query;
    query.select("lemma").select("pos").select("miscellanea");
    impl::condition(query, "lemma", boost::algorithm::replace_all_copy(form, " ", "_"), mode);
    if (POS::is_concrete(pos))
      query.where("pos", std::string(1, pos));
    if (! miscellanea.empty())
      query.where("miscellanea", miscellanea);
    
    row_set_type rows;
    __resolver->database().query(__language, "morpho", query, rows);
    
    return rows;
  }
  
  WordNet::relation_set_type WordNet::find_relations(const relation_filter_type& filter) const
  {
    // the edges between forms are stored with the wordnet only
    const bool lexical = (filter.lexical
			  || filter.type == RelationType::DERIVED_FROM
			  || filter.type == RelationType::RELATED_TO
			  || filter.type == RelationType::COMPOSED_OF
			  || filter.type == RelationType::COMPOSES);
    
    Query query;
    query.select("type").select("id_source").select("id_target").select("w_source").select("w_target").select("status");
    
    if (lexical) {
      if (! filter.w_source || ! filter.w_target)
	throw std::invalid_argument("lexical relations require both source and target lemmas");
      
      query.where("w_source", filter.w_source->form()).where("w_target", filter.w_target->form());
    }
    
    Query::value_set_type ids;
    
    if (filter.source)
      query.where("id_source", filter.source->id());
    else if (filter.w_source && ! lexical) {
      impl::synset_ids(*filter.w_source, ids);
      if (ids.empty())
	return relation_set_type();
      query.in("id_source", ids.begin(), ids.end());
    }
    
    if (filter.target)
      query.where("id_target", filter.target->id());
    else if (filter.w_target && ! lexical) {
      impl::synset_ids(*filter.w_target, ids);
      if (ids.empty())
	return relation_set_type();
      query.in("id_target", ids.begin(), ids.end());
    }
    
    if (! filter.type.empty())
      query.where("type", filter.type);
    
    const language_type sources[2] = {Language::common(), __language};
    
    relation_set_type relations;
    row_set_type rows;
    
    for (int i = (lexical ? 1 : 0); i != 2; ++ i) {
      if (! __resolver->database().query(sources[i], "relation", query, rows)) continue;
      
      row_set_type::const_iterator riter_end = rows.end();
      for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter) {
	const row_type& row = *riter;
	
	relations.push_back(Relation(row[0], row[1], row[2], row[3], row[4], row[5], sources[i], __language, __resolver));
      }
    }
    
    return relations;
  }
  
  WordNet::semfield_set_type WordNet::semfields_by_code(const std::string& code) const
  {
    semfield_set_type semfields;
    row_set_type rows;
    
    if (__resolver->database().query(Language::common(), "semfield_hierarchy", Query().select("english").where("code", code), rows)) {
      row_set_type::const_iterator riter_end = rows.end();
      for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter)
	semfields.push_back(Semfield(riter->front(), code, __language, __resolver));
    }
    
    return semfields;
  }
  
  WordNet::semfield_set_type WordNet::semfields_by_english(const std::string& english) const
  {
    return __resolver->semfields(english, __language);
  }
  
  const WordNet::lemma_set_type& WordNet::lemmas() const
  {
    if (__lemmas)
      return *__lemmas;
    
    lemma_set_type lemmas;
    row_set_type rows;
    
    if (__resolver->database().exists(__language, "morpho")) {
      __resolver->database().query(__language, "morpho",
				   Query().select("lemma").select("pos").select("miscellanea").select("id"),
				   rows);
      
      row_set_type::const_iterator riter_end = rows.end();
      for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter) {
	const row_type& row = *riter;
	const pos_type resolved = (! row[1].empty() ? row[1][0] : (! row[2].empty() ? row[2][0] : POS::WILDCARD));
	
	lemmas.push_back(Lemma(row[0], resolved, __language, __resolver, row[3], row[2]));
      }
    } else {
      Query query;
      query.select("lemma");
      for (const char* piter = POS::all(); *piter; ++ piter)
	query.select(POS::column(*piter));
      
      __resolver->database().query(__language, "index", query, rows);
      
      row_set_type::const_iterator riter_end = rows.end();
      for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter)
	for (int i = 0; i != 4; ++ i)
	  if (! (*riter)[i + 1].empty())
	    lemmas.push_back(Lemma(riter->front(), POS::all()[i], __language, __resolver));
    }
    
    __lemmas = lemmas;
    
    return *__lemmas;
  }
  
  const WordNet::synset_set_type& WordNet::synsets(const std::string& pos) const
  {
    synset_map_type::const_iterator iter = __synsets.find(pos);
    if (iter != __synsets.end())
      return iter->second;
    
    Query query;
    query.select("id");
    if (pos.size() == 1)
      query.like("id", Query::escape(pos) + Identifier::separator + '%');
    
    synset_set_type synsets;
    row_set_type rows;
    
    if (__resolver->database().query(__language, "synset", query, rows)) {
      row_set_type::const_iterator riter_end = rows.end();
      for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter) {
	const id_type& id = riter->front();
	
	if (id.empty() || pos.find(id[0]) == std::string::npos) continue;
	
	const boost::optional<Synset> synset = __resolver->synset(id, __language);
	if (synset)
	  synsets.push_back(*synset);
      }
    }
    
    return __synsets.insert(std::make_pair(pos, synsets)).first->second;
  }
  
  const WordNet::relation_set_type& WordNet::relations() const
  {
    if (__relations)
      return *__relations;
    
    const relation_filter_type all;
    
    __relations = find_relations(all);
    
    return *__relations;
  }
  
  const WordNet::semfield_set_type& WordNet::semfields() const
  {
    if (__semfields)
      return *__semfields;
    
    semfield_set_type semfields;
    row_set_type rows;
    
    __resolver->database().query(Language::common(), "semfield_hierarchy", Query().select("code").select("english"), rows);
    
    row_set_type::const_iterator riter_end = rows.end();
    for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter)
      semfields.push_back(Semfield((*riter)[1], (*riter)[0], __language, __resolver));
    
    __semfields = semfields;
    
    return *__semfields;
  }
  
  int WordNet::max_depth(const pos_type& pos) const
  {
    depth_map_type::const_iterator iter = __depths.find(pos);
    if (iter != __depths.end())
      return iter->second;
    
    const synset_set_type& synsets = this->synsets(std::string(1, pos));
    
    int depth = 0;
    synset_set_type::const_iterator siter_end = synsets.end();
    for (synset_set_type::const_iterator siter = synsets.begin(); siter != siter_end; ++ siter)
      depth = std::max(depth, mwn::max_depth(*siter));
    
    __depths[pos] = depth;
    
    return depth;
  }
};
