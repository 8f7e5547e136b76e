//
//  Copyright(C) 2013 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <algorithm>

#include "resolver.hpp"
#include "identifier.hpp"
#include "language.hpp"
#include "pos.hpp"
#include "error.hpp"

#include <boost/shared_ptr.hpp>
#include <boost/tokenizer.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/replace.hpp>

#include <utils/unordered_set.hpp>

namespace mwn
{
  typedef Database::row_type     row_type;
  typedef Database::row_set_type row_set_type;

  typedef utils::unordered_set<std::string, boost::hash<std::string>, std::equal_to<std::string>,
			       std::allocator<std::string> >::type id_set_type;
  
  namespace impl
  {
    inline
    std::string key(const std::string& x, const std::string& y)
    {
      return x + '\t' + y;
    }
    
    inline
    std::string key(const std::string& x, const std::string& y, const std::string& z)
    {
      return x + '\t' + y + '\t' + z;
    }

    inline
    std::string key(const std::string& x, const std::string& y, const char& z)
    {
      return x + '\t' + y + '\t' + z;
    }
    
    inline
    std::string normalize(const std::string& form)
    {
      return boost::algorithm::replace_all_copy(form, " ", "_");
    }

    template <typename Container>
    inline
    bool contains(const Container& tokens, const typename Container::value_type& x)
    {
      return std::find(tokens.begin(), tokens.end(), x) != tokens.end();
    }
    
    template <typename Container>
    inline
    void sort_unique(Container& x)
    {
      std::sort(x.begin(), x.end());
      x.erase(std::unique(x.begin(), x.end()), x.end());
    }
  };
  
  typedef boost::shared_ptr<Resolver> resolver_ptr_type;
  
  typedef utils::unordered_map<std::string, resolver_ptr_type, boost::hash<std::string>, std::equal_to<std::string>,
			       std::allocator<std::pair<const std::string, resolver_ptr_type> > >::type resolver_map_type;
  
  static resolver_map_type __resolvers;
  
  Resolver& Resolver::create(const std::string& parameter)
  {
    resolver_map_type::iterator iter = __resolvers.find(parameter);
    if (iter == __resolvers.end()) {
      const Database& database = Database::create(parameter);
      
      iter = __resolvers.insert(std::make_pair(parameter, resolver_ptr_type(new Resolver(database, database.debug)))).first;
    }
    
    return *(iter->second);
  }
  
  void Resolver::split(const std::string& x, token_set_type& tokens)
  {
    typedef boost::char_separator<char> separator_type;
    typedef boost::tokenizer<separator_type> tokenizer_type;
    
    tokens.clear();
    
    tokenizer_type tokenizer(x, separator_type(" \t"));
    tokens.insert(tokens.end(), tokenizer.begin(), tokenizer.end());
  }
  
  boost::optional<Synset> Resolver::synset(const id_type& id, const language_type& language) const
  {
    // decode first, so that malformed ids are never memoized
    const language_type origin = Identifier::language(id);
    
    const std::string key = impl::key(language, id);
    
    synset_memo_type::const_iterator iter = __synset.find(key);
    if (iter != __synset.end())
      return iter->second;
    
    const language_type tiers[3] = {origin, language, Language::reference()};
    
    boost::optional<Synset> result;
    row_set_type rows;
    
    for (int i = 0; i != 3 && ! result; ++ i) {
      if (std::find(tiers, tiers + i, tiers[i]) != tiers + i) continue;
      
      if (__database->query(tiers[i], "synset", Query().select("gloss").where("id", id), rows) && ! rows.empty())
	result = Synset(id, language, rows.front().front(), this);
    }
    
    __synset.insert(std::make_pair(key, result));
    
    return result;
  }
  
  boost::optional<Lemma> Resolver::lemma(const form_type& form,
					 const pos_type& pos,
					 const language_type& language,
					 const std::string& miscellanea,
					 const std::string& id) const
  {
    const form_type normalized = impl::normalize(form);
    const std::string key = impl::key(language, normalized, pos) + '\t' + id + '\t' + miscellanea;
    
    lemma_memo_type::const_iterator iter = __lemma.find(key);
    if (iter != __lemma.end())
      return iter->second;
    
    boost::optional<Lemma> result;
    row_set_type rows;
    
    if (Language::is_morphology(language)) {
      Query query;
      query.select("id").select("pos").select("miscellanea").where("lemma", normalized);
      if (! id.empty())
	query.where("id", id);
      if (POS::is_concrete(pos))
	query.where("pos", std::string(1, pos));
      if (! miscellanea.empty())
	query.where("miscellanea", miscellanea);
      
      if (__database->query(language, "morpho", query, rows) && ! rows.empty()) {
	if (rows.size() > 1) {
	  disambiguation_error::candidate_set_type candidates;
	  
	  row_set_type::const_iterator riter_end = rows.end();
	  for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter)
	    candidates.push_back((*riter)[0]);
	  
	  throw disambiguation_error(normalized, candidates);
	}
	
	const row_type& row = rows.front();
	const pos_type resolved = (! row[1].empty()
				   ? row[1][0]
				   : (! row[2].empty() ? row[2][0] : pos));
	
	result = Lemma(normalized, resolved, language, this, row[0], row[2]);
      }
    } else {
      Query query;
      for (const char* piter = POS::all(); *piter; ++ piter)
	query.select(POS::column(*piter));
      query.where("lemma", normalized);
      
      if (__database->query(language, "index", query, rows) && ! rows.empty()) {
	bool present[4] = {false, false, false, false};
	
	row_set_type::const_iterator riter_end = rows.end();
	for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter)
	  for (int i = 0; i != 4; ++ i)
	    present[i] |= ! (*riter)[i].empty();
	
	if (POS::is_concrete(pos)) {
	  if (present[POS::index(pos)])
	    result = Lemma(normalized, pos, language, this);
	} else {
	  disambiguation_error::candidate_set_type candidates;
	  for (int i = 0; i != 4; ++ i)
	    if (present[i])
	      candidates.push_back(std::string(1, POS::all()[i]));
	  
	  if (candidates.size() > 1)
	    throw disambiguation_error(normalized, candidates);
	  else if (candidates.size() == 1)
	    result = Lemma(normalized, candidates.front()[0], language, this);
	}
      }
    }
    
    __lemma.insert(std::make_pair(key, result));
    
    return result;
  }
  
  boost::optional<Semfield> Resolver::semfield(const english_type& english, const code_type& code, const language_type& language) const
  {
    const english_type normalized = impl::normalize(english);
    const std::string key = impl::key(language, normalized, code);
    
    semfield_memo_type::const_iterator iter = __semfield.find(key);
    if (iter != __semfield.end())
      return iter->second;
    
    Query query;
    query.select("code").select("english").where("english", normalized);
    if (! code.empty())
      query.where("code", code);
    
    boost::optional<Semfield> result;
    row_set_type rows;
    
    if (__database->query(Language::common(), "semfield_hierarchy", query, rows) && ! rows.empty()) {
      if (rows.size() > 1 && code.empty()) {
	disambiguation_error::candidate_set_type candidates;
	
	row_set_type::const_iterator riter_end = rows.end();
	for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter)
	  candidates.push_back((*riter)[0]);
	
	throw disambiguation_error(normalized, candidates);
      }
      
      result = Semfield(rows.front()[1], rows.front()[0], language, this);
    }
    
    __semfield.insert(std::make_pair(key, result));
    
    return result;
  }
  
  Resolver::semfield_set_type Resolver::semfields(const english_type& english, const language_type& language) const
  {
    semfield_set_type semfields;
    row_set_type rows;
    
    if (__database->query(Language::common(), "semfield_hierarchy",
			  Query().select("code").select("english").where("english", impl::normalize(english)),
			  rows)) {
      row_set_type::const_iterator riter_end = rows.end();
      for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter)
	semfields.push_back(Semfield((*riter)[1], (*riter)[0], language, this));
    }
    
    return semfields;
  }
  
  const Resolver::lemma_set_type& Resolver::lemmas(const Synset& synset) const
  {
    const std::string key = impl::key(synset.language(), synset.id());
    
    lemma_set_memo_type::const_iterator iter = __synset_lemmas.find(key);
    if (iter != __synset_lemmas.end())
      return iter->second;
    
    const pos_type pos = synset.pos();
    const language_type& language = synset.language();
    
    lemma_set_type words;
    lemma_set_type phrases;
    token_set_type tokens;
    row_set_type   rows;
    
    if (__database->query(language, "synset", Query().select("word").select("phrase").where("id", synset.id()), rows)) {
      row_set_type::const_iterator riter_end = rows.end();
      for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter) {
	split((*riter)[0], tokens);
	
	token_set_type::const_iterator titer_end = tokens.end();
	for (token_set_type::const_iterator titer = tokens.begin(); titer != titer_end; ++ titer) {
	  const std::string word = boost::algorithm::to_lower_copy(*titer);
	  
	  // placeholder of a lexical gap
	  if (word != "gap!")
	    words.push_back(Lemma(word, pos, language, this));
	}
	
	split((*riter)[1], tokens);
	
	for (token_set_type::const_iterator titer = tokens.begin(); titer != tokens.end(); ++ titer)
	  phrases.push_back(Lemma(*titer, pos, language, this));
      }
    }
    
    if (words.empty() && phrases.empty()) {
      const std::string column = POS::column(pos);
      
      if (__database->query(language, "index",
			    Query().select("lemma").select(column).like(column, '%' + Query::escape(synset.id()) + '%'),
			    rows)) {
	row_set_type::const_iterator riter_end = rows.end();
	for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter) {
	  if ((*riter)[0] == "gap!") continue;
	  
	  split((*riter)[1], tokens);
	  
	  if (impl::contains(tokens, synset.id()))
	    words.push_back(Lemma((*riter)[0], pos, language, this));
	}
      }
    }
    
    words.insert(words.end(), phrases.begin(), phrases.end());
    
    __synset_phrases.insert(std::make_pair(key, phrases));
    
    return __synset_lemmas.insert(std::make_pair(key, words)).first->second;
  }

  const Resolver::lemma_set_type& Resolver::phrases(const Synset& synset) const
  {
    const std::string key = impl::key(synset.language(), synset.id());
    
    lemma_set_memo_type::const_iterator iter = __synset_phrases.find(key);
    if (iter != __synset_phrases.end())
      return iter->second;
    
    lemmas(synset);
    
    return __synset_phrases.find(key)->second;
  }
  
  const Resolver::semfield_set_type& Resolver::semfields(const Synset& synset) const
  {
    const std::string key = impl::key(synset.language(), synset.id());
    
    semfield_set_memo_type::const_iterator iter = __synset_semfields.find(key);
    if (iter != __synset_semfields.end())
      return iter->second;
    
    const Query query = Query().select("english").where("synset", synset.id());
    
    row_set_type rows;
    if (! __database->query(Language::common(), "semfield", query, rows) || rows.empty())
      __database->query(synset.language(), "semfield", query, rows);
    
    semfield_set_type semfields;
    token_set_type tokens;
    
    row_set_type::const_iterator riter_end = rows.end();
    for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter) {
      split((*riter)[0], tokens);
      
      token_set_type::const_iterator titer_end = tokens.end();
      for (token_set_type::const_iterator titer = tokens.begin(); titer != titer_end; ++ titer) {
	// an ambiguous name stands for all of its fields
	const semfield_set_type fields = this->semfields(*titer, synset.language());
	
	semfield_set_type::const_iterator fiter_end = fields.end();
	for (semfield_set_type::const_iterator fiter = fields.begin(); fiter != fiter_end; ++ fiter)
	  if (! impl::contains(semfields, *fiter))
	    semfields.push_back(*fiter);
      }
    }
    
    return __synset_semfields.insert(std::make_pair(key, semfields)).first->second;
  }

  const Resolver::relation_set_type& Resolver::relations(const Synset& synset) const
  {
    const std::string key = impl::key(synset.language(), synset.id());
    
    relation_set_memo_type::const_iterator iter = __synset_relations.find(key);
    if (iter != __synset_relations.end())
      return iter->second;
    
    Query query;
    query.select("type").select("id_source").select("id_target").select("w_source").select("w_target").select("status");
    query.where("id_source", synset.id());
    
    const language_type sources[2] = {Language::common(), synset.language()};
    
    relation_set_type relations;
    row_set_type rows;
    
    for (int i = 0; i != 2; ++ i) {
      if (i && sources[i] == sources[0]) continue;
      
      if (! __database->query(sources[i], "relation", query, rows)) continue;
      
      row_set_type::const_iterator riter_end = rows.end();
      for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter) {
	const row_type& row = *riter;
	
	relations.push_back(Relation(row[0], row[1], row[2], row[3], row[4], row[5], sources[i], synset.language(), this));
      }
    }
    
    return __synset_relations.insert(std::make_pair(key, relations)).first->second;
  }
  
  const Resolver::synset_set_type& Resolver::synsets(const Lemma& lemma) const
  {
    const std::string key = impl::key(lemma.language(), lemma.form(), lemma.pos());
    
    synset_set_memo_type::const_iterator iter = __lemma_synsets.find(key);
    if (iter != __lemma_synsets.end())
      return iter->second;
    
    Query query;
    for (const char* piter = POS::all(); *piter; ++ piter)
      query.select(POS::column(*piter));
    query.where("lemma", lemma.form());
    
    synset_set_type synsets;
    token_set_type tokens;
    row_set_type rows;
    
    if (__database->query(lemma.language(), "index", query, rows)) {
      row_set_type::const_iterator riter_end = rows.end();
      for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter) {
	const row_type& row = *riter;
	
	int column = POS::index(lemma.pos());
	
	// first part-of-speech present for a wildcard
	if (column < 0)
	  for (int i = 0; i != 4 && column < 0; ++ i)
	    if (! row[i].empty())
	      column = i;
	
	if (column < 0) continue;
	
	split(row[column], tokens);
	
	token_set_type::const_iterator titer_end = tokens.end();
	for (token_set_type::const_iterator titer = tokens.begin(); titer != titer_end; ++ titer) {
	  const boost::optional<Synset> synset = this->synset(*titer, lemma.language());
	  
	  if (synset && ! impl::contains(synsets, *synset))
	    synsets.push_back(*synset);
	}
      }
    }
    
    return __lemma_synsets.insert(std::make_pair(key, synsets)).first->second;
  }
  
  const Resolver::lemma_set_type& Resolver::synonyms(const Lemma& lemma) const
  {
    const std::string key = impl::key(lemma.language(), lemma.form(), lemma.pos());
    
    lemma_set_memo_type::const_iterator iter = __lemma_synonyms.find(key);
    if (iter != __lemma_synonyms.end())
      return iter->second;
    
    const synset_set_type& synsets = this->synsets(lemma);
    
    lemma_set_type synonyms;
    token_set_type tokens;
    row_set_type rows;
    
    synset_set_type::const_iterator siter_end = synsets.end();
    
    if (__database->exists(lemma.language(), "synonyms"))
      for (synset_set_type::const_iterator siter = synsets.begin(); siter != siter_end; ++ siter) {
	__database->query(lemma.language(), "synonyms",
			  Query().select("lemma").where("pos", std::string(1, lemma.pos())).where("syn", siter->offset()),
			  rows);
	
	row_set_type::const_iterator riter_end = rows.end();
	for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter)
	  if ((*riter)[0] != lemma.form())
	    synonyms.push_back(Lemma((*riter)[0], lemma.pos(), lemma.language(), this));
      }
    
    if (synonyms.empty())
      for (synset_set_type::const_iterator siter = synsets.begin(); siter != siter_end; ++ siter) {
	if (! __database->query(lemma.language(), "synset", Query().select("word").select("phrase").where("id", siter->id()), rows))
	  break;
	
	row_set_type::const_iterator riter_end = rows.end();
	for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter)
	  for (int i = 0; i != 2; ++ i) {
	    split((*riter)[i], tokens);
	    
	    token_set_type::const_iterator titer_end = tokens.end();
	    for (token_set_type::const_iterator titer = tokens.begin(); titer != titer_end; ++ titer)
	      if (*titer != lemma.form() && *titer != "GAP!")
		synonyms.push_back(Lemma(*titer, lemma.pos(), lemma.language(), this));
	  }
      }
    
    impl::sort_unique(synonyms);
    
    return __lemma_synonyms.insert(std::make_pair(key, synonyms)).first->second;
  }
  
  const Resolver::lemma_set_type& Resolver::lexical(const Lemma& lemma, const type_type& type, const bool forward) const
  {
    const std::string key = impl::key(lemma.language(), lemma.form(), lemma.pos()) + '\t' + type + '\t' + (forward ? '>' : '<');
    
    lemma_set_memo_type::const_iterator iter = __lemma_lexical.find(key);
    if (iter != __lemma_lexical.end())
      return iter->second;
    
    // (id, form) of this side, then of the other side
    Query query;
    if (forward)
      query.select("id_source").select("id_target").select("w_target").where("w_source", lemma.form());
    else
      query.select("id_target").select("id_source").select("w_source").where("w_target", lemma.form());
    query.where("type", type);
    
    lemma_set_type lemmas;
    row_set_type rows;
    
    if (__database->query(lemma.language(), "relation", query, rows)) {
      row_set_type::const_iterator riter_end = rows.end();
      for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter) {
	const row_type& row = *riter;
	
	if (row[2].empty()) continue;
	
	// the same form under another part-of-speech is another lemma
	if (POS::is_concrete(lemma.pos()) && Identifier::pos(row[0]) != lemma.pos()) continue;
	
	lemmas.push_back(Lemma(row[2], Identifier::pos(row[1]), lemma.language(), this));
      }
    }
    
    impl::sort_unique(lemmas);
    
    return __lemma_lexical.insert(std::make_pair(key, lemmas)).first->second;
  }
  
  boost::optional<Morpho> Resolver::morpho(const Lemma& lemma) const
  {
    const std::string key = impl::key(lemma.language(), lemma.form(), lemma.pos()) + '\t' + lemma.id() + '\t' + lemma.miscellanea();
    
    morpho_memo_type::const_iterator iter = __morpho.find(key);
    if (iter != __morpho.end())
      return iter->second;
    
    Query query;
    query.where("lemma", lemma.form());
    if (! lemma.id().empty())
      query.where("id", lemma.id());
    if (POS::is_concrete(lemma.pos()))
      query.where("pos", std::string(1, lemma.pos()));
    if (! lemma.miscellanea().empty())
      query.where("miscellanea", lemma.miscellanea());
    
    boost::optional<Morpho> result;
    row_set_type rows;
    
    if (__database->query(lemma.language(), "morpho", query, rows) && ! rows.empty()) {
      if (rows.size() > 1) {
	disambiguation_error::candidate_set_type candidates;
	
	row_set_type::const_iterator riter_end = rows.end();
	for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter)
	  candidates.push_back(riter->front());
	
	throw disambiguation_error(lemma.form(), candidates);
      }
      
      result = Morpho(rows.front(), lemma.language());
    }
    
    __morpho.insert(std::make_pair(key, result));
    
    return result;
  }
  
  const Resolver::synset_set_type& Resolver::synsets(const Semfield& semfield) const
  {
    const std::string key = impl::key(semfield.language(), semfield.english(), semfield.code());
    
    synset_set_memo_type::const_iterator iter = __semfield_synsets.find(key);
    if (iter != __semfield_synsets.end())
      return iter->second;
    
    // english holds every field of a synset, match by token after the LIKE prefilter
    const Query query = Query().select("synset").select("english").like("english", '%' + Query::escape(semfield.english()) + '%');
    
    const language_type sources[2] = {Language::common(), semfield.language()};
    
    synset_set_type synsets;
    id_set_type     visited;
    token_set_type  tokens;
    row_set_type    rows;
    
    for (int i = 0; i != 2; ++ i) {
      if (i && sources[i] == sources[0]) continue;
      
      if (! __database->query(sources[i], "semfield", query, rows)) continue;
      
      row_set_type::const_iterator riter_end = rows.end();
      for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter) {
	split((*riter)[1], tokens);
	
	if (! impl::contains(tokens, semfield.english())) continue;
	if (! visited.insert((*riter)[0]).second) continue;
	
	const boost::optional<Synset> synset = this->synset((*riter)[0], semfield.language());
	if (synset)
	  synsets.push_back(*synset);
      }
    }
    
    return __semfield_synsets.insert(std::make_pair(key, synsets)).first->second;
  }
  
  const Resolver::semfield_set_type& Resolver::hypers(const Semfield& semfield) const
  {
    return neighbours(semfield, true);
  }
  
  const Resolver::semfield_set_type& Resolver::hypons(const Semfield& semfield) const
  {
    return neighbours(semfield, false);
  }
  
  const Resolver::semfield_set_type& Resolver::neighbours(const Semfield& semfield, const bool upward) const
  {
    semfield_set_memo_type& memo = (upward ? __semfield_hypers : __semfield_hypons);
    
    const std::string key = impl::key(semfield.language(), semfield.english(), semfield.code());
    
    semfield_set_memo_type::const_iterator iter = memo.find(key);
    if (iter != memo.end())
      return iter->second;
    
    const std::string column  = (upward ? "hypers" : "hypons");
    const std::string reverse = (upward ? "hypons" : "hypers");
    
    semfield_set_type neighbours;
    token_set_type names;
    token_set_type tokens;
    row_set_type rows;
    row_set_type candidates;
    
    if (__database->query(Language::common(), "semfield_hierarchy",
			  Query().select(column).where("english", semfield.english()).where("code", semfield.code()),
			  rows)) {
      row_set_type::const_iterator riter_end = rows.end();
      for (row_set_type::const_iterator riter = rows.begin(); riter != riter_end; ++ riter) {
	split((*riter)[0], names);
	
	token_set_type::const_iterator niter_end = names.end();
	for (token_set_type::const_iterator niter = names.begin(); niter != niter_end; ++ niter) {
	  __database->query(Language::common(), "semfield_hierarchy",
			    Query().select("code").select("english").select(reverse).where("english", *niter),
			    candidates);
	  
	  if (candidates.empty()) continue;
	  
	  // an ambiguous name resolves to the field which lists us back
	  row_set_type::const_iterator citer = candidates.begin();
	  if (candidates.size() > 1)
	    for (row_set_type::const_iterator fiter = candidates.begin(); fiter != candidates.end(); ++ fiter) {
	      split((*fiter)[2], tokens);
	      
	      if (impl::contains(tokens, semfield.english())) {
		citer = fiter;
		break;
	      }
	    }
	  
	  const Semfield neighbour((*citer)[1], (*citer)[0], semfield.language(), this);
	  
	  if (! impl::contains(neighbours, neighbour))
	    neighbours.push_back(neighbour);
	}
      }
    }
    
    return memo.insert(std::make_pair(key, neighbours)).first->second;
  }
  
  boost::optional<Semfield> Resolver::normal(const Semfield& semfield) const
  {
    const std::string key = impl::key(semfield.language(), semfield.english(), semfield.code());
    
    semfield_memo_type::const_iterator iter = __semfield_normal.find(key);
    if (iter != __semfield_normal.end())
      return iter->second;
    
    boost::optional<Semfield> result;
    row_set_type rows;
    
    if (__database->query(Language::common(), "semfield_hierarchy",
			  Query().select("normal").where("english", semfield.english()).where("code", semfield.code()),
			  rows)
	&& ! rows.empty()
	&& ! rows.front().front().empty()) {
      const english_type normal = rows.front().front();
      
      // prefer the normal field in the same top-level branch
      if (! semfield.code().empty())
	__database->query(Language::common(), "semfield_hierarchy",
			  Query().select("code").select("english").where("english", normal).like("code", Query::escape(semfield.code().substr(0, 2)) + '%'),
			  rows);
      else
	rows.clear();
      
      if (rows.empty())
	__database->query(Language::common(), "semfield_hierarchy",
			  Query().select("code").select("english").where("english", normal),
			  rows);
      
      if (! rows.empty())
	result = Semfield(rows.front()[1], rows.front()[0], semfield.language(), this);
    }
    
    __semfield_normal.insert(std::make_pair(key, result));
    
    return result;
  }
};
