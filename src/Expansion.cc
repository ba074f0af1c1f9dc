#include <algorithm>
#include <cstdio>
#include <map>
#include <vector>

#include "ConditionTester.h"
#include "DataStructures.h"
#include "Expansion.h"
#include "Model.h"
#include "modelUtils.h"
#include "MyConstants.h"

/* Sorting helper - lowest reliability score first, unscored candidates last */
class SCORECOMPARE {
public:
  SCORECOMPARE(const map<int, map<int,double> > &s) : scores(s) {}
  double get(const CANDIDATE &c) const {
    map<int, map<int,double> >::const_iterator it = scores.find(c.id);
    if(it == scores.end()) { return _db.MAX_FLUX * _db.MAX_FLUX; }
    map<int,double>::const_iterator dit = it->second.find(c.dir);
    if(dit == it->second.end()) { return _db.MAX_FLUX * _db.MAX_FLUX; }
    return dit->second;
  }
  bool operator()(const CANDIDATE &a, const CANDIDATE &b) const {
    return get(a) < get(b);
  }
private:
  const map<int, map<int,double> > &scores;
};

static bool containsItem(const vector<CANDIDATE> &list, const CANDIDATE &item) {
  for(int i=0; i<list.size(); i++) {
    if(list[i].sameItem(item)) { return true; }
  }
  return false;
}

REDUCER::REDUCER(CONDITIONTESTER &t, EXPANSIONMODE m) : tester(t), model(t.getModel()) {
  mode = m;
  cache = NULL;
  scores = NULL;
}

REDUCER::REDUCER(CONDITIONTESTER &t, EXPANSIONMODE m, GAPFILLCACHE *c) : tester(t), model(t.getModel()) {
  mode = m;
  cache = c;
  scores = NULL;
}

void REDUCER::setScores(const map<int, map<int,double> > *reliabilityScores) {
  scores = reliabilityScores;
}

/* Probe = the state the search starts from, base = the state a decided candidate ends in */
void REDUCER::toProbe(const CANDIDATE &item) {
  if(mode == FILTER_MODE) { model.setBound(item.id, item.dir, item.originalBound); }
  else { model.setBound(item.id, item.dir, 0.0f); }
}

void REDUCER::toBase(const CANDIDATE &item) {
  if(mode == FILTER_MODE) { model.setBound(item.id, item.dir, 0.0f); }
  else { model.setBound(item.id, item.dir, item.originalBound); }
}

/* Each guard is applied in turn, so the caller's media and objective are gone afterwards */
bool REDUCER::passesGuards(const vector<TESTCONDITION> &guards) {
  for(int i=0; i<guards.size(); i++) {
    if(!tester.testSingleCondition(guards[i], true)) {
      if(_db.DEBUGREDUCER) { printf("Does not pass positive growth test on media %s\n", guards[i].media.id.c_str()); }
      return false;
    }
  }
  return true;
}

EXPANSIONRESULT REDUCER::binaryExpansionTest(vector<CANDIDATE> &list, const TESTCONDITION &cond, const vector<TESTCONDITION> &guards) {
  EXPANSIONRESULT result;
  if(list.empty()) { return result; }

  if(tester.testSingleCondition(cond, false)) { return result; }

  if(list.size() == 1) {
    CANDIDATE &item = list[0];
    toBase(item);
    double decisionScore = tester.score();
    bool success = true;
    if(mode == FILTER_MODE && !guards.empty()) {
      success = passesGuards(guards);
      /* Only the condition under test is put back. Whatever else was applied before the guards is not restored */
      tester.applyTestCondition(cond);
    }
    if(success) {
      item.score = decisionScore;
      result.filtered.push_back(item);
    } else {
      toProbe(item);
      result.hasBreaking = true;
      result.breaking = item;
    }
    return result;
  }

  int midway = list.size() / 2;
  vector<CANDIDATE> first(list.begin(), list.begin() + midway);
  vector<CANDIDATE> second(list.begin() + midway, list.end());

  for(int i=0; i<second.size(); i++) { toBase(second[i]); }
  EXPANSIONRESULT sub = binaryExpansionTest(first, cond, guards);
  result.filtered.insert(result.filtered.end(), sub.filtered.begin(), sub.filtered.end());
  if(sub.hasBreaking) {
    if(_db.DEBUGREDUCER) { printf("Ending early due to breaking reaction %d%c\n", sub.breaking.id, dirChar(sub.breaking.dir)); }
    result.hasBreaking = true;
    result.breaking = sub.breaking;
    return result;
  }

  for(int i=0; i<second.size(); i++) { toProbe(second[i]); }
  sub = binaryExpansionTest(second, cond, guards);
  result.filtered.insert(result.filtered.end(), sub.filtered.begin(), sub.filtered.end());
  if(sub.hasBreaking) {
    result.hasBreaking = true;
    result.breaking = sub.breaking;
  }
  return result;
}

EXPANSIONRESULT REDUCER::linearExpansionTest(vector<CANDIDATE> &list, const TESTCONDITION &cond) {
  EXPANSIONRESULT result;
  if(tester.testSingleCondition(cond, false)) { return result; }

  /* Everything to base first, then one at a time back to the probe state */
  for(int i=0; i<list.size(); i++) { toBase(list[i]); }
  for(int i=0; i<list.size(); i++) {
    toProbe(list[i]);
    if(!tester.testSingleCondition(cond, false)) {
      toBase(list[i]);
      if(!containsItem(result.filtered, list[i])) {
	CANDIDATE item = list[i];
	item.score = tester.score();
	result.filtered.push_back(item);
      }
    }
  }
  return result;
}

bool REDUCER::checkIfSolutionExists(const vector<CANDIDATE> &list, const TESTCONDITION &cond) {
  BOUNDSCOPE scope(model, true);
  for(int i=0; i<list.size(); i++) {
    if(mode == FILTER_MODE) { scope.zero(list[i].id, list[i].dir); }
    else { scope.setBound(list[i].id, list[i].dir, list[i].originalBound); }
  }
  return tester.testSingleCondition(cond, true);
}

void REDUCER::sortByScore(vector<CANDIDATE> &list) const {
  if(scores == NULL) { return; }
  SCORECOMPARE cmp(*scores);
  std::stable_sort(list.begin(), list.end(), cmp);
  if(_db.DEBUGREDUCER) {
    for(int i=0; i<list.size(); i++) { printf("%d%c:%4.3f\n", list[i].id, dirChar(list[i].dir), cmp.get(list[i])); }
  }
}

void REDUCER::recordFilter(const TESTCONDITION &cond, const vector<CANDIDATE> &filtered) {
  if(cache == NULL) { return; }
  map<pair<int,int>, CANDIDATE> &entry = cache->gfFilter[FILTERKEY(cond)];
  for(int i=0; i<filtered.size(); i++) {
    pair<int,int> key(filtered[i].id, filtered[i].dir);
    if(entry.count(key) == 0) { entry[key] = filtered[i]; }
  }
}

/* Reactions filtered by an earlier run for the same condition are zeroed without being searched again */
void REDUCER::applyCachedFilter(const TESTCONDITION &cond, vector<CANDIDATE> &list, vector<CANDIDATE> &result) {
  if(cache == NULL) { return; }
  map<FILTERKEY, map<pair<int,int>, CANDIDATE> >::const_iterator it = cache->gfFilter.find(FILTERKEY(cond));
  if(it == cache->gfFilter.end()) { return; }
  vector<CANDIDATE> remaining;
  for(int i=0; i<list.size(); i++) {
    map<pair<int,int>, CANDIDATE>::const_iterator rec = it->second.find(pair<int,int>(list[i].id, list[i].dir));
    if(rec == it->second.end()) { remaining.push_back(list[i]); continue; }
    model.setBound(list[i].id, list[i].dir, 0.0f);
    if(!containsItem(result, list[i])) { result.push_back(rec->second); }
  }
  list = remaining;
}

int REDUCER::reactionExpansionTest(const vector<CANDIDATE> &reactionList, const vector<TESTCONDITION> &conditions, bool binarySearch,
				   const vector<TESTCONDITION> &guards, vector<CANDIDATE> &result) {
  result.clear();
  if(conditions.empty()) {
    printf("ERROR: reactionExpansionTest called without any test condition\n");
    return BAD_ARGUMENTS;
  }
  vector<CANDIDATE> list;
  for(int i=0; i<reactionList.size(); i++) {
    if(!model.hasReaction(reactionList[i].id)) {
      printf("ERROR: Candidate reaction %d is not in the model\n", reactionList[i].id);
      return BAD_ARGUMENTS;
    }
    if(containsItem(list, reactionList[i])) { continue; }
    CANDIDATE item = reactionList[i];
    item.originalBound = model.getBound(item.id, item.dir);
    list.push_back(item);
  }
  sortByScore(list);
  if(_db.DEBUGREDUCER) { printf("Expansion started! Binary = %d, %d candidates\n", binarySearch, (int)list.size()); }

  vector<CANDIDATE> needed;
  for(int c=0; c<conditions.size(); c++) {
    const TESTCONDITION &cond = conditions[c];
    if(mode == FILTER_MODE) { applyCachedFilter(cond, list, result); }

    if(!checkIfSolutionExists(list, cond)) {
      if(_db.DEBUGREDUCER) { printf("No solution exists that passes tests for condition %s\n", cond.media.id.c_str()); }
      return NO_GAPFILL_SOLUTION;
    }

    vector<CANDIDATE> searchList = list;
    EXPANSIONRESULT pass;
    {
      BOUNDSCOPE scope(model, true);
      tester.applyTestCondition(cond);
      for(int i=0; i<searchList.size(); i++) { toProbe(searchList[i]); }
      bool done = false;
      while(!done) {
	if(binarySearch) { pass = binaryExpansionTest(searchList, cond, guards); }
	else { pass = linearExpansionTest(searchList, cond); }
	if(!pass.hasBreaking) {
	  done = true;
	  continue;
	}
	/* The breaking reaction is kept as it is and the search restarts on the rest */
	if(_db.DEBUGREDUCER) { printf("Keeping breaking reaction %d%c\n", pass.breaking.id, dirChar(pass.breaking.dir)); }
	vector<CANDIDATE> rest;
	for(int i=0; i<searchList.size(); i++) {
	  if(!searchList[i].sameItem(pass.breaking)) { rest.push_back(searchList[i]); }
	}
	searchList = rest;
	for(int i=0; i<searchList.size(); i++) { toProbe(searchList[i]); }
	if(!checkIfSolutionExists(searchList, cond)) {
	  if(_db.DEBUGREDUCER) { printf("No solution exists after retaining breaking reaction %d\n", pass.breaking.id); }
	  return NO_GAPFILL_SOLUTION;
	}
	tester.applyTestCondition(cond);
      }
    }

    if(mode == FILTER_MODE) {
      /* The scope put every bound back; the decisions of this condition are made persistent here */
      for(int i=0; i<pass.filtered.size(); i++) {
	model.setBound(pass.filtered[i].id, pass.filtered[i].dir, 0.0f);
	if(!containsItem(result, pass.filtered[i])) { result.push_back(pass.filtered[i]); }
      }
      recordFilter(cond, pass.filtered);
      vector<CANDIDATE> remaining;
      for(int i=0; i<list.size(); i++) {
	if(!containsItem(pass.filtered, list[i])) { remaining.push_back(list[i]); }
      }
      list = remaining;
    } else {
      for(int i=0; i<pass.filtered.size(); i++) {
	if(!containsItem(needed, pass.filtered[i])) { needed.push_back(pass.filtered[i]); }
      }
    }
    if(_db.DEBUGREDUCER) {
      printf("Expansion on %s: %d decided out of %d\n", cond.media.id.c_str(), (int)pass.filtered.size(), (int)searchList.size());
    }
  }

  if(mode == RETAIN_MODE) {
    for(int i=0; i<list.size(); i++) {
      if(containsItem(needed, list[i])) {
	for(int j=0; j<needed.size(); j++) {
	  if(needed[j].sameItem(list[i])) { result.push_back(needed[j]); }
	}
      } else {
	model.setBound(list[i].id, list[i].dir, 0.0f);
      }
    }
  }
  return GAPFILL_SUCCESS;
}
