#ifndef EXPANSION_H
#define EXPANSION_H

#include <map>
#include <vector>
#include "ConditionTester.h"
#include "DataStructures.h"
#include "Model.h"

/* FILTER_MODE: candidates start present; the ones whose presence breaks a condition are zeroed and returned.
   RETAIN_MODE: candidates start zeroed; the ones that have to be present for the conditions to pass are returned
   (everything else ends up zeroed) */
enum EXPANSIONMODE { FILTER_MODE, RETAIN_MODE };

class REDUCER {
 public:
  REDUCER(CONDITIONTESTER &t, EXPANSIONMODE m);
  REDUCER(CONDITIONTESTER &t, EXPANSIONMODE m, GAPFILLCACHE *c);

  /* Search order by reliability score (lowest first). NULL keeps the order of the input list */
  void setScores(const map<int, map<int,double> > *reliabilityScores);

  /* Divide and conquer. The condition must already be applied to the model.
     guards are positive-growth conditions a filtered reaction must not break (FILTER_MODE only) */
  EXPANSIONRESULT binaryExpansionTest(vector<CANDIDATE> &list, const TESTCONDITION &cond, const vector<TESTCONDITION> &guards);
  /* One candidate at a time. The condition must already be applied to the model */
  EXPANSIONRESULT linearExpansionTest(vector<CANDIDATE> &list, const TESTCONDITION &cond);

  /* Does the condition pass with every candidate in its final state (present for FILTER_MODE, zeroed for RETAIN_MODE)?
     Leaves the model as found */
  bool checkIfSolutionExists(const vector<CANDIDATE> &list, const TESTCONDITION &cond);

  /* Driver over a list of conditions. Returns GAPFILL_SUCCESS, NO_GAPFILL_SOLUTION or BAD_ARGUMENTS.
     result holds the filtered (FILTER_MODE) or needed (RETAIN_MODE) candidates.
     The bounds of the returned candidates stay changed on the model; everything else is restored */
  int reactionExpansionTest(const vector<CANDIDATE> &reactionList, const vector<TESTCONDITION> &conditions, bool binarySearch,
			    const vector<TESTCONDITION> &guards, vector<CANDIDATE> &result);

 private:
  CONDITIONTESTER &tester;
  MODEL &model;
  EXPANSIONMODE mode;
  GAPFILLCACHE *cache;
  const map<int, map<int,double> > *scores;

  void toProbe(const CANDIDATE &item);
  void toBase(const CANDIDATE &item);
  bool passesGuards(const vector<TESTCONDITION> &guards);
  void sortByScore(vector<CANDIDATE> &list) const;
  void recordFilter(const TESTCONDITION &cond, const vector<CANDIDATE> &filtered);
  void applyCachedFilter(const TESTCONDITION &cond, vector<CANDIDATE> &list, vector<CANDIDATE> &result);
};

#endif
