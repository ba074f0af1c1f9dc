#ifndef GAPFILLPKG_H
#define GAPFILLPKG_H

#include <map>
#include <set>
#include <string>
#include <vector>

#include "DataStructures.h"
#include "Model.h"
#include "score.h"

using std::set;

/* Owns the gapfilling model: a copy of the model extended with the database reactions, exchanges for
   extracellular metabolites that lack one, auto-sinks, and the blocked directions of irreversible model reactions.
   Candidates are (reaction, direction) pairs the gapfilling LP may open at a penalty */
class GAPFILLPKG {
 public:
  GAPFILLPKG(const MODEL &model, const RXNSPACE &database, const METSPACE &databaseMets,
	     const vector<string> &blacklist, const REACTIONGENESCORES &reactionScores);
  virtual ~GAPFILLPKG();

  MODEL& gfModel();
  GAPFILLCACHE& cache();
  const vector<CANDIDATE>& candidates() const;
  const OBJECTIVE& baseObjective() const;
  double minimumObjective() const;
  bool isOriginalReaction(int rxnId) const;

  /* minimumObj < 0 keeps the current minimum */
  void setBaseObjective(const OBJECTIVE &target, double minimumObj);
  void setMedia(const GROWTH &media);

  /* Can the target reach the minimum objective with the whole (remaining) database open?
     active gets the candidates that carry flux. lastTestStatus() tells an infeasible problem from a low objective */
  bool testGapfillDatabase(vector<CANDIDATE> &active);
  int lastTestStatus() const;

  /* Zero every candidate whose presence breaks one of the tests. Results of an earlier run (baseFilter) are replayed first */
  int filterDatabaseBasedOnTests(const vector<TESTCONDITION> &tests, const vector<TESTCONDITION> &growthConditions,
				 const GAPFILLCACHE *baseFilter, bool baseFilterOnly,
				 const vector<vector<CANDIDATE> > &activeReactionSets);

  GAPFILLSOLUTION computeGapfilledSolution(const map<int,FLUXPAIR> &fluxValues) const;
  /* Optimize and read the solution. Returns GAPFILL_SUCCESS or NO_GAPFILL_SOLUTION */
  int solveGapfilling(GAPFILLSOLUTION &solution);
  /* Filter the solution against the tests and re-solve until it passes them or iterationLimit is reached */
  int runTestConditions(const vector<TESTCONDITION> &tests, GAPFILLSOLUTION &solution, int iterationLimit);
  /* Reduce the solution to a minimal set that still reaches the minimum objective. Leaves the gapfilling model as found */
  int binaryCheckGapfillingSolution(GAPFILLSOLUTION &solution);

  /* Candidates in exclusion cost nothing; the others cost MODEL_PENALTY / (1 + best gene probability) */
  void computeGapfillingPenalties(const vector<CANDIDATE> &exclusion, const REACTIONGENESCORES &reactionScores);
  void buildGapfillingObjectiveFunction();
  /* Share the max-flux variables across media copies (needed before optimizeGlobal) */
  void createMaxFluxVariables();

  virtual int optimize(map<int,FLUXPAIR> &maxFlux, double &objectiveValue) = 0;
  virtual int optimizeGlobal(const vector<GROWTH> &medias, const vector<OBJECTIVE> &targets, const vector<double> &thresholds,
			     map<int,FLUXPAIR> &maxFlux, double &objectiveValue) = 0;

 protected:
  MODEL *gfmodel;
  set<int> originalIds;
  vector<CANDIDATE> candidateList;
  map<int,PENALTY> candidatePenalties;
  map<int,PENALTY> objectivePenalties;
  bool maxFluxShared;
  OBJECTIVE target;
  double minObj;
  int testStatus;
  GAPFILLCACHE gfCache;
  RELIABILITYSCORES reliabilityScores;
  bool scoresComputed;

  void addCandidate(int rxnId, int dir, int type);
  bool isCandidate(int rxnId, int dir) const;
  void knockoutOutsideSolution(BOUNDSCOPE &scope, const GAPFILLSOLUTION &solution);

 private:
  GAPFILLPKG(const GAPFILLPKG &other);
  GAPFILLPKG& operator=(const GAPFILLPKG &other);
};

/* GLPK gapfilling LP (see GAPFILL_SOLVE) */
class GLPKGAPFILLPKG : public GAPFILLPKG {
 public:
  GLPKGAPFILLPKG(const MODEL &model, const RXNSPACE &database, const METSPACE &databaseMets,
		 const vector<string> &blacklist, const REACTIONGENESCORES &reactionScores);
  int optimize(map<int,FLUXPAIR> &maxFlux, double &objectiveValue);
  int optimizeGlobal(const vector<GROWTH> &medias, const vector<OBJECTIVE> &targets, const vector<double> &thresholds,
		     map<int,FLUXPAIR> &maxFlux, double &objectiveValue);
};

#endif
