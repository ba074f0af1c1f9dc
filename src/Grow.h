#ifndef GROW_H
#define GROW_H

/******************** GROW.h  ****************
    Gapfilling driver: tests and filters the
    gapfilling database, solves the gapfilling
    LP for one or many media and integrates the
    solutions into the model
****************************************/

#include <map>
#include <string>
#include <vector>

#include "DataStructures.h"
#include "GapfillPkg.h"
#include "Model.h"
#include "score.h"

class GAPFILLPARAMS {
 public:
  double minimumObj;
  int testConditionIterationLimit;
  GAPFILLPARAMS();
};

class MULTIGAPFILLOPTIONS {
 public:
  INTEGRATIONPOLICY mode;
  bool binaryCheck;
  bool prefilter;
  bool checkForGrowth;
  bool runSensitivityAnalysis;
  bool integrateSolutions; /* false: work on a copy of the model and leave the model untouched */
  bool removeUnneededReactions;
  double defaultMinimumObjective; /* < 0: use GAPFILLPARAMS::minimumObj */
  map<string, OBJECTIVE> targetHash; /* media id --> target (default: the target passed in) */
  map<string, double> minimumObjectives; /* media id --> threshold */
  MULTIGAPFILLOPTIONS();
};

/* The media / target / threshold triples (with matching growth conditions) that survived the database tests */
class GAPFILLCONDITIONS {
 public:
  vector<GROWTH> medias;
  vector<OBJECTIVE> targets;
  vector<double> thresholds;
  vector<TESTCONDITION> conditions;
  vector<vector<CANDIDATE> > activeReactions;
  bool empty() const;
};

class GAPFILLER {
 public:
  /* testConditions are the conditions every gapfilled model has to pass (ATP tests and the like) */
  GAPFILLER(MODEL &model, GAPFILLPKG &package, const vector<TESTCONDITION> &testConditions,
	    const REACTIONGENESCORES &reactionScores);
  GAPFILLER(MODEL &model, GAPFILLPKG &package, const vector<TESTCONDITION> &testConditions,
	    const REACTIONGENESCORES &reactionScores, const GAPFILLPARAMS &parameters);
  ~GAPFILLER();

  /* Can the target be reached on media with the gapfilling database? On failure the biomass compounds
     that cannot be made are stored in the sensitivity cache ("FBF" before filtering, "FAF" after) */
  bool testGapfillDatabase(const GROWTH &media, const OBJECTIVE &target, bool beforeFiltering, vector<CANDIDATE> &active);
  GAPFILLCONDITIONS testAndAdjustGapfillingConditions(const vector<GROWTH> &medias, const vector<OBJECTIVE> &targets,
						      const vector<double> &thresholds, bool prefilter);
  int prefilter(const vector<TESTCONDITION> &growthConditions, bool usePriorFiltering, bool baseFilterOnly,
		const vector<vector<CANDIDATE> > &activeReactionSets);

  /* An empty target / minimumObj < 0 mean the package's current target / the default minimum */
  int runGapfilling(const GROWTH &media, const OBJECTIVE &target, double minimumObj, bool binaryCheck, bool prefilter,
		    GAPFILLSOLUTION &solution);
  int runGlobalGapfilling(const vector<GROWTH> &medias, const vector<OBJECTIVE> &targets, const vector<double> &thresholds,
			  bool binaryCheck, bool prefilter, GAPFILLSOLUTION &solution);
  /* solutions: media id --> integrated solution for that media */
  int runMultiGapfill(const vector<GROWTH> &mediaList, const OBJECTIVE &target, const MULTIGAPFILLOPTIONS &options,
		      map<string, GAPFILLSOLUTION> &solutions);
  int integrateGapfillSolution(const GAPFILLSOLUTION &solution, vector<CANDIDATE> &cumulativeSolution, bool removeUnneeded,
			       bool checkForGrowth, INTEGRATIONPOLICY mode, GAPFILLSOLUTION &integratedSolution);

  MODEL& model();
  GAPFILLCACHE& cache();
  const vector<GAPFILLSOLUTION>& integratedGapfillings() const;
  const vector<CANDIDATE>& cumulativeGapfilling() const;
  const GAPFILLSOLUTION& lastSolution() const;

 private:
  MODEL *liveModel;
  MODEL *currentModel;
  GAPFILLPKG &pkg;
  GAPFILLPARAMS params;
  vector<TESTCONDITION> tests;
  REACTIONGENESCORES reactionScores;
  GAPFILLCACHE gfCache;
  vector<GAPFILLSOLUTION> integrated;
  vector<CANDIDATE> cumulative;
  GAPFILLSOLUTION last;

  int copyReactionFromGapfillModel(int rxnId);
  void assignGene(int rxnId);
  void pruneSolutions(const vector<CANDIDATE> &unneeded, vector<CANDIDATE> &cumulativeSolution, map<string, GAPFILLSOLUTION> &solutions);
  void runSensitivityAnalysis(const GAPFILLCONDITIONS &conditions, const map<string, GAPFILLSOLUTION> &solutions);

  GAPFILLER(const GAPFILLER &other);
  GAPFILLER& operator=(const GAPFILLER &other);
};

#endif
