#include <algorithm>
#include <cstdio>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "ConditionTester.h"
#include "DataStructures.h"
#include "Exchanges.h"
#include "Expansion.h"
#include "GapfillPkg.h"
#include "genericLinprog.h"
#include "Model.h"
#include "modelUtils.h"
#include "MyConstants.h"
#include "Printers.h"
#include "score.h"
#include "SolutionTester.h"

static bool isBlacklisted(const vector<string> &blacklist, const REACTION &rxn) {
  string core = coreId(rxn.name);
  for(int i=0; i<blacklist.size(); i++) {
    if(blacklist[i] == rxn.name || blacklist[i] == core) { return true; }
  }
  return false;
}

GAPFILLPKG::GAPFILLPKG(const MODEL &model, const RXNSPACE &database, const METSPACE &databaseMets,
		       const vector<string> &blacklist, const REACTIONGENESCORES &reactionScores) {
  gfmodel = model.clone();
  maxFluxShared = false;
  minObj = _db.DEFAULT_MINIMUM_OBJ;
  testStatus = SOLVE_FAILED;
  scoresComputed = false;
  target = model.getObjective();

  for(int i=0; i<model.reactions.rxns.size(); i++) { originalIds.insert(model.reactions.rxns[i].id); }

  for(int i=0; i<database.rxns.size(); i++) {
    const REACTION &dbrxn = database.rxns[i];
    if(isBlacklisted(blacklist, dbrxn)) { continue; }

    if(originalIds.count(dbrxn.id) > 0) {
      /* Open the blocked direction of irreversible model reactions if the database allows it */
      double ub = gfmodel->getBound(dbrxn.id, FORWARD);
      double lb = gfmodel->getBound(dbrxn.id, REVERSE);
      if(ub <= 0 && dbrxn.ub > 0) {
	gfmodel->setBound(dbrxn.id, FORWARD, dbrxn.ub);
	addCandidate(dbrxn.id, FORWARD, REVERSED_REACTION);
      }
      if(lb >= 0 && dbrxn.lb < 0) {
	gfmodel->setBound(dbrxn.id, REVERSE, dbrxn.lb);
	addCandidate(dbrxn.id, REVERSE, REVERSED_REACTION);
      }
      continue;
    }

    bool metsOk = true;
    for(int j=0; j<dbrxn.stoich.size(); j++) {
      if(gfmodel->metabolites.idIn(dbrxn.stoich[j].met_id)) { continue; }
      if(!databaseMets.idIn(dbrxn.stoich[j].met_id)) {
	printf("WARNING: Database reaction %s uses unknown metabolite %d and is skipped\n", dbrxn.name, dbrxn.stoich[j].met_id);
	metsOk = false;
	break;
      }
      gfmodel->addMetabolite(databaseMets.metFromId(dbrxn.stoich[j].met_id));
    }
    if(!metsOk) { continue; }
    if(gfmodel->addReaction(dbrxn) != GAPFILL_SUCCESS) { continue; }
    if(dbrxn.ub > 0) { addCandidate(dbrxn.id, FORWARD, NEW_REACTION); }
    if(dbrxn.lb < 0) { addCandidate(dbrxn.id, REVERSE, NEW_REACTION); }
  }

  vector<int> added;
  AddMissingExchanges(gfmodel->reactions, gfmodel->metabolites, added);
  AddAutoSinks(gfmodel->reactions, gfmodel->metabolites, added);
  for(int i=0; i<added.size(); i++) {
    const REACTION *rxn = gfmodel->reactions.rxnPtrFromId(added[i]);
    if(rxn->ub > 0) { addCandidate(rxn->id, FORWARD, NEW_REACTION); }
    if(rxn->lb < 0) { addCandidate(rxn->id, REVERSE, NEW_REACTION); }
  }

  if(_db.DEBUGGAPFILL) {
    printf("Gapfilling model: %d reactions, %d metabolites, %d candidates\n", (int)gfmodel->reactions.rxns.size(),
	   (int)gfmodel->metabolites.mets.size(), (int)candidateList.size());
  }

  computeGapfillingPenalties(vector<CANDIDATE>(), reactionScores);
  buildGapfillingObjectiveFunction();
}

GAPFILLPKG::~GAPFILLPKG() {
  delete gfmodel;
}

MODEL& GAPFILLPKG::gfModel() {
  return *gfmodel;
}

GAPFILLCACHE& GAPFILLPKG::cache() {
  return gfCache;
}

const vector<CANDIDATE>& GAPFILLPKG::candidates() const {
  return candidateList;
}

const OBJECTIVE& GAPFILLPKG::baseObjective() const {
  return target;
}

double GAPFILLPKG::minimumObjective() const {
  return minObj;
}

bool GAPFILLPKG::isOriginalReaction(int rxnId) const {
  return originalIds.count(rxnId) > 0;
}

void GAPFILLPKG::addCandidate(int rxnId, int dir, int type) {
  if(isCandidate(rxnId, dir)) { return; }
  candidateList.push_back(CANDIDATE(rxnId, dir, type));
}

bool GAPFILLPKG::isCandidate(int rxnId, int dir) const {
  for(int i=0; i<candidateList.size(); i++) {
    if(candidateList[i].id == rxnId && candidateList[i].dir == dir) { return true; }
  }
  return false;
}

void GAPFILLPKG::setBaseObjective(const OBJECTIVE &obj, double minimumObj) {
  target = obj;
  target.sense = 1;
  if(minimumObj >= 0) { minObj = minimumObj; }
  gfmodel->setObjective(target);
  if(_db.DEBUGGAPFILL) { printObjective(target); }
}

void GAPFILLPKG::setMedia(const GROWTH &media) {
  gfmodel->setMedia(media);
}

bool GAPFILLPKG::testGapfillDatabase(vector<CANDIDATE> &active) {
  active.clear();
  gfmodel->setObjective(target);
  FBARESULT res = gfmodel->solve();
  testStatus = res.status;
  if(res.status != SOLVE_OPTIMAL) {
    if(_db.DEBUGGAPFILL) { printf("Gapfilling database test on %s is not optimal (status %d)\n", gfmodel->getMedia().id.c_str(), res.status); }
    return false;
  }
  for(int i=0; i<candidateList.size(); i++) {
    double flux = res.fluxOf(candidateList[i].id);
    if(flux*candidateList[i].dir > _db.SOLUTION_FLUX_CUTOFF) { active.push_back(candidateList[i]); }
  }
  if(res.objective < minObj) {
    if(_db.DEBUGGAPFILL) { printf("Gapfilling database reaches only %4.6f on %s (minimum %4.6f)\n", res.objective, gfmodel->getMedia().id.c_str(), minObj); }
    return false;
  }
  return true;
}

int GAPFILLPKG::lastTestStatus() const {
  return testStatus;
}

int GAPFILLPKG::filterDatabaseBasedOnTests(const vector<TESTCONDITION> &tests, const vector<TESTCONDITION> &growthConditions,
					   const GAPFILLCACHE *baseFilter, bool baseFilterOnly,
					   const vector<vector<CANDIDATE> > &activeReactionSets) {
  /* Replay the filter of an earlier run */
  if(baseFilter != NULL) {
    map<FILTERKEY, map<pair<int,int>, CANDIDATE> >::const_iterator it;
    for(it = baseFilter->gfFilter.begin(); it != baseFilter->gfFilter.end(); it++) {
      map<pair<int,int>, CANDIDATE>::const_iterator rit;
      for(rit = it->second.begin(); rit != it->second.end(); rit++) {
	if(gfmodel->hasReaction(rit->first.first)) { gfmodel->setBound(rit->first.first, rit->first.second, 0.0f); }
      }
    }
    gfCache.mergeFilter(*baseFilter);
  }
  if(baseFilterOnly) { return GAPFILL_SUCCESS; }
  if(tests.empty()) { return GAPFILL_SUCCESS; }

  vector<CANDIDATE> list;
  for(int i=0; i<candidateList.size(); i++) {
    if(gfmodel->getBound(candidateList[i].id, candidateList[i].dir) != 0) { list.push_back(candidateList[i]); }
  }

  if(!scoresComputed) {
    reliabilityScores = assignReliabilityScoresToReactions(gfmodel->reactions, gfmodel->metabolites, activeReactionSets);
    scoresComputed = true;
  }

  GROWTH media = gfmodel->getMedia();
  OBJECTIVE obj = gfmodel->getObjective();

  CONDITIONTESTER tester(*gfmodel);
  REDUCER reducer(tester, FILTER_MODE, &gfCache);
  reducer.setScores(&reliabilityScores);
  vector<CANDIDATE> filtered;
  int status = reducer.reactionExpansionTest(list, tests, true, growthConditions, filtered);

  gfmodel->setObjective(obj);
  if(!media.empty()) { gfmodel->setMedia(media); }

  if(status != GAPFILL_SUCCESS) {
    printf("WARNING: No filtered gapfilling database passes the tests (status %d)\n", status);
    return status;
  }
  if(_db.DEBUGGAPFILL) { printf("Filtered %d out of %d candidates\n", (int)filtered.size(), (int)list.size()); }
  return GAPFILL_SUCCESS;
}

GAPFILLSOLUTION GAPFILLPKG::computeGapfilledSolution(const map<int,FLUXPAIR> &fluxValues) const {
  GAPFILLSOLUTION solution;
  solution.media = gfmodel->getMedia();
  solution.target = target;
  solution.minObjective = minObj;
  map<int,FLUXPAIR>::const_iterator it;
  for(it = fluxValues.begin(); it != fluxValues.end(); it++) {
    int id = it->first;
    map<int,int> &dest = isOriginalReaction(id) ? solution.reversedRxns : solution.newRxns;
    if(it->second.forward > _db.SOLUTION_FLUX_CUTOFF && isCandidate(id, FORWARD)) {
      dest[id] = FORWARD;
    } else if(it->second.reverse > _db.SOLUTION_FLUX_CUTOFF && isCandidate(id, REVERSE)) {
      dest[id] = REVERSE;
    }
  }
  return solution;
}

int GAPFILLPKG::solveGapfilling(GAPFILLSOLUTION &solution) {
  map<int,FLUXPAIR> maxFlux;
  double objectiveValue;
  int status = optimize(maxFlux, objectiveValue);
  if(status != GAPFILL_SUCCESS) {
    printf("WARNING: No gapfilling solution found for %s\n", gfmodel->getMedia().id.c_str());
    return NO_GAPFILL_SOLUTION;
  }
  if(_db.DEBUGGAPFILL) { printf("Gapfilling objective value %4.6f for media %s\n", objectiveValue, gfmodel->getMedia().id.c_str()); }
  solution = computeGapfilledSolution(maxFlux);
  return GAPFILL_SUCCESS;
}

/* Every candidate that is not part of the solution is closed (inside the given scope) */
void GAPFILLPKG::knockoutOutsideSolution(BOUNDSCOPE &scope, const GAPFILLSOLUTION &solution) {
  vector<CANDIDATE> list = convertSolutionToList(solution);
  for(int i=0; i<candidateList.size(); i++) {
    if(findItemInSolution(list, candidateList[i], false)) { continue; }
    scope.zero(candidateList[i].id, candidateList[i].dir);
  }
}

int GAPFILLPKG::runTestConditions(const vector<TESTCONDITION> &tests, GAPFILLSOLUTION &solution, int iterationLimit) {
  if(tests.empty()) { return GAPFILL_SUCCESS; }
  vector<TESTCONDITION> changeTests = tests;
  for(int i=0; i<changeTests.size(); i++) { changeTests[i].change = true; }

  GAPFILLSOLUTION current = solution;
  for(int iteration = 0; ; iteration++) {
    vector<CANDIDATE> filtered;
    int status;
    {
      BOUNDSCOPE scope(*gfmodel, true);
      knockoutOutsideSolution(scope, current);
      CONDITIONTESTER tester(*gfmodel);
      REDUCER reducer(tester, FILTER_MODE);
      status = reducer.reactionExpansionTest(convertSolutionToList(current), changeTests, true, vector<TESTCONDITION>(), filtered);
    }
    if(status != GAPFILL_SUCCESS) { return status; }
    if(filtered.empty()) {
      solution = current;
      return GAPFILL_SUCCESS;
    }
    if(iteration >= iterationLimit) {
      printf("WARNING: Gapfilling test failed %d times, no more iterations\n", iteration+1);
      return NO_GAPFILL_SOLUTION;
    }
    printf("Gapfilling test failed %d\n", iteration+1);
    /* Filtered reactions are closed for good and the gapfilling is re-run */
    for(int i=0; i<filtered.size(); i++) { gfmodel->setBound(filtered[i].id, filtered[i].dir, 0.0f); }
    GAPFILLSOLUTION next;
    if(solveGapfilling(next) != GAPFILL_SUCCESS) { return NO_GAPFILL_SOLUTION; }
    next.media = current.media;
    next.target = current.target;
    next.minObjective = current.minObjective;
    current = next;
  }
}

int GAPFILLPKG::binaryCheckGapfillingSolution(GAPFILLSOLUTION &solution) {
  vector<CANDIDATE> needed;
  int status;
  {
    BOUNDSCOPE scope(*gfmodel, true);
    knockoutOutsideSolution(scope, solution);
    TESTCONDITION cond(gfmodel->getMedia(), target, false, minObj);
    CONDITIONTESTER tester(*gfmodel);
    REDUCER reducer(tester, RETAIN_MODE);
    status = reducer.reactionExpansionTest(convertSolutionToList(solution), vector<TESTCONDITION>(1, cond), true,
					   vector<TESTCONDITION>(), needed);
  }
  if(status != GAPFILL_SUCCESS) { return status; }

  GAPFILLSOLUTION reduced = solution;
  reduced.newRxns.clear();
  reduced.reversedRxns.clear();
  reduced.binaryCheck = true;
  for(int i=0; i<needed.size(); i++) {
    if(needed[i].type == REVERSED_REACTION) { reduced.reversedRxns[needed[i].id] = needed[i].dir; }
    else { reduced.newRxns[needed[i].id] = needed[i].dir; }
  }
  if(_db.DEBUGGAPFILL) { printf("Binary check reduced the solution from %d to %d reactions\n", gapfillCount(solution), gapfillCount(reduced)); }
  solution = reduced;
  return GAPFILL_SUCCESS;
}

void GAPFILLPKG::computeGapfillingPenalties(const vector<CANDIDATE> &exclusion, const REACTIONGENESCORES &reactionScores) {
  candidatePenalties.clear();
  for(int i=0; i<candidateList.size(); i++) {
    const CANDIDATE &c = candidateList[i];
    double penalty = _db.MODEL_PENALTY;
    const REACTION *rxn = gfmodel->reactions.rxnPtrFromId(c.id);
    if(rxn != NULL) {
      string gene;
      double best = bestGeneProbability(reactionScores, *rxn, gene);
      if(best >= 0) { penalty = penalty / (1 + best); }
    }
    if(findItemInSolution(exclusion, c, false)) { penalty = 0.0f; }
    if(c.dir == FORWARD) { candidatePenalties[c.id].forward = penalty; }
    else { candidatePenalties[c.id].reverse = penalty; }
  }
}

void GAPFILLPKG::buildGapfillingObjectiveFunction() {
  objectivePenalties = candidatePenalties;
}

void GAPFILLPKG::createMaxFluxVariables() {
  maxFluxShared = true;
}

/************************* GLPKGAPFILLPKG *************************/

GLPKGAPFILLPKG::GLPKGAPFILLPKG(const MODEL &model, const RXNSPACE &database, const METSPACE &databaseMets,
			       const vector<string> &blacklist, const REACTIONGENESCORES &reactionScores)
  : GAPFILLPKG(model, database, databaseMets, blacklist, reactionScores) {
}

int GLPKGAPFILLPKG::optimize(map<int,FLUXPAIR> &maxFlux, double &objectiveValue) {
  if(target.empty()) {
    printf("ERROR: No gapfilling target has been set\n");
    return BAD_ARGUMENTS;
  }
  vector<RXNSPACE> copies(1, gfmodel->reactions);
  const char *lpName = NULL;
  if(_db.DEBUGGAPFILL) { lpName = "StandardGapfill.lp"; }
  return GAPFILL_SOLVE(copies, gfmodel->metabolites, vector<OBJECTIVE>(1, target), vector<double>(1, minObj),
		       objectivePenalties, maxFlux, objectiveValue, lpName);
}

/* One copy of the gapfilling network per media, all sharing the max-flux variables */
int GLPKGAPFILLPKG::optimizeGlobal(const vector<GROWTH> &medias, const vector<OBJECTIVE> &targets, const vector<double> &thresholds,
				   map<int,FLUXPAIR> &maxFlux, double &objectiveValue) {
  if(!maxFluxShared) {
    printf("ERROR: createMaxFluxVariables has to be called before global gapfilling\n");
    return BAD_ARGUMENTS;
  }
  if(medias.empty() || medias.size() != targets.size() || medias.size() != thresholds.size()) {
    printf("ERROR: Global gapfilling needs one target and one threshold per media\n");
    return BAD_ARGUMENTS;
  }
  vector<RXNSPACE> copies;
  for(int i=0; i<medias.size(); i++) {
    BOUNDSCOPE scope(*gfmodel, true);
    gfmodel->setMedia(medias[i]);
    copies.push_back(gfmodel->reactions);
  }
  const char *lpName = NULL;
  if(_db.DEBUGGAPFILL) { lpName = "GlobalGapfill.lp"; }
  return GAPFILL_SOLVE(copies, gfmodel->metabolites, targets, thresholds, objectivePenalties, maxFlux, objectiveValue, lpName);
}
