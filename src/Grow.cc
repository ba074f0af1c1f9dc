#include <cstdio>
#include <map>
#include <string>
#include <vector>

#include "DataStructures.h"
#include "GapfillPkg.h"
#include "Grow.h"
#include "Model.h"
#include "modelUtils.h"
#include "MyConstants.h"
#include "Printers.h"
#include "score.h"
#include "Sensitivity.h"
#include "SolutionTester.h"

GAPFILLPARAMS::GAPFILLPARAMS() {
  minimumObj = _db.DEFAULT_MINIMUM_OBJ;
  testConditionIterationLimit = _db.TEST_CONDITION_ITERATION_LIMIT;
}

MULTIGAPFILLOPTIONS::MULTIGAPFILLOPTIONS() {
  mode = SEQUENTIAL;
  binaryCheck = false;
  prefilter = true;
  checkForGrowth = true;
  runSensitivityAnalysis = true;
  integrateSolutions = true;
  removeUnneededReactions = true;
  defaultMinimumObjective = -1.0f;
}

bool GAPFILLCONDITIONS::empty() const {
  return medias.empty();
}

GAPFILLER::GAPFILLER(MODEL &model, GAPFILLPKG &package, const vector<TESTCONDITION> &testConditions,
		     const REACTIONGENESCORES &scores) : pkg(package) {
  liveModel = &model;
  currentModel = &model;
  tests = testConditions;
  reactionScores = scores;
}

GAPFILLER::GAPFILLER(MODEL &model, GAPFILLPKG &package, const vector<TESTCONDITION> &testConditions,
		     const REACTIONGENESCORES &scores, const GAPFILLPARAMS &parameters) : pkg(package) {
  liveModel = &model;
  currentModel = &model;
  tests = testConditions;
  reactionScores = scores;
  params = parameters;
}

GAPFILLER::~GAPFILLER() {
  if(currentModel != liveModel) { delete currentModel; }
}

MODEL& GAPFILLER::model() {
  return *currentModel;
}

GAPFILLCACHE& GAPFILLER::cache() {
  return gfCache;
}

const vector<GAPFILLSOLUTION>& GAPFILLER::integratedGapfillings() const {
  return integrated;
}

const vector<CANDIDATE>& GAPFILLER::cumulativeGapfilling() const {
  return cumulative;
}

const GAPFILLSOLUTION& GAPFILLER::lastSolution() const {
  return last;
}

bool GAPFILLER::testGapfillDatabase(const GROWTH &media, const OBJECTIVE &target, bool beforeFiltering, vector<CANDIDATE> &active) {
  if(!target.empty()) { pkg.setBaseObjective(target, -1.0f); }
  pkg.setMedia(media);
  if(pkg.testGapfillDatabase(active)) { return true; }
  if(pkg.lastTestStatus() == SOLVE_INFEASIBLE) { return false; }

  const OBJECTIVE &obj = pkg.baseObjective();
  string note = "FAF";
  string filterMsg = " ";
  if(beforeFiltering) {
    note = "FBF";
    filterMsg = " before filtering ";
  }
  SENSITIVITYRESULT result;
  if(findUnproducibleBiomassCompounds(pkg.gfModel(), obj, result) == GAPFILL_SUCCESS) {
    gfCache.gfSensitivity[media.id][obj.name][note] = result;
    if(_db.DEBUGGAPFILL) { printSensitivityResult(result, pkg.gfModel().metabolites); }
  }
  printf("WARNING: No gapfilling solution found%sfor %s activating %s\n", filterMsg.c_str(), media.id.c_str(), obj.name.c_str());
  return false;
}

GAPFILLCONDITIONS GAPFILLER::testAndAdjustGapfillingConditions(const vector<GROWTH> &medias, const vector<OBJECTIVE> &targets,
							      const vector<double> &thresholds, bool prefilter) {
  GAPFILLCONDITIONS output;
  if(medias.size() != targets.size() || medias.size() != thresholds.size()) {
    printf("ERROR: Need one target and one threshold per media (%d medias, %d targets, %d thresholds)\n",
	   (int)medias.size(), (int)targets.size(), (int)thresholds.size());
    return output;
  }
  if(_db.DEBUGGAPFILL) { printf("Testing unfiltered database\n"); }
  for(int i=0; i<medias.size(); i++) {
    vector<CANDIDATE> active;
    pkg.setBaseObjective(targets[i], thresholds[i]);
    if(!testGapfillDatabase(medias[i], targets[i], true, active)) { continue; }
    output.medias.push_back(medias[i]);
    output.targets.push_back(targets[i]);
    output.thresholds.push_back(thresholds[i]);
    output.activeReactions.push_back(active);
    output.conditions.push_back(TESTCONDITION(medias[i], targets[i], false, thresholds[i]));
  }
  if(!prefilter) { return output; }

  if(_db.DEBUGGAPFILL) { printf("Filtering database\n"); }
  if(this->prefilter(output.conditions, false, false, output.activeReactions) != GAPFILL_SUCCESS) {
    return GAPFILLCONDITIONS();
  }
  GAPFILLCONDITIONS filtered;
  for(int i=0; i<output.medias.size(); i++) {
    vector<CANDIDATE> active;
    pkg.setBaseObjective(output.targets[i], output.thresholds[i]);
    if(!testGapfillDatabase(output.medias[i], output.targets[i], false, active)) { continue; }
    filtered.medias.push_back(output.medias[i]);
    filtered.targets.push_back(output.targets[i]);
    filtered.thresholds.push_back(output.thresholds[i]);
    filtered.conditions.push_back(output.conditions[i]);
    filtered.activeReactions.push_back(active);
  }
  return filtered;
}

int GAPFILLER::prefilter(const vector<TESTCONDITION> &growthConditions, bool usePriorFiltering, bool baseFilterOnly,
			 const vector<vector<CANDIDATE> > &activeReactionSets) {
  if(tests.empty()) { return GAPFILL_SUCCESS; }
  if(_db.DEBUGGAPFILL) { printf("PREFILTERING WITH %d GROWTH CONDITIONS\n", (int)growthConditions.size()); }
  const GAPFILLCACHE *baseFilter = NULL;
  if(usePriorFiltering) { baseFilter = &gfCache; }
  int status = pkg.filterDatabaseBasedOnTests(tests, growthConditions, baseFilter, baseFilterOnly, activeReactionSets);
  gfCache.mergeFilter(pkg.cache());
  return status;
}

int GAPFILLER::runGapfilling(const GROWTH &media, const OBJECTIVE &target, double minimumObj, bool binaryCheck, bool prefilter,
			     GAPFILLSOLUTION &solution) {
  OBJECTIVE obj = target;
  if(obj.empty()) { obj = pkg.baseObjective(); }
  if(obj.empty()) {
    printf("ERROR: runGapfilling needs a target\n");
    return BAD_ARGUMENTS;
  }
  if(minimumObj < 0) { minimumObj = params.minimumObj; }
  pkg.setBaseObjective(obj, minimumObj);
  pkg.setMedia(media);

  vector<CANDIDATE> active;
  if(!testGapfillDatabase(media, obj, prefilter, active)) { return NO_GAPFILL_SOLUTION; }

  if(prefilter) {
    vector<TESTCONDITION> growth(1, TESTCONDITION(media, obj, false, minimumObj));
    int status = this->prefilter(growth, false, false, vector<vector<CANDIDATE> >());
    if(status != GAPFILL_SUCCESS) { return status; }
    if(!testGapfillDatabase(media, obj, false, active)) { return NO_GAPFILL_SOLUTION; }
  }

  GAPFILLSOLUTION sol;
  if(pkg.solveGapfilling(sol) != GAPFILL_SUCCESS) { return NO_GAPFILL_SOLUTION; }

  if(!tests.empty()) {
    if(pkg.runTestConditions(tests, sol, params.testConditionIterationLimit) != GAPFILL_SUCCESS) {
      printf("WARNING: no solution could be found that satisfied all specified test conditions in specified iterations!\n");
      return NO_GAPFILL_SOLUTION;
    }
  }

  if(binaryCheck) {
    int status = pkg.binaryCheckGapfillingSolution(sol);
    if(status != GAPFILL_SUCCESS) { return status; }
  }

  sol.media = media;
  sol.target = obj;
  sol.minObjective = minimumObj;
  sol.binaryCheck = binaryCheck;
  last = sol;
  solution = sol;
  if(_db.PRINTGAPFILLRESULTS) { printGapfillSolution(sol, pkg.gfModel().reactions); }
  return GAPFILL_SUCCESS;
}

int GAPFILLER::runGlobalGapfilling(const vector<GROWTH> &medias, const vector<OBJECTIVE> &targets, const vector<double> &thresholds,
				   bool binaryCheck, bool prefilter, GAPFILLSOLUTION &solution) {
  if(medias.empty() || medias.size() != targets.size() || medias.size() != thresholds.size()) {
    printf("ERROR: Global gapfilling needs one target and one threshold per media\n");
    return BAD_ARGUMENTS;
  }
  GAPFILLCONDITIONS conditions = testAndAdjustGapfillingConditions(medias, targets, thresholds, prefilter);
  if(conditions.empty()) { return NO_GAPFILL_SOLUTION; }

  pkg.createMaxFluxVariables();
  map<int,FLUXPAIR> maxFlux;
  double objectiveValue;
  if(pkg.optimizeGlobal(conditions.medias, conditions.targets, conditions.thresholds, maxFlux, objectiveValue) != GAPFILL_SUCCESS) {
    printf("WARNING: No global gapfilling solution found for %d media\n", (int)conditions.medias.size());
    return NO_GAPFILL_SOLUTION;
  }
  if(_db.DEBUGGAPFILL) { printf("Global gapfilling objective value %4.6f\n", objectiveValue); }

  GAPFILLSOLUTION sol = pkg.computeGapfilledSolution(maxFlux);
  sol.media = conditions.medias[0];
  sol.target = conditions.targets[0];
  sol.minObjective = conditions.thresholds[0];
  sol.binaryCheck = false;
  last = sol;
  solution = sol;
  if(_db.PRINTGAPFILLRESULTS) { printGapfillSolution(sol, pkg.gfModel().reactions); }
  return GAPFILL_SUCCESS;
}

/* Copies a reaction (and the metabolites it needs) from the gapfilling model with both bounds closed */
int GAPFILLER::copyReactionFromGapfillModel(int rxnId) {
  MODEL &gf = pkg.gfModel();
  if(!gf.hasReaction(rxnId)) {
    printf("ERROR: Reaction %d is neither in the model nor in the gapfilling model\n", rxnId);
    return BAD_ARGUMENTS;
  }
  REACTION rxn = gf.reactions.rxnFromId(rxnId);
  for(int i=0; i<rxn.stoich.size(); i++) {
    if(currentModel->metabolites.idIn(rxn.stoich[i].met_id)) { continue; }
    const METABOLITE &met = gf.metabolites.metFromId(rxn.stoich[i].met_id);
    if(_db.DEBUGGAPFILL) { printf("adding metabolite:\n"); printMETABOLITEinputs(met); }
    currentModel->addMetabolite(met);
  }
  rxn.lb = 0.0f;
  rxn.ub = 0.0f;
  if(_db.DEBUGGAPFILL) { printf("adding reaction:\n"); printREACTIONinputs(rxn); }
  return currentModel->addReaction(rxn);
}

void GAPFILLER::assignGene(int rxnId) {
  REACTION *rxn = currentModel->reactions.rxnPtrFromId(rxnId);
  if(rxn == NULL || !rxn->annote.empty()) { return; }
  string gene;
  double best = bestGeneProbability(reactionScores, *rxn, gene);
  if(gene.empty()) { return; }
  ANNOTATION a;
  a.genename = gene;
  a.probability = best;
  rxn->annote.push_back(a);
  printf("Assigning gene to reaction: %s %s\n", rxn->name, gene.c_str());
}

int GAPFILLER::integrateGapfillSolution(const GAPFILLSOLUTION &solution, vector<CANDIDATE> &cumulativeSolution, bool removeUnneeded,
					bool checkForGrowth, INTEGRATIONPOLICY mode, GAPFILLSOLUTION &integratedSolution) {
  MODEL &m = *currentModel;
  OBJECTIVE originalObjective = m.getObjective();
  OBJECTIVE target = solution.target;
  target.sense = 1;
  m.setObjective(target);

  /* Independent: earlier media's reactions are out of the way while this media is tested */
  BOUNDSCOPE isolation(m);
  if(mode == INDEPENDENT) {
    for(int i=0; i<cumulativeSolution.size(); i++) {
      if(m.hasReaction(cumulativeSolution[i].id)) { isolation.zero(cumulativeSolution[i].id, cumulativeSolution[i].dir); }
    }
  }

  vector<CANDIDATE> listSolution = convertSolutionToList(solution);
  vector<CANDIDATE> newCumulative;
  for(int i=0; i<listSolution.size(); i++) {
    const CANDIDATE &item = listSolution[i];
    if(!m.hasReaction(item.id)) {
      int status = copyReactionFromGapfillModel(item.id);
      if(status != GAPFILL_SUCCESS) {
	m.setObjective(originalObjective);
	return status;
      }
    }
    if(_db.DEBUGGAPFILL) { printf("integrating rxn: %d%c\n", item.id, dirChar(item.dir)); }
    assignGene(item.id);
    if(item.dir == FORWARD) { m.setBound(item.id, FORWARD, _db.INTEGRATION_BOUND); }
    else { m.setBound(item.id, REVERSE, -_db.INTEGRATION_BOUND); }
    if(!findItemInSolution(cumulativeSolution, item, false)) { newCumulative.push_back(item); }
  }

  GAPFILLSOLUTION current;
  current.media = solution.media;
  current.target = solution.target;
  current.minObjective = solution.minObjective;
  current.binaryCheck = solution.binaryCheck;
  current.growth = 0.0f;

  vector<OBJECTIVE> targets(1, solution.target);
  vector<GROWTH> medias(1, solution.media);
  vector<double> thresholds(1, solution.minObjective);
  vector<CANDIDATE> unneeded;
  int status;
  if(mode == INDEPENDENT) {
    /* Only this media's own solution is checked */
    status = testSolution(m, listSolution, targets, medias, thresholds, removeUnneeded, cumulativeSolution, unneeded);
    if(status != GAPFILL_SUCCESS) { m.setObjective(originalObjective); return status; }
    for(int i=0; i<listSolution.size(); i++) {
      if(findItemInSolution(unneeded, listSolution[i], false)) { continue; }
      if(listSolution[i].type == REVERSED_REACTION) { current.reversedRxns[listSolution[i].id] = listSolution[i].dir; }
      else { current.newRxns[listSolution[i].id] = listSolution[i].dir; }
      if(!findItemInSolution(cumulativeSolution, listSolution[i], false)) { cumulativeSolution.push_back(listSolution[i]); }
    }
  } else {
    vector<CANDIDATE> fullSolution = cumulativeSolution;
    fullSolution.insert(fullSolution.end(), newCumulative.begin(), newCumulative.end());
    int priorCount = cumulativeSolution.size();
    status = testSolution(m, fullSolution, targets, medias, thresholds, removeUnneeded, cumulativeSolution, unneeded);
    if(status != GAPFILL_SUCCESS) { m.setObjective(originalObjective); return status; }
    for(int i=0; i<fullSolution.size(); i++) {
      if(findItemInSolution(unneeded, fullSolution[i], false)) { continue; }
      if(fullSolution[i].type == REVERSED_REACTION) { current.reversedRxns[fullSolution[i].id] = fullSolution[i].dir; }
      else { current.newRxns[fullSolution[i].id] = fullSolution[i].dir; }
      if(i >= priorCount) { cumulativeSolution.push_back(fullSolution[i]); }
    }
  }
  if(_db.DEBUGGAPFILL) { printf("%d unneeded reactions for %s\n", (int)unneeded.size(), solution.media.id.c_str()); }

  if(checkForGrowth) {
    m.setMedia(solution.media);
    FBARESULT res = m.solve();
    if(res.status == SOLVE_OPTIMAL) { current.growth = res.objective; }
    printf("Growth: %4.6f %s\n", current.growth, solution.media.id.c_str());
  }
  isolation.rollback();

  integrated.push_back(current);
  for(int i=0; i<cumulativeSolution.size(); i++) {
    if(!findItemInSolution(cumulative, cumulativeSolution[i], false)) { cumulative.push_back(cumulativeSolution[i]); }
  }
  m.setObjective(originalObjective);
  integratedSolution = current;
  return GAPFILL_SUCCESS;
}

/* Unneeded items leave the cumulative solution and every per-media solution */
void GAPFILLER::pruneSolutions(const vector<CANDIDATE> &unneeded, vector<CANDIDATE> &cumulativeSolution,
			       map<string, GAPFILLSOLUTION> &solutions) {
  if(unneeded.empty()) { return; }
  vector<CANDIDATE> kept;
  for(int i=0; i<cumulativeSolution.size(); i++) {
    if(!findItemInSolution(unneeded, cumulativeSolution[i], false)) { kept.push_back(cumulativeSolution[i]); }
  }
  cumulativeSolution = kept;
  for(map<string, GAPFILLSOLUTION>::iterator it = solutions.begin(); it != solutions.end(); it++) {
    for(int i=0; i<unneeded.size(); i++) {
      map<int,int> &dest = unneeded[i].type == REVERSED_REACTION ? it->second.reversedRxns : it->second.newRxns;
      map<int,int>::iterator rit = dest.find(unneeded[i].id);
      if(rit != dest.end() && rit->second == unneeded[i].dir) { dest.erase(rit); }
    }
  }
  kept.clear();
  for(int i=0; i<cumulative.size(); i++) {
    if(!findItemInSolution(unneeded, cumulative[i], false)) { kept.push_back(cumulative[i]); }
  }
  cumulative = kept;
}

/* Biomass dependency of the reactions each growing media actually uses. A reaction is analysed on the first media that uses it */
void GAPFILLER::runSensitivityAnalysis(const GAPFILLCONDITIONS &conditions, const map<string, GAPFILLSOLUTION> &solutions) {
  printf("Gapfilling sensitivity analysis running\n");
  map<pair<int,int>, SENSITIVITYRESULT> rxnSensitivity;
  vector<CANDIDATE> seen;
  for(int i=0; i<conditions.medias.size(); i++) {
    map<string, GAPFILLSOLUTION>::const_iterator it = solutions.find(conditions.medias[i].id);
    if(it == solutions.end() || it->second.growth <= 0) { continue; }
    vector<CANDIDATE> items = convertSolutionToList(it->second);
    vector<CANDIDATE> koList;
    for(int j=0; j<items.size(); j++) {
      if(findItemInSolution(seen, items[j], false)) { continue; }
      seen.push_back(items[j]);
      koList.push_back(items[j]);
    }
    if(koList.empty()) { continue; }
    currentModel->setMedia(conditions.medias[i]);
    map<pair<int,int>, SENSITIVITYRESULT> results;
    if(findUnproducibleBiomassCompounds(*currentModel, conditions.targets[i], koList, results) != GAPFILL_SUCCESS) { continue; }
    rxnSensitivity.insert(results.begin(), results.end());
  }

  for(int i=0; i<conditions.medias.size(); i++) {
    const string &mediaId = conditions.medias[i].id;
    const string &targetName = conditions.targets[i].name;
    map<string, GAPFILLSOLUTION>::const_iterator it = solutions.find(mediaId);
    if(it != solutions.end() && it->second.growth > 0) {
      map<pair<int,int>, SENSITIVITYRESULT> &success = gfCache.gfSuccess[mediaId][targetName];
      success.clear();
      vector<CANDIDATE> items = convertSolutionToList(it->second);
      for(int j=0; j<items.size(); j++) {
	pair<int,int> key(items[j].id, items[j].dir);
	success[key] = rxnSensitivity[key];
      }
    } else {
      gfCache.gfFailure[mediaId][targetName] = true;
    }
  }
}

int GAPFILLER::runMultiGapfill(const vector<GROWTH> &mediaList, const OBJECTIVE &target, const MULTIGAPFILLOPTIONS &options,
			       map<string, GAPFILLSOLUTION> &solutions) {
  solutions.clear();
  int integratedBefore = integrated.size();
  vector<CANDIDATE> cumulativeBefore = cumulative;
  if(!options.integrateSolutions) { currentModel = liveModel->clone(); }

  double defaultMinimum = options.defaultMinimumObjective;
  if(defaultMinimum < 0) { defaultMinimum = params.minimumObj; }

  vector<OBJECTIVE> targets;
  vector<double> thresholds;
  for(int i=0; i<mediaList.size(); i++) {
    map<string, OBJECTIVE>::const_iterator tit = options.targetHash.find(mediaList[i].id);
    targets.push_back(tit == options.targetHash.end() ? target : tit->second);
    map<string, double>::const_iterator mit = options.minimumObjectives.find(mediaList[i].id);
    thresholds.push_back(mit == options.minimumObjectives.end() ? defaultMinimum : mit->second);
  }

  int status = GAPFILL_SUCCESS;
  GAPFILLCONDITIONS conditions = testAndAdjustGapfillingConditions(mediaList, targets, thresholds, options.prefilter);
  if(conditions.empty()) { status = NO_GAPFILL_SOLUTION; }

  vector<CANDIDATE> cumulativeSolution;
  if(status == GAPFILL_SUCCESS && (options.mode == INDEPENDENT || options.mode == SEQUENTIAL)) {
    for(int i=0; i<conditions.medias.size(); i++) {
      if(options.mode == INDEPENDENT) { printf("Running Independent gapfilling!\n"); }
      else { printf("Running Sequential gapfilling!\n"); }
      GAPFILLSOLUTION solution;
      int gfStatus = runGapfilling(conditions.medias[i], conditions.targets[i], conditions.thresholds[i], options.binaryCheck, false, solution);
      if(gfStatus != GAPFILL_SUCCESS) {
	printf("WARNING: Gapfilling failed for media %s; continuing with the other media\n", conditions.medias[i].id.c_str());
	continue;
      }
      GAPFILLSOLUTION integratedSolution;
      status = integrateGapfillSolution(solution, cumulativeSolution, options.removeUnneededReactions, options.checkForGrowth,
					options.mode, integratedSolution);
      if(status != GAPFILL_SUCCESS) { break; }
      solutions[conditions.medias[i].id] = integratedSolution;
      /* Later media are steered toward reactions that are already in */
      if(options.mode == SEQUENTIAL) {
	pkg.computeGapfillingPenalties(cumulativeSolution, reactionScores);
	pkg.buildGapfillingObjectiveFunction();
      }
    }
    if(status == GAPFILL_SUCCESS && options.mode == INDEPENDENT && !cumulativeSolution.empty()) {
      /* Everything that was accepted media by media is re-tested together */
      vector<CANDIDATE> unneeded;
      status = testSolution(*currentModel, cumulativeSolution, conditions.targets, conditions.medias, conditions.thresholds,
			    options.removeUnneededReactions, vector<CANDIDATE>(), unneeded);
      if(options.removeUnneededReactions) { pruneSolutions(unneeded, cumulativeSolution, solutions); }
    }
    if(options.mode == SEQUENTIAL) {
      /* Restoring the unbiased gapfilling objective */
      pkg.computeGapfillingPenalties(vector<CANDIDATE>(), reactionScores);
      pkg.buildGapfillingObjectiveFunction();
    }
  } else if(status == GAPFILL_SUCCESS && options.mode == GLOBAL) {
    printf("Running global gapfilling!\n");
    GAPFILLSOLUTION fullSolution;
    status = runGlobalGapfilling(conditions.medias, conditions.targets, conditions.thresholds, options.binaryCheck, false, fullSolution);
    for(int i=0; i<conditions.medias.size() && status == GAPFILL_SUCCESS; i++) {
      GAPFILLSOLUTION copySolution = fullSolution;
      copySolution.media = conditions.medias[i];
      copySolution.target = conditions.targets[i];
      copySolution.minObjective = conditions.thresholds[i];
      copySolution.binaryCheck = options.binaryCheck;
      /* Nothing is removed yet: a reaction unneeded here may be needed on another media */
      GAPFILLSOLUTION integratedSolution;
      status = integrateGapfillSolution(copySolution, cumulativeSolution, false, options.checkForGrowth, GLOBAL, integratedSolution);
      if(status == GAPFILL_SUCCESS) { solutions[conditions.medias[i].id] = integratedSolution; }
    }
    if(status == GAPFILL_SUCCESS) {
      /* Remove what no media needs */
      vector<CANDIDATE> unneeded;
      status = testSolution(*currentModel, cumulativeSolution, conditions.targets, conditions.medias, conditions.thresholds,
			    true, vector<CANDIDATE>(), unneeded);
      pruneSolutions(unneeded, cumulativeSolution, solutions);
      if(_db.DEBUGGAPFILL) { printf("Unneeded in global gapfill: %d\n", (int)unneeded.size()); }
    }
  }

  if(status == GAPFILL_SUCCESS && options.runSensitivityAnalysis) { runSensitivityAnalysis(conditions, solutions); }
  if(_db.DEBUGGAPFILL) { printGapfillCache(gfCache); }

  if(!options.integrateSolutions) {
    delete currentModel;
    currentModel = liveModel;
    integrated.resize(integratedBefore);
    cumulative = cumulativeBefore;
  }
  return status;
}
