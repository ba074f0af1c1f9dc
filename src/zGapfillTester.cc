/* Gapfilling on the three-media test network (GLPK). See TestNetwork.h for the network */

#include <cstdio>
#include <map>
#include <string>
#include <vector>

#include "DataStructures.h"
#include "GapfillPkg.h"
#include "Grow.h"
#include "Model.h"
#include "Sensitivity.h"
#include "SolutionTester.h"
#include "TestNetwork.h"

static int g_passed = 0;
static int g_failed = 0;

#define TEST_ASSERT(cond, msg) \
  if (!(cond)) { \
    printf("  FAIL: %s\n", msg); \
    g_failed++; \
    return false; \
  }

#define TEST_PASSED(name) \
  printf("  PASS: %s\n", name); \
  g_passed++; \
  return true;

static bool inList(const vector<CANDIDATE> &list, int id) {
  return findItemInSolution(list, CANDIDATE(id, FORWARD), false);
}

static MULTIGAPFILLOPTIONS makeOptions(INTEGRATIONPOLICY mode) {
  MULTIGAPFILLOPTIONS options;
  options.mode = mode;
  options.runSensitivityAnalysis = false;
  return options;
}

bool test_single_media() {
  GAPFILLNETWORK net;
  GLPKGAPFILLPKG pkg(net.model, net.database, net.databaseMets, vector<string>(), net.geneScores);
  GAPFILLER gapfiller(net.model, pkg, vector<TESTCONDITION>(), net.geneScores);
  GAPFILLSOLUTION sol;

  int status = gapfiller.runGapfilling(net.m1, net.biomass, 0.01f, false, false, sol);
  TEST_ASSERT(status == GAPFILL_SUCCESS, "M1 can be gapfilled");
  TEST_ASSERT(gapfillCount(sol) == 1 && sol.newRxns.count(TN_R0) == 1, "M1 needs R0 only");
  TEST_ASSERT(sol.media.id == "M1" && sol.target.name == "bio1", "solution carries its media and target");
  TEST_ASSERT(!net.model.hasReaction(TN_R0), "runGapfilling does not change the model");
  TEST_ASSERT(gapfiller.lastSolution().newRxns.count(TN_R0) == 1, "last solution is kept");
  TEST_ASSERT(pkg.minimumObjective() == 0.01f, "minimum objective follows the request");

  status = gapfiller.runGapfilling(net.m3, net.biomass, 0.01f, true, false, sol);
  TEST_ASSERT(status == GAPFILL_SUCCESS, "M3 can be gapfilled");
  TEST_ASSERT(gapfillCount(sol) == 2 && sol.newRxns.count(TN_R2) == 1 && sol.newRxns.count(TN_R3) == 1, "M3 needs R2 and R3");
  TEST_ASSERT(sol.binaryCheck, "binary check flag is set");
  TEST_PASSED("single media gapfilling");
}

bool test_sequential() {
  GAPFILLNETWORK net;
  GLPKGAPFILLPKG pkg(net.model, net.database, net.databaseMets, vector<string>(), net.geneScores);
  GAPFILLER gapfiller(net.model, pkg, vector<TESTCONDITION>(), net.geneScores);
  map<string, GAPFILLSOLUTION> solutions;

  int status = gapfiller.runMultiGapfill(net.medias(), net.biomass, makeOptions(SEQUENTIAL), solutions);
  TEST_ASSERT(status == GAPFILL_SUCCESS, "sequential gapfilling succeeds");
  TEST_ASSERT(solutions.size() == 3, "one solution per media");
  const vector<CANDIDATE> &cumulative = gapfiller.cumulativeGapfilling();
  /* Once R0 is in, B --> A --> X is cheaper than B --> X */
  TEST_ASSERT(inList(cumulative, TN_R0) && inList(cumulative, TN_R7), "R0 and R7 are integrated");
  TEST_ASSERT(inList(cumulative, TN_R2) && inList(cumulative, TN_R3), "R2 and R3 are integrated");
  TEST_ASSERT(!inList(cumulative, TN_R1), "R1 is not needed");
  TEST_ASSERT(net.model.getBound(TN_R7, FORWARD) > 0, "integrated reactions are open in the model");
  TEST_ASSERT(solutions["M2"].newRxns.count(TN_R7) == 1, "M2 solution uses R7");
  TEST_ASSERT(solutions["M2"].growth > 0, "M2 grows after integration");
  TEST_ASSERT(gapfiller.integratedGapfillings().size() == 3, "three integrated gapfillings");
  TEST_PASSED("sequential gapfilling");
}

bool test_independent() {
  GAPFILLNETWORK net;
  GLPKGAPFILLPKG pkg(net.model, net.database, net.databaseMets, vector<string>(), net.geneScores);
  GAPFILLER gapfiller(net.model, pkg, vector<TESTCONDITION>(), net.geneScores);
  map<string, GAPFILLSOLUTION> solutions;

  int status = gapfiller.runMultiGapfill(net.medias(), net.biomass, makeOptions(INDEPENDENT), solutions);
  TEST_ASSERT(status == GAPFILL_SUCCESS, "independent gapfilling succeeds");
  const vector<CANDIDATE> &cumulative = gapfiller.cumulativeGapfilling();
  TEST_ASSERT(cumulative.size() == 4, "four reactions integrated");
  TEST_ASSERT(inList(cumulative, TN_R0) && inList(cumulative, TN_R1), "R0 and R1 are integrated");
  TEST_ASSERT(inList(cumulative, TN_R2) && inList(cumulative, TN_R3), "R2 and R3 are integrated");
  TEST_ASSERT(!net.model.hasReaction(TN_R7), "R7 is never chosen");
  TEST_PASSED("independent gapfilling");
}

bool test_global() {
  GAPFILLNETWORK net;
  GLPKGAPFILLPKG pkg(net.model, net.database, net.databaseMets, vector<string>(), net.geneScores);
  GAPFILLER gapfiller(net.model, pkg, vector<TESTCONDITION>(), net.geneScores);
  map<string, GAPFILLSOLUTION> solutions;

  int status = gapfiller.runMultiGapfill(net.medias(), net.biomass, makeOptions(GLOBAL), solutions);
  TEST_ASSERT(status == GAPFILL_SUCCESS, "global gapfilling succeeds");
  const vector<CANDIDATE> &cumulative = gapfiller.cumulativeGapfilling();
  /* R0 is paid once for M1 and M2 */
  TEST_ASSERT(cumulative.size() == 4, "four reactions integrated");
  TEST_ASSERT(inList(cumulative, TN_R0) && inList(cumulative, TN_R7), "R0 and R7 are integrated");
  TEST_ASSERT(!inList(cumulative, TN_R1), "R1 is not needed");
  TEST_ASSERT(solutions["M1"].newRxns.size() == 1, "M1 keeps only what it needs");
  TEST_PASSED("global gapfilling");
}

/* With one media every policy gives the single media solution */
bool test_single_media_policies() {
  INTEGRATIONPOLICY modes[] = {INDEPENDENT, SEQUENTIAL, GLOBAL};
  for(int i=0; i<3; i++) {
    GAPFILLNETWORK net;
    GLPKGAPFILLPKG pkg(net.model, net.database, net.databaseMets, vector<string>(), net.geneScores);
    GAPFILLER gapfiller(net.model, pkg, vector<TESTCONDITION>(), net.geneScores);
    map<string, GAPFILLSOLUTION> solutions;
    int status = gapfiller.runMultiGapfill(vector<GROWTH>(1, net.m3), net.biomass, makeOptions(modes[i]), solutions);
    TEST_ASSERT(status == GAPFILL_SUCCESS, "gapfilling succeeds");
    TEST_ASSERT(gapfillCount(solutions["M3"]) == 2, "M3 needs two reactions");
    TEST_ASSERT(gapfiller.cumulativeGapfilling().size() == 2, "two reactions integrated");
  }
  TEST_PASSED("single media under every policy");
}

bool test_no_integration() {
  GAPFILLNETWORK net;
  GLPKGAPFILLPKG pkg(net.model, net.database, net.databaseMets, vector<string>(), net.geneScores);
  GAPFILLER gapfiller(net.model, pkg, vector<TESTCONDITION>(), net.geneScores);
  map<string, GAPFILLSOLUTION> solutions;
  MULTIGAPFILLOPTIONS options = makeOptions(SEQUENTIAL);
  options.integrateSolutions = false;
  int before = net.model.reactions.rxns.size();

  TEST_ASSERT(gapfiller.runMultiGapfill(net.medias(), net.biomass, options, solutions) == GAPFILL_SUCCESS, "gapfilling succeeds");
  TEST_ASSERT(solutions.size() == 3, "solutions are still reported");
  TEST_ASSERT(net.model.reactions.rxns.size() == before, "model is untouched");
  TEST_ASSERT(gapfiller.cumulativeGapfilling().empty(), "nothing is recorded as integrated");
  TEST_PASSED("gapfilling without integration");
}

/* A media with nothing to eat is dropped; the others are still gapfilled */
bool test_failed_media() {
  GAPFILLNETWORK net;
  GLPKGAPFILLPKG pkg(net.model, net.database, net.databaseMets, vector<string>(), net.geneScores);
  GAPFILLER gapfiller(net.model, pkg, vector<TESTCONDITION>(), net.geneScores);
  map<string, GAPFILLSOLUTION> solutions;
  vector<GROWTH> medias = net.medias();
  medias.push_back(GROWTH("EMPTY"));
  MULTIGAPFILLOPTIONS options = makeOptions(SEQUENTIAL);
  options.runSensitivityAnalysis = true;

  TEST_ASSERT(gapfiller.runMultiGapfill(medias, net.biomass, options, solutions) == GAPFILL_SUCCESS, "gapfilling succeeds");
  TEST_ASSERT(solutions.size() == 3 && solutions.count("EMPTY") == 0, "EMPTY is dropped");
  const SENSITIVITYRESULT &fbf = gapfiller.cache().gfSensitivity["EMPTY"]["bio1"]["FBF"];
  TEST_ASSERT(fbf.compounds.size() == 1 && fbf.compounds[0] == TN_X_C, "X cannot be made on EMPTY");
  const SENSITIVITYRESULT &r0 = gapfiller.cache().gfSuccess["M1"]["bio1"][pair<int,int>(TN_R0, FORWARD)];
  TEST_ASSERT(r0.canGrow && r0.compounds.size() == 1 && r0.compounds[0] == TN_X_C, "without R0 M1 cannot make X");
  TEST_PASSED("failed media and sensitivity");
}

bool test_sensitivity() {
  GAPFILLNETWORK net;
  net.model.setMedia(net.m1);
  SENSITIVITYRESULT result;
  TEST_ASSERT(findUnproducibleBiomassCompounds(net.model, net.biomass, result) == GAPFILL_SUCCESS, "analysis runs");
  TEST_ASSERT(result.canGrow && result.compounds.size() == 1 && result.compounds[0] == TN_X_C, "X needs a supply");
  TEST_ASSERT(findUnproducibleBiomassCompounds(net.model, OBJECTIVE("nothing", 4242), result) == BAD_ARGUMENTS,
	      "unknown target is a bad argument");
  TEST_PASSED("biomass sensitivity");
}

bool test_bad_arguments() {
  GAPFILLNETWORK net;
  GLPKGAPFILLPKG pkg(net.model, net.database, net.databaseMets, vector<string>(), net.geneScores);
  GAPFILLER gapfiller(net.model, pkg, vector<TESTCONDITION>(), net.geneScores);
  GAPFILLSOLUTION sol;
  vector<OBJECTIVE> targets(1, net.biomass);
  vector<double> thresholds;
  TEST_ASSERT(gapfiller.runGlobalGapfilling(net.medias(), targets, thresholds, false, false, sol) == BAD_ARGUMENTS,
	      "mismatched lists are a bad argument");
  TEST_PASSED("bad arguments");
}

int main() {
  printf("GAPFILLER\n");
  test_single_media();
  test_sequential();
  test_independent();
  test_global();
  test_single_media_policies();
  test_no_integration();
  test_failed_media();
  test_sensitivity();
  test_bad_arguments();
  printf("\n%d passed, %d failed\n", g_passed, g_failed);
  return g_failed > 0 ? 1 : 0;
}
