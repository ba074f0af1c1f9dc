/* Multi-media integration and test-condition handling of GAPFILLER, run on a RULEMODEL with a
   scripted gapfilling package so that every solution and every growth requirement is exact.

   M1, M2 and M3 each need R0 plus their own reaction (R1, R2, R3). The ATP condition passes only
   while R8 is closed */

#include <cstdio>
#include <map>
#include <string>
#include <vector>

#include "ConditionTester.h"
#include "DataStructures.h"
#include "GapfillPkg.h"
#include "Grow.h"
#include "Model.h"
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

#define TN_R5     15

static vector<CANDIDATE> items(int a, int b) {
  vector<CANDIDATE> out;
  out.push_back(CANDIDATE(a, FORWARD));
  out.push_back(CANDIDATE(b, FORWARD));
  return out;
}

static vector<CANDIDATE> items(int a, int b, int c) {
  vector<CANDIDATE> out = items(a, b);
  out.push_back(CANDIDATE(c, FORWARD));
  return out;
}

static bool inList(const vector<CANDIDATE> &list, int id) {
  return findItemInSolution(list, CANDIDATE(id, FORWARD), false);
}

static MULTIGAPFILLOPTIONS makeOptions(INTEGRATIONPOLICY mode) {
  MULTIGAPFILLOPTIONS options;
  options.mode = mode;
  options.runSensitivityAnalysis = false;
  return options;
}

class RULENETWORK {
 public:
  RULEMODEL model;
  RXNSPACE database;
  METSPACE databaseMets;
  OBJECTIVE biomass;
  GROWTH m1;
  GROWTH m2;
  GROWTH m3;

  RULENETWORK() {
    model.addReaction(makeReaction(TN_BIO, 0.0f, 100.0f));
    biomass = OBJECTIVE("bio1", TN_BIO);
    model.setObjective(biomass);
    m1 = GROWTH("M1");
    m2 = GROWTH("M2");
    m3 = GROWTH("M3");
    model.addGrowthRule("M1", items(TN_R0, TN_R1), 1.0f);
    model.addGrowthRule("M2", items(TN_R0, TN_R2), 1.0f);
    model.addGrowthRule("M3", items(TN_R0, TN_R3), 1.0f);
    model.addGrowthRule("ATP", vector<CANDIDATE>(1, CANDIDATE(TN_R8, FORWARD)), 5.0f);
    int ids[] = { TN_R0, TN_R1, TN_R2, TN_R3, TN_R8, TN_R9 };
    for(int i=0; i<6; i++) { database.addReaction(makeReaction(ids[i], 0.0f, 100.0f)); }
  }

  vector<GROWTH> medias() const {
    vector<GROWTH> out;
    out.push_back(m1);
    out.push_back(m2);
    out.push_back(m3);
    return out;
  }

  /* Fails when the ATP objective reaches 1 */
  vector<TESTCONDITION> atpTests() const {
    return vector<TESTCONDITION>(1, TESTCONDITION(GROWTH("ATP"), OBJECTIVE("atp", TN_BIO), true, 1.0f));
  }
};

/* The solutions the scripted package hands out. M2's solution carries R9, which nothing needs */
static void scriptSolutions(SCRIPTEDGAPFILLPKG &pkg) {
  pkg.addSolution("M1", items(TN_R0, TN_R1));
  pkg.addSolution("M2", items(TN_R0, TN_R2, TN_R9));
  pkg.addSolution("M3", items(TN_R0, TN_R3));
}

static bool checkSharedAndUnique(const char *name, INTEGRATIONPOLICY mode) {
  RULENETWORK net;
  SCRIPTEDGAPFILLPKG pkg(net.model, net.database, net.databaseMets);
  scriptSolutions(pkg);
  GAPFILLER gapfiller(net.model, pkg, vector<TESTCONDITION>(), REACTIONGENESCORES());
  map<string, GAPFILLSOLUTION> solutions;

  int status = gapfiller.runMultiGapfill(net.medias(), net.biomass, makeOptions(mode), solutions);
  TEST_ASSERT(status == GAPFILL_SUCCESS, "multi-media gapfilling succeeds");
  TEST_ASSERT(solutions.size() == 3, "one solution per media");
  const vector<CANDIDATE> &cumulative = gapfiller.cumulativeGapfilling();
  TEST_ASSERT(cumulative.size() == 4, "exactly four reactions are kept");
  TEST_ASSERT(inList(cumulative, TN_R0) && inList(cumulative, TN_R1) && inList(cumulative, TN_R2) && inList(cumulative, TN_R3),
	      "shared R0 and the unique R1, R2, R3 are kept");
  TEST_ASSERT(!inList(cumulative, TN_R9), "R9 is not kept");
  TEST_ASSERT(!net.model.hasReaction(TN_R9), "R9 is removed from the model");
  TEST_ASSERT(net.model.getBound(TN_R0, FORWARD) == 100.0f && net.model.getBound(TN_R1, FORWARD) == 100.0f
	      && net.model.getBound(TN_R2, FORWARD) == 100.0f && net.model.getBound(TN_R3, FORWARD) == 100.0f,
	      "kept reactions are open in the model");
  TEST_ASSERT(solutions["M1"].growth > 0 && solutions["M2"].growth > 0 && solutions["M3"].growth > 0, "every media grows");
  TEST_ASSERT(solutions["M2"].newRxns.count(TN_R9) == 0, "M2 solution does not report R9");

  CONDITIONTESTER tester(net.model);
  vector<GROWTH> medias = net.medias();
  for(int i=0; i<medias.size(); i++) {
    TEST_ASSERT(tester.testSingleCondition(TESTCONDITION(medias[i], net.biomass, false, 0.5f)), "media grows on the final model");
  }
  TEST_PASSED(name);
}

bool test_sequential_shared_and_unique() {
  return checkSharedAndUnique("sequential: shared and media-specific reactions", SEQUENTIAL);
}

bool test_independent_shared_and_unique() {
  return checkSharedAndUnique("independent: shared and media-specific reactions", INDEPENDENT);
}

/* M1 needs R5 forward and M2 needs it in reverse. Integrating M2 must not close the direction M1 opened, nor the reverse */
bool test_independent_opposite_directions() {
  RULENETWORK net;
  net.database.addReaction(makeReaction(TN_R5, -100.0f, 100.0f));
  net.model.addGrowthRule("M1", vector<CANDIDATE>(1, CANDIDATE(TN_R5, FORWARD)), 1.0f);
  net.model.addGrowthRule("M2", vector<CANDIDATE>(1, CANDIDATE(TN_R5, REVERSE)), 1.0f);
  SCRIPTEDGAPFILLPKG pkg(net.model, net.database, net.databaseMets);
  pkg.addSolution("M1", vector<CANDIDATE>(1, CANDIDATE(TN_R5, FORWARD)));
  pkg.addSolution("M2", vector<CANDIDATE>(1, CANDIDATE(TN_R5, REVERSE)));
  GAPFILLER gapfiller(net.model, pkg, vector<TESTCONDITION>(), REACTIONGENESCORES());

  vector<GROWTH> medias;
  medias.push_back(net.m1);
  medias.push_back(net.m2);
  map<string, GAPFILLSOLUTION> solutions;
  int status = gapfiller.runMultiGapfill(medias, net.biomass, makeOptions(INDEPENDENT), solutions);
  TEST_ASSERT(status == GAPFILL_SUCCESS, "independent gapfilling succeeds");
  TEST_ASSERT(solutions["M1"].newRxns.count(TN_R5) == 1 && solutions["M1"].newRxns[TN_R5] == FORWARD, "M1 uses R5 forward");
  TEST_ASSERT(solutions["M2"].newRxns.count(TN_R5) == 1 && solutions["M2"].newRxns[TN_R5] == REVERSE, "M2 uses R5 in reverse");
  TEST_ASSERT(net.model.getBound(TN_R5, FORWARD) > 0, "forward direction stays open");
  TEST_ASSERT(net.model.getBound(TN_R5, REVERSE) < 0, "reverse direction stays open");
  TEST_ASSERT(solutions["M2"].growth > 0, "M2 grows after integration");
  TEST_ASSERT(gapfiller.cumulativeGapfilling().size() == 2, "both directions are in the cumulative solution");

  CONDITIONTESTER tester(net.model);
  TEST_ASSERT(tester.testSingleCondition(TESTCONDITION(net.m1, net.biomass, false, 0.5f)), "M1 grows on the final model");
  TEST_ASSERT(tester.testSingleCondition(TESTCONDITION(net.m2, net.biomass, false, 0.5f)), "M2 grows on the final model");
  TEST_PASSED("independent: opposite directions of one reaction");
}

/* The first solution opens R8 and breaks the ATP test: R8 is filtered and the gapfilling re-run */
bool test_test_conditions_rerun() {
  RULENETWORK net;
  SCRIPTEDGAPFILLPKG pkg(net.model, net.database, net.databaseMets);
  pkg.addSolution("M1", items(TN_R0, TN_R1, TN_R8));
  pkg.addSolution("M1", items(TN_R0, TN_R1));
  GAPFILLPARAMS params;
  params.testConditionIterationLimit = 3;
  GAPFILLER gapfiller(net.model, pkg, net.atpTests(), REACTIONGENESCORES(), params);
  GAPFILLSOLUTION sol;

  int status = gapfiller.runGapfilling(net.m1, net.biomass, 0.01f, false, false, sol);
  TEST_ASSERT(status == GAPFILL_SUCCESS, "gapfilling with test conditions succeeds");
  TEST_ASSERT(pkg.optimizeCount() == 2, "gapfilling is solved twice");
  TEST_ASSERT(gapfillCount(sol) == 2 && sol.newRxns.count(TN_R0) == 1 && sol.newRxns.count(TN_R1) == 1, "solution is R0 and R1");
  TEST_ASSERT(sol.newRxns.count(TN_R8) == 0, "R8 is not in the solution");
  TEST_ASSERT(pkg.gfModel().getBound(TN_R8, FORWARD) == 0, "R8 stays closed in the gapfilling model");
  TEST_ASSERT(pkg.gfModel().getBound(TN_R9, FORWARD) == 100.0f, "candidates outside the solution are reopened");
  TEST_ASSERT(pkg.gfModel().getMedia().id == "M1", "gapfilling media is restored");
  TEST_PASSED("test conditions filter the solution and re-run");
}

/* Only a solution with R8 exists and the iteration limit is 0 */
bool test_test_conditions_iteration_limit() {
  RULENETWORK net;
  SCRIPTEDGAPFILLPKG pkg(net.model, net.database, net.databaseMets);
  pkg.addSolution("M1", items(TN_R0, TN_R1, TN_R8));
  GAPFILLPARAMS params;
  params.testConditionIterationLimit = 0;
  GAPFILLER gapfiller(net.model, pkg, net.atpTests(), REACTIONGENESCORES(), params);
  GAPFILLSOLUTION sol;

  int status = gapfiller.runGapfilling(net.m1, net.biomass, 0.01f, false, false, sol);
  TEST_ASSERT(status == NO_GAPFILL_SOLUTION, "no solution passes the tests");
  TEST_ASSERT(pkg.optimizeCount() == 1, "gapfilling is not re-run past the limit");
  TEST_PASSED("test conditions stop at the iteration limit");
}

bool test_prefilter() {
  RULENETWORK net;
  SCRIPTEDGAPFILLPKG pkg(net.model, net.database, net.databaseMets);
  GAPFILLER gapfiller(net.model, pkg, net.atpTests(), REACTIONGENESCORES());
  vector<TESTCONDITION> growth(1, TESTCONDITION(net.m1, net.biomass, false, 0.01f));

  int status = gapfiller.prefilter(growth, false, false, vector<vector<CANDIDATE> >());
  TEST_ASSERT(status == GAPFILL_SUCCESS, "prefilter succeeds");
  TEST_ASSERT(pkg.gfModel().getBound(TN_R8, FORWARD) == 0, "R8 is filtered");
  TEST_ASSERT(pkg.gfModel().getBound(TN_R0, FORWARD) == 100.0f && pkg.gfModel().getBound(TN_R1, FORWARD) == 100.0f,
	      "reactions M1 needs are not filtered");
  TEST_ASSERT(pkg.gfModel().getBound(TN_R9, FORWARD) == 100.0f, "reactions that do not matter stay open");
  TEST_ASSERT(gapfiller.cache().filterCount() == 1, "filter is cached on the gapfiller");
  TEST_ASSERT(pkg.gfModel().getMedia().id.empty(), "gapfilling media is restored");
  TEST_PASSED("prefilter closes what breaks the tests");
}

bool test_prefilter_without_tests() {
  RULENETWORK net;
  SCRIPTEDGAPFILLPKG pkg(net.model, net.database, net.databaseMets);
  GAPFILLER gapfiller(net.model, pkg, vector<TESTCONDITION>(), REACTIONGENESCORES());
  vector<TESTCONDITION> growth(1, TESTCONDITION(net.m1, net.biomass, false, 0.01f));

  TEST_ASSERT(gapfiller.prefilter(growth, false, false, vector<vector<CANDIDATE> >()) == GAPFILL_SUCCESS, "prefilter succeeds");
  TEST_ASSERT(pkg.gfModel().getBound(TN_R8, FORWARD) == 100.0f, "nothing is filtered");
  TEST_ASSERT(gapfiller.cache().filterCount() == 0, "nothing is cached");
  TEST_PASSED("prefilter without test conditions");
}

/* R8 carries flux before filtering and none after */
bool test_conditions_retested_after_filtering() {
  RULENETWORK net;
  SCRIPTEDGAPFILLPKG pkg(net.model, net.database, net.databaseMets);
  GAPFILLER gapfiller(net.model, pkg, net.atpTests(), REACTIONGENESCORES());
  vector<OBJECTIVE> targets(3, net.biomass);
  vector<double> thresholds(3, 0.01f);

  GAPFILLCONDITIONS unfiltered = gapfiller.testAndAdjustGapfillingConditions(net.medias(), targets, thresholds, false);
  TEST_ASSERT(unfiltered.medias.size() == 3, "all media pass before filtering");
  TEST_ASSERT(inList(unfiltered.activeReactions[0], TN_R8), "R8 is active before filtering");

  GAPFILLCONDITIONS conditions = gapfiller.testAndAdjustGapfillingConditions(net.medias(), targets, thresholds, true);
  TEST_ASSERT(conditions.medias.size() == 3, "all media pass after filtering");
  TEST_ASSERT(conditions.conditions.size() == 3 && conditions.activeReactions.size() == 3, "conditions and active sets match the media");
  for(int i=0; i<conditions.activeReactions.size(); i++) {
    TEST_ASSERT(!inList(conditions.activeReactions[i], TN_R8), "R8 is not active after filtering");
    TEST_ASSERT(inList(conditions.activeReactions[i], TN_R0), "R0 is still active after filtering");
  }
  TEST_ASSERT(pkg.gfModel().getBound(TN_R8, FORWARD) == 0, "R8 is filtered");
  TEST_PASSED("gapfilling conditions are re-tested after filtering");
}

/* Filtering that leaves a media unable to grow drops that media */
bool test_media_dropped_after_filtering() {
  RULENETWORK net;
  net.model.addGrowthRule("M4", vector<CANDIDATE>(1, CANDIDATE(TN_R8, FORWARD)), 1.0f);
  SCRIPTEDGAPFILLPKG pkg(net.model, net.database, net.databaseMets);
  GAPFILLER gapfiller(net.model, pkg, net.atpTests(), REACTIONGENESCORES());
  vector<GROWTH> medias;
  medias.push_back(net.m1);
  medias.push_back(GROWTH("M4"));
  vector<OBJECTIVE> targets(2, net.biomass);
  vector<double> thresholds(2, 0.01f);

  /* M4 is a guard while filtering, so R8 is kept and the ATP test cannot be met */
  GAPFILLCONDITIONS conditions = gapfiller.testAndAdjustGapfillingConditions(medias, targets, thresholds, true);
  TEST_ASSERT(conditions.empty(), "no conditions survive a failed prefilter");
  TEST_PASSED("failed prefilter drops every condition");
}

int main() {
  printf("MULTI-MEDIA GAPFILLING\n");
  test_sequential_shared_and_unique();
  test_independent_shared_and_unique();
  test_independent_opposite_directions();
  test_test_conditions_rerun();
  test_test_conditions_iteration_limit();
  test_prefilter();
  test_prefilter_without_tests();
  test_conditions_retested_after_filtering();
  test_media_dropped_after_filtering();
  printf("\n%d passed, %d failed\n", g_passed, g_failed);
  return g_failed > 0 ? 1 : 0;
}
