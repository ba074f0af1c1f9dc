/* testSolution and the solution list helpers */

#include <cstdio>
#include <vector>

#include "DataStructures.h"
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

static vector<CANDIDATE> items(int n, const int *ids) {
  vector<CANDIDATE> list;
  for(int i=0; i<n; i++) { list.push_back(CANDIDATE(ids[i], FORWARD)); }
  return list;
}

/* M1 needs R1 and R2, M2 needs R3. R4 is not used anywhere. Reaction 99 is the objective */
static void setupModel(RULEMODEL &model) {
  for(int i=1; i<=4; i++) { model.addReaction(makeReaction(i, 0.0f, 100.0f)); }
  model.addReaction(makeReaction(99, 0.0f, 100.0f));
  const int m1[] = {1, 2};
  model.addGrowthRule("M1", items(2, m1), 1.0f);
  const int m2[] = {3};
  model.addGrowthRule("M2", items(1, m2), 1.0f);
}

static void twoTriples(vector<OBJECTIVE> &targets, vector<GROWTH> &medias, vector<double> &thresholds) {
  targets.push_back(OBJECTIVE("bio1", 99));
  targets.push_back(OBJECTIVE("bio1", 99));
  medias.push_back(GROWTH("M1"));
  medias.push_back(GROWTH("M2"));
  thresholds.push_back(0.5f);
  thresholds.push_back(0.5f);
}

bool test_solution_list() {
  GAPFILLSOLUTION sol;
  sol.reversedRxns[5] = REVERSE;
  sol.newRxns[9] = FORWARD;
  sol.newRxns[2] = REVERSE;
  vector<CANDIDATE> list = convertSolutionToList(sol);
  TEST_ASSERT(gapfillCount(sol) == 3, "three items");
  TEST_ASSERT(list.size() == 3, "three items in the list");
  TEST_ASSERT(list[0].id == 2 && list[0].type == NEW_REACTION, "new reactions first, in id order");
  TEST_ASSERT(list[1].id == 9 && list[1].dir == FORWARD, "second new reaction");
  TEST_ASSERT(list[2].id == 5 && list[2].type == REVERSED_REACTION, "reversed reactions last");
  TEST_ASSERT(findItemInSolution(list, CANDIDATE(2, REVERSE), false), "same direction found");
  TEST_ASSERT(!findItemInSolution(list, CANDIDATE(2, FORWARD), false), "other direction not found");
  TEST_ASSERT(findItemInSolution(list, CANDIDATE(2, FORWARD), true), "other direction found when ignoring direction");
  TEST_PASSED("solution list");
}

bool test_unneeded_kept() {
  RULEMODEL model;
  setupModel(model);
  model.setMedia(GROWTH("START"));
  model.setObjective(OBJECTIVE("start", 1));
  vector<OBJECTIVE> targets; vector<GROWTH> medias; vector<double> thresholds;
  twoTriples(targets, medias, thresholds);
  const int ids[] = {1, 2, 3, 4};
  vector<CANDIDATE> unneeded;

  int status = testSolution(model, items(4, ids), targets, medias, thresholds, false, vector<CANDIDATE>(), unneeded);
  TEST_ASSERT(status == GAPFILL_SUCCESS, "test should succeed");
  TEST_ASSERT(unneeded.size() == 1 && unneeded[0].id == 4, "only R4 is unneeded");
  TEST_ASSERT(unneeded[0].originalBound == 100.0f, "the original bound is recorded");
  for(int i=1; i<=4; i++) { TEST_ASSERT(model.getBound(i, FORWARD) == 100.0f, "every bound should be back"); }
  TEST_ASSERT(model.getMedia().id == "START", "media should be restored");
  TEST_ASSERT(model.getObjective().name == "start", "objective should be restored");
  TEST_PASSED("unneeded reactions are reported and kept");
}

bool test_unneeded_removed() {
  RULEMODEL model;
  setupModel(model);
  vector<OBJECTIVE> targets; vector<GROWTH> medias; vector<double> thresholds;
  twoTriples(targets, medias, thresholds);
  const int ids[] = {1, 2, 3, 4};
  vector<CANDIDATE> unneeded;

  TEST_ASSERT(testSolution(model, items(4, ids), targets, medias, thresholds, true, vector<CANDIDATE>(), unneeded) == GAPFILL_SUCCESS,
	      "test should succeed");
  TEST_ASSERT(!model.hasReaction(4), "R4 has both bounds at zero and should be removed");
  TEST_ASSERT(model.hasReaction(3), "needed reactions stay");
  TEST_PASSED("unneeded reactions are removed");
}

bool test_do_not_remove() {
  RULEMODEL model;
  setupModel(model);
  vector<OBJECTIVE> targets; vector<GROWTH> medias; vector<double> thresholds;
  twoTriples(targets, medias, thresholds);
  const int ids[] = {1, 2, 3, 4};
  vector<CANDIDATE> keep(1, CANDIDATE(4, FORWARD));
  vector<CANDIDATE> unneeded;

  TEST_ASSERT(testSolution(model, items(4, ids), targets, medias, thresholds, true, keep, unneeded) == GAPFILL_SUCCESS,
	      "test should succeed");
  TEST_ASSERT(unneeded.size() == 1, "R4 is still reported");
  TEST_ASSERT(model.hasReaction(4) && model.getBound(4, FORWARD) == 100.0f, "R4 should be kept with its bound");
  TEST_PASSED("protected reactions are not removed");
}

/* Only one of two redundant reactions can go: the first unneeded one stays out while the next is tested */
bool test_combinations() {
  RULEMODEL model;
  model.addReaction(makeReaction(1, 0.0f, 100.0f));
  model.addReaction(makeReaction(2, 0.0f, 100.0f));
  model.addReaction(makeReaction(99, 0.0f, 100.0f));
  const int r1[] = {1};
  const int r2[] = {2};
  model.addGrowthRule("M", items(1, r1), 1.0f);
  model.addGrowthRule("M", items(1, r2), 1.0f);
  vector<OBJECTIVE> targets(1, OBJECTIVE("bio1", 99));
  vector<GROWTH> medias(1, GROWTH("M"));
  vector<double> thresholds(1, 0.5f);
  const int ids[] = {1, 2};
  vector<CANDIDATE> unneeded;

  TEST_ASSERT(testSolution(model, items(2, ids), targets, medias, thresholds, false, vector<CANDIDATE>(), unneeded) == GAPFILL_SUCCESS,
	      "test should succeed");
  TEST_ASSERT(unneeded.size() == 1 && unneeded[0].id == 1, "only the first redundant reaction is unneeded");
  TEST_PASSED("redundant reactions");
}

/* A lower bound that forces flux forward is cleared by the knockout and put back after */
bool test_forced_flux() {
  RULEMODEL model;
  setupModel(model);
  model.addReaction(makeReaction(5, 10.0f, 100.0f));
  vector<OBJECTIVE> targets; vector<GROWTH> medias; vector<double> thresholds;
  twoTriples(targets, medias, thresholds);
  const int ids[] = {5};
  vector<CANDIDATE> unneeded;

  TEST_ASSERT(testSolution(model, items(1, ids), targets, medias, thresholds, false, vector<CANDIDATE>(), unneeded) == GAPFILL_SUCCESS,
	      "test should succeed");
  TEST_ASSERT(unneeded.size() == 1 && unneeded[0].hasOther && unneeded[0].otherOriginalBound == 10.0f, "forcing bound recorded");
  TEST_ASSERT(model.getBound(5, REVERSE) == 10.0f && model.getBound(5, FORWARD) == 100.0f, "both bounds restored");
  TEST_PASSED("forced flux");
}

bool test_bad_arguments() {
  RULEMODEL model;
  setupModel(model);
  vector<OBJECTIVE> targets; vector<GROWTH> medias; vector<double> thresholds;
  twoTriples(targets, medias, thresholds);
  const int ids[] = {1, 42};
  vector<CANDIDATE> unneeded;
  TEST_ASSERT(testSolution(model, items(2, ids), targets, medias, thresholds, false, vector<CANDIDATE>(), unneeded) == BAD_ARGUMENTS,
	      "unknown reaction is a bad argument");
  thresholds.pop_back();
  TEST_ASSERT(testSolution(model, items(1, ids), targets, medias, thresholds, false, vector<CANDIDATE>(), unneeded) == BAD_ARGUMENTS,
	      "missing threshold is a bad argument");
  TEST_PASSED("bad arguments");
}

int main() {
  printf("SOLUTIONTESTER\n");
  test_solution_list();
  test_unneeded_kept();
  test_unneeded_removed();
  test_do_not_remove();
  test_combinations();
  test_forced_flux();
  test_bad_arguments();
  printf("\n%d passed, %d failed\n", g_passed, g_failed);
  return g_failed > 0 ? 1 : 0;
}
