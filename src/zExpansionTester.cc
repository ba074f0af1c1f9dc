/* REDUCER: binary / linear expansion tests in both modes */

#include <cstdio>
#include <vector>

#include "ConditionTester.h"
#include "DataStructures.h"
#include "Expansion.h"
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

static vector<CANDIDATE> forwardList(int a, int b) {
  vector<CANDIDATE> list;
  list.push_back(CANDIDATE(a, FORWARD));
  list.push_back(CANDIDATE(b, FORWARD));
  return list;
}

static bool hasItem(const vector<CANDIDATE> &list, int id, int dir) {
  for(int i=0; i<list.size(); i++) {
    if(list[i].id == id && list[i].dir == dir) { return true; }
  }
  return false;
}

/* Growth on "M" needs R1 only */
static void setupRetain(RULEMODEL &model) {
  model.addReaction(makeReaction(1, 0.0f, 100.0f));
  model.addReaction(makeReaction(2, 0.0f, 100.0f));
  model.addReaction(makeReaction(99, 0.0f, 100.0f));
  vector<CANDIDATE> needed(1, CANDIDATE(1, FORWARD));
  model.addGrowthRule("M", needed, 1.0f);
}

bool test_retain_minimal(bool binary) {
  RULEMODEL model;
  setupRetain(model);
  CONDITIONTESTER tester(model);
  REDUCER reducer(tester, RETAIN_MODE);
  vector<TESTCONDITION> conds(1, TESTCONDITION(GROWTH("M"), OBJECTIVE("obj", 99), false, 0.5f));
  vector<CANDIDATE> result;

  int status = reducer.reactionExpansionTest(forwardList(1, 2), conds, binary, vector<TESTCONDITION>(), result);
  TEST_ASSERT(status == GAPFILL_SUCCESS, "reduction should succeed");
  TEST_ASSERT(result.size() == 1 && result[0].id == 1, "only R1 is needed");
  TEST_ASSERT(result[0].originalBound == 100.0f, "the original bound should be recorded");
  TEST_ASSERT(model.getBound(1, FORWARD) == 100.0f, "R1 keeps its bound");
  TEST_ASSERT(model.getBound(2, FORWARD) == 0.0f, "R2 should be zeroed");
  TEST_ASSERT(tester.testSingleCondition(conds[0]), "the reduced set still passes");
  TEST_PASSED(binary ? "retain minimal set (binary)" : "retain minimal set (linear)");
}

/* Removing any single reaction of the result has to break the condition */
bool test_retain_every_item_needed() {
  RULEMODEL model;
  for(int i=1; i<=6; i++) { model.addReaction(makeReaction(i, 0.0f, 100.0f)); }
  vector<CANDIDATE> path;
  path.push_back(CANDIDATE(2, FORWARD));
  path.push_back(CANDIDATE(5, FORWARD));
  model.addGrowthRule("M", path, 1.0f);
  vector<CANDIDATE> longer;
  longer.push_back(CANDIDATE(1, FORWARD));
  longer.push_back(CANDIDATE(3, FORWARD));
  longer.push_back(CANDIDATE(4, FORWARD));
  model.addGrowthRule("M", longer, 1.0f);

  CONDITIONTESTER tester(model);
  REDUCER reducer(tester, RETAIN_MODE);
  vector<TESTCONDITION> conds(1, TESTCONDITION(GROWTH("M"), OBJECTIVE("obj", 6), false, 0.5f));
  vector<CANDIDATE> list;
  for(int i=1; i<=6; i++) { list.push_back(CANDIDATE(i, FORWARD)); }
  vector<CANDIDATE> result;
  TEST_ASSERT(reducer.reactionExpansionTest(list, conds, true, vector<TESTCONDITION>(), result) == GAPFILL_SUCCESS,
	      "reduction should succeed");
  TEST_ASSERT(tester.testSingleCondition(conds[0]), "the result passes");
  for(int i=0; i<result.size(); i++) {
    model.setBound(result[i].id, FORWARD, 0.0f);
    TEST_ASSERT(!tester.testSingleCondition(conds[0]), "removing an item of the result should fail the condition");
    model.setBound(result[i].id, FORWARD, 100.0f);
  }
  TEST_PASSED("every retained item is needed");
}

/* "ATP" fails while R3 and R4 are both open. Growth on "G" needs R3 */
static void setupFilter(RULEMODEL &model) {
  model.addReaction(makeReaction(3, 0.0f, 100.0f));
  model.addReaction(makeReaction(4, 0.0f, 100.0f));
  model.addReaction(makeReaction(99, 0.0f, 100.0f));
  model.addGrowthRule("ATP", forwardList(3, 4), 5.0f);
  model.addGrowthRule("G", vector<CANDIDATE>(1, CANDIDATE(3, FORWARD)), 1.0f);
}

bool test_filter_with_breaking() {
  RULEMODEL model;
  setupFilter(model);
  CONDITIONTESTER tester(model);
  REDUCER reducer(tester, FILTER_MODE);
  vector<TESTCONDITION> tests(1, TESTCONDITION(GROWTH("ATP"), OBJECTIVE("atp", 99), true, 1.0f));
  vector<TESTCONDITION> guards(1, TESTCONDITION(GROWTH("G"), OBJECTIVE("bio1", 99), false, 0.5f));
  vector<CANDIDATE> result;

  /* R4 is tried first, R3 next: zeroing R3 breaks the guard so it is kept and the search restarts */
  int status = reducer.reactionExpansionTest(forwardList(4, 3), tests, true, guards, result);
  TEST_ASSERT(status == GAPFILL_SUCCESS, "filtering should succeed");
  TEST_ASSERT(result.size() == 1 && hasItem(result, 4, FORWARD), "only R4 should be filtered");
  TEST_ASSERT(model.getBound(4, FORWARD) == 0.0f, "R4 is zeroed");
  TEST_ASSERT(model.getBound(3, FORWARD) == 100.0f, "R3 keeps its bound");
  TEST_ASSERT(tester.testSingleCondition(tests[0]), "the test passes after filtering");
  TEST_ASSERT(tester.testSingleCondition(guards[0]), "the guard passes after filtering");
  TEST_PASSED("filter with a breaking reaction");
}

bool test_filter_cache() {
  RULEMODEL model;
  setupFilter(model);
  CONDITIONTESTER tester(model);
  GAPFILLCACHE cache;
  REDUCER reducer(tester, FILTER_MODE, &cache);
  vector<TESTCONDITION> tests(1, TESTCONDITION(GROWTH("ATP"), OBJECTIVE("atp", 99), true, 1.0f));
  vector<CANDIDATE> result;

  TEST_ASSERT(reducer.reactionExpansionTest(forwardList(3, 4), tests, false, vector<TESTCONDITION>(), result) == GAPFILL_SUCCESS,
	      "linear filtering should succeed");
  TEST_ASSERT(result.size() == 1, "one reaction should be filtered");
  TEST_ASSERT(cache.filterCount() == 1, "the filtered reaction should be cached");

  /* Second run: the cached reaction is zeroed without a search */
  model.setBound(result[0].id, FORWARD, 100.0f);
  int before = model.solveCount();
  vector<CANDIDATE> again;
  TEST_ASSERT(reducer.reactionExpansionTest(forwardList(3, 4), tests, false, vector<TESTCONDITION>(), again) == GAPFILL_SUCCESS,
	      "second run should succeed");
  TEST_ASSERT(again.size() == 1 && again[0].sameItem(result[0]), "cached reaction should be reported again");
  TEST_ASSERT(model.getBound(result[0].id, FORWARD) == 0.0f, "cached reaction should be zeroed");
  TEST_ASSERT(model.solveCount() - before <= 2, "no search should be needed");
  TEST_PASSED("filter cache");
}

bool test_no_solution_leaves_model() {
  RULEMODEL model;
  setupFilter(model);
  model.setInfeasibleMedia("BAD");
  CONDITIONTESTER tester(model);
  REDUCER reducer(tester, FILTER_MODE);
  vector<TESTCONDITION> tests(1, TESTCONDITION(GROWTH("BAD"), OBJECTIVE("atp", 99), true, 1.0f));
  vector<CANDIDATE> result;

  int status = reducer.reactionExpansionTest(forwardList(3, 4), tests, true, vector<TESTCONDITION>(), result);
  TEST_ASSERT(status == NO_GAPFILL_SOLUTION, "an infeasible test has no solution");
  TEST_ASSERT(result.empty(), "nothing should be filtered");
  TEST_ASSERT(model.getBound(3, FORWARD) == 100.0f && model.getBound(4, FORWARD) == 100.0f, "no bound should change");
  TEST_PASSED("no solution leaves the model unchanged");
}

bool test_bad_arguments() {
  RULEMODEL model;
  setupFilter(model);
  CONDITIONTESTER tester(model);
  REDUCER reducer(tester, FILTER_MODE);
  vector<CANDIDATE> result;
  TEST_ASSERT(reducer.reactionExpansionTest(forwardList(3, 4), vector<TESTCONDITION>(), true, vector<TESTCONDITION>(), result)
	      == BAD_ARGUMENTS, "no conditions is a bad argument");
  vector<TESTCONDITION> tests(1, TESTCONDITION(GROWTH("ATP"), OBJECTIVE("atp", 99), true, 1.0f));
  TEST_ASSERT(reducer.reactionExpansionTest(forwardList(3, 42), tests, true, vector<TESTCONDITION>(), result) == BAD_ARGUMENTS,
	      "unknown reaction is a bad argument");
  TEST_PASSED("bad arguments");
}

/* "M" needs R1 and R2, "N" needs R3. What one condition needs is kept even where the other does not need it */
bool test_retain_multiple_conditions() {
  RULEMODEL model;
  for(int i=1; i<=4; i++) { model.addReaction(makeReaction(i, 0.0f, 100.0f)); }
  model.addReaction(makeReaction(99, 0.0f, 100.0f));
  model.addGrowthRule("M", forwardList(1, 2), 1.0f);
  model.addGrowthRule("N", vector<CANDIDATE>(1, CANDIDATE(3, FORWARD)), 1.0f);

  CONDITIONTESTER tester(model);
  REDUCER reducer(tester, RETAIN_MODE);
  vector<TESTCONDITION> conds;
  conds.push_back(TESTCONDITION(GROWTH("M"), OBJECTIVE("obj", 99), false, 0.5f));
  conds.push_back(TESTCONDITION(GROWTH("N"), OBJECTIVE("obj", 99), false, 0.5f));
  vector<CANDIDATE> list;
  for(int i=1; i<=4; i++) { list.push_back(CANDIDATE(i, FORWARD)); }
  vector<CANDIDATE> result;

  TEST_ASSERT(reducer.reactionExpansionTest(list, conds, true, vector<TESTCONDITION>(), result) == GAPFILL_SUCCESS,
	      "reduction should succeed");
  TEST_ASSERT(result.size() == 3, "three items are needed");
  TEST_ASSERT(result[0].id == 1 && result[1].id == 2 && result[2].id == 3, "needed items come back in list order");
  TEST_ASSERT(model.getBound(1, FORWARD) == 100.0f && model.getBound(2, FORWARD) == 100.0f && model.getBound(3, FORWARD) == 100.0f,
	      "needed items keep their bound");
  TEST_ASSERT(model.getBound(4, FORWARD) == 0.0f, "R4 should be zeroed");
  TEST_ASSERT(tester.testSingleCondition(conds[0]) && tester.testSingleCondition(conds[1]), "both conditions still pass");
  TEST_PASSED("retain over several conditions");
}

/* "ATP" fails while R3 is open, "NADH" while R4 is open. Each condition filters its own reaction */
bool test_filter_multiple_conditions() {
  RULEMODEL model;
  for(int i=1; i<=4; i++) { model.addReaction(makeReaction(i, 0.0f, 100.0f)); }
  model.addReaction(makeReaction(99, 0.0f, 100.0f));
  model.addGrowthRule("ATP", vector<CANDIDATE>(1, CANDIDATE(3, FORWARD)), 5.0f);
  model.addGrowthRule("NADH", vector<CANDIDATE>(1, CANDIDATE(4, FORWARD)), 5.0f);

  CONDITIONTESTER tester(model);
  REDUCER reducer(tester, FILTER_MODE);
  vector<TESTCONDITION> tests;
  tests.push_back(TESTCONDITION(GROWTH("ATP"), OBJECTIVE("atp", 99), true, 1.0f));
  tests.push_back(TESTCONDITION(GROWTH("NADH"), OBJECTIVE("nadh", 99), true, 1.0f));
  vector<CANDIDATE> list;
  for(int i=1; i<=4; i++) { list.push_back(CANDIDATE(i, FORWARD)); }
  vector<CANDIDATE> result;

  TEST_ASSERT(reducer.reactionExpansionTest(list, tests, true, vector<TESTCONDITION>(), result) == GAPFILL_SUCCESS,
	      "filtering should succeed");
  TEST_ASSERT(result.size() == 2 && hasItem(result, 3, FORWARD) && hasItem(result, 4, FORWARD), "R3 and R4 are filtered");
  TEST_ASSERT(model.getBound(3, FORWARD) == 0.0f && model.getBound(4, FORWARD) == 0.0f, "filtered items stay zeroed");
  TEST_ASSERT(model.getBound(1, FORWARD) == 100.0f && model.getBound(2, FORWARD) == 100.0f, "R1 and R2 are untouched");
  TEST_ASSERT(tester.testSingleCondition(tests[0]) && tester.testSingleCondition(tests[1]), "both tests pass afterwards");
  TEST_PASSED("filter over several conditions");
}

int main() {
  printf("REDUCER\n");
  test_retain_minimal(true);
  test_retain_minimal(false);
  test_retain_every_item_needed();
  test_filter_with_breaking();
  test_filter_cache();
  test_retain_multiple_conditions();
  test_filter_multiple_conditions();
  test_no_solution_leaves_model();
  test_bad_arguments();
  printf("\n%d passed, %d failed\n", g_passed, g_failed);
  return g_failed > 0 ? 1 : 0;
}
