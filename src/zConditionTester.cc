/* Threshold semantics of CONDITIONTESTER on a rule-driven model */

#include <cstdio>
#include <vector>

#include "ConditionTester.h"
#include "DataStructures.h"
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

/* R1 alone gives 1, R1 + R2 give 3 on media "M" */
static void setupModel(RULEMODEL &model) {
  model.addReaction(makeReaction(1, 0.0f, 100.0f));
  model.addReaction(makeReaction(2, 0.0f, 100.0f));
  vector<CANDIDATE> needed;
  needed.push_back(CANDIDATE(1, FORWARD));
  model.addGrowthRule("M", needed, 1.0f);
  needed.push_back(CANDIDATE(2, FORWARD));
  model.addGrowthRule("M", needed, 3.0f);
}

bool test_min_threshold() {
  RULEMODEL model;
  setupModel(model);
  CONDITIONTESTER tester(model);
  TESTCONDITION cond(GROWTH("M"), OBJECTIVE("obj", 1), false, 2.0f);

  TEST_ASSERT(tester.testSingleCondition(cond), "3 >= 2 should pass a minimum threshold");
  TEST_ASSERT(tester.score() == 3.0f, "score should be the objective");
  model.setBound(2, FORWARD, 0.0f);
  TEST_ASSERT(!tester.testSingleCondition(cond), "1 < 2 should fail a minimum threshold");
  cond.threshold = 1.0f;
  TEST_ASSERT(tester.testSingleCondition(cond), "objective equal to a minimum threshold should pass");
  TEST_PASSED("minimum threshold");
}

bool test_max_threshold() {
  RULEMODEL model;
  setupModel(model);
  CONDITIONTESTER tester(model);
  TESTCONDITION cond(GROWTH("M"), OBJECTIVE("obj", 1), true, 3.0f);

  TEST_ASSERT(!tester.testSingleCondition(cond), "objective equal to a maximum threshold should fail");
  model.setBound(2, FORWARD, 0.0f);
  TEST_ASSERT(tester.testSingleCondition(cond), "1 < 3 should pass a maximum threshold");
  TEST_PASSED("maximum threshold");
}

bool test_change_reference() {
  RULEMODEL model;
  setupModel(model);
  model.setBound(2, FORWARD, 0.0f);
  CONDITIONTESTER tester(model);
  TESTCONDITION cond(GROWTH("M"), OBJECTIVE("obj", 1), true, 1.5f);
  cond.change = true;

  TEST_ASSERT(tester.testSingleCondition(cond), "1 < 1.5 should pass");
  TEST_ASSERT(tester.lastObjective() == 1.0f, "passing objective should be recorded");
  model.setBound(2, FORWARD, 100.0f);
  TEST_ASSERT(!tester.testSingleCondition(cond), "an increase of 2 should fail a change threshold of 1.5");
  TEST_ASSERT(tester.score() == 2.0f, "score should be the difference");
  tester.resetChangeReference();
  TEST_ASSERT(!tester.testSingleCondition(cond), "3 >= 1.5 should fail without a reference");
  TEST_PASSED("change mode reference");
}

bool test_infeasible() {
  RULEMODEL model;
  setupModel(model);
  model.setInfeasibleMedia("M");
  CONDITIONTESTER tester(model);
  TESTCONDITION minCond(GROWTH("M"), OBJECTIVE("obj", 1), false, 0.0f);
  TESTCONDITION maxCond(GROWTH("M"), OBJECTIVE("obj", 1), true, 100.0f);

  TEST_ASSERT(!tester.testSingleCondition(minCond), "infeasible problem should fail a minimum threshold");
  TEST_ASSERT(!tester.testSingleCondition(maxCond), "infeasible problem should fail a maximum threshold");
  TEST_ASSERT(model.lpWrites() == 2, "an LP file should be written for each infeasible test");
  TEST_PASSED("infeasible problem");
}

bool test_condition_list() {
  RULEMODEL model;
  setupModel(model);
  CONDITIONTESTER tester(model);
  vector<TESTCONDITION> conditions;
  conditions.push_back(TESTCONDITION(GROWTH("M"), OBJECTIVE("obj", 1), false, 2.0f));
  conditions.push_back(TESTCONDITION(GROWTH("M"), OBJECTIVE("obj", 1), true, 5.0f));
  TEST_ASSERT(tester.testConditionList(conditions), "both conditions should pass");
  conditions.push_back(TESTCONDITION(GROWTH("M"), OBJECTIVE("obj", 1), true, 2.0f));
  int before = model.solveCount();
  TEST_ASSERT(!tester.testConditionList(conditions), "third condition should fail the list");
  TEST_ASSERT(model.solveCount() - before == 3, "every condition up to the failure should be solved");
  TEST_PASSED("condition list");
}

int main() {
  printf("CONDITIONTESTER\n");
  test_min_threshold();
  test_max_threshold();
  test_change_reference();
  test_infeasible();
  test_condition_list();
  printf("\n%d passed, %d failed\n", g_passed, g_failed);
  return g_failed > 0 ? 1 : 0;
}
