#include <cstdio>
#include <string>
#include <vector>

#include "ConditionTester.h"
#include "DataStructures.h"
#include "MyConstants.h"
#include "Printers.h"

CONDITIONTESTER::CONDITIONTESTER(MODEL &m) : model(m) {
  lastScore = 0.0f;
  passedObjective = 0.0f;
  hasPassed = false;
}

void CONDITIONTESTER::applyTestCondition(const TESTCONDITION &cond) {
  OBJECTIVE obj = cond.objective;
  obj.sense = 1;
  model.setObjective(obj);
  model.setMedia(cond.media);
  if(_db.DEBUGREDUCER) { printTestCondition(cond); }
}

bool CONDITIONTESTER::testSingleCondition(const TESTCONDITION &cond) {
  return testSingleCondition(cond, true);
}

bool CONDITIONTESTER::testSingleCondition(const TESTCONDITION &cond, bool applyCondition) {
  if(applyCondition) { applyTestCondition(cond); }
  FBARESULT res = model.solve();

  if(res.status != SOLVE_OPTIMAL) {
    string lpName = cond.media.id + "-Testing-Infeasible.lp";
    model.writeLp(lpName.c_str());
    printf("ERROR: Testing media %s (objective %s) leads to a non-optimal problem (status %d). LP file printed to %s\n",
	   cond.media.id.c_str(), cond.objective.name.c_str(), res.status, lpName.c_str());
    lastScore = 0.0f;
    return false;
  }

  double value = res.objective;
  if(cond.change && hasPassed) {
    value = res.objective - passedObjective;
    if(_db.DEBUGREDUCER) {
      printf("%s testing for change: %4.6f = %4.6f - %4.6f\n", cond.media.id.c_str(), value, res.objective, passedObjective);
    }
  }
  lastScore = value;

  if(cond.isMaxThreshold && value >= cond.threshold) {
    if(_db.DEBUGREDUCER) { printf("Failed high: %s: %4.6f; %4.6f\n", cond.media.id.c_str(), res.objective, cond.threshold); }
    return false;
  }
  /* A minimum threshold is met on equality: an objective of exactly 1.0 passes a 1.0 growth requirement */
  if(!cond.isMaxThreshold && value < cond.threshold) {
    if(_db.DEBUGREDUCER) { printf("Failed low: %s: %4.6f; %4.6f\n", cond.media.id.c_str(), res.objective, cond.threshold); }
    return false;
  }
  passedObjective = res.objective;
  hasPassed = true;
  if(_db.DEBUGREDUCER) { printf("Passed: %s: %4.6f; %4.6f\n", cond.media.id.c_str(), res.objective, cond.threshold); }
  return true;
}

bool CONDITIONTESTER::testConditionList(const vector<TESTCONDITION> &conditions) {
  for(int i=0; i<conditions.size(); i++) {
    if(!testSingleCondition(conditions[i], true)) { return false; }
  }
  return true;
}

double CONDITIONTESTER::score() const {
  return lastScore;
}

double CONDITIONTESTER::lastObjective() const {
  return passedObjective;
}

void CONDITIONTESTER::resetChangeReference() {
  hasPassed = false;
  passedObjective = 0.0f;
}

MODEL& CONDITIONTESTER::getModel() {
  return model;
}
