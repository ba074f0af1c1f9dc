#ifndef CONDITIONTESTER_H
#define CONDITIONTESTER_H

#include <vector>
#include "DataStructures.h"
#include "Model.h"

/* Runs growth / threshold tests against a MODEL. The model is borrowed, not owned */
class CONDITIONTESTER {
 public:
  CONDITIONTESTER(MODEL &m);

  /* Sets the media and the objective of the condition (always maximized) */
  void applyTestCondition(const TESTCONDITION &cond);

  /* Solves and compares to the threshold. Returns true if the condition passes */
  bool testSingleCondition(const TESTCONDITION &cond);
  bool testSingleCondition(const TESTCONDITION &cond, bool applyCondition);

  /* AND of all conditions, stops at the first failure */
  bool testConditionList(const vector<TESTCONDITION> &conditions);

  /* Value compared to the threshold by the last test (a difference in change mode) */
  double score() const;
  /* Objective of the last test that passed. Reference for change mode */
  double lastObjective() const;
  void resetChangeReference();

  MODEL& getModel();

 private:
  MODEL &model;
  double lastScore;
  double passedObjective;
  bool hasPassed;
};

#endif
