/* GLPK flux balance, the gapfilling LP, exchanges and bound transactions */

#include <cstdio>
#include <map>
#include <vector>

#include "DataStructures.h"
#include "Exchanges.h"
#include "genericLinprog.h"
#include "Model.h"
#include "MyConstants.h"
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

static bool near(double a, double b) {
  return a - b < 1E-6 && b - a < 1E-6;
}

/* The test network plus R0 (A --> X) */
static void addR0(GAPFILLNETWORK &net) {
  net.model.addReaction(net.database.rxnFromId(TN_R0));
}

bool test_growth() {
  GAPFILLNETWORK net;
  addR0(net);
  net.model.setMedia(net.m1);
  FBARESULT res = net.model.solve();
  TEST_ASSERT(res.status == SOLVE_OPTIMAL, "M1 is feasible");
  TEST_ASSERT(near(res.objective, 10.0f), "growth is limited by the uptake of A");
  TEST_ASSERT(near(res.fluxOf(TN_R0), 10.0f), "all A goes through R0");
  TEST_ASSERT(near(res.fluxOf(TN_EX_A), -10.0f), "uptake is negative exchange flux");

  net.model.setMedia(net.m2);
  res = net.model.solve();
  TEST_ASSERT(res.status == SOLVE_OPTIMAL && near(res.objective, 0.0f), "nothing grows on M2");
  TEST_PASSED("growth");
}

bool test_infeasible() {
  GAPFILLNETWORK net;
  addR0(net);
  net.model.setMedia(net.m1);
  net.model.setBound(TN_BIO, REVERSE, 20.0f);
  FBARESULT res = net.model.solve();
  TEST_ASSERT(res.status == SOLVE_INFEASIBLE, "a forced growth above the uptake is infeasible");
  TEST_PASSED("infeasible problem");
}

bool test_no_objective() {
  GAPFILLNETWORK net;
  net.model.setObjective(OBJECTIVE());
  FBARESULT res = net.model.solve();
  TEST_ASSERT(res.status == SOLVE_FAILED, "no objective cannot be solved");
  TEST_PASSED("missing objective");
}

bool test_media() {
  GAPFILLNETWORK net;
  net.model.setMedia(net.m1);
  TEST_ASSERT(net.model.getBound(TN_EX_A, REVERSE) == -10.0f, "A can be taken up");
  TEST_ASSERT(net.model.getBound(TN_EX_B, REVERSE) == 0.0f, "B cannot");
  net.model.setMedia(net.m2);
  TEST_ASSERT(net.model.getBound(TN_EX_A, REVERSE) == 0.0f, "A is closed again");
  TEST_ASSERT(net.model.getBound(TN_EX_B, REVERSE) == -10.0f, "B can be taken up");
  TEST_ASSERT(net.model.getMedia().id == "M2", "current media is recorded");
  TEST_PASSED("media");
}

bool test_exchanges() {
  GAPFILLNETWORK net;
  TEST_ASSERT(FindExchange4Metabolite(net.model.reactions.rxns, TN_A_E) == TN_EX_A, "exchange of A");
  TEST_ASSERT(FindExchange4Metabolite(net.model.reactions.rxns, TN_X_C) == -1, "biomass is not an exchange");

  METABOLITE d = makeMetabolite(6, "cpd00006_e0", "e0");
  net.model.addMetabolite(d);
  vector<int> added;
  AddMissingExchanges(net.model.reactions, net.model.metabolites, added);
  TEST_ASSERT(added.size() == 1 && added[0] == _db.MISSINGEXCHANGEFACTOR + 6, "one exchange added for D");
  TEST_ASSERT(FindExchange4Metabolite(net.model.reactions.rxns, 6) == added[0], "D now has an exchange");

  REACTION sink = AutoSink(net.model.metabolites.metFromId(TN_X_C));
  TEST_ASSERT(isGeneratedReaction(sink.id), "sinks are generated reactions");
  TEST_ASSERT(sink.lb == 0.0f && sink.ub > 0.0f, "sinks only excrete");
  REACTION flex = FlexSupply(net.model.metabolites.metFromId(TN_X_C));
  TEST_ASSERT(flex.lb < 0.0f && flex.ub == 0.0f, "supply reactions only take up");
  TEST_PASSED("exchanges");
}

bool test_scope() {
  RULEMODEL model;
  model.addReaction(makeReaction(1, -5.0f, 5.0f));
  model.addReaction(makeReaction(2, 0.0f, 5.0f));
  {
    BOUNDSCOPE scope(model);
    scope.zero(1, FORWARD);
    scope.setBound(1, FORWARD, 3.0f);
    TEST_ASSERT(scope.originalBound(1, FORWARD) == 5.0f, "first touch is remembered");
    TEST_ASSERT(scope.touched(1) && !scope.touched(2), "touched reactions");
    {
      BOUNDSCOPE inner(model);
      inner.zero(1, REVERSE);
      inner.zero(2, FORWARD);
    }
    TEST_ASSERT(model.getBound(1, REVERSE) == -5.0f && model.getBound(2, FORWARD) == 5.0f, "inner scope rolls back");
    TEST_ASSERT(model.getBound(1, FORWARD) == 3.0f, "outer change survives the inner scope");
  }
  TEST_ASSERT(model.getBound(1, FORWARD) == 5.0f, "outer scope rolls back");
  {
    BOUNDSCOPE scope(model);
    scope.zero(2, FORWARD);
    scope.commit();
  }
  TEST_ASSERT(model.getBound(2, FORWARD) == 0.0f, "committed change stays");

  model.setMedia(GROWTH("A"));
  model.setObjective(OBJECTIVE("one", 1));
  {
    BOUNDSCOPE scope(model, true);
    model.setMedia(GROWTH("B"));
    model.setObjective(OBJECTIVE("two", 2));
    model.setBound(1, REVERSE, 0.0f);
  }
  TEST_ASSERT(model.getMedia().id == "A" && model.getObjective().name == "one", "media and objective restored");
  TEST_ASSERT(model.getBound(1, REVERSE) == -5.0f, "bounds changed outside the scope are restored too");
  TEST_PASSED("bound scope");
}

/* Rolling back one direction of a reaction leaves the other direction as it is now */
bool test_scope_directions() {
  RULEMODEL model;
  model.addReaction(makeReaction(1, 0.0f, 100.0f));
  {
    BOUNDSCOPE scope(model);
    scope.zero(1, FORWARD);
    model.setBound(1, REVERSE, -100.0f);
    TEST_ASSERT(scope.touched(1), "reaction is touched");
    TEST_ASSERT(scope.originalBound(1, REVERSE) == -100.0f, "untouched direction reports its current bound");
  }
  TEST_ASSERT(model.getBound(1, FORWARD) == 100.0f, "forward bound is restored");
  TEST_ASSERT(model.getBound(1, REVERSE) == -100.0f, "reverse bound opened outside the scope survives");
  {
    BOUNDSCOPE scope(model);
    scope.setBounds(1, 0.0f, 0.0f);
  }
  TEST_ASSERT(model.getBound(1, FORWARD) == 100.0f && model.getBound(1, REVERSE) == -100.0f, "setBounds restores both directions");
  TEST_PASSED("bound scope directions");
}

/* Two copies of R0 (A --> X) and R1 (B --> X) sharing the max-flux variables */
bool test_gapfill_lp() {
  GAPFILLNETWORK net;
  net.model.addReaction(net.database.rxnFromId(TN_R0));
  net.model.addReaction(net.database.rxnFromId(TN_R1));
  map<int,PENALTY> penalties;
  penalties[TN_R0].forward = 1.0f;
  penalties[TN_R1].forward = 3.0f;

  vector<RXNSPACE> copies;
  net.model.setMedia(net.m1);
  copies.push_back(net.model.reactions);
  GROWTH both = net.m1;
  both.id = "AB";
  both.media.push_back(net.m2.media[0]);
  net.model.setMedia(both);
  copies.push_back(net.model.reactions);

  map<int,FLUXPAIR> maxFlux;
  double objective;
  vector<OBJECTIVE> targets(2, net.biomass);
  vector<double> thresholds(2, 0.5f);
  int status = GAPFILL_SOLVE(copies, net.model.metabolites, targets, thresholds, penalties, maxFlux, objective, NULL);
  TEST_ASSERT(status == GAPFILL_SUCCESS, "the gapfilling LP is feasible");
  TEST_ASSERT(near(objective, 0.5f), "R0 is paid once for both copies");
  TEST_ASSERT(near(maxFlux[TN_R0].forward, 0.5f) && maxFlux[TN_R1].forward < 1E-8, "R1 is not used");

  thresholds[0] = 50.0f;
  status = GAPFILL_SOLVE(copies, net.model.metabolites, targets, thresholds, penalties, maxFlux, objective, NULL);
  TEST_ASSERT(status == NO_GAPFILL_SOLUTION, "a threshold above the uptake has no solution");
  thresholds.pop_back();
  status = GAPFILL_SOLVE(copies, net.model.metabolites, targets, thresholds, penalties, maxFlux, objective, NULL);
  TEST_ASSERT(status == BAD_ARGUMENTS, "one threshold per copy");
  TEST_PASSED("gapfilling LP");
}

int main() {
  printf("FBA\n");
  test_growth();
  test_infeasible();
  test_no_objective();
  test_media();
  test_exchanges();
  test_scope();
  test_scope_directions();
  test_gapfill_lp();
  printf("\n%d passed, %d failed\n", g_passed, g_failed);
  return g_failed > 0 ? 1 : 0;
}
