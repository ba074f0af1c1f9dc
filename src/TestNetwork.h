#ifndef TESTNETWORK_H
#define TESTNETWORK_H

/* Small networks and a rule-driven model used by the z*Tester drivers */

#include <map>
#include <set>
#include <string>
#include <vector>

#include "DataStructures.h"
#include "GapfillPkg.h"
#include "Model.h"
#include "score.h"

using std::set;

METABOLITE makeMetabolite(int id, const char* name, const char* compartment);
STOICH makeStoich(const char* metName, double stoichCoeff, int metId);
REACTION makeReaction(int id, const char* name, double lb, double ub, const vector<STOICH> &stoichList);
/* Reaction with no metabolites (for RULEMODEL) */
REACTION makeReaction(int id, double lb, double ub);
GROWTH makeMedia(const string &id, const vector<int> &metIds, double rate);

/* A MODEL whose solve() reads the open bounds instead of solving an LP. The objective on a media is the
   best value among the growth rules whose (reaction, direction) items are all open.
   Lets the reduction algorithms be tested on exact scenarios */
class RULEMODEL : public MODEL {
 public:
  RULEMODEL();

  void addGrowthRule(const string &mediaId, const vector<CANDIDATE> &needed, double value);
  /* solve() on this media reports SOLVE_INFEASIBLE */
  void setInfeasibleMedia(const string &mediaId);

  bool isOpen(int rxnId, int dir) const;
  int solveCount() const;
  int lpWrites() const;

  FBARESULT solve();
  MODEL* clone() const;
  int writeLp(const char *filename);

 private:
  class RULE {
  public:
    string mediaId;
    vector<CANDIDATE> items;
    double value;
  };
  vector<RULE> growthRules;
  set<string> infeasibleMedia;
  int solves;
  int writes;
};

/* Gapfilling package whose optimizer returns scripted solutions instead of solving the LP.
   On a media, optimize() returns the first scripted solution whose items are all still open in the
   gapfilling model, so filtered reactions push it to the next one. optimizeGlobal() returns the union */
class SCRIPTEDGAPFILLPKG : public GAPFILLPKG {
 public:
  SCRIPTEDGAPFILLPKG(const MODEL &model, const RXNSPACE &database, const METSPACE &databaseMets);

  void addSolution(const string &mediaId, const vector<CANDIDATE> &items);
  int optimizeCount() const;

  int optimize(map<int,FLUXPAIR> &maxFlux, double &objectiveValue);
  int optimizeGlobal(const vector<GROWTH> &medias, const vector<OBJECTIVE> &targets, const vector<double> &thresholds,
		     map<int,FLUXPAIR> &maxFlux, double &objectiveValue);

 private:
  map<string, vector<vector<CANDIDATE> > > scripted;
  int optimizations;

  const vector<CANDIDATE>* firstOpen(const string &mediaId) const;
};

/* Ids used by the test networks */
#define TN_A_E    1
#define TN_B_E    2
#define TN_C_E    3
#define TN_X_C    4
#define TN_Y_C    5
#define TN_EX_A   101
#define TN_EX_B   102
#define TN_EX_C   103
#define TN_BIO    200
#define TN_R0     10
#define TN_R1     11
#define TN_R2     12
#define TN_R3     13
#define TN_R7     17
#define TN_R8     18
#define TN_R9     19

/* Three media (M1: A, M2: B, M3: C) and a model that has the exchanges and the biomass reaction
   but no way to make X. The database can connect each media to X:

     rxn00010  A_e --> X_c        rxn00011  B_e --> X_c
     rxn00012  C_e --> Y_c        rxn00013  Y_c --> X_c
     rxn00017  B_e --> A_e

   rxn00017 has a gene (so a lower penalty than the others) */
class GAPFILLNETWORK {
 public:
  FBAMODEL model;
  RXNSPACE database;
  METSPACE databaseMets;
  OBJECTIVE biomass;
  GROWTH m1;
  GROWTH m2;
  GROWTH m3;
  REACTIONGENESCORES geneScores;

  GAPFILLNETWORK();
  vector<GROWTH> medias() const;
};

#endif
