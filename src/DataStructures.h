// Data structures used throughout the project

#ifndef _DATASTRUCTURES_H
#define _DATASTRUCTURES_H

#include <algorithm>
#include <climits>
#include <map>
#include <string>
#include <utility>
#include <vector>

using std::vector;
using std::map;
using std::string;
using std::pair;

/* Status codes returned by the gapfilling routines */
#define GAPFILL_SUCCESS      0
#define NO_GAPFILL_SOLUTION -1
#define BAD_ARGUMENTS       -2

/* Solver status codes (FBARESULT::status) */
#define SOLVE_OPTIMAL    0
#define SOLVE_INFEASIBLE 1
#define SOLVE_UNBOUNDED  2
#define SOLVE_FAILED     3

/* Reaction directions. A direction names the bound that has to be open for
   flux to go that way: FORWARD = '>' (upper bound), REVERSE = '<' (lower bound) */
#define FORWARD  1
#define REVERSE -1

/* Solution item types */
#define NEW_REACTION      0
#define REVERSED_REACTION 1

/* Input data classes */
struct MEDIA;
struct ANNOTATION;
class STOICH;
class REACTION;
class GROWTH;
class METABOLITE;
class RXNSPACE;
class METSPACE;

/* Gapfilling classes */
class OBJECTIVE;
class TESTCONDITION;
class FBARESULT;
class CANDIDATE;
class GAPFILLSOLUTION;
class EXPANSIONRESULT;
class FILTERKEY;
class GAPFILLCACHE;

enum INTEGRATIONPOLICY { INDEPENDENT, SEQUENTIAL, GLOBAL };

class RXNSPACE{
 public:
  vector<REACTION> rxns;

  RXNSPACE();

  void clear();

  void change_Lb_and_Ub(int id, double new_lb, double new_ub);

  void addReaction(const REACTION &rxn);
  void removeReaction(int id);
  REACTION rxnFromId(int id) const;
  REACTION* rxnPtrFromId(int id);
  const REACTION* rxnPtrFromId(int id) const;
  int idxFromId(int id) const;
  bool idIn(int id) const;
  void rxnMap();

  RXNSPACE operator=(const RXNSPACE& init);

 private:
  map<int,int> Ids2Idx;
  int numRxns;
};

class METSPACE{
 public:
  vector<METABOLITE> mets;

  METSPACE();

  void clear();
  void addMetabolite(const METABOLITE &met);
  METABOLITE metFromId(int id) const;
  METABOLITE* metPtrFromId(int id);
  const METABOLITE* metPtrFromId(int id) const;
  int idxFromId(int id) const;
  bool idIn(int id) const;

  METSPACE operator=(const METSPACE& init);
  map<int, int> Ids2Idx;

 private:
  int numMets;
};

struct MEDIA{
  int id; /* Metabolite id */
  char name[64]; /* Metabolie name */
  double rate; /* mmol/gDW/hr
		  (uptake rate for media, secretion rate for byproducts */
  bool operator==(const MEDIA &rhs) const;
  bool operator<(const MEDIA &rhs) const;

  MEDIA();
};

/* A growth environment. The id is what caches and logs refer to, so two GROWTH
   with the same id are assumed to be the same media */
class GROWTH{
 public:
  string id;
  /* Note that these should be metabolite ID's not Indexes */
  vector<MEDIA> media;
  vector<MEDIA> byproduct;

  GROWTH();
  GROWTH(const string &mediaId);
  void reset();
  bool empty() const;
};

class METABOLITE{
 public:
  int id; /* Has to be big matrix row index */
  char name[64];
  int charge;
  char compartment[8]; /* "c0", "e0", ... */
  char chemform[64]; /* Empty if the formula is unknown */
  string inchikey; /* Empty if unknown */
  double deltaG; /* _db.UNKNOWN_DELTAG if unknown */

  METABOLITE();
  void reset();
  bool isExtracellular() const;
};

class STOICH{
  public:
  int met_id;
  double rxn_coeff;
  char met_name[64];

  bool operator==(const STOICH &rhs) const;
  bool operator<(const STOICH &rhs) const;
  STOICH();
  void reset();
};

class REACTION{
 public:

  int id;
  char name[64];
  vector<STOICH> stoich; /* Full chemical reaction */

  /* Reactions with either no reactants or no products */
  int isExchange;

  int init_reversible; /* -1 backwards only, 0 reversible, 1 forward only */
  double lb;  double ub;

  /* Biochemistry data used for reliability scores */
  bool hasBiochem; /* false if the reaction could not be matched to the biochemistry database */
  char status[8]; /* "OK", "MI" (mass imbalanced), "CI" (charge imbalanced) */
  double deltaG; /* _db.UNKNOWN_DELTAG if unknown */

  vector<ANNOTATION> annote; /* List of gene annotations */

  bool operator==(const REACTION &rhs) const;
  bool operator<(const REACTION &rhs) const;
  REACTION();
  void reset();
  double bound(int dir) const;
  void setBound(int dir, double value);
};

struct ANNOTATION{
  double probability;
  string genename;
  /* THis compares > because we want to go in opposite order.. when sorting these. */
  bool operator<(const ANNOTATION &rhs) const;
};

/* Linear objective over reactions. sense: -1 = MIN, 1 = MAX */
class OBJECTIVE{
 public:
  string name;
  vector<int> rxnIds;
  vector<double> coeffs;
  int sense;

  OBJECTIVE();
  OBJECTIVE(const string &objName, int rxnId);
  bool empty() const;
  bool operator==(const OBJECTIVE &rhs) const;
};

/* One growth / threshold requirement. Conditions in a list are ANDed */
class TESTCONDITION{
 public:
  GROWTH media;
  OBJECTIVE objective;
  bool isMaxThreshold; /* true: fails if objective >= threshold. false: fails if objective < threshold */
  double threshold;
  bool change; /* Compare the difference to the last passing objective instead of the objective itself */

  TESTCONDITION();
  TESTCONDITION(const GROWTH &m, const OBJECTIVE &obj, bool isMax, double thresh);
};

class FBARESULT{
 public:
  int status;
  double objective;
  map<int,double> flux; /* Reaction id --> flux */

  FBARESULT();
  double fluxOf(int rxnId) const;
};

/* A (reaction, direction) under test.
   originalBound is the open value of the tested bound. If the opposite bound
   forced flux in the tested direction it is kept in otherOriginalBound. */
class CANDIDATE{
 public:
  int id;
  int dir;
  int type; /* NEW_REACTION or REVERSED_REACTION */
  double originalBound;
  bool hasOther;
  double otherOriginalBound;
  double score; /* Objective value (or reliability score) recorded when the decision was made */

  CANDIDATE();
  CANDIDATE(int rxnId, int direction);
  CANDIDATE(int rxnId, int direction, int itemType);
  bool sameItem(const CANDIDATE &rhs) const;
};

class GAPFILLSOLUTION{
 public:
  GROWTH media;
  OBJECTIVE target;
  double minObjective;
  bool binaryCheck;
  map<int,int> newRxns; /* Reaction id --> direction */
  map<int,int> reversedRxns;
  double growth;

  GAPFILLSOLUTION();
  bool empty() const;
};

/* Per-candidate penalty of the gapfilling objective (negative = not a candidate in that direction) */
class PENALTY{
 public:
  double forward;
  double reverse;
  PENALTY();
};

/* Solution values of the max-flux variables of one reaction */
class FLUXPAIR{
 public:
  double forward;
  double reverse;
  FLUXPAIR();
};

/* Result of one (sub)call of the expansion tests. If hasBreaking is set the
   search was abandoned and breaking names the reaction that could not be decided */
class EXPANSIONRESULT{
 public:
  vector<CANDIDATE> filtered;
  bool hasBreaking;
  CANDIDATE breaking;
  EXPANSIONRESULT();
};

class FILTERKEY{
 public:
  string mediaId;
  string objective;
  double threshold;
  FILTERKEY();
  FILTERKEY(const TESTCONDITION &cond);
  bool operator<(const FILTERKEY &rhs) const;
};

/* Biomass dependency of one solution item (or of the whole model) */
class SENSITIVITYRESULT{
 public:
  bool canGrow;
  vector<int> compounds; /* Metabolite ids of biomass components that could not be produced */
  SENSITIVITYRESULT();
};

/* Typed cache of filtering and sensitivity results. It is a report;
   nothing in the algorithms depends on its content except the skip of already filtered reactions */
class GAPFILLCACHE{
 public:
  /* (media, objective, threshold) --> (reaction id, direction) --> record */
  map<FILTERKEY, map<pair<int,int>, CANDIDATE> > gfFilter;
  /* media id --> objective name --> label ("FBF", "FAF") --> result */
  map<string, map<string, map<string, SENSITIVITYRESULT> > > gfSensitivity;
  /* media id --> objective name --> (reaction id, direction) --> result (success of a multi-media run) */
  map<string, map<string, map<pair<int,int>, SENSITIVITYRESULT> > > gfSuccess;
  /* media id --> objective name, for media that did not grow in a multi-media run */
  map<string, map<string, bool> > gfFailure;

  void clear();
  void mergeFilter(const GAPFILLCACHE &other);
  int filterCount() const;
};

#endif // _DATASTRUCTURES_H
