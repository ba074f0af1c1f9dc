#include <glpk.h>
#include <vector>
#include "DataStructures.h"

#ifndef GENERICLINPROG_H
#define GENERICLINPROG_H

/* Plug-in version: solve with the objective described by obj */
FBARESULT FBA_SOLVE(const RXNSPACE &rxnspace, const METSPACE &metspace, const OBJECTIVE &obj);

/* Gapfilling LP over one copy of the network per media (copies[k] carries the bounds of media k).
   The max-flux variables are shared by all copies, so one reaction direction pays its penalty once:

   MINIMIZE sum( penalty_c * maxflux_c )
   s.t. S v^k = 0, lb^k <= v^k <= ub^k, target_k . v^k >= threshold_k
        maxflux_c >= v^k_c (forward candidates), maxflux_c >= -v^k_c (reverse candidates)

   Returns GAPFILL_SUCCESS and fills maxFlux with the value of every max-flux variable, or NO_GAPFILL_SOLUTION */
int GAPFILL_SOLVE(const vector<RXNSPACE> &copies, const METSPACE &metspace, const vector<OBJECTIVE> &targets,
		  const vector<double> &thresholds, const map<int,PENALTY> &penalties,
		  map<int,FLUXPAIR> &maxFlux, double &objectiveValue, const char *lpName);

/* The best way to ensure consistency is perhaps to force the user to make a new one of these if the problem changes -
   I try to enforce that with private and public here */
class GLPKDATA {
 public:
  GLPKDATA(const RXNSPACE &rxns, const METSPACE &mets, const vector<int> &objId, const vector<double> &objCoeff, int sense);
  ~GLPKDATA();

  /* Solver routines */
  FBARESULT FBA_SOLVE();
  int writeLp(const char *filename);

  /* Map a GLPK return code / solution status to SOLVE_* */
  static int solverStatus(glp_prob *lp, int simplexReturn);
  static void printGlpkError(int errorCode);

  /* This has to be declared as static because we're making a function pointer to it and we can't have the address changing on us mid-program, can we? */
  static int suppressGLPKOutput(void *info, const char *s);

 private:
  int numrows;
  int numcols;
  double* lb;
  double* ub;
  int totalDataSize;
  int* ia;
  int* ja;
  double* ar;

  RXNSPACE rxnsUsed;
  METSPACE metsUsed;

  vector<int> objIdx;
  vector<double> objCoef;

  int objSense; /* -1 = MIN, 1 = MAX */

  glp_prob* problem;

  /* The malloc'd arrays and the glp_prob can't be shared - make a new GLPKDATA instead of copying one */
  GLPKDATA(const GLPKDATA &other);
  GLPKDATA& operator=(const GLPKDATA &other);

  bool validSense(int sense) const;
  void initialize(const METSPACE &metspace, const RXNSPACE &rxnspace, const vector<int> &objId, const vector<double> &objCoeff, int sense);
  void setUpProblem();
};

#endif
