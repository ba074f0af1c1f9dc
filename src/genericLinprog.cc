#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <glpk.h>
#include <vector>

#include "DataStructures.h"
#include "genericLinprog.h"
#include "MyConstants.h"
#include "modelUtils.h"
#include "Printers.h"

/* Useful plug-in functions */
FBARESULT FBA_SOLVE(const RXNSPACE &rxnspace, const METSPACE &metspace, const OBJECTIVE &obj) {
  GLPKDATA prob(rxnspace, metspace, obj.rxnIds, obj.coeffs, obj.sense);
  return prob.FBA_SOLVE();
}

/**************** Public Methods ****************/

GLPKDATA::~GLPKDATA() {
  free(lb);  free(ub);  free(ar);  free(ia); free(ja);
  glp_delete_prob(problem);
}

/* Objectives are all assumed to be zero except for IDs listed in objId */
GLPKDATA::GLPKDATA(const RXNSPACE &rxnspace, const METSPACE &metspace, const vector<int> &objId, const vector<double> &objCoeff, int sense) {
  initialize(metspace, rxnspace, objId, objCoeff, sense);
}

/* Solve the simplex problem vanilla */
FBARESULT GLPKDATA::FBA_SOLVE() {
  FBARESULT result;
  /* initialize() refused the data */
  if(numcols < 0) { return result; }

  setUpProblem();

  /* Turn pre-solving on...
     without doing this I obtain a basic solution that is not feasible...that isn't useful */
  glp_smcp param;
  glp_init_smcp(&param);
  param.presolve=GLP_ON;

  /* Use dual and then switch to primal if dual fails
   I had more success with the numerical stability of this method
   than with just primal simplex (since the dual was having issues being feasible) */
  param.meth = GLP_DUALP;
  if(!_db.DEBUGFBA) { param.msg_lev = GLP_MSG_OFF; }

  glp_std_basis(problem);

  /*Scale problem with equilibrium scaling to improve numerical stability
    (this is the default behavior in GLPKMEX) */
  glp_scale_prob(problem, GLP_SF_EQ);

  int res = glp_simplex(problem, &param);
  result.status = solverStatus(problem, res);

  /* Check solution quality */
  if(_db.DEBUGFBA && result.status == SOLVE_OPTIMAL) {
    double ae_max, re_max;
    int ae_ind, re_ind;
    glp_check_kkt(problem, GLP_SOL, GLP_KKT_PE, &ae_max, &ae_ind, &re_max, &re_ind);
    printf("QUALITY REPORT: Primal equality residual: absolute %g relative %g\n", ae_max, re_max);
    glp_check_kkt(problem, GLP_SOL, GLP_KKT_PB, &ae_max, &ae_ind, &re_max, &re_ind);
    printf("Primal bound residual: absolute %g relative %g\n", ae_max, re_max);
  }

  if(result.status == SOLVE_FAILED) {
    printf("ERROR: Numerical issues with solution... such cases are treated the same as NO GROWTH cases \n");
    printGlpkError(res);
    glp_write_lp(problem, NULL, "PROBLEMATIC_PROBLEM");
    return result;
  }
  if(result.status != SOLVE_OPTIMAL) { return result; }

  result.objective = glp_get_obj_val(problem);
  /* Return solution (GLPK doesn't rearrange columns) */
  for(int i=0; i<numcols; i++) {
    result.flux[rxnsUsed.rxns[i].id] = glp_get_col_prim(problem, i+1);
  }
  if(_db.DEBUGFBA) {
    printFluxResult(rxnsUsed, result);
  }
  return result;
}

/* CPLEX LP format dump of the current data (for debugging infeasible tests) */
int GLPKDATA::writeLp(const char *filename) {
  if(numcols < 0) { return -1; }
  setUpProblem();
  int res = glp_write_lp(problem, NULL, filename);
  if(res != 0) { printf("WARNING: Unable to write LP file %s\n", filename); }
  return res;
}

int GLPKDATA::solverStatus(glp_prob *lp, int simplexReturn) {
  /* The presolver reports infeasibility through the return code instead of the status */
  if(simplexReturn == GLP_ENOPFS) { return SOLVE_INFEASIBLE; }
  if(simplexReturn == GLP_ENODFS) { return SOLVE_UNBOUNDED; }
  if(simplexReturn != 0) { return SOLVE_FAILED; }
  int status = glp_get_status(lp);
  if(status == GLP_OPT) { return SOLVE_OPTIMAL; }
  if(status == GLP_NOFEAS || status == GLP_INFEAS) { return SOLVE_INFEASIBLE; }
  if(status == GLP_UNBND) { return SOLVE_UNBOUNDED; }
  return SOLVE_FAILED;
}

/* glp_simplex return codes. Only the ones that reach SOLVE_FAILED are spelled out */
void GLPKDATA::printGlpkError(int errorCode) {
  const char *what = "UNKNOWN";
  switch(errorCode) {
  case 0: what = "no error"; break;
  case GLP_EBADB: what = "invalid initial basis"; break;
  case GLP_ESING: what = "singular basis matrix"; break;
  case GLP_ECOND: what = "ill-conditioned basis matrix"; break;
  case GLP_EBOUND: what = "double-bounded column with incorrect bounds"; break;
  case GLP_EFAIL: what = "solver failure"; break;
  case GLP_EITLIM: what = "iteration limit"; break;
  case GLP_ETMLIM: what = "time limit"; break;
  case GLP_ENOPFS: what = "presolver: no primal feasible solution"; break;
  case GLP_ENODFS: what = "presolver: no dual feasible solution"; break;
  }
  printf("GLPK returned %d (%s)\n", errorCode, what);
}

int GLPKDATA::suppressGLPKOutput(void *info, const char *s) {
  /* GLPK doesn't print if this function returns 1 so that's what I do */
  return 1;
}

/************************ Private Methods ************************/

/* Set up the glp_prob "problem" to have all the data it needs to run a simulation based on the current arrays
 Deletes the old problem and starts fresh.

Uses the following class variables: problem (resets before using)
 numrows, numcols
 lb, ub
 ia, ja, ar
 totalDataSize
 objIdx, objCoef */
void GLPKDATA::setUpProblem() {
  glp_delete_prob(problem);
  problem = glp_create_prob();

  if(objSense == -1) { glp_set_obj_dir(problem, GLP_MIN); }
  else { glp_set_obj_dir(problem, GLP_MAX); }

  /* Num rows and num columns */
  if(numrows > 0) { glp_add_rows(problem, numrows); }
  if(numcols > 0) { glp_add_cols(problem, numcols); }

  /* Assumed to be SV = 0 */
  for(int i=1; i<numrows+1; i++) {    glp_set_row_bnds(problem, i, GLP_FX, 0.0f, 0.0f);   }

  /* Columns (reactions) get bounded according to the assigned LB and UB */
  for(int i=1; i<numcols+1; i++) {
    if( rougheq(lb[i] - ub[i], 0.0f, _db.FLUX_CUTOFF) == 1 ) {  glp_set_col_bnds(problem, i, GLP_FX, lb[i], lb[i]); }
    else { glp_set_col_bnds(problem, i, GLP_DB, lb[i], ub[i]); }
  }

  /* Objective function - all zeros except for the stated objectives, which have the desired coefficients */
  vector<int>::iterator it;
  for(int i=1; i<numcols+1; i++) {
    it = find(objIdx.begin(), objIdx.end(), i);
    if(it == objIdx.end()) { glp_set_obj_coef(problem, i, 0); }
    else {
      glp_set_obj_coef(problem, i, objCoef[(int)(it-objIdx.begin())]);
    }
  }

  /* The S matrix itself */
  glp_load_matrix(problem, totalDataSize, ia, ja, ar);

  int (*func)(void*, const char *) = &suppressGLPKOutput;
  if(!_db.DEBUGFBA) { glp_term_hook(func, NULL); }
}

bool GLPKDATA::validSense(int sense) const {
  return (sense == -1 || sense == 1);
}

/* (Re)-initialize based on the given data.
   Bad data leaves numcols = -1 so that the solvers report SOLVE_FAILED instead of crashing */
void GLPKDATA::initialize(const METSPACE &metspace, const RXNSPACE &rxnspace, const vector<int> &objId, const vector<double> &objCoeff, int sense) {

  rxnsUsed = rxnspace;
  metsUsed = metspace;
  problem = glp_create_prob();
  lb = NULL; ub = NULL; ia = NULL; ja = NULL; ar = NULL;
  numrows = 0; numcols = -1; totalDataSize = 0;
  objSense = 1;

  if(objId.size() != objCoeff.size()) { printf("ERROR: In initializing GLPKDATA, provided objective IDs and objective Coefficients did not have the same size!\n"); return; }
  if(!validSense(sense)) { printf("ERROR: In initializing GLPKDATA, objective sense %d is neither -1 (MIN) nor 1 (MAX)\n", sense); return; }
  objSense = sense;

  /****** Initialize memory ******/
  int ncols = rxnspace.rxns.size();
  numrows = metspace.mets.size();
  lb = (double*) malloc(sizeof(double) * (ncols + 1));
  ub = (double*) malloc(sizeof(double) * (ncols + 1));

  /* Total number of stoich entries - plus the one needed because GLPK starts at 1 instead of 0 */
  int total = 1;
  for(int i=0; i<ncols; i++) { total += rxnspace.rxns[i].stoich.size();  }

  ia = (int*) malloc( sizeof(int)*total);
  ja = (int*) malloc( sizeof(int)*total);
  ar = (double*) malloc( sizeof(double)*total);

  /************** Fill up data ******************/

  /* Objective info */
  objIdx.clear(); objCoef.clear();
  for(int i=0; i<objId.size(); i++) {
    int idx = rxnspace.idxFromId(objId[i]);
    if(idx < 0) { printf("ERROR: Objective reaction %d is not in the network\n", objId[i]); return; }
    objIdx.push_back(idx + 1);
  }
  this->objCoef = objCoeff;

  /* Fill LB and UB from reaction data */
  for(int i=0; i<ncols; i++) { lb[i+1] = rxnspace.rxns[i].lb; ub[i+1] = rxnspace.rxns[i].ub; }

  /* Fill up ia (row counter), ja (column counter) and ar (stoich coeff) from the stoich data */
  int counter=0;
  for(int j=0; j<ncols; j++) {
    for(int i=0; i < rxnspace.rxns[j].stoich.size(); i++){
      /* Don't allow 0's to mess things up... */
      if(rxnspace.rxns[j].stoich[i].rxn_coeff < 1E-8 && rxnspace.rxns[j].stoich[i].rxn_coeff > -1E-8) { continue; }
      int row = metspace.idxFromId(rxnspace.rxns[j].stoich[i].met_id);
      if(row < 0) { printf("ERROR: Reaction %s uses a metabolite that is not in the METSPACE\n", rxnspace.rxns[j].name); return; }
      int idx = counter + 1;
      ia[idx] = row+1; // Rows: Metabolites
      ja[idx] = j+1; // Columns = reactions
      ar[idx] = rxnspace.rxns[j].stoich[i].rxn_coeff;
      counter++;
    }
  }
  totalDataSize = counter;
  numcols = ncols;
}

/****************** Gapfilling LP ******************/

int GAPFILL_SOLVE(const vector<RXNSPACE> &copies, const METSPACE &metspace, const vector<OBJECTIVE> &targets,
		  const vector<double> &thresholds, const map<int,PENALTY> &penalties,
		  map<int,FLUXPAIR> &maxFlux, double &objectiveValue, const char *lpName) {
  maxFlux.clear();
  objectiveValue = 0.0f;
  if(copies.size() == 0 || copies.size() != targets.size() || copies.size() != thresholds.size()) {
    printf("ERROR: GAPFILL_SOLVE needs one target and one threshold per network copy (%d copies, %d targets, %d thresholds)\n",
	   (int)copies.size(), (int)targets.size(), (int)thresholds.size());
    return BAD_ARGUMENTS;
  }

  int nmets = metspace.mets.size();

  /* Column layout: [copy 0 reactions][copy 1 reactions]...[max-flux variables] */
  vector<int> colOffset;
  int ncols = 0;
  for(int k=0; k<copies.size(); k++) { colOffset.push_back(ncols); ncols += copies[k].rxns.size(); }

  map<int,int> fwdCol, revCol;
  map<int,PENALTY>::const_iterator pit;
  for(pit = penalties.begin(); pit != penalties.end(); pit++) {
    if(pit->second.forward >= 0.0f) { ncols++; fwdCol[pit->first] = ncols; }
    if(pit->second.reverse >= 0.0f) { ncols++; revCol[pit->first] = ncols; }
  }

  /* Row layout: [copy k mass balance][copy k target] for every k, then the max-flux coupling rows */
  int nrows = 0;
  vector<int> rowOffset;
  for(int k=0; k<copies.size(); k++) { rowOffset.push_back(nrows); nrows += nmets + 1; }
  int couplingStart = nrows;
  for(int k=0; k<copies.size(); k++) {
    for(pit = penalties.begin(); pit != penalties.end(); pit++) {
      if(!copies[k].idIn(pit->first)) { continue; }
      if(pit->second.forward >= 0.0f) { nrows++; }
      if(pit->second.reverse >= 0.0f) { nrows++; }
    }
  }

  /* Non-zeros: stoichiometry + target + two per coupling row (+1 because GLPK starts at 1) */
  int total = 1 + 2*(nrows - couplingStart);
  for(int k=0; k<copies.size(); k++) {
    for(int j=0; j<copies[k].rxns.size(); j++) { total += copies[k].rxns[j].stoich.size(); }
    total += targets[k].rxnIds.size();
  }
  int* ia = (int*) malloc(sizeof(int)*total);
  int* ja = (int*) malloc(sizeof(int)*total);
  double* ar = (double*) malloc(sizeof(double)*total);

  glp_prob *lp = glp_create_prob();
  glp_set_obj_dir(lp, GLP_MIN);
  glp_add_rows(lp, nrows);
  glp_add_cols(lp, ncols);

  int counter = 0;
  int status = GAPFILL_SUCCESS;
  for(int k=0; k<copies.size() && status == GAPFILL_SUCCESS; k++) {
    const RXNSPACE &rxns = copies[k];
    for(int i=1; i<=nmets; i++) { glp_set_row_bnds(lp, rowOffset[k] + i, GLP_FX, 0.0f, 0.0f); }
    for(int j=0; j<rxns.rxns.size(); j++) {
      int col = colOffset[k] + j + 1;
      double l = rxns.rxns[j].lb, u = rxns.rxns[j].ub;
      if(rougheq(l - u, 0.0f, _db.FLUX_CUTOFF) == 1) { glp_set_col_bnds(lp, col, GLP_FX, l, l); }
      else { glp_set_col_bnds(lp, col, GLP_DB, l, u); }
      glp_set_obj_coef(lp, col, 0.0f);
      for(int s=0; s<rxns.rxns[j].stoich.size(); s++) {
	double coeff = rxns.rxns[j].stoich[s].rxn_coeff;
	if(coeff < 1E-8 && coeff > -1E-8) { continue; }
	int row = metspace.idxFromId(rxns.rxns[j].stoich[s].met_id);
	if(row < 0) { printf("ERROR: Reaction %s uses a metabolite that is not in the METSPACE\n", rxns.rxns[j].name); status = BAD_ARGUMENTS; break; }
	counter++;
	ia[counter] = rowOffset[k] + row + 1; ja[counter] = col; ar[counter] = coeff;
      }
    }
    /* The target has to reach its threshold in every copy */
    int targetRow = rowOffset[k] + nmets + 1;
    glp_set_row_bnds(lp, targetRow, GLP_LO, thresholds[k], 0.0f);
    for(int t=0; t<targets[k].rxnIds.size(); t++) {
      int idx = rxns.idxFromId(targets[k].rxnIds[t]);
      if(idx < 0) { printf("ERROR: Gapfilling target %s is not in the gapfilling network\n", targets[k].name.c_str()); status = BAD_ARGUMENTS; break; }
      counter++;
      ia[counter] = targetRow; ja[counter] = colOffset[k] + idx + 1; ar[counter] = targets[k].coeffs[t];
    }
  }

  /* Max-flux variables and their coupling to every copy */
  int row = couplingStart;
  for(pit = penalties.begin(); pit != penalties.end() && status == GAPFILL_SUCCESS; pit++) {
    int id = pit->first;
    if(fwdCol.count(id) > 0) {
      glp_set_col_bnds(lp, fwdCol[id], GLP_DB, 0.0f, _db.MAX_FLUX);
      glp_set_obj_coef(lp, fwdCol[id], pit->second.forward);
    }
    if(revCol.count(id) > 0) {
      glp_set_col_bnds(lp, revCol[id], GLP_DB, 0.0f, _db.MAX_FLUX);
      glp_set_obj_coef(lp, revCol[id], pit->second.reverse);
    }
    for(int k=0; k<copies.size(); k++) {
      if(!copies[k].idIn(id)) { continue; }
      int idx = copies[k].idxFromId(id);
      int col = colOffset[k] + idx + 1;
      if(fwdCol.count(id) > 0) {
	/* maxflux - v >= 0 */
	row++;
	glp_set_row_bnds(lp, row, GLP_LO, 0.0f, 0.0f);
	counter++; ia[counter] = row; ja[counter] = fwdCol[id]; ar[counter] = 1.0f;
	counter++; ia[counter] = row; ja[counter] = col; ar[counter] = -1.0f;
      }
      if(revCol.count(id) > 0) {
	/* maxflux + v >= 0 */
	row++;
	glp_set_row_bnds(lp, row, GLP_LO, 0.0f, 0.0f);
	counter++; ia[counter] = row; ja[counter] = revCol[id]; ar[counter] = 1.0f;
	counter++; ia[counter] = row; ja[counter] = col; ar[counter] = 1.0f;
      }
    }
  }

  if(status == GAPFILL_SUCCESS) {
    glp_load_matrix(lp, counter, ia, ja, ar);

    int (*func)(void*, const char *) = &GLPKDATA::suppressGLPKOutput;
    if(!_db.DEBUGFBA) { glp_term_hook(func, NULL); }
    if(lpName != NULL) { glp_write_lp(lp, NULL, lpName); }

    glp_smcp param;
    glp_init_smcp(&param);
    param.presolve = GLP_ON;
    param.meth = GLP_DUALP;
    if(!_db.DEBUGFBA) { param.msg_lev = GLP_MSG_OFF; }
    glp_std_basis(lp);
    glp_scale_prob(lp, GLP_SF_EQ);

    int res = glp_simplex(lp, &param);
    int solveStatus = GLPKDATA::solverStatus(lp, res);
    if(solveStatus != SOLVE_OPTIMAL) {
      if(solveStatus == SOLVE_FAILED) { GLPKDATA::printGlpkError(res); }
      if(_db.DEBUGGAPFILL) { printf("Gapfilling LP was not solved to optimality (status %d)\n", solveStatus); }
      status = NO_GAPFILL_SOLUTION;
    } else {
      objectiveValue = glp_get_obj_val(lp);
      for(pit = penalties.begin(); pit != penalties.end(); pit++) {
	FLUXPAIR pair;
	if(fwdCol.count(pit->first) > 0) { pair.forward = glp_get_col_prim(lp, fwdCol[pit->first]); }
	if(revCol.count(pit->first) > 0) { pair.reverse = glp_get_col_prim(lp, revCol[pit->first]); }
	maxFlux[pit->first] = pair;
      }
    }
  }

  free(ia); free(ja); free(ar);
  glp_delete_prob(lp);
  return status;
}
