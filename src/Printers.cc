#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <map>
#include <vector>

#include "DataStructures.h"
#include "modelUtils.h"
#include "MyConstants.h"
#include "Printers.h"
#include "SolutionTester.h"

using std::map;
using std::vector;

/***************** Metabolite / reaction printers ****************/

/* Appends the formula to rxnString. The arrow follows the current bounds, not init_reversible */
void printRxnFormula(const REACTION &rxn, char* rxnString) {
  const char *arrow = " <=> ";
  if(rxn.lb >= 0.0f && rxn.ub > 0.0f) { arrow = " --> "; }
  else if(rxn.lb < 0.0f && rxn.ub <= 0.0f) { arrow = " <-- "; }
  else if(rxn.lb == 0.0f && rxn.ub == 0.0f) { arrow = " -x- "; }

  vector<STOICH> st = rxn.stoich;
  std::sort(st.begin(), st.end());
  bool arrowDone = false; /* Needed to make sure we always get an arrow including on exchanges */
  for(int i=0; i < st.size(); i++) {
    char oneReactantString[96];
    sprintf(oneReactantString, "%1.4f %s", fabs(st[i].rxn_coeff), st[i].met_name);
    strcat(rxnString, oneReactantString);
    if(i != st.size() - 1) {
      if(st[i+1].rxn_coeff * st[i].rxn_coeff < 0.0f) {
	strcat(rxnString, arrow);
	arrowDone = true;
      } else {
	strcat(rxnString, " + ");
      }
    }
  }
  if(!arrowDone) { strcat(rxnString, arrow); }
  return;
}

void printMETABOLITEinputs(const METABOLITE &metabolite){
  printf("\tid: %05d\n",metabolite.id);
  printf("\tname: %s\n",metabolite.name);
  printf("\tcharge: %d\n",metabolite.charge);
  printf("\tcompartment: %s\n",metabolite.compartment);
  if(strlen(metabolite.chemform) > 0) { printf("\tformula: %s\n", metabolite.chemform); }
  else { printf("\tformula: (UNKNOWN)\n"); }
  if(!metabolite.inchikey.empty()) { printf("\tinchikey: %s\n", metabolite.inchikey.c_str()); }
  if(metabolite.deltaG != _db.UNKNOWN_DELTAG) { printf("\tdeltaG: %4.3f\n", metabolite.deltaG); }
  printf("\n");
}

void printGROWTHinputs(const GROWTH &growth){
  int i;
  printf("GROWTH MEDIA %s:\n", growth.id.c_str());
  for(i=0;i<growth.media.size();i++){
    printf("\t%05d\t%s\t%1.3f\n",growth.media[i].id,growth.media[i].name,growth.media[i].rate);
  }
  printf("\nBYPRODUCTS:\n");
  for(i=0;i<growth.byproduct.size();i++){
    printf("\t%05d\t%s\t%1.3f\n",growth.byproduct[i].id,growth.byproduct[i].name,
	   growth.byproduct[i].rate);
  }
  printf("\n");
}

void printREACTIONinputs(const REACTION &reaction){
  printf("\tid: %05d\n",reaction.id);
  printf("\tname: %s\n",reaction.name);
  printf("\treversible: %d  ",reaction.init_reversible);
  if(reaction.init_reversible==0){ printf("(YES)\n");}
  if(reaction.init_reversible==-1){ printf("(NO - BACKWARDS)\n");}
  if(reaction.init_reversible==1){ printf("(NO - FORWARDS)\n");}
  printf("\t [lb: %f; ub: %f]\n", reaction.lb, reaction.ub);
  printf("\texchange: %d  ",reaction.isExchange);
  if(reaction.isExchange==0){ printf("(NO)\n");} else{printf("(YES)\n");}
  if(reaction.hasBiochem) { printf("\tstatus: %s\n", reaction.status); }
  else { printf("\tstatus: (NOT IN BIOCHEMISTRY)\n"); }
  char formula[4096] = "";
  printRxnFormula(reaction, formula);
  printf("\tformula: %s\n", formula);
  for(int i=0; i<reaction.annote.size(); i++) {
    printf("\tgene: %s (%1.3f)\n", reaction.annote[i].genename.c_str(), reaction.annote[i].probability);
  }
  printf("\n");
}

/***************** Gapfilling printers ****************/

void printObjective(const OBJECTIVE &obj) {
  printf("%s %s:", obj.sense == 1 ? "MAX" : "MIN", obj.name.c_str());
  for(int i=0; i<obj.rxnIds.size(); i++) {
    printf(" %+1.3f*%d", obj.coeffs[i], obj.rxnIds[i]);
  }
  printf("\n");
}

void printTestCondition(const TESTCONDITION &cond) {
  printf("%s on %s: fails if %s %s %4.6f\n", cond.objective.name.c_str(), cond.media.id.c_str(),
	 cond.change ? "change" : "objective", cond.isMaxThreshold ? ">=" : "<", cond.threshold);
}

void printCandidateList(const vector<CANDIDATE> &list) {
  if(list.empty()) {printf("EMPTY\n"); return;}
  for(int i=0; i<list.size(); i++) {
    printf("%d%c ", list[i].id, dirChar(list[i].dir));
  }
  printf("\n");
}

void printCandidateList(const vector<CANDIDATE> &list, const RXNSPACE &rxnspace) {
  if(list.empty()) {printf("EMPTY\n"); return;}
  for(int i=0; i<list.size(); i++) {
    const REACTION *rxn = rxnspace.rxnPtrFromId(list[i].id);
    printf("\t%c%s\t%s\t%4.6f\n", dirChar(list[i].dir), rxn == NULL ? "?" : rxn->name,
	   list[i].type == REVERSED_REACTION ? "reversed" : "new", list[i].score);
  }
}

void printGapfillSolution(const GAPFILLSOLUTION &solution, const RXNSPACE &rxnspace) {
  printf("Gapfilling solution for %s on %s (minimum %4.6f%s): %d reactions\n", solution.target.name.c_str(),
	 solution.media.id.c_str(), solution.minObjective, solution.binaryCheck ? ", binary checked" : "", gapfillCount(solution));
  printCandidateList(convertSolutionToList(solution), rxnspace);
  if(solution.growth > 0) { printf("Growth: %4.6f\n", solution.growth); }
}

void printFluxResult(const RXNSPACE &rxnspace, const FBARESULT &result) {
  printf("Solver status %d, objective %4.6f\n", result.status, result.objective);
  for(map<int,double>::const_iterator it = result.flux.begin(); it != result.flux.end(); it++) {
    if(fabs(it->second) < _db.FLUX_CUTOFF) { continue; }
    const REACTION *rxn = rxnspace.rxnPtrFromId(it->first);
    printf("%s\t%4.6f\n", rxn == NULL ? "?" : rxn->name, it->second);
  }
}

void printSensitivityResult(const SENSITIVITYRESULT &result, const METSPACE &metspace) {
  if(!result.canGrow) { printf("NO GROWTH\n"); return; }
  if(result.compounds.empty()) { printf("NONE\n"); return; }
  for(int i=0; i<result.compounds.size(); i++) {
    const METABOLITE *met = metspace.metPtrFromId(result.compounds[i]);
    printf("%s ", met == NULL ? "?" : met->name);
  }
  printf("\n");
}

void printGapfillCache(const GAPFILLCACHE &cache) {
  printf("Filtered reactions:\n");
  map<FILTERKEY, map<pair<int,int>, CANDIDATE> >::const_iterator fit;
  for(fit = cache.gfFilter.begin(); fit != cache.gfFilter.end(); fit++) {
    printf("\t%s %s %4.6f:", fit->first.mediaId.c_str(), fit->first.objective.c_str(), fit->first.threshold);
    map<pair<int,int>, CANDIDATE>::const_iterator rit;
    for(rit = fit->second.begin(); rit != fit->second.end(); rit++) {
      printf(" %d%c", rit->first.first, dirChar(rit->first.second));
    }
    printf("\n");
  }
  map<string, map<string, bool> >::const_iterator nit;
  for(nit = cache.gfFailure.begin(); nit != cache.gfFailure.end(); nit++) {
    map<string, bool>::const_iterator oit;
    for(oit = nit->second.begin(); oit != nit->second.end(); oit++) {
      printf("No growth after gapfilling: %s %s\n", nit->first.c_str(), oit->first.c_str());
    }
  }
}
