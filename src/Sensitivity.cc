#include <cstdio>
#include <map>
#include <vector>

#include "DataStructures.h"
#include "Exchanges.h"
#include "Model.h"
#include "modelUtils.h"
#include "MyConstants.h"
#include "Sensitivity.h"

/* Adds one supply reaction per biomass reactant and returns the objective that minimizes the total supply */
static int addFlexSupply(MODEL &temp, int biomassId, OBJECTIVE &minFlex) {
  const REACTION *bio = temp.reactions.rxnPtrFromId(biomassId);
  vector<STOICH> stoich = bio->stoich;
  minFlex = OBJECTIVE();
  minFlex.name = "MinFlex";
  minFlex.sense = -1;
  for(int i=0; i<stoich.size(); i++) {
    if(stoich[i].rxn_coeff >= 0) { continue; }
    if(!temp.metabolites.idIn(stoich[i].met_id)) { continue; }
    REACTION flex = FlexSupply(temp.metabolites.metFromId(stoich[i].met_id));
    if(temp.hasReaction(flex.id)) { continue; }
    if(temp.addReaction(flex) != GAPFILL_SUCCESS) { return BAD_ARGUMENTS; }
    /* Supply runs backwards (negative flux), so the minimized sum uses -1 */
    minFlex.rxnIds.push_back(flex.id);
    minFlex.coeffs.push_back(-1.0f);
  }
  return GAPFILL_SUCCESS;
}

static SENSITIVITYRESULT runBiomassDependencyTest(MODEL &temp, const OBJECTIVE &growthObj, int biomassId, const OBJECTIVE &minFlex) {
  SENSITIVITYRESULT result;
  temp.setObjective(growthObj);
  FBARESULT res = temp.solve();
  if(res.status != SOLVE_OPTIMAL || res.objective <= _db.GROWTH_CUTOFF) {
    if(_db.DEBUGGAPFILL) { printf("Cannot grow\n"); }
    result.canGrow = false;
    return result;
  }
  result.canGrow = true;
  double lb = temp.getBound(biomassId, REVERSE);
  temp.setBound(biomassId, REVERSE, _db.SENSITIVITY_MIN_GROWTH);
  temp.setObjective(minFlex);
  res = temp.solve();
  if(res.status == SOLVE_OPTIMAL) {
    for(int i=0; i<minFlex.rxnIds.size(); i++) {
      if(res.fluxOf(minFlex.rxnIds[i]) < -_db.FLUX_CUTOFF) {
	int metId = minFlex.rxnIds[i] - _db.FLEXFACTOR;
	if(_db.DEBUGGAPFILL) { printf("Depends on: %s\n", temp.metabolites.metFromId(metId).name); }
	result.compounds.push_back(metId);
      }
    }
  } else {
    printf("WARNING: Minimal supply problem is not optimal (status %d)\n", res.status);
  }
  temp.setBound(biomassId, REVERSE, lb);
  return result;
}

static int prepare(const MODEL &model, const OBJECTIVE &target, MODEL *&temp, OBJECTIVE &growthObj, OBJECTIVE &minFlex) {
  if(target.rxnIds.empty() || !model.hasReaction(target.rxnIds[0])) {
    printf("ERROR: Target %s is not in the model\n", target.name.c_str());
    return BAD_ARGUMENTS;
  }
  temp = model.clone();
  growthObj = target;
  growthObj.sense = 1;
  int status = addFlexSupply(*temp, target.rxnIds[0], minFlex);
  if(status != GAPFILL_SUCCESS) {
    delete temp;
    temp = NULL;
  }
  return status;
}

int findUnproducibleBiomassCompounds(const MODEL &model, const OBJECTIVE &target, SENSITIVITYRESULT &result) {
  MODEL *temp = NULL;
  OBJECTIVE growthObj, minFlex;
  int status = prepare(model, target, temp, growthObj, minFlex);
  if(status != GAPFILL_SUCCESS) { return status; }
  result = runBiomassDependencyTest(*temp, growthObj, target.rxnIds[0], minFlex);
  delete temp;
  return GAPFILL_SUCCESS;
}

int findUnproducibleBiomassCompounds(const MODEL &model, const OBJECTIVE &target, const vector<CANDIDATE> &koList,
				     map<pair<int,int>, SENSITIVITYRESULT> &results) {
  results.clear();
  MODEL *temp = NULL;
  OBJECTIVE growthObj, minFlex;
  int status = prepare(model, target, temp, growthObj, minFlex);
  if(status != GAPFILL_SUCCESS) { return status; }

  for(int i=0; i<koList.size(); i++) {
    pair<int,int> key(koList[i].id, koList[i].dir);
    if(!temp->hasReaction(koList[i].id)) {
      printf("Reaction %d not in model during sensitivity analysis!\n", koList[i].id);
      results[key] = SENSITIVITYRESULT();
      results[key].canGrow = true;
      continue;
    }
    if(_db.DEBUGGAPFILL) { printf("KO: %d%c\n", koList[i].id, dirChar(koList[i].dir)); }
    BOUNDSCOPE scope(*temp);
    scope.zero(koList[i].id, koList[i].dir);
    results[key] = runBiomassDependencyTest(*temp, growthObj, target.rxnIds[0], minFlex);
  }
  delete temp;
  return GAPFILL_SUCCESS;
}
