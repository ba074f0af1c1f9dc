#include <cstdio>
#include <map>
#include <vector>

#include "DataStructures.h"
#include "Exchanges.h"
#include "genericLinprog.h"
#include "Model.h"
#include "MyConstants.h"
#include "Printers.h"

/************************* MODEL *************************/

MODEL::MODEL() {
}

MODEL::MODEL(const RXNSPACE &rxns, const METSPACE &mets) {
  reactions = rxns;
  metabolites = mets;
}

MODEL::~MODEL() {
}

void MODEL::setMedia(const GROWTH &growth) {
  FeedTheBeast(reactions, metabolites, growth);
  currentMedia = growth;
  if(_db.DEBUGFBA) { printGROWTHinputs(growth); }
}

const GROWTH& MODEL::getMedia() const {
  return currentMedia;
}

void MODEL::setObjective(const OBJECTIVE &obj) {
  for(int i=0; i<obj.rxnIds.size(); i++) {
    if(!reactions.idIn(obj.rxnIds[i])) {
      printf("WARNING: Objective %s uses reaction %d that is not in the model\n", obj.name.c_str(), obj.rxnIds[i]);
    }
  }
  objective = obj;
}

const OBJECTIVE& MODEL::getObjective() const {
  return objective;
}

double MODEL::getBound(int rxnId, int dir) const {
  const REACTION *rxn = reactions.rxnPtrFromId(rxnId);
  if(rxn == NULL) { return 0.0f; }
  return rxn->bound(dir);
}

int MODEL::setBound(int rxnId, int dir, double value) {
  REACTION *rxn = reactions.rxnPtrFromId(rxnId);
  if(rxn == NULL) {
    printf("ERROR: Attempted to set a bound on reaction %d which is not in the model\n", rxnId);
    return BAD_ARGUMENTS;
  }
  rxn->setBound(dir, value);
  return GAPFILL_SUCCESS;
}

int MODEL::setBounds(int rxnId, double lb, double ub) {
  REACTION *rxn = reactions.rxnPtrFromId(rxnId);
  if(rxn == NULL) {
    printf("ERROR: Attempted to set the bounds of reaction %d which is not in the model\n", rxnId);
    return BAD_ARGUMENTS;
  }
  rxn->lb = lb;
  rxn->ub = ub;
  return GAPFILL_SUCCESS;
}

/* Metabolites used by the reaction have to be added first */
int MODEL::addReaction(const REACTION &rxn) {
  for(int i=0; i<rxn.stoich.size(); i++) {
    if(!metabolites.idIn(rxn.stoich[i].met_id)) {
      printf("ERROR: Reaction %s uses metabolite %d which is not in the model\n", rxn.name, rxn.stoich[i].met_id);
      return BAD_ARGUMENTS;
    }
  }
  reactions.addReaction(rxn);
  return GAPFILL_SUCCESS;
}

void MODEL::addMetabolite(const METABOLITE &met) {
  metabolites.addMetabolite(met);
}

void MODEL::removeReactions(const vector<int> &rxnIds) {
  for(int i=0; i<rxnIds.size(); i++) {
    if(reactions.idIn(rxnIds[i])) { reactions.removeReaction(rxnIds[i]); }
  }
}

bool MODEL::hasReaction(int rxnId) const {
  return reactions.idIn(rxnId);
}

/************************* FBAMODEL *************************/

FBAMODEL::FBAMODEL() {
}

FBAMODEL::FBAMODEL(const RXNSPACE &rxns, const METSPACE &mets) : MODEL(rxns, mets) {
}

FBARESULT FBAMODEL::solve() {
  if(objective.empty()) {
    printf("ERROR: No objective has been set on the model\n");
    return FBARESULT();
  }
  return FBA_SOLVE(reactions, metabolites, objective);
}

MODEL* FBAMODEL::clone() const {
  return new FBAMODEL(*this);
}

int FBAMODEL::writeLp(const char *filename) {
  GLPKDATA data(reactions, metabolites, objective.rxnIds, objective.coeffs, objective.sense);
  return data.writeLp(filename);
}

/************************* BOUNDSCOPE *************************/

BOUNDSCOPE::BOUNDSCOPE(MODEL &m) : model(m) {
  done = false;
  conditionSaved = false;
}

/* saveCondition: also restore the media, the objective and every bound on rollback
   (setMedia changes bounds that are not touched through the scope) */
BOUNDSCOPE::BOUNDSCOPE(MODEL &m, bool saveCondition) : model(m) {
  done = false;
  conditionSaved = saveCondition;
  if(saveCondition) {
    savedMedia = model.currentMedia;
    savedObjective = model.objective;
    for(int i=0; i<model.reactions.rxns.size(); i++) {
      const REACTION &rxn = model.reactions.rxns[i];
      savedAll[rxn.id] = pair<double,double>(rxn.lb, rxn.ub);
    }
  }
}

BOUNDSCOPE::~BOUNDSCOPE() {
  if(!done) { rollback(); }
}

/* First touch wins */
void BOUNDSCOPE::remember(int rxnId, int dir) {
  pair<int,int> key(rxnId, dir);
  if(saved.count(key) > 0 || !model.hasReaction(rxnId)) { return; }
  saved[key] = model.getBound(rxnId, dir);
}

void BOUNDSCOPE::setBound(int rxnId, int dir, double value) {
  remember(rxnId, dir);
  model.setBound(rxnId, dir, value);
}

void BOUNDSCOPE::setBounds(int rxnId, double lb, double ub) {
  remember(rxnId, REVERSE);
  remember(rxnId, FORWARD);
  model.setBounds(rxnId, lb, ub);
}

void BOUNDSCOPE::zero(int rxnId, int dir) {
  setBound(rxnId, dir, 0.0f);
}

double BOUNDSCOPE::originalBound(int rxnId, int dir) const {
  map<pair<int,int>, double>::const_iterator it = saved.find(pair<int,int>(rxnId, dir));
  if(it == saved.end()) { return model.getBound(rxnId, dir); }
  return it->second;
}

bool BOUNDSCOPE::touched(int rxnId) const {
  return saved.count(pair<int,int>(rxnId, FORWARD)) > 0 || saved.count(pair<int,int>(rxnId, REVERSE)) > 0;
}

void BOUNDSCOPE::commit() {
  done = true;
  saved.clear();
  savedAll.clear();
}

/* Reactions deleted inside the scope are skipped */
void BOUNDSCOPE::restore(const map<int, pair<double,double> > &bounds) {
  map<int, pair<double,double> >::const_iterator it;
  for(it = bounds.begin(); it != bounds.end(); it++) {
    if(!model.reactions.idIn(it->first)) { continue; }
    REACTION *rxn = model.reactions.rxnPtrFromId(it->first);
    rxn->lb = it->second.first;
    rxn->ub = it->second.second;
  }
}

void BOUNDSCOPE::rollback() {
  if(done) { return; }
  map<pair<int,int>, double>::const_iterator it;
  for(it = saved.begin(); it != saved.end(); it++) {
    if(!model.hasReaction(it->first.first)) { continue; }
    model.setBound(it->first.first, it->first.second, it->second);
  }
  if(conditionSaved) {
    restore(savedAll);
    /* The saved bounds already reflect the saved media, so it is not re-applied */
    model.currentMedia = savedMedia;
    model.objective = savedObjective;
  }
  done = true;
  saved.clear();
  savedAll.clear();
}
