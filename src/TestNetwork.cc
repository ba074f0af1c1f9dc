/* Series of functions that create the small networks the testers run on. See TestNetwork.h for pictures */

#include "TestNetwork.h"
#include "MyConstants.h"
#include <vector>
#include <map>
#include <stdio.h>

METABOLITE makeMetabolite(int id, const char* name, const char* compartment) {
  METABOLITE met;
  met.id = id;
  snprintf(met.name, sizeof(met.name), "%s", name);
  snprintf(met.compartment, sizeof(met.compartment), "%s", compartment);
  return met;
}

STOICH makeStoich(const char* metName, double stoichCoeff, int metId) {
  STOICH stoich;
  stoich.met_id = metId;
  stoich.rxn_coeff = stoichCoeff;
  snprintf(stoich.met_name, sizeof(stoich.met_name), "%s", metName);
  return stoich;
}

REACTION makeReaction(int id, const char* name, double lb, double ub, const vector<STOICH> &stoichList) {
  REACTION rxn;
  rxn.id = id;
  snprintf(rxn.name, sizeof(rxn.name), "%s", name);
  rxn.lb = lb;
  rxn.ub = ub;
  if(lb < 0 && ub > 0) { rxn.init_reversible = 0; }
  else if(lb < 0) { rxn.init_reversible = -1; }
  else { rxn.init_reversible = 1; }
  rxn.stoich = stoichList;
  rxn.isExchange = (stoichList.size() == 1) ? 1 : 0;
  rxn.hasBiochem = true;
  return rxn;
}

REACTION makeReaction(int id, double lb, double ub) {
  char name[64];
  sprintf(name, "rxn%05d_c0", id);
  return makeReaction(id, name, lb, ub, vector<STOICH>());
}

GROWTH makeMedia(const string &id, const vector<int> &metIds, double rate) {
  GROWTH growth(id);
  for(int i=0; i<metIds.size(); i++) {
    MEDIA m;
    m.id = metIds[i];
    sprintf(m.name, "cpd%05d", metIds[i]);
    m.rate = rate;
    growth.media.push_back(m);
  }
  return growth;
}

/************************* RULEMODEL *************************/

RULEMODEL::RULEMODEL() {
  solves = 0;
  writes = 0;
}

void RULEMODEL::addGrowthRule(const string &mediaId, const vector<CANDIDATE> &needed, double value) {
  RULE r;
  r.mediaId = mediaId;
  r.items = needed;
  r.value = value;
  growthRules.push_back(r);
}

void RULEMODEL::setInfeasibleMedia(const string &mediaId) {
  infeasibleMedia.insert(mediaId);
}

bool RULEMODEL::isOpen(int rxnId, int dir) const {
  if(!hasReaction(rxnId)) { return false; }
  return getBound(rxnId, dir) * dir > 0;
}

int RULEMODEL::solveCount() const {
  return solves;
}

int RULEMODEL::lpWrites() const {
  return writes;
}

FBARESULT RULEMODEL::solve() {
  solves++;
  FBARESULT result;
  const string &mediaId = getMedia().id;
  if(infeasibleMedia.count(mediaId) > 0) {
    result.status = SOLVE_INFEASIBLE;
    return result;
  }
  double value = 0.0f;
  for(int i=0; i<growthRules.size(); i++) {
    if(growthRules[i].mediaId != mediaId) { continue; }
    bool allOpen = true;
    for(int j=0; j<growthRules[i].items.size() && allOpen; j++) {
      allOpen = isOpen(growthRules[i].items[j].id, growthRules[i].items[j].dir);
    }
    if(allOpen && growthRules[i].value > value) { value = growthRules[i].value; }
  }
  result.status = SOLVE_OPTIMAL;
  result.objective = value;
  for(int i=0; i<reactions.rxns.size(); i++) {
    const REACTION &rxn = reactions.rxns[i];
    if(rxn.ub > 0) { result.flux[rxn.id] = rxn.ub; }
    else if(rxn.lb < 0) { result.flux[rxn.id] = rxn.lb; }
  }
  return result;
}

MODEL* RULEMODEL::clone() const {
  return new RULEMODEL(*this);
}

int RULEMODEL::writeLp(const char *filename) {
  writes++;
  printf("RULEMODEL: would write %s\n", filename);
  return 0;
}

/************************* SCRIPTEDGAPFILLPKG *************************/

SCRIPTEDGAPFILLPKG::SCRIPTEDGAPFILLPKG(const MODEL &model, const RXNSPACE &database, const METSPACE &databaseMets)
  : GAPFILLPKG(model, database, databaseMets, vector<string>(), REACTIONGENESCORES()) {
  optimizations = 0;
}

void SCRIPTEDGAPFILLPKG::addSolution(const string &mediaId, const vector<CANDIDATE> &items) {
  scripted[mediaId].push_back(items);
}

int SCRIPTEDGAPFILLPKG::optimizeCount() const {
  return optimizations;
}

const vector<CANDIDATE>* SCRIPTEDGAPFILLPKG::firstOpen(const string &mediaId) const {
  map<string, vector<vector<CANDIDATE> > >::const_iterator it = scripted.find(mediaId);
  if(it == scripted.end()) { return NULL; }
  for(int i=0; i<it->second.size(); i++) {
    bool open = true;
    for(int j=0; j<it->second[i].size() && open; j++) {
      const CANDIDATE &c = it->second[i][j];
      open = gfmodel->hasReaction(c.id) && gfmodel->getBound(c.id, c.dir) * c.dir > 0;
    }
    if(open) { return &it->second[i]; }
  }
  return NULL;
}

static void addScriptedFlux(const vector<CANDIDATE> &items, map<int,FLUXPAIR> &maxFlux) {
  for(int i=0; i<items.size(); i++) {
    if(items[i].dir == FORWARD) { maxFlux[items[i].id].forward = 1.0f; }
    else { maxFlux[items[i].id].reverse = 1.0f; }
  }
}

int SCRIPTEDGAPFILLPKG::optimize(map<int,FLUXPAIR> &maxFlux, double &objectiveValue) {
  optimizations++;
  maxFlux.clear();
  objectiveValue = 0.0f;
  const vector<CANDIDATE> *items = firstOpen(gfmodel->getMedia().id);
  if(items == NULL) { return NO_GAPFILL_SOLUTION; }
  addScriptedFlux(*items, maxFlux);
  objectiveValue = items->size();
  return GAPFILL_SUCCESS;
}

int SCRIPTEDGAPFILLPKG::optimizeGlobal(const vector<GROWTH> &medias, const vector<OBJECTIVE> &targets, const vector<double> &thresholds,
				       map<int,FLUXPAIR> &maxFlux, double &objectiveValue) {
  optimizations++;
  maxFlux.clear();
  objectiveValue = 0.0f;
  for(int i=0; i<medias.size(); i++) {
    const vector<CANDIDATE> *items = firstOpen(medias[i].id);
    if(items == NULL) { return NO_GAPFILL_SOLUTION; }
    addScriptedFlux(*items, maxFlux);
  }
  objectiveValue = maxFlux.size();
  return GAPFILL_SUCCESS;
}

/************************* GAPFILLNETWORK *************************/

GAPFILLNETWORK::GAPFILLNETWORK() {
  vector<STOICH> st;

  /* Model */
  model.addMetabolite(makeMetabolite(TN_A_E, "cpd00001_e0", "e0"));
  model.addMetabolite(makeMetabolite(TN_B_E, "cpd00002_e0", "e0"));
  model.addMetabolite(makeMetabolite(TN_C_E, "cpd00003_e0", "e0"));
  model.addMetabolite(makeMetabolite(TN_X_C, "cpd00004_c0", "c0"));

  st.clear(); st.push_back(makeStoich("cpd00001_e0", -1, TN_A_E));
  model.addReaction(makeReaction(TN_EX_A, "EX_cpd00001_e0", 0.0f, _db.MAX_FLUX, st));
  st.clear(); st.push_back(makeStoich("cpd00002_e0", -1, TN_B_E));
  model.addReaction(makeReaction(TN_EX_B, "EX_cpd00002_e0", 0.0f, _db.MAX_FLUX, st));
  st.clear(); st.push_back(makeStoich("cpd00003_e0", -1, TN_C_E));
  model.addReaction(makeReaction(TN_EX_C, "EX_cpd00003_e0", 0.0f, _db.MAX_FLUX, st));
  st.clear(); st.push_back(makeStoich("cpd00004_c0", -1, TN_X_C));
  REACTION bio = makeReaction(TN_BIO, "bio1", 0.0f, _db.MAX_FLUX, st);
  bio.isExchange = 0;
  model.addReaction(bio);

  biomass = OBJECTIVE("bio1", TN_BIO);
  model.setObjective(biomass);

  /* Database */
  databaseMets.addMetabolite(makeMetabolite(TN_Y_C, "cpd00005_c0", "c0"));

  st.clear(); st.push_back(makeStoich("cpd00001_e0", -1, TN_A_E)); st.push_back(makeStoich("cpd00004_c0", 1, TN_X_C));
  database.addReaction(makeReaction(TN_R0, "rxn00010_c0", 0.0f, _db.MAX_FLUX, st));
  st.clear(); st.push_back(makeStoich("cpd00002_e0", -1, TN_B_E)); st.push_back(makeStoich("cpd00004_c0", 1, TN_X_C));
  database.addReaction(makeReaction(TN_R1, "rxn00011_c0", 0.0f, _db.MAX_FLUX, st));
  st.clear(); st.push_back(makeStoich("cpd00003_e0", -1, TN_C_E)); st.push_back(makeStoich("cpd00005_c0", 1, TN_Y_C));
  database.addReaction(makeReaction(TN_R2, "rxn00012_c0", 0.0f, _db.MAX_FLUX, st));
  st.clear(); st.push_back(makeStoich("cpd00005_c0", -1, TN_Y_C)); st.push_back(makeStoich("cpd00004_c0", 1, TN_X_C));
  database.addReaction(makeReaction(TN_R3, "rxn00013_c0", 0.0f, _db.MAX_FLUX, st));
  st.clear(); st.push_back(makeStoich("cpd00002_e0", -1, TN_B_E)); st.push_back(makeStoich("cpd00001_e0", 1, TN_A_E));
  database.addReaction(makeReaction(TN_R7, "rxn00017_c0", 0.0f, _db.MAX_FLUX, st));

  geneScores["rxn00017"]["gene17"] = 1.0f;

  vector<int> ids;
  ids.push_back(TN_A_E);
  m1 = makeMedia("M1", ids, 10.0f);
  ids[0] = TN_B_E;
  m2 = makeMedia("M2", ids, 10.0f);
  ids[0] = TN_C_E;
  m3 = makeMedia("M3", ids, 10.0f);
}

vector<GROWTH> GAPFILLNETWORK::medias() const {
  vector<GROWTH> out;
  out.push_back(m1);
  out.push_back(m2);
  out.push_back(m3);
  return out;
}
