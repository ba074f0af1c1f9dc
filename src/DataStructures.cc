#include "DataStructures.h"
#include "MyConstants.h"

#include <cstring>
#include <cstdio>
#include <map>
#include <vector>

using std::map;
using std::vector;
using std::strcpy;
using std::sprintf;

METABOLITE::METABOLITE() {
  id = -1;
  name[0] = '\0';
  charge = 0;
  strcpy(compartment, "c0");
  chemform[0] = '\0';
  deltaG = _db.UNKNOWN_DELTAG;
}

void METABOLITE::reset() {
  id = -1;
  name[0] = '\0';
  charge = 0;
  strcpy(compartment, "c0");
  chemform[0] = '\0';
  inchikey.clear();
  deltaG = _db.UNKNOWN_DELTAG;
}

bool METABOLITE::isExtracellular() const {
  return compartment[0] == _db.E_compartment;
}

bool STOICH::operator==(const STOICH &rhs) const{
  return (this[0].rxn_coeff == rhs.rxn_coeff);
}

bool STOICH::operator<(const STOICH &rhs) const{
  return (this[0].rxn_coeff < rhs.rxn_coeff);
}

bool ANNOTATION::operator<(const ANNOTATION &rhs)const {
  return this->probability > rhs.probability;
}

STOICH::STOICH() {
  met_id = -1;
  met_name[0] = '\0';
  rxn_coeff = 999;
}

void STOICH::reset() {
  met_id = -1;
  rxn_coeff = 999;
}

bool REACTION::operator==(const REACTION &rhs) const{
  return (this[0].id == rhs.id);
}
bool REACTION::operator<(const REACTION &rhs) const{
  return (this[0].id < rhs.id);
}

REACTION::REACTION(){
  id = -1;
  name[0] = '\0';
  isExchange = 0;
  init_reversible = 0;
  lb = -_db.MAX_FLUX; ub = _db.MAX_FLUX;
  hasBiochem = false;
  strcpy(status, "OK");
  deltaG = _db.UNKNOWN_DELTAG;
}

void REACTION::reset() {
  isExchange = 0;
  init_reversible = 0;
  lb = -_db.MAX_FLUX; ub = _db.MAX_FLUX;
  hasBiochem = false;
  strcpy(status, "OK");
  deltaG = _db.UNKNOWN_DELTAG;
  stoich.clear();
  annote.clear();
}

/* The bound that has to be open for flux to go in direction dir */
double REACTION::bound(int dir) const {
  if(dir == FORWARD) { return ub; }
  return lb;
}

void REACTION::setBound(int dir, double value) {
  if(dir == FORWARD) { ub = value; }
  else { lb = value; }
}

bool MEDIA::operator==(const MEDIA &rhs) const{
  return (this[0].id == rhs.id);
}
bool MEDIA::operator<(const MEDIA &rhs) const{
  return (this[0].id < rhs.id);
}

MEDIA::MEDIA() {
  id = -1;
  name[0] = '\0';
  rate = 1000.0f;
}

GROWTH::GROWTH() {
}
GROWTH::GROWTH(const string &mediaId) {
  id = mediaId;
}
void GROWTH::reset() {
  id.clear();
  media.clear();
  byproduct.clear();
}
/* A GROWTH with no id and no components means "no media has been applied" */
bool GROWTH::empty() const {
  return id.empty() && media.empty();
}

OBJECTIVE::OBJECTIVE() {
  sense = 1;
}

OBJECTIVE::OBJECTIVE(const string &objName, int rxnId) {
  name = objName;
  rxnIds.push_back(rxnId);
  coeffs.push_back(1.0f);
  sense = 1;
}

bool OBJECTIVE::empty() const {
  return rxnIds.empty();
}

bool OBJECTIVE::operator==(const OBJECTIVE &rhs) const {
  return name == rhs.name && rxnIds == rhs.rxnIds && coeffs == rhs.coeffs && sense == rhs.sense;
}

TESTCONDITION::TESTCONDITION() {
  isMaxThreshold = false;
  threshold = _db.DEFAULT_MINIMUM_OBJ;
  change = false;
}

TESTCONDITION::TESTCONDITION(const GROWTH &m, const OBJECTIVE &obj, bool isMax, double thresh) {
  media = m;
  objective = obj;
  isMaxThreshold = isMax;
  threshold = thresh;
  change = false;
}

FBARESULT::FBARESULT() {
  status = SOLVE_FAILED;
  objective = 0.0f;
}

double FBARESULT::fluxOf(int rxnId) const {
  map<int,double>::const_iterator it = flux.find(rxnId);
  if(it == flux.end()) { return 0.0f; }
  return it->second;
}

CANDIDATE::CANDIDATE() {
  id = -1;
  dir = FORWARD;
  type = NEW_REACTION;
  originalBound = 0.0f;
  hasOther = false;
  otherOriginalBound = 0.0f;
  score = 0.0f;
}

CANDIDATE::CANDIDATE(int rxnId, int direction) {
  id = rxnId;
  dir = direction;
  type = NEW_REACTION;
  originalBound = 0.0f;
  hasOther = false;
  otherOriginalBound = 0.0f;
  score = 0.0f;
}

CANDIDATE::CANDIDATE(int rxnId, int direction, int itemType) {
  id = rxnId;
  dir = direction;
  type = itemType;
  originalBound = 0.0f;
  hasOther = false;
  otherOriginalBound = 0.0f;
  score = 0.0f;
}

bool CANDIDATE::sameItem(const CANDIDATE &rhs) const {
  return id == rhs.id && dir == rhs.dir;
}

GAPFILLSOLUTION::GAPFILLSOLUTION() {
  minObjective = _db.DEFAULT_MINIMUM_OBJ;
  binaryCheck = false;
  growth = 0.0f;
}

bool GAPFILLSOLUTION::empty() const {
  return newRxns.empty() && reversedRxns.empty();
}

/* Negative = not a candidate in that direction */
PENALTY::PENALTY() {
  forward = -1.0f;
  reverse = -1.0f;
}

FLUXPAIR::FLUXPAIR() {
  forward = 0.0f;
  reverse = 0.0f;
}

EXPANSIONRESULT::EXPANSIONRESULT() {
  hasBreaking = false;
}

FILTERKEY::FILTERKEY() {
  threshold = 0.0f;
}

FILTERKEY::FILTERKEY(const TESTCONDITION &cond) {
  mediaId = cond.media.id;
  objective = cond.objective.name;
  threshold = cond.threshold;
}

bool FILTERKEY::operator<(const FILTERKEY &rhs) const {
  if(mediaId != rhs.mediaId) { return mediaId < rhs.mediaId; }
  if(objective != rhs.objective) { return objective < rhs.objective; }
  return threshold < rhs.threshold;
}

SENSITIVITYRESULT::SENSITIVITYRESULT() {
  canGrow = false;
}

void GAPFILLCACHE::clear() {
  gfFilter.clear();
  gfSensitivity.clear();
  gfSuccess.clear();
  gfFailure.clear();
}

/* Copy filter results from another cache, replacing whole (media, objective, threshold) entries */
void GAPFILLCACHE::mergeFilter(const GAPFILLCACHE &other) {
  map<FILTERKEY, map<pair<int,int>, CANDIDATE> >::const_iterator it;
  for(it = other.gfFilter.begin(); it != other.gfFilter.end(); it++) {
    gfFilter[it->first] = it->second;
  }
}

int GAPFILLCACHE::filterCount() const {
  int count = 0;
  map<FILTERKEY, map<pair<int,int>, CANDIDATE> >::const_iterator it;
  for(it = gfFilter.begin(); it != gfFilter.end(); it++) { count += it->second.size(); }
  return count;
}

/* I think I'm required to put this here...even if it does nothing*/
RXNSPACE::RXNSPACE() {
  numRxns = 0;
}

void RXNSPACE::clear() {
  rxns.clear();
  Ids2Idx.clear();
  numRxns = 0;
}

/* Note - I implemented this myself so that I automatically reserve the capacity... */
RXNSPACE RXNSPACE::operator=(const RXNSPACE &orig) {
  if(&orig != this) {
    clear();
    rxns.reserve(orig.rxns.capacity());
    for(int i=0; i<orig.rxns.size(); i++) {
      addReaction(orig.rxns[i]);
    }
  }
  return *this;
}

void RXNSPACE::addReaction(const REACTION &rxn) {
  if(idIn(rxn.id)) {
    if(_db.DEBUGGAPFILL) { printf("WARNING: Attempted to pass a reaction with id %d that was already in the RXNSPACE!\n", rxn.id); }
    return;
  }
  rxns.push_back(rxn);
  Ids2Idx[rxn.id] = rxns.size()-1;
  numRxns++;
}

/* Indexes of every reaction after the removed one shift down, so the map is rebuilt */
void RXNSPACE::removeReaction(int id) {
  int idx = idxFromId(id);
  if(idx < 0) { return; }
  rxns.erase(rxns.begin() + idx);
  numRxns--;
  rxnMap();
}

/* If you know you want to change both the LB AND the UB... you can pass both here */
void RXNSPACE::change_Lb_and_Ub(int id, double new_lb, double new_ub) {
  REACTION* ptr = rxnPtrFromId(id);
  if(ptr == NULL) { return; }
  if(new_lb > new_ub + 1E-8) {
    printf("ERROR: Requested LB %4.3f above requested UB %4.3f for reaction %s\n", new_lb, new_ub, ptr->name);
    return;
  }
  ptr->lb = new_lb;
  ptr->ub = new_ub;
}

/* Uses "find" function from map to allow us to declare constant RXNSPACE's
Return a reaction with a given ID (a default REACTION if it is missing) */
REACTION RXNSPACE::rxnFromId(int id) const {
  int idx = this->idxFromId(id);
  if(idx < 0) { return REACTION(); }
  return rxns[idx];
}

REACTION* RXNSPACE::rxnPtrFromId(int id) {
  int idx = this->idxFromId(id);
  if(idx < 0) { return NULL; }
  return &rxns[idx];
}

const REACTION* RXNSPACE::rxnPtrFromId(int id) const {
  int idx = this->idxFromId(id);
  if(idx < 0) { return NULL; }
  return &rxns[idx];
}

/* Returns a reaction index from an Id, or -1 if the id is not in the RXNSPACE */
int RXNSPACE::idxFromId(int id) const {
  map<int,int>::const_iterator it = Ids2Idx.find(id);
  if(it == Ids2Idx.end()) {
    printf("FAILURE: Attempt to get an index for ID %d that is not in the RXNSPACE(%d)!\n",
	   id,(int)this->rxns.size());
    return -1;
  }
  return (it -> second);
}

bool RXNSPACE::idIn(int id) const {
  if(Ids2Idx.count(id) > 0) { return true; }
  else { return false; }
}

void RXNSPACE::rxnMap() {
  this->Ids2Idx.clear();
  for(int i=0;i<this->rxns.size();i++) {
    this->Ids2Idx[this->rxns[i].id] = i;
  }
  return;
}


METSPACE::METSPACE() {
  numMets = 0;
}

void METSPACE::clear() {
  mets.clear();
  Ids2Idx.clear();
  numMets = 0;
}

void METSPACE::addMetabolite(const METABOLITE &met) {
  if(idIn(met.id)) {
    return;
  }
  mets.push_back(met);
  Ids2Idx[met.id] = mets.size()-1;
  numMets++;
}

METABOLITE METSPACE::metFromId(int id) const {
  int idx = idxFromId(id);
  if(idx < 0) { return METABOLITE(); }
  return mets[idx];
}

METABOLITE* METSPACE::metPtrFromId(int id) {
  int idx = this->idxFromId(id);
  if(idx < 0) { return NULL; }
  return &mets[idx];
}

const METABOLITE* METSPACE::metPtrFromId(int id) const {
  int idx = this->idxFromId(id);
  if(idx < 0) { return NULL; }
  return &mets[idx];
}

int METSPACE::idxFromId(int id) const {
  map<int,int>::const_iterator it = Ids2Idx.find(id);
  if(it == Ids2Idx.end()) {
    printf("FAIL: Attempted to access metabolite %d that is not present in the metabolite struct...\n", id);
    return -1;
  }
  return (it -> second);
}

bool METSPACE::idIn(int id) const {
  if(Ids2Idx.count(id) > 0) { return true; }
  else { return false; }
}

METSPACE METSPACE::operator=(const METSPACE &orig) {
  if(&orig != this) {
    clear();
    mets.reserve(orig.mets.capacity());
    for(int i=0; i<orig.mets.size(); i++) {
      addMetabolite(orig.mets[i]);
    }
  }
  return *this;
}
