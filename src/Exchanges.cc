#include "Exchanges.h"
#include "MyConstants.h"
#include "modelUtils.h"
#include "Printers.h"

#include<cstdio>
#include<cstdlib>
#include<cstring>
#include<vector>

/* Functions */

/* Zeros out the uptake on every exchange (reset). Generated sinks and supply reactions are left alone */
void ResetFood(vector<REACTION> &reactions){
  for(int i=0;i<reactions.size();i++){
    if(reactions[i].isExchange==1 && !isGeneratedReaction(reactions[i].id)){
      if(reactions[i].lb < 0.0f) { reactions[i].lb = 0.0f; }
      if(reactions[i].ub < 0.0f) { reactions[i].ub = 0.0f; }
    }
  }
}

// Adjusts Flux limits on Exchange Reactions for each Media condition
void FeedTheBeast(RXNSPACE &inModel, const METSPACE &metspace, const GROWTH &growth){
  ResetFood(inModel.rxns);
  for(int i=0;i<growth.media.size();i++){
    int j = FindExchange4Metabolite(inModel.rxns,growth.media[i].id);
    if(j == -1) {
      printf("WARNING: Media %s component %s (%d) has no exchange reaction in the model and is skipped\n",
	     growth.id.c_str(), growth.media[i].name, growth.media[i].id);
      continue;
    }
    if(_db.DEBUGFBA) { printf("Media %s: opening exchange %d for metabolite %d\n", growth.id.c_str(), j, growth.media[i].id); }
    inModel.change_Lb_and_Ub(j, -growth.media[i].rate, _db.MAX_FLUX);
  }
  return;
}

REACTION MagicExchange(const METABOLITE &met, double uptake, double excretion) {
  return MagicExchange(met, uptake, excretion, _db.MISSINGEXCHANGEFACTOR, "MagicEx_");
}

REACTION MagicExchange(const METABOLITE &met, double uptake, double excretion, int idFactor, const char *prefix){
  REACTION rxn_add;
  STOICH stoich_add;

  if(met.id >= _db.MINFACTORSPACING) {
    printf("WARNING: Metabolite id %d is above MINFACTORSPACING, generated reaction %d may collide with another one\n",
	   met.id, idFactor + met.id);
  }
  rxn_add.isExchange = 1;
  rxn_add.hasBiochem = true;
  rxn_add.id = idFactor + met.id;

  /* Size of string could be a problem but for now I left this since we don't want 30 extra spaces in everything... */
  snprintf(rxn_add.name, sizeof(rxn_add.name), "%s%s", prefix, met.name);
  stoich_add.met_id = met.id;
  stoich_add.rxn_coeff = -1;
  snprintf(stoich_add.met_name, sizeof(stoich_add.met_name), "%s", met.name);
  rxn_add.stoich.push_back(stoich_add);

  rxn_add.lb = -uptake;
  rxn_add.ub = excretion;
  if(uptake > 0.0f && excretion > 0.0f) { rxn_add.init_reversible = 0; }
  else if(uptake > 0.0f) { rxn_add.init_reversible = -1; }
  else { rxn_add.init_reversible = 1; }
  return rxn_add;
}

/* Sinks let the network get rid of compounds it can only make as byproducts */
REACTION AutoSink(const METABOLITE &met) {
  return MagicExchange(met, 0.0f, _db.DEFAULT_EXCRETION, _db.AUTOSINKFACTOR, "SK_");
}

/* Supply reaction for one biomass reactant (sensitivity analysis) */
REACTION FlexSupply(const METABOLITE &met) {
  REACTION rxn = MagicExchange(met, _db.MAX_FLUX, 0.0f, _db.FLEXFACTOR, "FLEX_");
  return rxn;
}

/* Add an exchange for every extracellular metabolite that has none. Ids of the new reactions go in added */
void AddMissingExchanges(RXNSPACE &rxnspace, const METSPACE &metspace, vector<int> &added) {
  for(int i=0; i<metspace.mets.size(); i++) {
    if(!metspace.mets[i].isExtracellular()) { continue; }
    if(FindExchange4Metabolite(rxnspace.rxns, metspace.mets[i].id) != -1) { continue; }
    REACTION ex = MagicExchange(metspace.mets[i], _db.DEFAULT_UPTAKE, _db.DEFAULT_EXCRETION);
    if(rxnspace.idIn(ex.id)) { continue; }
    rxnspace.addReaction(ex);
    added.push_back(ex.id);
  }
}

/* Add a sink for each auto-sink compound present (in any compartment but the extracellular one) */
void AddAutoSinks(RXNSPACE &rxnspace, const METSPACE &metspace, vector<int> &added) {
  for(int i=0; i<metspace.mets.size(); i++) {
    const METABOLITE &met = metspace.mets[i];
    if(met.isExtracellular()) { continue; }
    string core = coreId(met.name);
    for(int j=0; j<_db.NUM_AUTOSINKS; j++) {
      if(core != _db.AUTOSINKS[j]) { continue; }
      REACTION sink = AutoSink(met);
      if(!rxnspace.idIn(sink.id)) {
	rxnspace.addReaction(sink);
	added.push_back(sink.id);
      }
    }
  }
}

/* Returns the ID for the exchange reaction for metabolite "met_id" in the vector<REACTION> 
   reaction, if there is one in that vector, and -1 if there is not 
   Does not depend on the "isExchange" property. Generated sinks and supply reactions are not exchanges */
int FindExchange4Metabolite(const vector<REACTION> &reaction, int met_id){
  for(int i=0;i<reaction.size();i++){
    if(reaction[i].stoich.size()==1 && reaction[i].stoich[0].met_id==met_id && strncmp(reaction[i].name, "bio", 3) != 0
       && reaction[i].id < _db.AUTOSINKFACTOR) {
      return reaction[i].id;
    }
  }
  return -1; /* Exchange not found in database */
}

bool isGeneratedReaction(int rxnId) {
  return rxnId >= _db.AUTOSINKFACTOR;
}
