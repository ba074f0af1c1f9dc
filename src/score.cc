#include<cstdio>
#include<cstring>
#include<map>
#include<string>
#include<vector>

#include"DataStructures.h"
#include"modelUtils.h"
#include"MyConstants.h"
#include"score.h"

/* Score of one direction of a reaction before the activity multiplier.
   Penalties: wrong-way ion transport, mass / charge imbalance, missing or unfavorable free energy,
   making ATP, and poorly described compounds */
double reliabilityScore(const METSPACE &metspace, const REACTION &rxn, int dir) {
  if(!rxn.hasBiochem) {
    if(isBoundaryName(rxn.name)) { return -10.0f; }
    return 1000.0f;
  }

  double transportedCharge = 0.0f;
  for(int i=0; i<rxn.stoich.size(); i++) {
    if(!metspace.idIn(rxn.stoich[i].met_id)) { continue; }
    const METABOLITE *met = metspace.metPtrFromId(rxn.stoich[i].met_id);
    if(met->isExtracellular()) { transportedCharge += rxn.stoich[i].rxn_coeff * met->charge; }
  }

  double forwardScore(0.0f), reverseScore(0.0f), baseScore(0.0f);
  if(transportedCharge > 0) { forwardScore += 50*transportedCharge; }
  if(transportedCharge < 0) { reverseScore += -50*transportedCharge; }

  if(strncmp(rxn.status, "MI", 2) == 0) { baseScore = 1000; }
  if(strncmp(rxn.status, "CI", 2) == 0) { baseScore = 800; }
  if(rxn.deltaG == _db.UNKNOWN_DELTAG) {
    baseScore = 200;
  } else {
    if(rxn.deltaG <= -5) { reverseScore += 20; }
    if(rxn.deltaG <= -10) { reverseScore += 20; }
    if(rxn.deltaG >= 5) { forwardScore += 20; }
    if(rxn.deltaG >= 10) { forwardScore += 20; }
  }

  for(int i=0; i<rxn.stoich.size(); i++) {
    if(coreId(rxn.stoich[i].met_name) == _db.ATP_name) {
      if(rxn.stoich[i].rxn_coeff < 0) { reverseScore += 100; }
      else if(rxn.stoich[i].rxn_coeff > 0) { forwardScore += 100; }
    }
    if(!metspace.idIn(rxn.stoich[i].met_id)) { continue; }
    const METABOLITE *met = metspace.metPtrFromId(rxn.stoich[i].met_id);
    if(met->inchikey.empty()) { baseScore += 40; }
    if(met->chemform[0] == '\0') { baseScore += 60; }
    if(met->deltaG == _db.UNKNOWN_DELTAG) { baseScore += 20; }
  }

  if(dir == FORWARD) { return baseScore + forwardScore; }
  return baseScore + reverseScore;
}

/* Reactions that carried flux in earlier (active) solutions are pushed back in the search order:
   each appearance adds 10% to the score of that direction */
RELIABILITYSCORES assignReliabilityScoresToReactions(const RXNSPACE &rxnspace, const METSPACE &metspace,
						     const vector<vector<CANDIDATE> > &activeReactionSets) {
  map<int, map<int,int> > activeCount;
  for(int i=0; i<activeReactionSets.size(); i++) {
    for(int j=0; j<activeReactionSets[i].size(); j++) {
      activeCount[activeReactionSets[i][j].id][activeReactionSets[i][j].dir]++;
    }
  }

  RELIABILITYSCORES scores;
  for(int i=0; i<rxnspace.rxns.size(); i++) {
    const REACTION &rxn = rxnspace.rxns[i];
    double forMultiplier(1.0f), revMultiplier(1.0f);
    if(activeCount.count(rxn.id) > 0) {
      forMultiplier += 0.1f*activeCount[rxn.id][FORWARD];
      revMultiplier += 0.1f*activeCount[rxn.id][REVERSE];
    }
    scores[rxn.id][FORWARD] = reliabilityScore(metspace, rxn, FORWARD)*forMultiplier;
    scores[rxn.id][REVERSE] = reliabilityScore(metspace, rxn, REVERSE)*revMultiplier;
  }
  return scores;
}

double bestGeneProbability(const REACTIONGENESCORES &reactionScores, const REACTION &rxn, string &bestGene) {
  bestGene.clear();
  double best = -1.0f;
  REACTIONGENESCORES::const_iterator it = reactionScores.find(coreId(rxn.name));
  if(it == reactionScores.end()) { return best; }
  for(map<string,double>::const_iterator git = it->second.begin(); git != it->second.end(); git++) {
    if(git->second > best) {
      best = git->second;
      bestGene = git->first;
    }
  }
  return best;
}
