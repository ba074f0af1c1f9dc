#ifndef EXCHANGES_H_
#define EXCHANGES_H_

#include <vector>
#include "DataStructures.h"

/* Open the exchanges of the media components (and close every other uptake) */
void FeedTheBeast(RXNSPACE &inModel, const METSPACE &metspace, const GROWTH &growth);

/* Generated reactions. dir > 0 only excretes, dir < 0 only takes up, 0 both */
REACTION MagicExchange(const METABOLITE &met, double uptake, double excretion);
REACTION MagicExchange(const METABOLITE &met, double uptake, double excretion, int idFactor, const char *prefix);
REACTION AutoSink(const METABOLITE &met);
REACTION FlexSupply(const METABOLITE &met);

void AddMissingExchanges(RXNSPACE &rxnspace, const METSPACE &metspace, vector<int> &added);
void AddAutoSinks(RXNSPACE &rxnspace, const METSPACE &metspace, vector<int> &added);

int FindExchange4Metabolite(const vector<REACTION> &reaction, int met_id);
bool isGeneratedReaction(int rxnId);

#endif
