#ifndef _SCORE_H_
#define _SCORE_H_

#include<map>
#include<string>
#include<vector> 
#include"DataStructures.h"

using std::vector;
using std::map;
using std::string;

/* reaction id --> direction (FORWARD / REVERSE) --> score. Lower is more reliable */
typedef map<int, map<int,double> > RELIABILITYSCORES;

/* gapfilling-database reaction core id --> gene --> probability */
typedef map<string, map<string,double> > REACTIONGENESCORES;

RELIABILITYSCORES assignReliabilityScoresToReactions(const RXNSPACE &rxnspace, const METSPACE &metspace,
						     const vector<vector<CANDIDATE> > &activeReactionSets);
double reliabilityScore(const METSPACE &metspace, const REACTION &rxn, int dir);

/* Best scoring gene for a reaction (looked up by core id). Returns -1 and leaves bestGene empty if there is none */
double bestGeneProbability(const REACTIONGENESCORES &reactionScores, const REACTION &rxn, string &bestGene);

#endif
