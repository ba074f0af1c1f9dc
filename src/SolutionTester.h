#ifndef SOLUTIONTESTER_H
#define SOLUTIONTESTER_H

#include <vector>
#include "DataStructures.h"
#include "Model.h"

int gapfillCount(const GAPFILLSOLUTION &solution);

/* New reactions first, then reversed ones, each in id order */
vector<CANDIDATE> convertSolutionToList(const GAPFILLSOLUTION &solution);

/* ignoreDir: any direction of the same reaction matches */
bool findItemInSolution(const vector<CANDIDATE> &list, const CANDIDATE &item, bool ignoreDir);

/* Which reactions of an integrated solution are not needed to reach threshold[i] with targets[i] on medias[i], for every i.
   Reactions found unneeded stay knocked out while the rest of the list is tested.
   removeUnneeded = false: every bound is put back.
   removeUnneeded = true: items in doNotRemove get their bounds back; other unneeded reactions whose
   bounds are both zero are deleted from the model.
   The media and objective in effect on entry are restored before returning.
   Returns GAPFILL_SUCCESS or BAD_ARGUMENTS */
int testSolution(MODEL &model, const vector<CANDIDATE> &solution, const vector<OBJECTIVE> &targets, const vector<GROWTH> &medias,
		 const vector<double> &thresholds, bool removeUnneeded, const vector<CANDIDATE> &doNotRemove,
		 vector<CANDIDATE> &unneeded);
int testSolution(MODEL &model, const GAPFILLSOLUTION &solution, const vector<OBJECTIVE> &targets, const vector<GROWTH> &medias,
		 const vector<double> &thresholds, bool removeUnneeded, const vector<CANDIDATE> &doNotRemove,
		 vector<CANDIDATE> &unneeded);

#endif
