#ifndef SENSITIVITY_H
#define SENSITIVITY_H

#include <map>
#include <vector>
#include "DataStructures.h"
#include "Model.h"

/* Biomass components that need an outside supply for the target (biomass) reaction to carry SENSITIVITY_MIN_GROWTH.
   Runs on a copy of the model; the model itself is not changed. Returns GAPFILL_SUCCESS or BAD_ARGUMENTS */
int findUnproducibleBiomassCompounds(const MODEL &model, const OBJECTIVE &target, SENSITIVITYRESULT &result);

/* Same, once per knocked out (reaction, direction) of koList */
int findUnproducibleBiomassCompounds(const MODEL &model, const OBJECTIVE &target, const vector<CANDIDATE> &koList,
				     map<pair<int,int>, SENSITIVITYRESULT> &results);

#endif
