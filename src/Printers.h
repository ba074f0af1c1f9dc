#ifndef PRINTERS_H
#define PRINTERS_H

/* printers.h - various utilities for printing results */

#include <map>
#include <vector>
#include "DataStructures.h"

using std::vector;

/* Reaction and metabolite printers */
void printGROWTHinputs(const GROWTH &growth);
void printRxnFormula(const REACTION &rxn, char* rxnString);
void printMETABOLITEinputs(const METABOLITE &metabolite);
void printREACTIONinputs(const REACTION &reaction);

/* Gapfilling printers */
void printObjective(const OBJECTIVE &obj);
void printTestCondition(const TESTCONDITION &cond);
void printCandidateList(const vector<CANDIDATE> &list);
void printCandidateList(const vector<CANDIDATE> &list, const RXNSPACE &rxnspace);
void printGapfillSolution(const GAPFILLSOLUTION &solution, const RXNSPACE &rxnspace);
void printFluxResult(const RXNSPACE &rxnspace, const FBARESULT &result);
void printSensitivityResult(const SENSITIVITYRESULT &result, const METSPACE &metspace);
void printGapfillCache(const GAPFILLCACHE &cache);

#endif
