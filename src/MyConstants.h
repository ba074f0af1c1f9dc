#include <cstdio>
#include <cstdlib>

#ifndef MYCONST_H
#define MYCONST_H

/* See MyConstants.cc for definitions and values for all of these switches.
   If you want to change a value you must re-compile for it to take effect */
class DEBUGFLAGS{
 public:

  bool DEBUGFBA;
  bool DEBUGGAPFILL;
  bool DEBUGREDUCER;
  bool DEBUGSOLUTION;
  bool PRINTGAPFILLRESULTS;

  /* Gapfilling defaults */
  double DEFAULT_MINIMUM_OBJ;
  double DEFAULT_EXCRETION;
  double DEFAULT_UPTAKE;
  double MODEL_PENALTY;
  double INTEGRATION_BOUND;
  double MAX_FLUX;
  int TEST_CONDITION_ITERATION_LIMIT;
  double SENSITIVITY_MIN_GROWTH;

  int MISSINGEXCHANGEFACTOR;
  int AUTOSINKFACTOR;
  int FLEXFACTOR;
  int MINFACTORSPACING;

  /* Database conventions */
  char ATP_name[16];
  char E_compartment;
  int NUM_AUTOSINKS;
  char AUTOSINKS[5][16];
  double UNKNOWN_DELTAG;

  double FLUX_CUTOFF;
  double GROWTH_CUTOFF;
  double SOLUTION_FLUX_CUTOFF;

  DEBUGFLAGS();
};

/* Global debugflags variable - should be used in all files in the project instead of each one defning its own copy  */
const DEBUGFLAGS _db;

#endif
