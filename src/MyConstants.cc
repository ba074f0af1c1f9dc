#include <cstring>
#include <cstdio>
#include <cstdlib>
#include "MyConstants.h"

DEBUGFLAGS::DEBUGFLAGS() {

  /************ Printer switches **********************/
  /* True to get printouts of FBA results (including GLPK printouts) */
  DEBUGFBA = false;
  /* True if you want to print out information about the gapfilling package and the orchestrator (more detailed than PRINTGAPFILLRESULTS - suggested false) */
  DEBUGGAPFILL = false;
  /* True to trace every probe made by the binary / linear expansion tests (very large, suggested false) */
  DEBUGREDUCER = false;
  /* True to print every knockout made while testing an integrated solution */
  DEBUGSOLUTION = false;
  /* True if you want to get gapfill results (suggested true) */
  PRINTGAPFILLRESULTS = true;

  /******************** Gapfilling defaults *********/
  /* Minimum value the target must reach when no threshold is given */
  DEFAULT_MINIMUM_OBJ = 0.01;
  /* Bounds on the exchanges that the gapfilling model adds for extracellular metabolites */
  DEFAULT_EXCRETION = 100.0f;
  DEFAULT_UPTAKE = 0.0f;
  /* Penalty of one gapfilled reaction direction before score adjustments */
  MODEL_PENALTY = 1.0f;
  /* Bound opened on a reaction when a gapfilling solution is integrated into the model */
  INTEGRATION_BOUND = 100.0f;
  MAX_FLUX = 1000.0f;
  /* Number of re-filter and re-solve rounds allowed when a solution fails the test conditions */
  TEST_CONDITION_ITERATION_LIMIT = 10;
  /* Biomass flux forced during biomass sensitivity analysis */
  SENSITIVITY_MIN_GROWTH = 0.1;

  /************ FLUX and GROWTH RATE precision ( DO NOT CHANGE UNLESS YOU KNOW WHAT YOU ARE DOING!) ************/
  FLUX_CUTOFF = 1E-7;
  GROWTH_CUTOFF = 1E-5;
  SOLUTION_FLUX_CUTOFF = 1E-8;

  /************ Internal constants (DO NOT CHANGE UNLESS YOU KNOW WHAT YOU ARE DOING!) ********/
  MISSINGEXCHANGEFACTOR = 3000000; /* For exchanges the gapfilling model adds for extracellular metabolites */
  AUTOSINKFACTOR = 4000000;        /* Sinks for compounds with no known consumer (auto-sinks) */
  FLEXFACTOR = 5000000;            /* Biomass component supply reactions used by the sensitivity analysis */
  MINFACTORSPACING = 500000; /* This is the minimum distance between two special flags - 
				It must be larger than the number of metabolites in the database */

  /* Database conventions for important metabolites and for compartment names */
  strcpy(ATP_name, "cpd00002");
  E_compartment = 'e';
  UNKNOWN_DELTAG = 10000000;

  /* Compounds that always get a sink in the gapfilling model */
  NUM_AUTOSINKS = 5;
  strcpy(AUTOSINKS[0], "cpd01042");
  strcpy(AUTOSINKS[1], "cpd02701");
  strcpy(AUTOSINKS[2], "cpd11416");
  strcpy(AUTOSINKS[3], "cpd15302");
  strcpy(AUTOSINKS[4], "cpd03091");
}
