#include <cstdio>
#include <map>
#include <vector>

#include "DataStructures.h"
#include "Model.h"
#include "modelUtils.h"
#include "MyConstants.h"
#include "SolutionTester.h"

int gapfillCount(const GAPFILLSOLUTION &solution) {
  return solution.newRxns.size() + solution.reversedRxns.size();
}

vector<CANDIDATE> convertSolutionToList(const GAPFILLSOLUTION &solution) {
  vector<CANDIDATE> output;
  map<int,int>::const_iterator it;
  for(it = solution.newRxns.begin(); it != solution.newRxns.end(); it++) {
    output.push_back(CANDIDATE(it->first, it->second, NEW_REACTION));
  }
  for(it = solution.reversedRxns.begin(); it != solution.reversedRxns.end(); it++) {
    output.push_back(CANDIDATE(it->first, it->second, REVERSED_REACTION));
  }
  return output;
}

bool findItemInSolution(const vector<CANDIDATE> &list, const CANDIDATE &item, bool ignoreDir) {
  for(int i=0; i<list.size(); i++) {
    if(list[i].id == item.id && list[i].dir == item.dir) { return true; }
    if(ignoreDir && list[i].id == item.id) { return true; }
  }
  return false;
}

/* Put back the tested bound (and the opposite bound when it had to be cleared) */
static void restoreItem(MODEL &model, const CANDIDATE &item) {
  model.setBound(item.id, item.dir, item.originalBound);
  if(item.hasOther) { model.setBound(item.id, oppositeDir(item.dir), item.otherOriginalBound); }
}

/* Zero the tested direction. A forced flux in that direction (lb > 0 for '>', ub < 0 for '<') is cleared too */
static void knockoutItem(MODEL &model, int rxnId, int dir, double &bound, bool &hasOther, double &otherBound) {
  bound = model.getBound(rxnId, dir);
  double other = model.getBound(rxnId, oppositeDir(dir));
  hasOther = false;
  if((dir == FORWARD && other > 0) || (dir == REVERSE && other < 0)) {
    hasOther = true;
    otherBound = other;
    model.setBound(rxnId, oppositeDir(dir), 0.0f);
  }
  model.setBound(rxnId, dir, 0.0f);
}

static bool isKnockedOut(MODEL &model, int rxnId, int dir) {
  double other = model.getBound(rxnId, oppositeDir(dir));
  return model.getBound(rxnId, dir) == 0 && !((dir == FORWARD && other > 0) || (dir == REVERSE && other < 0));
}

static void applyTriple(MODEL &model, const OBJECTIVE &target, const GROWTH &media) {
  OBJECTIVE obj = target;
  obj.sense = 1;
  model.setMedia(media);
  model.setObjective(obj);
}

int testSolution(MODEL &model, const vector<CANDIDATE> &solution, const vector<OBJECTIVE> &targets, const vector<GROWTH> &medias,
		 const vector<double> &thresholds, bool removeUnneeded, const vector<CANDIDATE> &doNotRemove,
		 vector<CANDIDATE> &unneeded) {
  unneeded.clear();
  if(targets.empty() || targets.size() != medias.size() || targets.size() != thresholds.size()) {
    printf("ERROR: testSolution needs one media and one threshold per target (%d targets, %d medias, %d thresholds)\n",
	   (int)targets.size(), (int)medias.size(), (int)thresholds.size());
    return BAD_ARGUMENTS;
  }
  for(int i=0; i<solution.size(); i++) {
    if(!model.hasReaction(solution[i].id)) {
      printf("ERROR: Solution reaction %d is not in the model\n", solution[i].id);
      return BAD_ARGUMENTS;
    }
  }

  GROWTH currentMedia = model.getMedia();
  OBJECTIVE currentObjective = model.getObjective();

  for(int t=0; t<targets.size(); t++) {
    applyTriple(model, targets[t], medias[t]);
    FBARESULT res = model.solve();
    if(_db.DEBUGSOLUTION) { printf("Starting objective for %s/%s = %4.6f\n", medias[t].id.c_str(), targets[t].name.c_str(), res.objective); }
  }

  for(int i=0; i<solution.size(); i++) {
    CANDIDATE item = solution[i];
    bool needed = false;
    bool captured = false;
    double objective = 0.0f;
    for(int t=0; t<targets.size(); t++) {
      /* With a single target the media and objective are still in place from above */
      if(targets.size() > 1) { applyTriple(model, targets[t], medias[t]); }
      /* The knockout happens after the media is applied in case the reaction is an exchange */
      double bound, otherBound(0.0f);
      bool hasOther;
      if(captured && isKnockedOut(model, item.id, item.dir)) {
	/* Still out from the previous target. Only media changes reopen exchanges */
      } else if(!captured) {
	knockoutItem(model, item.id, item.dir, bound, hasOther, otherBound);
	item.originalBound = bound;
	item.hasOther = hasOther;
	item.otherOriginalBound = otherBound;
	captured = true;
      } else {
	knockoutItem(model, item.id, item.dir, bound, hasOther, otherBound);
	if(!rougheq(bound, item.originalBound, _db.FLUX_CUTOFF) || hasOther != item.hasOther) {
	  printf("WARNING: Reaction %d%c had bound %4.3f on %s but %4.3f on %s. Keeping the first one\n",
		 item.id, dirChar(item.dir), item.originalBound, medias[0].id.c_str(), bound, medias[t].id.c_str());
	}
      }
      FBARESULT res = model.solve();
      objective = res.objective;
      if(res.status != SOLVE_OPTIMAL || res.objective < thresholds[t]) {
	needed = true;
	if(_db.DEBUGSOLUTION) {
	  printf("%s/%s: %d%c needed: %4.6f with min obj: %4.6f\n", medias[t].id.c_str(), targets[t].name.c_str(),
		 item.id, dirChar(item.dir), res.objective, thresholds[t]);
	}
      }
    }
    if(!needed) {
      item.score = objective;
      unneeded.push_back(item);
      if(_db.DEBUGSOLUTION) { printf("%d%c not needed: %4.6f\n", item.id, dirChar(item.dir), objective); }
      /* Left knocked out so that combinations are screened */
    } else {
      restoreItem(model, item);
    }
  }

  if(!removeUnneeded) {
    for(int i=0; i<unneeded.size(); i++) { restoreItem(model, unneeded[i]); }
  } else {
    vector<int> removed;
    for(int i=0; i<unneeded.size(); i++) {
      if(findItemInSolution(doNotRemove, unneeded[i], false)) {
	restoreItem(model, unneeded[i]);
      } else if(model.getBound(unneeded[i].id, FORWARD) == 0 && model.getBound(unneeded[i].id, REVERSE) == 0
		&& !findItemInSolution(doNotRemove, unneeded[i], true)) {
	removed.push_back(unneeded[i].id);
      }
    }
    custom_unique(removed);
    if(!removed.empty()) { model.removeReactions(removed); }
  }

  model.setObjective(currentObjective);
  if(!currentMedia.empty()) { model.setMedia(currentMedia); }
  return GAPFILL_SUCCESS;
}

int testSolution(MODEL &model, const GAPFILLSOLUTION &solution, const vector<OBJECTIVE> &targets, const vector<GROWTH> &medias,
		 const vector<double> &thresholds, bool removeUnneeded, const vector<CANDIDATE> &doNotRemove,
		 vector<CANDIDATE> &unneeded) {
  return testSolution(model, convertSolutionToList(solution), targets, medias, thresholds, removeUnneeded, doNotRemove, unneeded);
}
