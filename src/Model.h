#ifndef MODEL_H
#define MODEL_H

#include <map>
#include <vector>
#include "DataStructures.h"

/* A metabolic network together with the media and objective currently applied to it.
   The solver is behind solve(), so the search algorithms work with any LP backend (or a mock) */
class MODEL {
 public:
  RXNSPACE reactions;
  METSPACE metabolites;

  MODEL();
  MODEL(const RXNSPACE &rxns, const METSPACE &mets);
  virtual ~MODEL();

  /* Close every exchange uptake and open the ones of the media components */
  void setMedia(const GROWTH &growth);
  const GROWTH& getMedia() const;
  void setObjective(const OBJECTIVE &obj);
  const OBJECTIVE& getObjective() const;

  /* dir: FORWARD reads/writes the upper bound, REVERSE the lower bound */
  double getBound(int rxnId, int dir) const;
  int setBound(int rxnId, int dir, double value);
  int setBounds(int rxnId, double lb, double ub);

  int addReaction(const REACTION &rxn);
  void addMetabolite(const METABOLITE &met);
  void removeReactions(const vector<int> &rxnIds);
  bool hasReaction(int rxnId) const;

  virtual FBARESULT solve() = 0;
  virtual MODEL* clone() const = 0;
  virtual int writeLp(const char *filename) = 0;

 protected:
  GROWTH currentMedia;
  OBJECTIVE objective;

  friend class BOUNDSCOPE;
};

/* GLPK implementation. Every solve builds a new problem from the current bounds */
class FBAMODEL : public MODEL {
 public:
  FBAMODEL();
  FBAMODEL(const RXNSPACE &rxns, const METSPACE &mets);
  FBARESULT solve();
  MODEL* clone() const;
  int writeLp(const char *filename);
};

/* Transaction over the bounds (and optionally the media and objective) of a MODEL.
   The destructor puts back everything that was changed through the scope unless commit() was called.
   Bounds are recorded per (reaction, direction): a rollback never touches the other direction of a reaction.
   Scopes nest: an inner scope that rolls back restores the values the outer scope left */
class BOUNDSCOPE {
 public:
  BOUNDSCOPE(MODEL &m);
  BOUNDSCOPE(MODEL &m, bool saveCondition);
  ~BOUNDSCOPE();

  void setBound(int rxnId, int dir, double value);
  void setBounds(int rxnId, double lb, double ub);
  void zero(int rxnId, int dir);
  /* Bound of a reaction before the scope first touched it (the current bound if it was never touched) */
  double originalBound(int rxnId, int dir) const;
  bool touched(int rxnId) const;

  void commit();
  void rollback();

 private:
  MODEL &model;
  bool done;
  bool conditionSaved;
  GROWTH savedMedia;
  OBJECTIVE savedObjective;
  map<int, pair<double,double> > savedAll;
  /* (reaction id, direction) --> bound */
  map<pair<int,int>, double> saved;

  void remember(int rxnId, int dir);
  void restore(const map<int, pair<double,double> > &bounds);

  BOUNDSCOPE(const BOUNDSCOPE &other);
  BOUNDSCOPE& operator=(const BOUNDSCOPE &other);
};

#endif
