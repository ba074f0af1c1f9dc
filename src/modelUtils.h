#ifndef _MODELUTILS
#define _MODELUTILS

#include <algorithm>
#include "DataStructures.h"

template <class T> void custom_unique(vector<T> &inVector);

/* Utility functions */
int rougheq(const double one, const double two);
int rougheq(const double one, const double two, const double constant);

/* Database id with the compartment suffix (_c0, _e0, ...) removed */
string coreId(const char *name);
/* Exchange, sink, demand and biomass reactions (by name prefix) */
bool isBoundaryName(const char *name);
char dirChar(int dir);
int oppositeDir(int dir);

/* For template classes to work for anything but built-in types (int, double, etc), 
   the definition of the function has to be in the same file as the prototype.
   So I put them here... */
template <class T>
void custom_unique(std::vector<T> &inVector) {
  typename std::vector<T>::iterator iter;
  std::sort(inVector.begin(), inVector.end());
  iter = std::unique(inVector.begin(), inVector.end());
  inVector.resize(iter-inVector.begin());
}

#endif
