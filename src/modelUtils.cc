#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include "DataStructures.h"
#include "modelUtils.h"

/* Test if two variables are equal within 0.1 */
int rougheq(const double one, const double two){
  if(one < two + 0.1 && one > two - 0.1){ return 1;}
  else{ return 0; }
}

/* Test if two variables are equal within a constant */
int rougheq(const double one, const double two, const double constant){
  if(one < two + constant && one > two - constant){ return 1;}
  else{ return 0; }
}

/* rxn00001_c0 --> rxn00001. Only a trailing _<lowercase letter><digits> is removed */
string coreId(const char *name) {
  string full(name);
  size_t pos = full.rfind('_');
  if(pos == string::npos || pos + 2 > full.size()) { return full; }
  if(full[pos+1] < 'a' || full[pos+1] > 'z') { return full; }
  if(pos + 2 == full.size()) { return full; }
  for(size_t i=pos+2; i<full.size(); i++) {
    if(full[i] < '0' || full[i] > '9') { return full; }
  }
  return full.substr(0, pos);
}

bool isBoundaryName(const char *name) {
  return strncmp(name, "EX_", 3) == 0 || strncmp(name, "SK_", 3) == 0 ||
    strncmp(name, "DM_", 3) == 0 || strncmp(name, "bio", 3) == 0;
}

char dirChar(int dir) {
  if(dir == FORWARD) { return '>'; }
  return '<';
}

int oppositeDir(int dir) {
  return -dir;
}
