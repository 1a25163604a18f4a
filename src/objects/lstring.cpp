/*
** $Id: lstring.cpp $
** String table (keeps all strings handled by the runtime)
** See Copyright Notice in lrt.h
*/

#define lstring_c
#define LRT_CORE

#include <cstring>

#include "lrt.h"

#include "ldebug.h"
#include "ldo.h"
#include "lgc.h"
#include "lmem.h"
#include "lobject.h"
#include "lstate.h"
#include "lstring.h"


/*
** Compare two strings 'ts1' x 'ts2', returning an integer less-equal-
** -greater than zero if 'ts1' is less-equal-greater than 'ts2'.
** The code is a little tricky because it allows '\0' in the strings
** and it uses 'strcoll' (to respect locales) for each segment
** of the strings. Note that segments can compare equal but still
** have different lengths.
*/
int lrtS_cmp (const TString *ts1, const TString *ts2) {
  const char *s1 = ts1->c_str();
  size_t rl1 = ts1->length();  /* real length */
  const char *s2 = ts2->c_str();
  size_t rl2 = ts2->length();
  for (;;) {  /* for each segment */
    int temp = std::strcoll(s1, s2);
    if (temp != 0)  /* not equal? */
      return temp;  /* done */
    else {  /* strings are equal up to a '\0' */
      size_t zl1 = std::strlen(s1);  /* index of first '\0' in 's1' */
      size_t zl2 = std::strlen(s2);  /* index of first '\0' in 's2' */
      if (zl2 == rl2)  /* 's2' is finished? */
        return (zl1 == rl1) ? 0 : 1;  /* check 's1' */
      else if (zl1 == rl1)  /* 's1' is finished? */
        return -1;  /* 's1' is less than 's2' ('s2' is not finished) */
      /* both strings longer than 'zl'; go on comparing after the '\0' */
      s1 += zl1 + 1; rl1 -= zl1 + 1; s2 += zl2 + 1; rl2 -= zl2 + 1;
    }
  }
}


/*
** Create the preallocated memory-error message. It is a root of the
** collector, so it is never freed before the state closes.
*/
void lrtS_init (lrt_State *L) {
  G(L)->setMemErrMsg(lrtS_newliteral(L, MEMERRMSG));
}


/*
** Intern a string: return the existing object with the same contents
** or create a new one.
*/
TString *lrtS_newlstr (lrt_State *L, const char *str, size_t l) {
  StringMap &strt = G(L)->getStringTable();
  auto it = strt.find(std::string_view(str, l));
  if (it != strt.end())
    return it->second;  /* found */
  if (l_unlikely(l >= (MAX_SIZE - sizeof(TString))))
    lrtM_toobig(L);
  TString *ts = lrtC_newobj<TString>(L, TString::allocSize(l), l);
  std::memcpy(ts->contents(), str, l * sizeof(char));
  ts->contents()[l] = '\0';  /* ending 0 */
  strt.emplace(ts->view(), ts);
  return ts;
}


TString *lrtS_new (lrt_State *L, const char *str) {
  return lrtS_newlstr(L, str, std::strlen(str));
}


/*
** Remove a string from the table (before freeing it). A string that
** never made it into the table (its insertion failed) has nothing to
** remove.
*/
void lrtS_remove (global_State *g, TString *ts) noexcept {
  StringMap &strt = g->getStringTable();
  auto it = strt.find(ts->view());
  if (it != strt.end() && it->second == ts)
    strt.erase(it);
}


Udata *lrtS_newudata (lrt_State *L, size_t s, int tag) {
  if (l_unlikely(s > MAX_SIZE - Udata::memOffset()))
    lrtM_toobig(L);
  return lrtC_newobj<Udata>(L, Udata::allocSize(s), s, tag);
}
