/*
** $Id: lvm_table.cpp $
** Indexed access through '__index' and '__newindex'
** See Copyright Notice in lrt.h
*/

#define lvm_table_c
#define LRT_CORE

#include "lrt.h"

#include "ldebug.h"
#include "ldo.h"
#include "lobject.h"
#include "lstate.h"
#include "lstring.h"
#include "ltable.h"
#include "ltm.h"
#include "lvm.h"


/*
** Limit for handler chains ('__index' resolving to a value that has
** its own '__index' and so on), to catch loops.
*/
inline constexpr int MAXTAGLOOP = 2000;


/*
** Finish the access 'val = t[key]'. Tables are read raw first and
** consult '__index' only for absent keys; other values always go
** through '__index'. A handler that is a function is called; any
** other handler is indexed in turn.
*/
void VirtualMachine::finishGet (const TValue *t, const TValue *key,
                                StkId val) {
  TValue cur = *t;  /* handlers may move the stack */
  TValue k = *key;
  for (int loop = 0; loop < MAXTAGLOOP; loop++) {
    TValue tm;
    if (cur.isTable()) {
      const TValue *slot = cur.tableValue()->get(&k);
      if (!slot->isNil()) {
        *L->s2v(val) = *slot;
        return;
      }
      if (!lrtT_gettm(L, &cur, TMS::TM_INDEX, &tm)) {  /* no handler? */
        L->s2v(val)->setNil();  /* result is nil */
        return;
      }
    }
    else if (!lrtT_gettm(L, &cur, TMS::TM_INDEX, &tm))
      lrtG_typeerror(L, &cur, "index");  /* no handler */
    if (tm.isFunction()) {  /* is handler a function? */
      lrtT_callTMres(L, &tm, &cur, &k, val);  /* call it */
      return;
    }
    cur = tm;  /* else try to access 'tm[key]' */
  }
  lrtG_runerror(L, "'__index' chain too long; possible loop");
}


/*
** Finish the assignment 't[key] = val'. A table takes the value raw
** when the key is present or there is no '__newindex' handler.
*/
void VirtualMachine::finishSet (const TValue *t, const TValue *key,
                                const TValue *val) {
  TValue cur = *t;
  TValue k = *key, v = *val;
  for (int loop = 0; loop < MAXTAGLOOP; loop++) {
    TValue tm;
    if (cur.isTable()) {
      Table *h = cur.tableValue();
      if (!h->get(&k)->isNil() ||
          !lrtT_gettm(L, &cur, TMS::TM_NEWINDEX, &tm)) {
        h->set(L, &k, &v);  /* raw assignment */
        return;
      }
    }
    else if (!lrtT_gettm(L, &cur, TMS::TM_NEWINDEX, &tm))
      lrtG_typeerror(L, &cur, "index");
    if (tm.isFunction()) {
      lrtT_callTM(L, &tm, &cur, &k, &v);
      return;
    }
    cur = tm;  /* repeat assignment over 'tm' */
  }
  lrtG_runerror(L, "'__newindex' chain too long; possible loop");
}


/*
** Main operation 'ra = #rb'. Only strings and tables have a length.
*/
void VirtualMachine::objlen (StkId ra, const TValue *rb) {
  switch (rb->typeTag()) {
    case ValueTag::TABLE:
      L->s2v(ra)->setInt(l_castU2S(rb->tableValue()->length()));
      return;
    case ValueTag::STRING:
      L->s2v(ra)->setInt(static_cast<lrt_Integer>(rb->stringValue()->length()));
      return;
    default:
      lrtG_typeerror(L, rb, "get length of");
  }
}
