/*
** $Id: ltm.cpp $
** Tag methods
** See Copyright Notice in lrt.h
*/

#define ltm_c
#define LRT_CORE

#include "lrt.h"

#include "ldebug.h"
#include "ldo.h"
#include "lobject.h"
#include "lstate.h"
#include "ltm.h"


const char *const lrtT_typenames_[LRT_NUMTYPES + 3] = {
  "no value",
  "nil", "boolean", "number", "string", "table", "function",
  "userdata", "thread",
  "upvalue", "proto" /* these last cases are used for tests only */
};


const char *const lrtT_eventname[static_cast<int>(TMS::TM_N)] = {  /* ORDER TM */
  "__index", "__newindex", "__eq",
  "__add", "__sub", "__mul", "__mod", "__div", "__idiv", "__unm",
  "__lt", "__le", "__call"
};


const char *lrtT_objtypename (const TValue *o) {
  return ttypename(o->baseType());
}


/*
** Ask the resolver for the handler of 'event' for value 'o'. The
** operand goes on the stack for the resolver, which may push the
** handler; the stack is restored before returning. A nil handler
** counts as absent.
*/
bool lrtT_gettm (lrt_State *L, const TValue *o, TMS event, TValue *res) {
  global_State *g = G(L);
  lrt_MetaResolver resolver = g->getResolver();
  if (resolver == nullptr)
    return false;  /* no resolver: no metamethods */
  TValue operand = *o;  /* 'o' may live in the stack */
  lrtD_checkstack(L, LRT_MINSTACK);  /* give the resolver some room */
  StkId base = L->getTop();
  *L->s2v(base) = operand;
  L->setTop(base + 1);
  int idx = cast_int(base - L->getCI()->getFunc());
  int found = resolver(L, g->getUdResolver(), idx, static_cast<int>(event));
  bool ok = false;
  if (found && L->getTop() > base + 1) {
    *res = *L->s2v(L->getTop() - 1);
    ok = !res->isNil();
  }
  L->setTop(base);
  return ok;
}


/*
** Call a handler with three arguments and no results ('__newindex').
** Arguments are copied first, as growing the stack moves its slots.
*/
void lrtT_callTM (lrt_State *L, const TValue *f, const TValue *p1,
                  const TValue *p2, const TValue *p3) {
  TValue tf = *f, a1 = *p1, a2 = *p2, a3 = *p3;
  lrtD_checkstack(L, 4);
  StkId func = L->getTop();
  *L->s2v(func) = tf;  /* push function */
  *L->s2v(func + 1) = a1;  /* 1st argument */
  *L->s2v(func + 2) = a2;  /* 2nd argument */
  *L->s2v(func + 3) = a3;  /* 3rd argument */
  L->setTop(func + 4);
  /* handlers run as non-yieldable calls */
  L->callNoYield(func, 0);
}


/*
** Call a handler with two arguments and store its only result in
** slot 'res'.
*/
void lrtT_callTMres (lrt_State *L, const TValue *f, const TValue *p1,
                     const TValue *p2, StkId res) {
  TValue tf = *f, a1 = *p1, a2 = *p2;
  lrtD_checkstack(L, 3);
  StkId func = L->getTop();
  *L->s2v(func) = tf;  /* push function */
  *L->s2v(func + 1) = a1;  /* 1st argument */
  *L->s2v(func + 2) = a2;  /* 2nd argument */
  L->setTop(func + 3);
  L->callNoYield(func, 1);
  *L->s2v(res) = *L->s2v(func);  /* move result to its place */
  L->setTop(func);
}


void lrtT_trybinTM (lrt_State *L, const TValue *p1, const TValue *p2,
                    StkId res, TMS event) {
  TValue v1 = *p1, v2 = *p2;
  TValue tm;
  if (!lrtT_gettm(L, &v1, event, &tm) &&  /* try first operand */
      !lrtT_gettm(L, &v2, event, &tm)) {  /* try second operand */
    if (event == TMS::TM_UNM)
      lrtG_typeerror(L, &v1, "perform arithmetic on");
    lrtG_opinterror(L, &v1, &v2, "perform arithmetic on");
  }
  lrtT_callTMres(L, &tm, &v1, &v2, res);
}


/*
** Call an order handler ('__lt' or '__le'). The result is the
** truth value of what the handler returns.
*/
bool lrtT_callorderTM (lrt_State *L, const TValue *p1, const TValue *p2,
                       TMS event) {
  TValue v1 = *p1, v2 = *p2;
  TValue tm;
  if (lrtT_gettm(L, &v1, event, &tm) ||  /* try first operand */
      lrtT_gettm(L, &v2, event, &tm)) {  /* try second operand */
    StkId top = L->getTop();
    lrtT_callTMres(L, &tm, &v1, &v2, top);
    return !L->s2v(top)->isFalseLike();
  }
  lrtG_ordererror(L, &v1, &v2);  /* no metamethod found */
}


/*
** Prepare the frame of a vararg function: the function and its fixed
** parameters are copied above the actual arguments, so that the extra
** arguments stay below the new frame base.
*/
void lrtT_adjustvarargs (lrt_State *L, int nfixparams, CallInfo *ci,
                         const Proto *p) {
  int i;
  int actual = cast_int(L->getTop() - ci->getFunc()) - 1;  /* number of arguments */
  int nextra = actual - nfixparams;  /* number of extra arguments */
  ci->setExtraArgs(nextra);
  lrtD_checkstack(L, p->getMaxStackSize() + 1);
  /* copy function to the top of the stack */
  *L->s2v(L->getTop()) = *L->s2v(ci->getFunc());
  L->getStackSubsystem().push();
  /* move fixed parameters to the top of the stack */
  for (i = 1; i <= nfixparams; i++) {
    *L->s2v(L->getTop()) = *L->s2v(ci->getFunc() + i);
    L->getStackSubsystem().push();
    L->s2v(ci->getFunc() + i)->setNil();  /* erase original parameter (for GC) */
  }
  ci->funcRef() += actual + 1;
  ci->topRef() += actual + 1;
  lrt_assert(L->getTop() <= ci->getTop() &&
             ci->getTop() <= L->getStackSubsystem().getLast());
}


void lrtT_getvarargs (lrt_State *L, CallInfo *ci, StkId where, int wanted) {
  int i;
  int nextra = ci->getExtraArgs();
  if (wanted < 0) {
    wanted = nextra;  /* get all extra arguments available */
    lrtD_checkstack(L, nextra);  /* ensure stack space */
    L->setTop(where + nextra);  /* next instruction will need top */
  }
  for (i = 0; i < wanted && i < nextra; i++)
    *L->s2v(where + i) = *L->s2v(ci->getFunc() - nextra + i);
  for (; i < wanted; i++)   /* complete required results with nil */
    L->s2v(where + i)->setNil();
}
