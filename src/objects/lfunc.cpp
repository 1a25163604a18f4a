/*
** $Id: lfunc.cpp $
** Auxiliary functions to manipulate prototypes and closures
** See Copyright Notice in lrt.h
*/

#define lfunc_c
#define LRT_CORE

#include "lrt.h"

#include "lfunc.h"
#include "lgc.h"
#include "lstate.h"


TValue *UpVal::getValue () noexcept {
  return isOpen() ? thread->s2v(level) : &value;
}


Proto *lrtF_newproto (lrt_State *L) {
  return lrtC_newobj<Proto>(L, sizeof(Proto), G(L));
}


LClosure *lrtF_newLclosure (lrt_State *L, Proto *p) {
  int nup = p->getUpvaluesSize();
  return lrtC_newobj<LClosure>(L, LClosure::allocSize(nup), p, nup);
}


CClosure *lrtF_newCclosure (lrt_State *L, lrt_CFunction f, int nup) {
  return lrtC_newobj<CClosure>(L, CClosure::allocSize(nup), f, nup);
}


/*
** fill a closure with new closed upvalues
*/
void lrtF_initupvals (lrt_State *L, LClosure *cl) {
  for (int i = 0; i < cl->getNumUpvalues(); i++)
    cl->setUpval(i, lrtC_newobj<UpVal>(L, sizeof(UpVal)));
}


/*
** Find and reuse, or create if it does not exist, an upvalue at the
** given level. The list of open upvalues is sorted by decreasing level.
*/
UpVal *lrtF_findupval (lrt_State *L, StkId level) {
  UpVal **pp = L->getOpenUpvalPtr();
  UpVal *p;
  while ((p = *pp) != nullptr && p->getLevel() >= level) {  /* search for it */
    if (p->getLevel() == level)  /* corresponding upvalue? */
      return p;  /* return it */
    pp = p->getOpenNextPtr();
  }
  /* not found: create a new upvalue after 'pp' */
  UpVal *uv = lrtC_newobj<UpVal>(L, sizeof(UpVal));
  uv->open(L, level);
  uv->setOpenNext(*pp);
  *pp = uv;
  return uv;
}


/*
** Close all upvalues up to the given stack level: each one takes a copy
** of its stack slot and leaves the list of open upvalues.
*/
void lrtF_closeupval (lrt_State *L, StkId level) {
  UpVal *uv;
  while ((uv = L->getOpenUpval()) != nullptr && uv->getLevel() >= level) {
    lrt_assert(uv->getLevel() < L->getStackSubsystem().getSize());
    L->setOpenUpval(uv->getOpenNext());
    uv->setOpenNext(nullptr);
    uv->close(*L->s2v(uv->getLevel()));
  }
}
