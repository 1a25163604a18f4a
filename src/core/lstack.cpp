/*
** $Id: lstack.cpp $
** Stack of a thread
** See Copyright Notice in lrt.h
*/

#define lstack_c
#define LRT_CORE

#include <climits>
#include <new>

#include "lrt.h"

#include "ldebug.h"
#include "lfunc.h"
#include "lmem.h"
#include "lstack.h"
#include "lstate.h"


/* is 'idx' a pseudo-index (registry or upvalue)? */
static inline bool ispseudo (int idx) noexcept {
  return idx <= LRT_REGISTRYINDEX;
}


void ValueStack::init (lrt_State *L) {
  try {
    slots.resize(BASIC_STACK_SIZE + EXTRA_STACK, absentvalue);
  } catch (const std::bad_alloc&) {
    lrtM_error(L);
  }
  stack_last = BASIC_STACK_SIZE;
  top = 0;
}


void ValueStack::free () noexcept {
  Slots empty(slots.get_allocator());
  slots.swap(empty);
  top = 0;
  stack_last = 0;
}


/*
** Reallocate the stack to a new size. The slots keep their indices;
** only raw 'TValue*' into the old block become invalid. In case of
** allocation failure, raise an error or return false according to
** 'raiseerror'.
*/
int ValueStack::realloc (lrt_State *L, int newsize, int raiseerror) {
  int oldsize = getSize();
  lrt_assert(newsize <= G(L)->getStackLimit() + STACKERRSPACE);
  try {
    if (newsize > oldsize)
      slots.resize(static_cast<size_t>(newsize + EXTRA_STACK), absentvalue);
    else {  /* copy to a smaller block, so that memory is returned */
      Slots smaller(slots.begin(), slots.begin() + newsize + EXTRA_STACK,
                    slots.get_allocator());
      slots.swap(smaller);
    }
  } catch (const std::bad_alloc&) {
    if (raiseerror)
      lrtM_error(L);
    else return 0;  /* do not raise an error */
  }
  stack_last = newsize;
  return 1;
}


/*
** Try to grow the stack by at least 'n' elements. When 'raiseerror'
** is true, raises any error; otherwise, return 0 in case of errors.
*/
int ValueStack::grow (lrt_State *L, int n, int raiseerror) {
  int size = getSize();
  int limit = G(L)->getStackLimit();
  if (l_unlikely(size >= limit + STACKERRSPACE)) {
    /* thread is already using the extra space reserved for errors,
       that is, thread is handling a stack error; cannot grow further
       than that. */
    if (raiseerror)
      L->errorError();  /* error inside message handler */
    return 0;  /* if not 'raiseerror', just signal it */
  }
  else if (size < limit && n < limit) {  /* avoids arithmetic overflows */
    int newsize = (size > INT_MAX / 3 * 2) ? INT_MAX : size + (size >> 1);
    int needed = top + n;
    if (newsize > limit)  /* cannot cross the limit */
      newsize = limit;
    if (newsize < needed)  /* but must respect what was asked for */
      newsize = needed;
    if (l_likely(newsize <= limit))  /* new size is ok? */
      return realloc(L, newsize, raiseerror);
  }
  /* else stack is in its reserved error area */
  realloc(L, limit + STACKERRSPACE, raiseerror);
  if (raiseerror)
    lrtG_raise(L, LRT_ERRSTACK, "stack overflow");
  return 0;
}


/*
** Compute how much of the stack is being used, by computing the
** maximum top of all call frames in the stack and the current top.
*/
int ValueStack::inUse (const lrt_State *L) const noexcept {
  StkId lim = top;
  for (const CallInfo *ci = L->getCI(); ci != nullptr; ci = ci->getPrevious()) {
    if (lim < ci->getTop())
      lim = ci->getTop();
  }
  lrt_assert(lim <= stack_last + EXTRA_STACK);
  int res = lim + 1;  /* part of stack in use */
  if (res < LRT_MINSTACK)
    res = LRT_MINSTACK;  /* ensure a minimum size */
  return res;
}


/*
** If stack size is more than 3 times the current use, reduce that size
** to twice the current use. (So, the final stack size is at most 2/3
** the previous size, and half of its entries are empty.) A stack that
** grew into its error area always goes back below the limit.
*/
void ValueStack::shrink (lrt_State *L) {
  int limit = G(L)->getStackLimit();
  int inuse = inUse(L);
  int max = (inuse > limit / 3) ? limit : inuse * 3;
  if (inuse <= limit && getSize() > max) {
    int nsize = (inuse > limit / 2) ? limit : inuse * 2;
    cast_void(realloc(L, nsize, 0));  /* ok if that fails */
  }
  lrtE_shrinkCI(L);  /* shrink CI list */
}


void ValueStack::clearFrom (StkId from) noexcept {
  for (size_t i = static_cast<size_t>(from); i < slots.size(); i++)
    slots[i].setNil();
}


/*
** Convert an API index into a value. Positive indices up to the top
** limit of the current frame are acceptable (reading above 'top' gives
** an absent nil); negative indices must reach a slot above the frame
** base.
*/
TValue *ValueStack::indexToValue (lrt_State *L, int idx) {
  CallInfo *ci = L->getCI();
  if (idx > 0) {
    StkId o = ci->getFunc() + idx;
    if (l_unlikely(o >= ci->getTop() && o >= top))
      lrtG_raise(L, LRT_ERRINDEX, "invalid stack index %d", idx);
    if (o >= top) return const_cast<TValue*>(G(L)->getNilValue());
    else return at(o);
  }
  else if (!ispseudo(idx)) {  /* negative index */
    if (l_unlikely(idx == 0 || -idx > top - (ci->getFunc() + 1)))
      lrtG_raise(L, LRT_ERRINDEX, "invalid stack index %d", idx);
    return at(top + idx);
  }
  else if (idx == LRT_REGISTRYINDEX)
    return G(L)->getRegistry();
  else {  /* upvalues */
    idx = LRT_REGISTRYINDEX - idx;
    if (l_unlikely(idx > MAXUPVAL + 1))
      lrtG_raise(L, LRT_ERRINDEX, "upvalue index too large");
    const TValue *fn = at(ci->getFunc());
    if (fn->isCClosure()) {  /* native closure? */
      CClosure *func = fn->cClosureValue();
      return (idx <= func->getNumUpvalues()) ? func->getUpvalue(idx - 1)
                                             : const_cast<TValue*>(G(L)->getNilValue());
    }
    else {  /* light native function or bytecode function (through a hook)? */
      return const_cast<TValue*>(G(L)->getNilValue());  /* no upvalues */
    }
  }
}


/*
** Convert a valid actual index (not a pseudo-index) to its slot.
*/
StkId ValueStack::indexToStack (lrt_State *L, int idx) {
  CallInfo *ci = L->getCI();
  if (idx > 0) {
    StkId o = ci->getFunc() + idx;
    if (l_unlikely(o >= top))
      lrtG_raise(L, LRT_ERRINDEX, "invalid stack index %d", idx);
    return o;
  }
  else {  /* non-positive index */
    if (l_unlikely(idx == 0 || ispseudo(idx) ||
                   -idx > top - (ci->getFunc() + 1)))
      lrtG_raise(L, LRT_ERRINDEX, "invalid stack index %d", idx);
    return top + idx;
  }
}


bool ValueStack::checkHasElements (const CallInfo *ci, int n) const noexcept {
  return n < (top - ci->getFunc());
}


int ValueStack::getDepthFromFunc (const CallInfo *ci) const noexcept {
  return cast_int(top - (ci->getFunc() + 1));
}
