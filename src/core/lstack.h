/*
** $Id: lstack.h $
** Stack of a thread
** See Copyright Notice in lrt.h
*/

#ifndef lstack_h
#define lstack_h

#include <vector>

#include "llimits.h"
#include "lobject.h"
#include "lrtallocator.h"


class CallInfo;


/*
** Extra stack space to handle metamethod calls and some other extras.
** These slots are allocated but never counted in the stack size.
*/
inline constexpr int EXTRA_STACK = 5;

inline constexpr int BASIC_STACK_SIZE = 2 * LRT_MINSTACK;

/* space reserved above the limit to report a stack overflow */
inline constexpr int STACKERRSPACE = 200;


/*
** ValueStack - the slots of one thread
**
** Slots are addressed by their absolute index ('StkId'). Slot 0 holds
** the function of the base frame; 'top' is the first free slot and
** 'stack_last' the end of the usable part (EXTRA_STACK more slots are
** allocated after it). Reallocation moves the slots, so raw 'TValue*'
** obtained from 'at' are valid only until the next growth; indices are
** always valid.
**
**   slot 0 ............ base frame function
**   [1, top) .......... values in use
**   [top, stack_last) . free
**   EXTRA_STACK ....... reserved
*/
class ValueStack {
public:
  using Slots = std::vector<TValue, LrtAllocator<TValue>>;

private:
  Slots slots;
  StkId top;         /* first free slot */
  StkId stack_last;  /* end of usable stack */

public:
  explicit ValueStack(global_State* g) noexcept
    : slots(LrtAllocator<TValue>(g)), top(0), stack_last(0) {}

  StkId getTop() const noexcept { return top; }
  void setTop(StkId t) noexcept { top = t; }
  StkId getLast() const noexcept { return stack_last; }

  /* number of usable slots */
  int getSize() const noexcept { return stack_last; }
  bool isAllocated() const noexcept { return !slots.empty(); }

  TValue* at(StkId idx) noexcept { return &slots[static_cast<size_t>(idx)]; }
  const TValue* at(StkId idx) const noexcept {
    return &slots[static_cast<size_t>(idx)];
  }

  void push() noexcept { top++; }
  void pop(int n = 1) noexcept { top -= n; }

  /* free slots above 'top' */
  int available() const noexcept { return stack_last - top; }

  void init(lrt_State* L);
  void free() noexcept;

  int realloc(lrt_State* L, int newsize, int raiseerror);
  int grow(lrt_State* L, int n, int raiseerror);
  void shrink(lrt_State* L);
  int inUse(const lrt_State* L) const noexcept;

  /* ensure 'n' free slots above 'top', growing if needed */
  void ensureSpace(lrt_State* L, int n) {
    if (l_unlikely(stack_last - top <= n))
      grow(L, n, 1);
  }

  /* increment 'top', checking for stack overflow */
  void incTop(lrt_State* L) {
    ensureSpace(L, 1);
    top++;
  }

  /* set slots [from, end of allocation) to nil */
  void clearFrom(StkId from) noexcept;

  /* API index conversion, raising an IndexError for invalid indices */
  TValue* indexToValue(lrt_State* L, int idx);
  StkId indexToStack(lrt_State* L, int idx);

  bool checkHasElements(const CallInfo* ci, int n) const noexcept;
  int getDepthFromFunc(const CallInfo* ci) const noexcept;
};


#endif
