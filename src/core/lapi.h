/*
** $Id: lapi.h $
** Auxiliary functions from the runtime API
** See Copyright Notice in lrt.h
*/

#ifndef lapi_h
#define lapi_h


#include "ldebug.h"
#include "llimits.h"
#include "lstate.h"


#if defined(LRT_USE_APICHECK)
#include <cassert>
#define api_check(l,e,msg)	assert(e)
#else
#define api_check(l,e,msg)	((void)(l), lrt_assert((e) && msg))
#endif


/*
** Increment top, growing the stack when needed. Values pushed by the
** API may go beyond the frame top, which then follows them.
*/
inline void api_incr_top(lrt_State* L) {
  L->inctop();
  if (L->getCI()->getTop() < L->getTop())
    L->getCI()->topRef() = L->getTop();
}


/*
** Check if the current frame has at least n elements. Asking for more
** than the frame holds (or a negative count) is an IndexError.
*/
inline void api_checknelems(lrt_State* L, int n) {
  if (l_unlikely(n < 0 ||
                 !L->getStackSubsystem().checkHasElements(L->getCI(), n)))
    lrtG_raise(L, LRT_ERRINDEX, "not enough values on the stack (%d needed)", n);
}


/*
** If a call returns too many multiple returns, the callee may not have
** stack space to accommodate all results. In this case, this function
** increases its stack space ('L->getCI()->getTop()').
*/
inline void adjustresults(lrt_State* L, int nres) noexcept {
  if (nres <= LRT_MULTRET && L->getCI()->getTop() < L->getTop())
    L->getCI()->topRef() = L->getTop();
}

#endif
