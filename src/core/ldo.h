/*
** $Id: ldo.h $
** Stack and Call structure of the runtime
** See Copyright Notice in lrt.h
*/

#ifndef ldo_h
#define ldo_h


#include "llimits.h"
#include "lobject.h"
#include "lstate.h"


/*
** Recover point of a protected call. 'rawRunProtected' keeps one on
** its native frame; an 'LrtException' names the one it is meant for.
*/
struct lrt_longjmp {
  struct lrt_longjmp *previous;
  TStatus status;  /* error code */
};


/* Ensure stack has space for n elements */
inline void lrtD_checkstack(lrt_State* L, int n) {
  L->getStackSubsystem().ensureSpace(L, n);
}


/*
** Run the installed compiler over 'text' in protected mode. On success
** the new function is on the top of the stack; otherwise the error
** message is.
*/
LRTI_FUNC TStatus lrtD_compile (lrt_State *L, const char *text, size_t len,
                                const char *chunkname);

#endif
