/*
** $Id: lfunc.h $
** Auxiliary functions to manipulate prototypes and closures
** See Copyright Notice in lrt.h
*/

#ifndef lfunc_h
#define lfunc_h


#include "lobject.h"


/* maximum number of upvalues in a closure (both native and bytecode) */
inline constexpr int MAXUPVAL = 255;


LRTI_FUNC Proto *lrtF_newproto (lrt_State *L);
LRTI_FUNC LClosure *lrtF_newLclosure (lrt_State *L, Proto *p);
LRTI_FUNC CClosure *lrtF_newCclosure (lrt_State *L, lrt_CFunction f, int nup);
LRTI_FUNC void lrtF_initupvals (lrt_State *L, LClosure *cl);
LRTI_FUNC UpVal *lrtF_findupval (lrt_State *L, StkId level);
LRTI_FUNC void lrtF_closeupval (lrt_State *L, StkId level);


#endif
