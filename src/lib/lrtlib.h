/*
** $Id: lrtlib.h $
** Runtime standard libraries
** See Copyright Notice in lrt.h
*/

#ifndef lrtlib_h
#define lrtlib_h

#include "lrt.h"


#define LRT_COLIBNAME	"coroutine"


/* base functions in the globals table plus the 'coroutine' table */
LRT_API void (lrtL_openbase) (lrt_State *L);


#endif
