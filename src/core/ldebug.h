/*
** $Id: ldebug.h $
** Auxiliary functions from Debug Interface module
** See Copyright Notice in lrt.h
*/

#ifndef ldebug_h
#define ldebug_h


#include "lstate.h"


/* program counter of the instruction being run by a bytecode frame */
LRTI_FUNC int lrtG_currentpc (lrt_State *L, CallInfo *ci);
LRTI_FUNC int lrtG_getfuncline (const Proto *f, int pc);

LRTI_FUNC l_noret lrtG_typeerror (lrt_State *L, const TValue *o,
                                                const char *opname);
LRTI_FUNC l_noret lrtG_callerror (lrt_State *L, const TValue *o);
LRTI_FUNC l_noret lrtG_opinterror (lrt_State *L, const TValue *p1,
                                                 const TValue *p2,
                                                 const char *msg);
LRTI_FUNC l_noret lrtG_ordererror (lrt_State *L, const TValue *p1,
                                                 const TValue *p2);
LRTI_FUNC l_noret lrtG_raise (lrt_State *L, int status, const char *fmt, ...);
LRTI_FUNC l_noret lrtG_runerror (lrt_State *L, const char *fmt, ...);
LRTI_FUNC const char *lrtG_addinfo (lrt_State *L, const char *msg,
                                                  TString *src, int line);
LRTI_FUNC l_noret lrtG_errormsg (lrt_State *L, int status);

#endif
