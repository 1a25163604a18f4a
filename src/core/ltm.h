/*
** $Id: ltm.h $
** Tag methods
** See Copyright Notice in lrt.h
*/

#ifndef ltm_h
#define ltm_h


#include "lobject.h"


/*
* WARNING: if you change the order of this enumeration,
* grep "ORDER TM" and "ORDER OP"
*/
enum class TMS {
  TM_INDEX = LRT_TMINDEX,
  TM_NEWINDEX = LRT_TMNEWINDEX,
  TM_EQ = LRT_TMEQ,
  TM_ADD = LRT_TMADD,
  TM_SUB = LRT_TMSUB,
  TM_MUL = LRT_TMMUL,
  TM_MOD = LRT_TMMOD,
  TM_DIV = LRT_TMDIV,
  TM_IDIV = LRT_TMIDIV,
  TM_UNM = LRT_TMUNM,
  TM_LT = LRT_TMLT,
  TM_LE = LRT_TMLE,
  TM_CALL = LRT_TMCALL,
  TM_N		/* number of elements in the enum */
};


/* arithmetic event of an 'LRT_OP*' operator */
inline TMS lrtT_arithevent(int op) noexcept {
  return static_cast<TMS>(op + static_cast<int>(TMS::TM_ADD));
}


/* basic type names; index 0 is 'no value' */
LRTI_FUNC const char *const lrtT_typenames_[LRT_NUMTYPES + 3];

inline const char* ttypename(int x) noexcept { return lrtT_typenames_[x + 1]; }

LRTI_FUNC const char *const lrtT_eventname[static_cast<int>(TMS::TM_N)];


LRTI_FUNC const char *lrtT_objtypename (const TValue *o);

LRTI_FUNC bool lrtT_gettm (lrt_State *L, const TValue *o, TMS event,
                           TValue *res);
LRTI_FUNC void lrtT_callTM (lrt_State *L, const TValue *f, const TValue *p1,
                            const TValue *p2, const TValue *p3);
LRTI_FUNC void lrtT_callTMres (lrt_State *L, const TValue *f,
                               const TValue *p1, const TValue *p2, StkId res);
LRTI_FUNC void lrtT_trybinTM (lrt_State *L, const TValue *p1, const TValue *p2,
                              StkId res, TMS event);
LRTI_FUNC bool lrtT_callorderTM (lrt_State *L, const TValue *p1,
                                 const TValue *p2, TMS event);

LRTI_FUNC void lrtT_adjustvarargs (lrt_State *L, int nfixparams,
                                   CallInfo *ci, const Proto *p);
LRTI_FUNC void lrtT_getvarargs (lrt_State *L, CallInfo *ci,
                                StkId where, int wanted);


#endif
