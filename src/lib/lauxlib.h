/*
** $Id: lauxlib.h $
** Auxiliary functions for building native functions and libraries
** See Copyright Notice in lrt.h
*/

#ifndef lauxlib_h
#define lauxlib_h


#include <cstddef>

#include "lrtconf.h"
#include "lrt.h"
#include "llimits.h"


#define LRTL_API	LRT_API


struct lrtL_Reg {
  const char *name;
  lrt_CFunction func;
};


LRTL_API lrt_State *(lrtL_newstate) (void);

LRTL_API int (lrtL_argerror) (lrt_State *L, int arg, const char *extramsg);
LRTL_API int (lrtL_typeerror) (lrt_State *L, int arg, const char *tname);
LRTL_API void (lrtL_checkany) (lrt_State *L, int arg);
LRTL_API void (lrtL_checktype) (lrt_State *L, int arg, int t);
LRTL_API lrt_Integer (lrtL_checkinteger) (lrt_State *L, int arg);
LRTL_API lrt_Integer (lrtL_optinteger) (lrt_State *L, int arg,
                                        lrt_Integer def);
LRTL_API const char *(lrtL_checklstring) (lrt_State *L, int arg, size_t *l);

LRTL_API void (lrtL_where) (lrt_State *L, int lvl);
LRTL_API int (lrtL_error) (lrt_State *L, const char *fmt, ...);

LRTL_API const char *(lrtL_tolstring) (lrt_State *L, int idx, size_t *len);

LRTL_API void (lrtL_setfuncs) (lrt_State *L, const lrtL_Reg *l, int nup);


/*
** {======================================================
** some useful helpers
** =======================================================
*/

inline void lrtL_argcheck(lrt_State *L, bool cond, int arg,
                          const char *extramsg) {
  if (l_unlikely(!cond))
    lrtL_argerror(L, arg, extramsg);
}

inline const char *lrtL_checkstring(lrt_State *L, int arg) {
  return lrtL_checklstring(L, arg, nullptr);
}

inline const char *lrtL_typename(lrt_State *L, int i) {
  return lrt_typename(L, lrt_type(L, i));
}

template<size_t N>
inline void lrtL_newlib(lrt_State *L, const lrtL_Reg (&l)[N]) {
  lrt_createtable(L, 0, static_cast<int>(N) - 1);
  lrtL_setfuncs(L, l, 0);
}

/* }====================================================== */


#endif
