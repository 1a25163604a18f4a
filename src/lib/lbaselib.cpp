/*
** $Id: lbaselib.cpp $
** Basic library and coroutine functions
** See Copyright Notice in lrt.h
*/

#define lbaselib_c
#define LRT_LIB

#include "lrt.h"

#include "lauxlib.h"
#include "lrtlib.h"


static int lrtB_warn (lrt_State *L) {
  int n = lrt_gettop(L);  /* number of arguments */
  lrtL_checkstring(L, 1);  /* at least one argument */
  for (int i = 2; i <= n; i++)
    lrtL_checkstring(L, i);  /* make sure all arguments are strings */
  for (int i = 1; i < n; i++)  /* compose warning */
    lrt_warning(L, lrt_tostring(L, i), 1);
  lrt_warning(L, lrt_tostring(L, n), 0);  /* close warning */
  return 0;
}


static int lrtB_error (lrt_State *L) {
  int level = static_cast<int>(lrtL_optinteger(L, 2, 1));
  lrt_settop(L, 1);
  if (lrt_type(L, 1) == LRT_TSTRING && level > 0) {
    lrtL_where(L, level);   /* add extra information */
    lrt_pushfstring(L, "%s%s", lrt_tostring(L, 2), lrt_tostring(L, 1));
    lrt_replace(L, 1);
    lrt_settop(L, 1);
  }
  return lrt_error(L);
}


static int lrtB_type (lrt_State *L) {
  int t = lrt_type(L, 1);
  lrtL_argcheck(L, t != LRT_TNONE, 1, "value expected");
  lrt_pushstring(L, lrt_typename(L, t));
  return 1;
}


static int lrtB_tostring (lrt_State *L) {
  lrtL_checkany(L, 1);
  lrtL_tolstring(L, 1, nullptr);
  return 1;
}


static int lrtB_select (lrt_State *L) {
  int n = lrt_gettop(L);
  if (lrt_type(L, 1) == LRT_TSTRING && *lrt_tostring(L, 1) == '#') {
    lrt_pushinteger(L, n-1);
    return 1;
  }
  else {
    lrt_Integer i = lrtL_checkinteger(L, 1);
    if (i < 0) i = n + i;
    else if (i > n) i = n;
    lrtL_argcheck(L, 1 <= i, 1, "index out of range");
    return n - static_cast<int>(i);
  }
}


/*
** Continuation function for 'pcall'. The function already pushed a
** 'true' before doing the call, so in case of success 'finishpcall'
** only has to return everything in the stack.
*/
static int finishpcall (lrt_State *L, int status, lrt_KContext extra) {
  if (l_unlikely(status != LRT_OK && status != LRT_YIELD)) {  /* error? */
    lrt_pushboolean(L, 0);  /* first result (false) */
    lrt_pushvalue(L, -2);  /* error message */
    return 2;  /* return false, msg */
  }
  else
    return lrt_gettop(L) - static_cast<int>(extra);  /* return all results */
}


static int lrtB_pcall (lrt_State *L) {
  int status;
  lrtL_checkany(L, 1);
  lrt_pushboolean(L, 1);  /* first result if no errors */
  lrt_insert(L, 1);  /* put it in place */
  status = lrt_pcallk(L, lrt_gettop(L) - 2, LRT_MULTRET, 0, 0, finishpcall);
  return finishpcall(L, status, 0);
}



/*
** {======================================================
** Coroutines
** =======================================================
*/

static lrt_State *getco (lrt_State *L) {
  lrt_State *co = lrt_tothread(L, 1);
  if (l_unlikely(co == nullptr))
    lrtL_typeerror(L, 1, "coroutine");
  return co;
}


/*
** Resumes a coroutine. Returns the number of results for non-error
** cases or -1 for errors.
*/
static int auxresume (lrt_State *L, lrt_State *co, int narg) {
  int status, nres;
  if (l_unlikely(!lrt_checkstack(co, narg))) {
    lrt_pushstring(L, "too many arguments to resume");
    return -1;  /* error flag */
  }
  lrt_xmove(L, co, narg);
  status = lrt_resume(co, L, narg, &nres);
  if (l_likely(status == LRT_OK || status == LRT_YIELD)) {
    if (l_unlikely(!lrt_checkstack(L, nres + 1))) {
      lrt_pop(co, nres);  /* remove results anyway */
      lrt_pushstring(L, "too many results to resume");
      return -1;  /* error flag */
    }
    lrt_xmove(co, L, nres);  /* move yielded values */
    return nres;
  }
  else {
    lrt_xmove(co, L, 1);  /* move error message */
    return -1;  /* error flag */
  }
}


static int lrtB_coresume (lrt_State *L) {
  lrt_State *co = getco(L);
  int r = auxresume(L, co, lrt_gettop(L) - 1);
  if (l_unlikely(r < 0)) {
    lrt_pushboolean(L, 0);
    lrt_insert(L, -2);
    return 2;  /* return false + error message */
  }
  else {
    lrt_pushboolean(L, 1);
    lrt_insert(L, -(r + 1));
    return r + 1;  /* return true + 'resume' returns */
  }
}


static int auxwrap (lrt_State *L) {
  lrt_State *co = lrt_tothread(L, lrt_upvalueindex(1));
  int r = auxresume(L, co, lrt_gettop(L));
  if (l_unlikely(r < 0)) {  /* error? */
    int stat = lrt_status(co);
    if (stat != LRT_OK && stat != LRT_YIELD) {  /* error in the coroutine? */
      stat = lrt_closethread(co, L);  /* close its variables */
      lrt_xmove(co, L, 1);  /* move error message to the caller */
    }
    if (lrt_type(L, -1) == LRT_TSTRING) {  /* error object is a string? */
      lrtL_where(L, 1);  /* get extra info, if available */
      lrt_pushfstring(L, "%s%s", lrt_tostring(L, -1), lrt_tostring(L, -2));
      lrt_replace(L, -3);
      lrt_pop(L, 1);
    }
    return lrt_error(L);  /* propagate error */
  }
  return r;
}


static int lrtB_cocreate (lrt_State *L) {
  lrt_State *NL;
  lrtL_checktype(L, 1, LRT_TFUNCTION);
  NL = lrt_newthread(L);
  lrt_pushvalue(L, 1);  /* move function to top */
  lrt_xmove(L, NL, 1);  /* move function from L to NL */
  return 1;
}


static int lrtB_cowrap (lrt_State *L) {
  lrtB_cocreate(L);
  lrt_pushcclosure(L, auxwrap, 1);
  return 1;
}


static int lrtB_yield (lrt_State *L) {
  return lrt_yield(L, lrt_gettop(L));
}


static const char *const statname[] =
  {"suspended", "running", "suspended", "normal", "dead"};  /* ORDER LRT_CO */


static int lrtB_costatus (lrt_State *L) {
  lrt_State *co = getco(L);
  lrt_pushstring(L, statname[lrt_costatus(L, co)]);
  return 1;
}


static int lrtB_yieldable (lrt_State *L) {
  lrt_State *co = lrt_isnone(L, 1) ? L : getco(L);
  lrt_pushboolean(L, lrt_isyieldable(co));
  return 1;
}


static int lrtB_corunning (lrt_State *L) {
  int ismain = lrt_pushthread(L);
  lrt_pushboolean(L, ismain);
  return 2;
}


static const lrtL_Reg co_funcs[] = {
  {"create", lrtB_cocreate},
  {"resume", lrtB_coresume},
  {"running", lrtB_corunning},
  {"status", lrtB_costatus},
  {"wrap", lrtB_cowrap},
  {"yield", lrtB_yield},
  {"isyieldable", lrtB_yieldable},
  {nullptr, nullptr}
};

/* }====================================================== */


static const lrtL_Reg base_funcs[] = {
  {"error", lrtB_error},
  {"pcall", lrtB_pcall},
  {"select", lrtB_select},
  {"tostring", lrtB_tostring},
  {"type", lrtB_type},
  {"warn", lrtB_warn},
  {nullptr, nullptr}
};


LRT_API void lrtL_openbase (lrt_State *L) {
  /* open lib into global table */
  lrt_pushglobaltable(L);
  lrtL_setfuncs(L, base_funcs, 0);
  /* set global _G */
  lrt_pushvalue(L, -1);
  lrt_setfield(L, -2, "_G");
  /* coroutine table */
  lrtL_newlib(L, co_funcs);
  lrt_setfield(L, -2, LRT_COLIBNAME);
  lrt_pop(L, 1);  /* pop global table */
}
