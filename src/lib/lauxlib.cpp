/*
** $Id: lauxlib.cpp $
** Auxiliary functions for building native functions and libraries
** See Copyright Notice in lrt.h
*/

#define lauxlib_c
#define LRT_LIB

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "lrt.h"

#include "lauxlib.h"
#include "llimits.h"


/*
** {======================================================
** Error-report functions
** =======================================================
*/


LRTL_API int lrtL_argerror (lrt_State *L, int arg, const char *extramsg) {
  lrt_Debug ar;
  if (!lrt_getstack(L, 0, &ar))  /* no stack frame? */
    return lrtL_error(L, "bad argument #%d (%s)", arg, extramsg);
  lrt_getinfo(L, "n", &ar);
  if (ar.name == nullptr)
    ar.name = "?";
  return lrtL_error(L, "bad argument #%d to '%s' (%s)", arg, ar.name, extramsg);
}


LRTL_API int lrtL_typeerror (lrt_State *L, int arg, const char *tname) {
  const char *typearg;  /* name for the type of the actual argument */
  if (lrt_isnone(L, arg))
    typearg = "no value";
  else
    typearg = lrtL_typename(L, arg);
  const char *msg = lrt_pushfstring(L, "%s expected, got %s", tname, typearg);
  return lrtL_argerror(L, arg, msg);
}


static void tag_error (lrt_State *L, int arg, int tag) {
  lrtL_typeerror(L, arg, lrt_typename(L, tag));
}


/*
** The use of 'lrt_pushfstring' ensures this function does not
** need reserved stack space when called.
*/
LRTL_API void lrtL_where (lrt_State *L, int level) {
  lrt_Debug ar;
  if (lrt_getstack(L, level, &ar)) {  /* check function at level */
    lrt_getinfo(L, "Sl", &ar);
    if (ar.currentline > 0) {  /* is there info? */
      lrt_pushfstring(L, "%s:%d: ", ar.short_src, ar.currentline);
      return;
    }
  }
  lrt_pushfstring(L, "");  /* else, no information available... */
}


/*
** Again, the use of 'lrt_pushvfstring' ensures this function does
** not need reserved stack space when called. (At worst, it generates
** a memory error instead of the given message.)
*/
LRTL_API int lrtL_error (lrt_State *L, const char *fmt, ...) {
  va_list argp;
  va_start(argp, fmt);
  lrtL_where(L, 1);
  const char *where = lrt_tostring(L, -1);
  lrt_pushvfstring(L, fmt, argp);
  va_end(argp);
  lrt_pushfstring(L, "%s%s", where, lrt_tostring(L, -1));
  lrt_replace(L, -3);  /* message replaces the location */
  lrt_pop(L, 1);
  return lrt_error(L);
}

/* }====================================================== */



/*
** {======================================================
** Argument check functions
** =======================================================
*/


LRTL_API void lrtL_checkany (lrt_State *L, int arg) {
  if (l_unlikely(lrt_type(L, arg) == LRT_TNONE))
    lrtL_argerror(L, arg, "value expected");
}


LRTL_API void lrtL_checktype (lrt_State *L, int arg, int t) {
  if (l_unlikely(lrt_type(L, arg) != t))
    tag_error(L, arg, t);
}


LRTL_API lrt_Integer lrtL_checkinteger (lrt_State *L, int arg) {
  int isnum;
  lrt_Integer d = lrt_tointegerx(L, arg, &isnum);
  if (l_unlikely(!isnum)) {
    if (lrt_isnumber(L, arg))
      lrtL_argerror(L, arg, "number has no integer representation");
    else
      tag_error(L, arg, LRT_TNUMBER);
  }
  return d;
}


LRTL_API lrt_Integer lrtL_optinteger (lrt_State *L, int arg,
                                      lrt_Integer def) {
  return lrt_isnoneornil(L, arg) ? def : lrtL_checkinteger(L, arg);
}


LRTL_API const char *lrtL_checklstring (lrt_State *L, int arg, size_t *len) {
  const char *s = lrt_tolstring(L, arg, len);
  if (l_unlikely(!s)) tag_error(L, arg, LRT_TSTRING);
  return s;
}

/* }====================================================== */



/*
** Push the textual form of any value. Numbers and strings keep their
** own text; other values show their type and identity.
*/
LRTL_API const char *lrtL_tolstring (lrt_State *L, int idx, size_t *len) {
  idx = lrt_absindex(L, idx);
  switch (lrt_type(L, idx)) {
    case LRT_TNUMBER:
    case LRT_TSTRING:
      lrt_pushvalue(L, idx);
      break;
    case LRT_TBOOLEAN:
      lrt_pushstring(L, (lrt_toboolean(L, idx) ? "true" : "false"));
      break;
    case LRT_TNIL:
      lrt_pushstring(L, "nil");
      break;
    default:
      lrt_pushfstring(L, "%s: %p", lrtL_typename(L, idx),
                                   lrt_topointer(L, idx));
      break;
  }
  return lrt_tolstring(L, -1, len);
}


/*
** Register all functions in the array 'l' into the table on the top
** of the stack (below optional upvalues). Each function gets the 'nup'
** upvalues.
*/
LRTL_API void lrtL_setfuncs (lrt_State *L, const lrtL_Reg *l, int nup) {
  lrt_ensurestack(L, nup);
  for (; l->name != nullptr; l++) {  /* fill the table with given functions */
    for (int i = 0; i < nup; i++)  /* copy upvalues to the top */
      lrt_pushvalue(L, -nup);
    lrt_pushcclosure(L, l->func, nup);  /* closure with those upvalues */
    lrt_setfield(L, -(nup + 2), l->name);
  }
  lrt_pop(L, nup);  /* remove upvalues */
}



/*
** {======================================================
** Default state: allocator, panic and warnings
** =======================================================
*/

static void *l_alloc (void *ud, void *ptr, size_t osize, size_t nsize) {
  UNUSED(ud); UNUSED(osize);
  if (nsize == 0) {
    std::free(ptr);
    return nullptr;
  }
  else
    return std::realloc(ptr, nsize);
}


static int panic (lrt_State *L) {
  const char *msg = (lrt_type(L, -1) == LRT_TSTRING)
                  ? lrt_tolstring(L, -1, nullptr)
                  : "error object is not a string";
  lrt_writestringerror("PANIC: unprotected error in call to runtime API (%s)\n",
                        msg);
  return 0;  /* return to the host, which receives the exception */
}


/*
** Warning functions:
** warnfoff: warning system is off
** warnfon: ready to start a new message
** warnfcont: previous message is to be continued
*/
static void warnfoff (void *ud, const char *message, int tocont);
static void warnfon (void *ud, const char *message, int tocont);
static void warnfcont (void *ud, const char *message, int tocont);


/*
** Check whether message is a control message. If so, execute the
** control or ignore it if unknown.
*/
static int checkcontrol (lrt_State *L, const char *message, int tocont) {
  if (tocont || *(message++) != '@')  /* not a control message? */
    return 0;
  else {
    if (std::strcmp(message, "off") == 0)
      lrt_setwarnf(L, warnfoff, L);  /* turn warnings off */
    else if (std::strcmp(message, "on") == 0)
      lrt_setwarnf(L, warnfon, L);   /* turn warnings on */
    return 1;  /* it was a control message */
  }
}


static void warnfoff (void *ud, const char *message, int tocont) {
  checkcontrol(static_cast<lrt_State*>(ud), message, tocont);
}


/*
** Writes the message and handle 'tocont', finishing the message
** if needed and setting the next warn function.
*/
static void warnfcont (void *ud, const char *message, int tocont) {
  lrt_State *L = static_cast<lrt_State*>(ud);
  lrt_writestringerror("%s", message);  /* write message */
  if (tocont)  /* not the last part? */
    lrt_setwarnf(L, warnfcont, L);  /* to be continued */
  else {  /* last part */
    lrt_writestringerror("%s", "\n");  /* finish message with end-of-line */
    lrt_setwarnf(L, warnfon, L);  /* next call is a new message */
  }
}


static void warnfon (void *ud, const char *message, int tocont) {
  if (checkcontrol(static_cast<lrt_State*>(ud), message, tocont))  /* control message? */
    return;  /* nothing else to be done */
  lrt_writestringerror("%s", "Lrt warning: ");  /* start a new warning */
  warnfcont(ud, message, tocont);  /* finish processing */
}


LRTL_API lrt_State *lrtL_newstate (void) {
  lrt_State *L = lrt_newstate(l_alloc, nullptr);
  if (l_likely(L)) {
    lrt_atpanic(L, &panic);
    lrt_setwarnf(L, warnfoff, L);  /* default is warnings off */
  }
  return L;
}

/* }====================================================== */
