/*
** $Id: lrt.h $
** lrt - a register/stack based scripting runtime core
** See Copyright Notice at the end of this file
*/


#ifndef lrt_h
#define lrt_h

#include <cstdarg>
#include <cstddef>


#include "lrtconf.h"


#define LRT_VERSION_MAJOR	"1"
#define LRT_VERSION_MINOR	"0"
#define LRT_VERSION_RELEASE	"0"

#define LRT_VERSION_NUM			100
#define LRT_VERSION_RELEASE_NUM		(LRT_VERSION_NUM * 100 + 0)

#define LRT_VERSION	"lrt " LRT_VERSION_MAJOR "." LRT_VERSION_MINOR
#define LRT_RELEASE	LRT_VERSION "." LRT_VERSION_RELEASE
#define LRT_COPYRIGHT	LRT_RELEASE "  Copyright (C) 1994-2026 Lua.org, PUC-Rio"


/* option for multiple returns in 'lrt_pcall' and 'lrt_call' */
#define LRT_MULTRET	(-1)


/*
** Pseudo-indices
** (-LRTI_MAXSTACK is the minimum valid index; we keep some free empty
** space after that to help overflow detection)
*/
#define LRT_REGISTRYINDEX	(-LRTI_MAXSTACK - 1000)
#define lrt_upvalueindex(i)	(LRT_REGISTRYINDEX - (i))


/*
** Thread status and error kinds
*/
#define LRT_OK		0
#define LRT_YIELD	1
#define LRT_ERRRUN	2	/* RuntimeError */
#define LRT_ERRSYNTAX	3	/* CompileError */
#define LRT_ERRMEM	4
#define LRT_ERRERR	5	/* error while handling an error */
#define LRT_ERRCONV	6	/* ConversionError */
#define LRT_ERRINDEX	7	/* IndexError */
#define LRT_ERRSTACK	8	/* StackOverflowError */
#define LRT_ERRCORO	9	/* CoroutineStateError */
#define LRT_ERRYIELD	10	/* YieldError */


/*
** Coroutine states (see 'lrt_costatus')
*/
#define LRT_COCREATED	0	/* created, never resumed */
#define LRT_CORUNNING	1
#define LRT_COYIELDED	2	/* suspended by a yield */
#define LRT_CONORMAL	3	/* active, but resumed another thread */
#define LRT_CODEAD	4


class lrt_State;


/*
** Exception used to unwind the native stack when an error is raised.
** Protected calls catch the ones addressed to them ('handler'); it
** reaches the host only when the thread has no protected call active.
*/
struct lrt_longjmp;

class LrtException {
private:
  int status_;
  struct lrt_longjmp *handler_;

public:
  explicit LrtException(int status, struct lrt_longjmp *handler = nullptr) noexcept
    : status_(status), handler_(handler) {}

  int status() const noexcept { return status_; }
  struct lrt_longjmp* handler() const noexcept { return handler_; }
};


/*
** basic types
*/
#define LRT_TNONE		(-1)

#define LRT_TNIL		0
#define LRT_TBOOLEAN		1
#define LRT_TNUMBER		2
#define LRT_TSTRING		3
#define LRT_TTABLE		4
#define LRT_TFUNCTION		5
#define LRT_TUSERDATA		6
#define LRT_TTHREAD		7

#define LRT_NUMTYPES		8



/* minimum stack available to a native function */
#define LRT_MINSTACK	20


/* predefined values in the registry */
#define LRT_RIDX_MAINTHREAD	1
#define LRT_RIDX_GLOBALS	2
#define LRT_RIDX_LAST		LRT_RIDX_GLOBALS


/* type of numbers */
typedef LRT_NUMBER lrt_Number;


/* type for integer functions */
typedef LRT_INTEGER lrt_Integer;

/* unsigned integer type */
typedef LRT_UNSIGNED lrt_Unsigned;

/* type for continuation-function contexts */
typedef LRT_KCONTEXT lrt_KContext;


/*
** Type for native functions registered with the runtime
*/
typedef int (*lrt_CFunction) (lrt_State *L);

/*
** Type for continuation functions
*/
typedef int (*lrt_KFunction) (lrt_State *L, int status, lrt_KContext ctx);


/*
** Type for memory-allocation functions
*/
typedef void * (*lrt_Alloc) (void *ud, void *ptr, size_t osize, size_t nsize);


/*
** Type for warning functions
*/
typedef void (*lrt_WarnFunction) (void *ud, const char *msg, int tocont);


/*
** Type for the compiler collaborator: translates 'text' into a function
** and pushes it (returning LRT_OK), or pushes an error message (returning
** LRT_ERRSYNTAX).
*/
typedef int (*lrt_Compiler) (lrt_State *L, void *ud, const char *text,
                             size_t len, const char *chunkname);


/*
** Type for the metamethod resolver. The operand is at stack index 'idx';
** a resolver that knows a handler for 'event' pushes it and returns 1,
** otherwise it pushes nothing and returns 0.
*/
typedef int (*lrt_MetaResolver) (lrt_State *L, void *ud, int idx, int event);


/*
** Type for the allocation hook: called for every collectable object
** created, with its basic type (LRT_T*, or -1 for internal objects).
*/
typedef void (*lrt_AllocHook) (void *ud, int kind, size_t size);


/*
** Metamethod events seen by the resolver
*/
#define LRT_TMINDEX	0
#define LRT_TMNEWINDEX	1
#define LRT_TMEQ	2
#define LRT_TMADD	3
#define LRT_TMSUB	4
#define LRT_TMMUL	5
#define LRT_TMMOD	6
#define LRT_TMDIV	7
#define LRT_TMIDIV	8
#define LRT_TMUNM	9
#define LRT_TMLT	10
#define LRT_TMLE	11
#define LRT_TMCALL	12

#define LRT_NUMTMS	13


/*
** state manipulation
*/
LRT_API lrt_State *(lrt_newstate) (lrt_Alloc f, void *ud);
LRT_API void       (lrt_close) (lrt_State *L);
LRT_API lrt_State *(lrt_newthread) (lrt_State *L);
LRT_API int        (lrt_closethread) (lrt_State *L, lrt_State *from);

LRT_API lrt_CFunction (lrt_atpanic) (lrt_State *L, lrt_CFunction panicf);

LRT_API lrt_Number (lrt_version) (lrt_State *L);

LRT_API int   (lrt_setstacklimit) (lrt_State *L, int limit);


/*
** basic stack manipulation
*/
LRT_API int   (lrt_absindex) (lrt_State *L, int idx);
LRT_API int   (lrt_gettop) (lrt_State *L);
LRT_API void  (lrt_settop) (lrt_State *L, int idx);
LRT_API void  (lrt_pushvalue) (lrt_State *L, int idx);
LRT_API void  (lrt_rotate) (lrt_State *L, int idx, int n);
LRT_API void  (lrt_copy) (lrt_State *L, int fromidx, int toidx);
LRT_API int   (lrt_checkstack) (lrt_State *L, int n);
LRT_API void  (lrt_ensurestack) (lrt_State *L, int n);

LRT_API void  (lrt_xmove) (lrt_State *from, lrt_State *to, int n);


/*
** access functions (stack -> C)
*/

LRT_API int             (lrt_isnumber) (lrt_State *L, int idx);
LRT_API int             (lrt_isstring) (lrt_State *L, int idx);
LRT_API int             (lrt_iscfunction) (lrt_State *L, int idx);
LRT_API int             (lrt_isinteger) (lrt_State *L, int idx);
LRT_API int             (lrt_isuserdata) (lrt_State *L, int idx);
LRT_API int             (lrt_type) (lrt_State *L, int idx);
LRT_API const char     *(lrt_typename) (lrt_State *L, int tp);

LRT_API lrt_Number      (lrt_tonumberx) (lrt_State *L, int idx, int *isnum);
LRT_API lrt_Integer     (lrt_tointegerx) (lrt_State *L, int idx, int *isnum);
LRT_API lrt_Number      (lrt_tonumber) (lrt_State *L, int idx);
LRT_API lrt_Integer     (lrt_tointeger) (lrt_State *L, int idx);
LRT_API int             (lrt_toboolean) (lrt_State *L, int idx);
LRT_API const char     *(lrt_tolstring) (lrt_State *L, int idx, size_t *len);
LRT_API const char     *(lrt_tostring) (lrt_State *L, int idx);
LRT_API lrt_Unsigned    (lrt_rawlen) (lrt_State *L, int idx);
LRT_API lrt_CFunction   (lrt_tocfunction) (lrt_State *L, int idx);
LRT_API void	       *(lrt_touserdata) (lrt_State *L, int idx);
LRT_API int             (lrt_userdatatag) (lrt_State *L, int idx);
LRT_API lrt_State      *(lrt_tothread) (lrt_State *L, int idx);
LRT_API const void     *(lrt_topointer) (lrt_State *L, int idx);


/*
** Comparison and arithmetic functions
*/

#define LRT_OPADD	0	/* ORDER TM, ORDER OP */
#define LRT_OPSUB	1
#define LRT_OPMUL	2
#define LRT_OPMOD	3
#define LRT_OPDIV	4
#define LRT_OPIDIV	5
#define LRT_OPUNM	6

LRT_API void  (lrt_arith) (lrt_State *L, int op);

#define LRT_OPEQ	0
#define LRT_OPLT	1
#define LRT_OPLE	2

LRT_API int   (lrt_rawequal) (lrt_State *L, int idx1, int idx2);
LRT_API int   (lrt_compare) (lrt_State *L, int idx1, int idx2, int op);


/*
** push functions (C -> stack)
*/
LRT_API void        (lrt_pushnil) (lrt_State *L);
LRT_API void        (lrt_pushnumber) (lrt_State *L, lrt_Number n);
LRT_API void        (lrt_pushinteger) (lrt_State *L, lrt_Integer n);
LRT_API const char *(lrt_pushlstring) (lrt_State *L, const char *s, size_t len);
LRT_API const char *(lrt_pushstring) (lrt_State *L, const char *s);
LRT_API const char *(lrt_pushvfstring) (lrt_State *L, const char *fmt,
                                                      va_list argp);
LRT_API const char *(lrt_pushfstring) (lrt_State *L, const char *fmt, ...);
LRT_API void  (lrt_pushcclosure) (lrt_State *L, lrt_CFunction fn, int n);
LRT_API void  (lrt_pushboolean) (lrt_State *L, int b);
LRT_API int   (lrt_pushthread) (lrt_State *L);
LRT_API void *(lrt_newuserdata) (lrt_State *L, size_t sz, int tag);


/*
** get functions (runtime -> stack)
*/
LRT_API int (lrt_getglobal) (lrt_State *L, const char *name);
LRT_API int (lrt_gettable) (lrt_State *L, int idx);
LRT_API int (lrt_getfield) (lrt_State *L, int idx, const char *k);
LRT_API int (lrt_geti) (lrt_State *L, int idx, lrt_Integer n);
LRT_API int (lrt_rawget) (lrt_State *L, int idx);
LRT_API int (lrt_rawgeti) (lrt_State *L, int idx, lrt_Integer n);

LRT_API void  (lrt_createtable) (lrt_State *L, int narr, int nrec);


/*
** set functions (stack -> runtime)
*/
LRT_API void  (lrt_setglobal) (lrt_State *L, const char *name);
LRT_API void  (lrt_settable) (lrt_State *L, int idx);
LRT_API void  (lrt_setfield) (lrt_State *L, int idx, const char *k);
LRT_API void  (lrt_seti) (lrt_State *L, int idx, lrt_Integer n);
LRT_API void  (lrt_rawset) (lrt_State *L, int idx);
LRT_API void  (lrt_rawseti) (lrt_State *L, int idx, lrt_Integer n);


/*
** 'load' and 'call' functions (run compiled code)
*/
LRT_API void  (lrt_callk) (lrt_State *L, int nargs, int nresults,
                           lrt_KContext ctx, lrt_KFunction k);
LRT_API int   (lrt_pcallk) (lrt_State *L, int nargs, int nresults, int errfunc,
                            lrt_KContext ctx, lrt_KFunction k);

LRT_API int   (lrt_load) (lrt_State *L, const char *text, size_t len,
                          const char *chunkname);
LRT_API void  (lrt_setcompiler) (lrt_State *L, lrt_Compiler f, void *ud);


/*
** coroutine functions
*/
LRT_API int  (lrt_yieldk)     (lrt_State *L, int nresults, lrt_KContext ctx,
                               lrt_KFunction k);
LRT_API int  (lrt_resume)     (lrt_State *L, lrt_State *from, int narg,
                               int *nres);
LRT_API int  (lrt_status)     (lrt_State *L);
LRT_API int  (lrt_isyieldable) (lrt_State *L);
LRT_API int  (lrt_costatus)   (lrt_State *L, lrt_State *co);
LRT_API void (lrt_cancel)     (lrt_State *L);


/*
** Warning-related functions
*/
LRT_API void (lrt_setwarnf) (lrt_State *L, lrt_WarnFunction f, void *ud);
LRT_API void (lrt_warning)  (lrt_State *L, const char *msg, int tocont);


/*
** collector interface
*/
#define LRT_GCCOLLECT		0
#define LRT_GCCOUNT		1
#define LRT_GCCOUNTB		2
#define LRT_GCOBJECTS		3

LRT_API int (lrt_gc) (lrt_State *L, int what);
LRT_API void (lrt_setallochook) (lrt_State *L, lrt_AllocHook f, void *ud);


/*
** miscellaneous functions
*/

LRT_API int   (lrt_error) (lrt_State *L);
LRT_API int   (lrt_errorkind) (lrt_State *L, int status);

LRT_API const char *(lrt_statusname) (int status);

LRT_API void  (lrt_setmetaresolver) (lrt_State *L, lrt_MetaResolver f,
                                     void *ud);

LRT_API lrt_Alloc (lrt_getallocf) (lrt_State *L, void **ud);



/*
** {==============================================================
** some useful helpers
** ===============================================================
*/

inline void lrt_call(lrt_State *L, int n, int r) {
  lrt_callk(L, n, r, 0, nullptr);
}

inline int lrt_pcall(lrt_State *L, int n, int r, int f) {
  return lrt_pcallk(L, n, r, f, 0, nullptr);
}

inline int lrt_yield(lrt_State *L, int n) {
  return lrt_yieldk(L, n, 0, nullptr);
}

inline void lrt_pop(lrt_State *L, int n) { lrt_settop(L, -(n)-1); }

inline void lrt_newtable(lrt_State *L) { lrt_createtable(L, 0, 0); }

inline void lrt_pushcfunction(lrt_State *L, lrt_CFunction f) {
  lrt_pushcclosure(L, f, 0);
}

inline void lrt_register(lrt_State *L, const char *n, lrt_CFunction f) {
  lrt_pushcfunction(L, f);
  lrt_setglobal(L, n);
}

inline bool lrt_isfunction(lrt_State *L, int n) { return lrt_type(L, n) == LRT_TFUNCTION; }
inline bool lrt_istable(lrt_State *L, int n) { return lrt_type(L, n) == LRT_TTABLE; }
inline bool lrt_isnil(lrt_State *L, int n) { return lrt_type(L, n) == LRT_TNIL; }
inline bool lrt_isboolean(lrt_State *L, int n) { return lrt_type(L, n) == LRT_TBOOLEAN; }
inline bool lrt_isthread(lrt_State *L, int n) { return lrt_type(L, n) == LRT_TTHREAD; }
inline bool lrt_isnone(lrt_State *L, int n) { return lrt_type(L, n) == LRT_TNONE; }
inline bool lrt_isnoneornil(lrt_State *L, int n) { return lrt_type(L, n) <= 0; }

inline void lrt_pushglobaltable(lrt_State *L) {
  lrt_rawgeti(L, LRT_REGISTRYINDEX, LRT_RIDX_GLOBALS);
}

inline void lrt_insert(lrt_State *L, int idx) { lrt_rotate(L, idx, 1); }

inline void lrt_remove(lrt_State *L, int idx) {
  lrt_rotate(L, idx, -1);
  lrt_pop(L, 1);
}

inline void lrt_replace(lrt_State *L, int idx) {
  lrt_copy(L, -1, idx);
  lrt_pop(L, 1);
}

/* }============================================================== */


/*
** {======================================================================
** Debug API
** =======================================================================
*/

class CallInfo;

struct lrt_Debug {
  const char *name;	/* (n) */
  const char *namewhat;	/* (n) 'global', 'local', 'field', 'method', 'upvalue' */
  const char *what;	/* (S) 'Lua', 'C', 'main' */
  const char *source;	/* (S) */
  size_t srclen;	/* (S) */
  int currentline;	/* (l) */
  int linedefined;	/* (S) */
  int lastlinedefined;	/* (S) */
  unsigned char nups;	/* (u) number of upvalues */
  unsigned char nparams;/* (u) number of parameters */
  char isvararg;        /* (u) */
  char istailcall;	/* (t) */
  char short_src[LRT_IDSIZE]; /* (S) */
  /* private part */
  CallInfo *i_ci;  /* active function */
};

LRT_API int (lrt_getstack) (lrt_State *L, int level, lrt_Debug *ar);
LRT_API int (lrt_getinfo) (lrt_State *L, const char *what, lrt_Debug *ar);

/* }====================================================================== */


/******************************************************************************
* Copyright (C) 1994-2026 Lua.org, PUC-Rio.
*
* Permission is hereby granted, free of charge, to any person obtaining
* a copy of this software and associated documentation files (the
* "Software"), to deal in the Software without restriction, including
* without limitation the rights to use, copy, modify, merge, publish,
* distribute, sublicense, and/or sell copies of the Software, and to
* permit persons to whom the Software is furnished to do so, subject to
* the following conditions:
*
* The above copyright notice and this permission notice shall be
* included in all copies or substantial portions of the Software.
*
* THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
* EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
* MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.
* IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY
* CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT,
* TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE
* SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
******************************************************************************/


#endif
