/*
** $Id: lapi.cpp $
** Runtime API
** See Copyright Notice in lrt.h
*/

#define lapi_c
#define LRT_CORE

#include <climits>
#include <cstdarg>
#include <cstring>

#include "lrt.h"

#include "lapi.h"
#include "ldebug.h"
#include "ldo.h"
#include "lfunc.h"
#include "lgc.h"
#include "lmem.h"
#include "lobject.h"
#include "lstate.h"
#include "lstring.h"
#include "ltable.h"
#include "ltm.h"
#include "lvm.h"



const char lrt_ident[] =
  "$LrtVersion: " LRT_COPYRIGHT " $";



/* test for pseudo index */
static inline bool ispseudo (int i) noexcept {
  return i <= LRT_REGISTRYINDEX;
}

/* test for upvalue */
static inline bool isupvalue (int i) noexcept {
  return i < LRT_REGISTRYINDEX;
}


/*
** Test for a valid index (one that is not the 'nilvalue').
*/
static inline bool isvalid (lrt_State *L, const TValue *o) noexcept {
  return o != G(L)->getNilValue();
}


static inline TValue *index2value (lrt_State *L, int idx) {
  return L->getStackSubsystem().indexToValue(L, idx);
}


static inline StkId index2stack (lrt_State *L, int idx) {
  return L->getStackSubsystem().indexToStack(L, idx);
}


LRT_API int lrt_checkstack (lrt_State *L, int n) {
  int res;
  CallInfo *ci = L->getCI();
  api_check(L, n >= 0, "negative 'n'");
  if (L->getStackSubsystem().available() > n)  /* stack large enough? */
    res = 1;  /* yes; check is OK */
  else  /* need to grow stack */
    res = L->getStackSubsystem().grow(L, n, 0);
  if (res && ci->getTop() < L->getTop() + n)
    ci->topRef() = L->getTop() + n;  /* adjust frame top */
  return res;
}


LRT_API void lrt_ensurestack (lrt_State *L, int n) {
  if (n < 0)
    lrtG_raise(L, LRT_ERRINDEX, "invalid number of slots %d", n);
  if (l_unlikely(!lrt_checkstack(L, n)))
    lrtG_raise(L, LRT_ERRSTACK, "stack overflow (cannot grow by %d slots)", n);
}


LRT_API void lrt_xmove (lrt_State *from, lrt_State *to, int n) {
  if (from == to) return;
  api_checknelems(from, n);
  api_check(from, G(from) == G(to), "moving among independent states");
  lrtD_checkstack(to, n);
  from->getStackSubsystem().pop(n);
  for (int i = 0; i < n; i++) {
    *to->s2v(to->getTop()) = *from->s2v(from->getTop() + i);
    api_incr_top(to);
  }
}


LRT_API lrt_CFunction lrt_atpanic (lrt_State *L, lrt_CFunction panicf) {
  lrt_CFunction old = G(L)->getPanic();
  G(L)->setPanic(panicf);
  return old;
}


LRT_API lrt_Number lrt_version (lrt_State *L) {
  UNUSED(L);
  return LRT_VERSION_NUM;
}


/*
** Set the maximum size of the thread stacks of this state. Returns the
** previous limit. Threads already larger than the new limit overflow
** on their next growth.
*/
LRT_API int lrt_setstacklimit (lrt_State *L, int limit) {
  global_State *g = G(L);
  int old = g->getStackLimit();
  if (limit < BASIC_STACK_SIZE || limit > LRTI_MAXSTACK)
    lrtG_raise(L, LRT_ERRSTACK, "invalid stack limit %d (must be in [%d, %d])",
                                limit, BASIC_STACK_SIZE, LRTI_MAXSTACK);
  g->setStackLimit(limit);
  return old;
}



/*
** basic stack manipulation
*/


/*
** convert an acceptable stack index into an absolute index
*/
LRT_API int lrt_absindex (lrt_State *L, int idx) {
  if (ispseudo(idx))
    return idx;
  int top = lrt_gettop(L);
  int abs = (idx > 0) ? idx : top + idx + 1;
  if (l_unlikely(idx == 0 || abs < 1 || abs > top))
    lrtG_raise(L, LRT_ERRINDEX, "invalid stack index %d (top is %d)", idx, top);
  return abs;
}


LRT_API int lrt_gettop (lrt_State *L) {
  return L->getStackSubsystem().getDepthFromFunc(L->getCI());
}


/*
** Set the top. A positive index above the frame limit grows the frame;
** new slots are nil.
*/
LRT_API void lrt_settop (lrt_State *L, int idx) {
  CallInfo *ci = L->getCI();
  StkId func = ci->getFunc();
  StkId newtop;
  if (idx >= 0) {
    if (func + 1 + idx > ci->getTop()) {
      lrtD_checkstack(L, func + 1 + idx - L->getTop());
      ci->topRef() = func + 1 + idx;
    }
    newtop = func + 1 + idx;
    for (StkId p = L->getTop(); p < newtop; p++)
      L->s2v(p)->setNil();  /* clear new slots */
  }
  else {
    if (l_unlikely(-(idx + 1) > L->getTop() - (func + 1)))
      lrtG_raise(L, LRT_ERRINDEX, "invalid new top %d", idx);
    newtop = L->getTop() + idx + 1;
  }
  L->setTop(newtop);
}


/*
** Reverse the stack segment from 'from' to 'to'
** (auxiliary to 'lrt_rotate')
*/
static void reverse (lrt_State *L, StkId from, StkId to) {
  for (; from < to; from++, to--) {
    TValue temp = *L->s2v(from);
    *L->s2v(from) = *L->s2v(to);
    *L->s2v(to) = temp;
  }
}


/*
** Let x = AB, where A is a prefix of length 'n'. Then,
** rotate x n == BA. But BA == (A^r . B^r)^r.
*/
LRT_API void lrt_rotate (lrt_State *L, int idx, int n) {
  StkId t = L->getTop() - 1;  /* end of stack segment being rotated */
  StkId p = index2stack(L, idx);  /* start of segment */
  if (l_unlikely((n >= 0 ? n : -n) > (t - p + 1)))
    lrtG_raise(L, LRT_ERRINDEX, "invalid rotation %d", n);
  StkId m = (n >= 0 ? t - n : p - n - 1);  /* end of prefix */
  reverse(L, p, m);  /* reverse the prefix with length 'n' */
  reverse(L, m + 1, t);  /* reverse the suffix */
  reverse(L, p, t);  /* reverse the entire segment */
}


LRT_API void lrt_copy (lrt_State *L, int fromidx, int toidx) {
  TValue fr = *index2value(L, fromidx);
  TValue *to = index2value(L, toidx);
  if (l_unlikely(!isvalid(L, to) || toidx == LRT_REGISTRYINDEX))
    lrtG_raise(L, LRT_ERRINDEX, "invalid stack index %d", toidx);
  lrt_assert(!isupvalue(toidx) || L->s2v(L->getCI()->getFunc())->isCClosure());
  *to = fr;
}


LRT_API void lrt_pushvalue (lrt_State *L, int idx) {
  TValue v = *index2value(L, idx);
  *L->s2v(L->getTop()) = v;
  api_incr_top(L);
}



/*
** access functions (stack -> C)
*/


LRT_API int lrt_type (lrt_State *L, int idx) {
  const TValue *o = index2value(L, idx);
  return (isvalid(L, o) ? o->baseType() : LRT_TNONE);
}


LRT_API const char *lrt_typename (lrt_State *L, int t) {
  UNUSED(L);
  api_check(L, LRT_TNONE <= t && t < LRT_NUMTYPES, "invalid type");
  return ttypename(t);
}


LRT_API int lrt_iscfunction (lrt_State *L, int idx) {
  const TValue *o = index2value(L, idx);
  return o->isCFunction();
}


LRT_API int lrt_isinteger (lrt_State *L, int idx) {
  const TValue *o = index2value(L, idx);
  return o->isInteger();
}


LRT_API int lrt_isnumber (lrt_State *L, int idx) {
  lrt_Number n;
  const TValue *o = index2value(L, idx);
  return tonumber(o, &n);
}


LRT_API int lrt_isstring (lrt_State *L, int idx) {
  const TValue *o = index2value(L, idx);
  return (o->isString() || o->isNumber());
}


LRT_API int lrt_isuserdata (lrt_State *L, int idx) {
  const TValue *o = index2value(L, idx);
  return o->isFullUserdata();
}


LRT_API int lrt_rawequal (lrt_State *L, int index1, int index2) {
  const TValue *o1 = index2value(L, index1);
  const TValue *o2 = index2value(L, index2);
  return (isvalid(L, o1) && isvalid(L, o2)) ? lrtO_rawequal(o1, o2) : 0;
}


LRT_API void lrt_arith (lrt_State *L, int op) {
  if (l_unlikely(op < LRT_OPADD || op > LRT_OPUNM))
    lrtG_runerror(L, "invalid arithmetic operator %d", op);
  if (op != LRT_OPUNM)
    api_checknelems(L, 2);  /* all other operations expect two operands */
  else {  /* for unary operations, add fake 2nd operand */
    api_checknelems(L, 1);
    *L->s2v(L->getTop()) = *L->s2v(L->getTop() - 1);
    api_incr_top(L);
  }
  /* first operand at top - 2, second at top - 1; result go to top - 2 */
  StkId top = L->getTop();
  VirtualMachine(L).arith(op, L->s2v(top - 2), L->s2v(top - 1), top - 2);
  L->setTop(top - 1);  /* pop second operand */
}


LRT_API int lrt_compare (lrt_State *L, int index1, int index2, int op) {
  int i = 0;
  TValue o1 = *index2value(L, index1);
  TValue o2 = *index2value(L, index2);
  if (lrt_type(L, index1) != LRT_TNONE && lrt_type(L, index2) != LRT_TNONE) {
    VirtualMachine vm(L);
    switch (op) {
      case LRT_OPEQ: i = vm.equalObj(&o1, &o2); break;
      case LRT_OPLT: i = vm.lessThan(&o1, &o2); break;
      case LRT_OPLE: i = vm.lessEqual(&o1, &o2); break;
      default: lrtG_runerror(L, "invalid comparison operator %d", op);
    }
  }
  return i;
}


/*
** Raise a ConversionError for the value at 'idx'.
*/
static l_noret converror (lrt_State *L, int idx, const char *target) {
  const char *tname = (lrt_type(L, idx) == LRT_TNONE)
                    ? "no value"
                    : lrtT_objtypename(index2value(L, idx));
  if (idx < 0 && !ispseudo(idx))  /* report the absolute position */
    idx = lrt_gettop(L) + idx + 1;
  lrtG_raise(L, LRT_ERRCONV, "cannot convert value at index %d to %s (a %s)",
                             idx, target, tname);
}


LRT_API lrt_Number lrt_tonumberx (lrt_State *L, int idx, int *pisnum) {
  const TValue *o = index2value(L, idx);
  lrt_Number n = 0;
  int isnum = tonumber(o, &n);
  if (pisnum)
    *pisnum = isnum;
  return n;
}


LRT_API lrt_Integer lrt_tointegerx (lrt_State *L, int idx, int *pisnum) {
  const TValue *o = index2value(L, idx);
  lrt_Integer res = 0;
  int isnum = tointeger(o, &res);
  if (pisnum)
    *pisnum = isnum;
  return res;
}


LRT_API lrt_Number lrt_tonumber (lrt_State *L, int idx) {
  int isnum;
  lrt_Number n = lrt_tonumberx(L, idx, &isnum);
  if (l_unlikely(!isnum))
    converror(L, idx, "number");
  return n;
}


LRT_API lrt_Integer lrt_tointeger (lrt_State *L, int idx) {
  int isnum;
  lrt_Integer i = lrt_tointegerx(L, idx, &isnum);
  if (l_unlikely(!isnum))
    converror(L, idx, "integer");
  return i;
}


LRT_API int lrt_toboolean (lrt_State *L, int idx) {
  const TValue *o = index2value(L, idx);
  return !o->isFalseLike();
}


LRT_API const char *lrt_tolstring (lrt_State *L, int idx, size_t *len) {
  TValue *o = index2value(L, idx);
  if (!o->isString()) {
    if (!o->isNumber()) {  /* not convertible? */
      if (len != nullptr) *len = 0;
      return nullptr;
    }
    TValue v = *o;
    lrtO_tostring(L, &v);  /* may reallocate the stack */
    o = index2value(L, idx);
    *o = v;
  }
  TString *ts = o->stringValue();
  if (len != nullptr)
    *len = ts->length();
  return ts->c_str();
}


LRT_API const char *lrt_tostring (lrt_State *L, int idx) {
  const char *s = lrt_tolstring(L, idx, nullptr);
  if (l_unlikely(s == nullptr))
    converror(L, idx, "string");
  return s;
}


LRT_API lrt_Unsigned lrt_rawlen (lrt_State *L, int idx) {
  const TValue *o = index2value(L, idx);
  switch (o->typeTag()) {
    case ValueTag::STRING: return static_cast<lrt_Unsigned>(o->stringValue()->length());
    case ValueTag::USERDATA: return static_cast<lrt_Unsigned>(o->userdataValue()->getLen());
    case ValueTag::TABLE: return o->tableValue()->length();
    default: return 0;
  }
}


LRT_API lrt_CFunction lrt_tocfunction (lrt_State *L, int idx) {
  const TValue *o = index2value(L, idx);
  if (o->isLightCFunction()) return o->functionValue();
  else if (o->isCClosure())
    return o->cClosureValue()->getFunction();
  else return nullptr;  /* not a native function */
}


LRT_API void *lrt_touserdata (lrt_State *L, int idx) {
  const TValue *o = index2value(L, idx);
  return o->isFullUserdata() ? o->userdataValue()->getMemory() : nullptr;
}


LRT_API int lrt_userdatatag (lrt_State *L, int idx) {
  const TValue *o = index2value(L, idx);
  return o->isFullUserdata() ? o->userdataValue()->getTag() : -1;
}


LRT_API lrt_State *lrt_tothread (lrt_State *L, int idx) {
  const TValue *o = index2value(L, idx);
  return (!o->isThread()) ? nullptr : o->threadValue();
}


/*
** Returns a pointer to the internal representation of an object.
** Only for identification (e.g., in messages).
*/
LRT_API const void *lrt_topointer (lrt_State *L, int idx) {
  const TValue *o = index2value(L, idx);
  switch (o->typeTag()) {
    case ValueTag::LCF:
      return cast(void *, cast_sizet(o->functionValue()));
    case ValueTag::USERDATA:
      return o->userdataValue()->getMemory();
    default: {
      if (o->isCollectable())
        return o->gcValue();
      else
        return nullptr;
    }
  }
}



/*
** push functions (C -> stack)
*/


LRT_API void lrt_pushnil (lrt_State *L) {
  L->s2v(L->getTop())->setNil();
  api_incr_top(L);
}


LRT_API void lrt_pushnumber (lrt_State *L, lrt_Number n) {
  L->s2v(L->getTop())->setFloat(n);
  api_incr_top(L);
}


LRT_API void lrt_pushinteger (lrt_State *L, lrt_Integer n) {
  L->s2v(L->getTop())->setInt(n);
  api_incr_top(L);
}


/*
** Pushes on the stack a string with given length. Avoid using 's' when
** 'len' == 0 (as 's' can be nullptr in that case).
*/
LRT_API const char *lrt_pushlstring (lrt_State *L, const char *s, size_t len) {
  TString *ts = (len == 0) ? lrtS_new(L, "") : lrtS_newlstr(L, s, len);
  L->s2v(L->getTop())->setString(ts);
  api_incr_top(L);
  return ts->c_str();
}


LRT_API const char *lrt_pushstring (lrt_State *L, const char *s) {
  if (s == nullptr)
    L->s2v(L->getTop())->setNil();
  else {
    TString *ts = lrtS_new(L, s);
    L->s2v(L->getTop())->setString(ts);
    s = ts->c_str();  /* internal copy's address */
  }
  api_incr_top(L);
  return s;
}


LRT_API const char *lrt_pushvfstring (lrt_State *L, const char *fmt,
                                      va_list argp) {
  const char *ret = lrtO_pushvfstring(L, fmt, argp);
  adjustresults(L, LRT_MULTRET);
  return ret;
}


LRT_API const char *lrt_pushfstring (lrt_State *L, const char *fmt, ...) {
  const char *ret;
  va_list argp;
  va_start(argp, fmt);
  ret = lrt_pushvfstring(L, fmt, argp);
  va_end(argp);
  return ret;
}


LRT_API void lrt_pushcclosure (lrt_State *L, lrt_CFunction fn, int n) {
  if (n == 0) {
    L->s2v(L->getTop())->setFunction(fn);
    api_incr_top(L);
  }
  else {
    api_checknelems(L, n);
    if (l_unlikely(n < 0 || n > MAXUPVAL))
      lrtG_raise(L, LRT_ERRINDEX, "invalid number of upvalues %d", n);
    CClosure *cl = lrtF_newCclosure(L, fn, n);
    for (int i = 0; i < n; i++)
      *cl->getUpvalue(i) = *L->s2v(L->getTop() - n + i);
    L->getStackSubsystem().pop(n);
    L->s2v(L->getTop())->setCClosure(cl);
    api_incr_top(L);
  }
}


LRT_API void lrt_pushboolean (lrt_State *L, int b) {
  L->s2v(L->getTop())->setBool(b != 0);
  api_incr_top(L);
}


LRT_API int lrt_pushthread (lrt_State *L) {
  L->s2v(L->getTop())->setThread(L);
  api_incr_top(L);
  return (G(L)->getMainThread() == L);
}


LRT_API void *lrt_newuserdata (lrt_State *L, size_t size, int tag) {
  Udata *u = lrtS_newudata(L, size, tag);
  L->s2v(L->getTop())->setUserdata(u);
  api_incr_top(L);
  return u->getMemory();
}



/*
** get functions (runtime -> stack)
*/


static TValue getGlobalTable (lrt_State *L) {
  Table *registry = G(L)->getRegistry()->tableValue();
  const TValue *gt = registry->getInt(LRT_RIDX_GLOBALS);
  lrt_assert(gt->isTable());
  return *gt;
}


/*
** Push 't[k]'. Both the indexed value and the key are copied first,
** as a handler may move the stack.
*/
static int auxget (lrt_State *L, const TValue *t, const TValue *key) {
  TValue tv = *t, kv = *key;
  StkId res = L->getTop();
  L->s2v(res)->setNil();
  api_incr_top(L);  /* anchor the result slot */
  VirtualMachine(L).finishGet(&tv, &kv, res);
  return L->s2v(res)->baseType();
}


static int auxgetstr (lrt_State *L, const TValue *t, const char *k) {
  TValue tv = *t;
  TValue key;
  key.setString(lrtS_new(L, k));
  return auxget(L, &tv, &key);
}


LRT_API int lrt_getglobal (lrt_State *L, const char *name) {
  TValue gt = getGlobalTable(L);
  return auxgetstr(L, &gt, name);
}


LRT_API int lrt_gettable (lrt_State *L, int idx) {
  api_checknelems(L, 1);
  TValue t = *index2value(L, idx);
  TValue key = *L->s2v(L->getTop() - 1);
  L->getStackSubsystem().pop();  /* the result takes the key's place */
  return auxget(L, &t, &key);
}


LRT_API int lrt_getfield (lrt_State *L, int idx, const char *k) {
  return auxgetstr(L, index2value(L, idx), k);
}


LRT_API int lrt_geti (lrt_State *L, int idx, lrt_Integer n) {
  TValue key;
  key.setInt(n);
  return auxget(L, index2value(L, idx), &key);
}


static Table *gettable (lrt_State *L, int idx) {
  TValue *t = index2value(L, idx);
  if (l_unlikely(!t->isTable()))
    lrtG_runerror(L, "table expected at index %d, got %s", idx,
                     lrtT_objtypename(t));
  return t->tableValue();
}


static int finishrawget (lrt_State *L, const TValue *val) {
  *L->s2v(L->getTop()) = *val;
  api_incr_top(L);
  return val->baseType();
}


LRT_API int lrt_rawget (lrt_State *L, int idx) {
  api_checknelems(L, 1);
  Table *t = gettable(L, idx);
  TValue key = *L->s2v(L->getTop() - 1);
  L->getStackSubsystem().pop();  /* pop key */
  return finishrawget(L, t->get(&key));
}


LRT_API int lrt_rawgeti (lrt_State *L, int idx, lrt_Integer n) {
  Table *t = gettable(L, idx);
  TValue v = *t->getInt(n);
  return finishrawget(L, &v);
}


LRT_API void lrt_createtable (lrt_State *L, int narray, int nrec) {
  Table *t = Table::create(L, narray, nrec);
  L->s2v(L->getTop())->setTable(t);
  api_incr_top(L);
}



/*
** set functions (stack -> runtime)
*/


/*
** t[k] = value at the top of the stack; the value is popped.
*/
static void auxset (lrt_State *L, const TValue *t, const TValue *key) {
  api_checknelems(L, 1);
  TValue tv = *t, kv = *key;
  TValue val = *L->s2v(L->getTop() - 1);
  VirtualMachine(L).finishSet(&tv, &kv, &val);
  L->getStackSubsystem().pop();  /* pop value */
}


static void auxsetstr (lrt_State *L, const TValue *t, const char *k) {
  TValue tv = *t;
  TValue key;
  key.setString(lrtS_new(L, k));
  auxset(L, &tv, &key);
}


LRT_API void lrt_setglobal (lrt_State *L, const char *name) {
  TValue gt = getGlobalTable(L);
  auxsetstr(L, &gt, name);
}


LRT_API void lrt_settable (lrt_State *L, int idx) {
  api_checknelems(L, 2);
  TValue t = *index2value(L, idx);
  TValue key = *L->s2v(L->getTop() - 2);
  TValue val = *L->s2v(L->getTop() - 1);
  VirtualMachine(L).finishSet(&t, &key, &val);
  L->getStackSubsystem().pop(2);  /* pop index and value */
}


LRT_API void lrt_setfield (lrt_State *L, int idx, const char *k) {
  auxsetstr(L, index2value(L, idx), k);
}


LRT_API void lrt_seti (lrt_State *L, int idx, lrt_Integer n) {
  TValue key;
  key.setInt(n);
  auxset(L, index2value(L, idx), &key);
}


LRT_API void lrt_rawset (lrt_State *L, int idx) {
  api_checknelems(L, 2);
  Table *t = gettable(L, idx);
  t->set(L, L->s2v(L->getTop() - 2), L->s2v(L->getTop() - 1));
  L->getStackSubsystem().pop(2);
}


LRT_API void lrt_rawseti (lrt_State *L, int idx, lrt_Integer n) {
  api_checknelems(L, 1);
  Table *t = gettable(L, idx);
  t->setInt(L, n, L->s2v(L->getTop() - 1));
  L->getStackSubsystem().pop();
}



/*
** 'load' and 'call' functions (run compiled code)
*/


inline void checkresults(lrt_State* L, int na, int nr) {
  api_check(L, (nr) == LRT_MULTRET
            || (L->getCI()->getTop() - L->getTop() >= (nr) - (na)),
            "results from function overflow current stack size");
  api_check(L, LRT_MULTRET <= (nr) && (nr) <= MAXRESULTS,
            "invalid number of results");
  UNUSED(na);
}


/*
** Check the arguments of a call: the function and its arguments must
** be on the stack and the thread must be able to run it.
*/
static void checkcall (lrt_State *L, int nargs, int nresults) {
  if (l_unlikely(nargs < 0 || !L->getStackSubsystem().checkHasElements(L->getCI(), nargs)))
    lrtG_raise(L, LRT_ERRINDEX, "not enough values on the stack for a call "
                                "with %d arguments", nargs);
  if (l_unlikely(nresults < LRT_MULTRET || nresults > MAXRESULTS))
    lrtG_raise(L, LRT_ERRINDEX, "invalid number of results %d", nresults);
  api_check(L, L->getStatus() == LRT_OK, "cannot do calls on non-normal thread");
  checkresults(L, nargs, nresults);
}


LRT_API void lrt_callk (lrt_State *L, int nargs, int nresults,
                        lrt_KContext ctx, lrt_KFunction k) {
  StkId func;
  checkcall(L, nargs, nresults);
  func = L->getTop() - (nargs+1);
  if (k != nullptr && yieldable(L)) {  /* need to prepare continuation? */
    L->getCI()->setK(k);  /* save continuation */
    L->getCI()->setCtx(ctx);  /* save context */
    L->call(func, nresults);  /* do the call */
  }
  else  /* no continuation or no yieldable */
    L->callNoYield(func, nresults);  /* just do the call */
  adjustresults(L, nresults);
}



/*
** Execute a protected call.
*/
struct CallS {  /* data to 'f_call' */
  StkId func;
  int nresults;
};


static void f_call (lrt_State *L, void *ud) {
  CallS *c = static_cast<CallS*>(ud);
  L->callNoYield(c->func, c->nresults);
}



LRT_API int lrt_pcallk (lrt_State *L, int nargs, int nresults, int errfunc,
                        lrt_KContext ctx, lrt_KFunction k) {
  CallS c;
  TStatus status;
  StkId func;
  checkcall(L, nargs, nresults);
  if (errfunc == 0)
    func = 0;
  else {
    func = index2stack(L, errfunc);
    api_check(L, L->s2v(func)->isFunction(), "error handler must be a function");
  }
  c.func = L->getTop() - (nargs+1);  /* function to be called */
  if (k == nullptr || !yieldable(L)) {  /* no continuation or no yieldable? */
    c.nresults = nresults;  /* do a 'conventional' protected call */
    status = L->pCall(f_call, &c, c.func, func);
  }
  else {  /* prepare continuation (call is already protected by 'resume') */
    CallInfo *ci = L->getCI();
    ci->setK(k);  /* save continuation */
    ci->setCtx(ctx);  /* save context */
    /* save information for error recovery */
    ci->setFuncIdx(c.func);
    ci->setOldErrFunc(L->getErrFunc());
    L->setErrFunc(func);
    ci->callStatusRef() |= CIST_YPCALL;  /* function can do error recovery */
    L->call(c.func, nresults);  /* do the call */
    ci->callStatusRef() &= ~CIST_YPCALL;
    L->setErrFunc(ci->getOldErrFunc());
    status = LRT_OK;  /* if it is here, there were no errors */
  }
  adjustresults(L, nresults);
  return APIstatus(status);
}


LRT_API int lrt_load (lrt_State *L, const char *text, size_t len,
                      const char *chunkname) {
  if (!chunkname) chunkname = "?";
  TStatus status = lrtD_compile(L, text, len, chunkname);
  adjustresults(L, LRT_MULTRET);
  return APIstatus(status);
}


LRT_API void lrt_setcompiler (lrt_State *L, lrt_Compiler f, void *ud) {
  G(L)->setCompiler(f, ud);
}



/*
** coroutine functions not in 'ldo.cpp'
*/


LRT_API int lrt_status (lrt_State *L) {
  return APIstatus(L->getStatus());
}


LRT_API int lrt_costatus (lrt_State *L, lrt_State *co) {
  UNUSED(L);
  return co->getCoStatus();
}


/*
** Request the cancellation of a thread; it is raised as an error the
** next time the thread crosses a call boundary.
*/
LRT_API void lrt_cancel (lrt_State *L) {
  L->setCancelled(true);
}



/*
** Warning-related functions
*/


LRT_API void lrt_setwarnf (lrt_State *L, lrt_WarnFunction f, void *ud) {
  G(L)->setWarnF(f, ud);
}


LRT_API void lrt_warning (lrt_State *L, const char *msg, int tocont) {
  lrtE_warning(L, msg, tocont);
}



/*
** Collector functions
*/


LRT_API int lrt_gc (lrt_State *L, int what) {
  global_State *g = G(L);
  int res = 0;
  switch (what) {
    case LRT_GCCOLLECT: {
      lrtC_fullgc(L);
      break;
    }
    case LRT_GCCOUNT: {
      /* values are expressed in Kbytes: #bytes/2^10 */
      res = cast_int(g->getTotalBytes() >> 10);
      break;
    }
    case LRT_GCCOUNTB: {
      res = cast_int(g->getTotalBytes() & 0x3ff);
      break;
    }
    case LRT_GCOBJECTS: {
      size_t n = lrtC_countobjects(g);
      res = (n > static_cast<size_t>(INT_MAX)) ? INT_MAX : cast_int(n);
      break;
    }
    default: res = -1;  /* invalid option */
  }
  return res;
}


LRT_API void lrt_setallochook (lrt_State *L, lrt_AllocHook f, void *ud) {
  G(L)->setAllocHook(f, ud);
}



/*
** miscellaneous functions
*/


LRT_API int lrt_error (lrt_State *L) {
  api_checknelems(L, 1);
  TValue *errobj = L->s2v(L->getTop() - 1);
  /* error object is the memory error message? */
  if (errobj->isString() && errobj->stringValue() == G(L)->getMemErrMsg())
    lrtM_error(L);  /* raise a memory error */
  else
    lrtG_errormsg(L, LRT_ERRRUN);  /* raise a regular error */
  return 0;  /* to avoid warnings */
}


/*
** Raise the value on the top of the stack as an error of the given
** kind (one of the error statuses).
*/
LRT_API int lrt_errorkind (lrt_State *L, int status) {
  api_checknelems(L, 1);
  if (l_unlikely(!errorstatus(status) || status > LRT_ERRYIELD))
    lrtG_runerror(L, "invalid error kind %d", status);
  if (status == LRT_ERRMEM)
    lrtM_error(L);
  lrtG_errormsg(L, status);
  return 0;  /* to avoid warnings */
}


LRT_API const char *lrt_statusname (int status) {
  switch (status) {
    case LRT_OK: return "ok";
    case LRT_YIELD: return "yield";
    case LRT_ERRRUN: return "runtime error";
    case LRT_ERRSYNTAX: return "syntax error";
    case LRT_ERRMEM: return "memory error";
    case LRT_ERRERR: return "error in error handling";
    case LRT_ERRCONV: return "conversion error";
    case LRT_ERRINDEX: return "index error";
    case LRT_ERRSTACK: return "stack overflow";
    case LRT_ERRCORO: return "coroutine state error";
    case LRT_ERRYIELD: return "yield error";
    default: return "unknown status";
  }
}


LRT_API void lrt_setmetaresolver (lrt_State *L, lrt_MetaResolver f, void *ud) {
  G(L)->setResolver(f, ud);
}


LRT_API lrt_Alloc lrt_getallocf (lrt_State *L, void **ud) {
  if (ud) *ud = G(L)->getUd();
  return G(L)->getFrealloc();
}
