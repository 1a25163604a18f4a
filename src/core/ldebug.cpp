/*
** $Id: ldebug.cpp $
** Debug Interface
** See Copyright Notice in lrt.h
*/

#define ldebug_c
#define LRT_CORE

#include <cstdarg>
#include <cstring>

#include "lrt.h"

#include "lapi.h"
#include "ldebug.h"
#include "ldo.h"
#include "lfunc.h"
#include "lobject.h"
#include "lopcodes.h"
#include "lstate.h"
#include "lstring.h"
#include "ltm.h"


static const char *funcnamefromcall (lrt_State *L, CallInfo *ci,
                                                   const char **name);


int lrtG_currentpc (lrt_State *L, CallInfo *ci) {
  lrt_assert(ci->isLua());
  const Proto *p = L->ciFunc(ci)->getProto();
  return cast_int(ci->getSavedPC() - p->getCode().data()) - 1;
}


int lrtG_getfuncline (const Proto *f, int pc) {
  return f->getLine(pc);
}


static int getcurrentline (lrt_State *L, CallInfo *ci) {
  return lrtG_getfuncline(L->ciFunc(ci)->getProto(), lrtG_currentpc(L, ci));
}


/*
** {======================================================
** Activation records
** =======================================================
*/

LRT_API int lrt_getstack (lrt_State *L, int level, lrt_Debug *ar) {
  int status;
  CallInfo *ci;
  if (level < 0) return 0;  /* invalid (negative) level */
  for (ci = L->getCI(); level > 0 && ci != L->getBaseCI(); ci = ci->getPrevious())
    level--;
  if (level == 0 && ci != L->getBaseCI()) {  /* level found? */
    status = 1;
    ar->i_ci = ci;
  }
  else status = 0;  /* no such level */
  return status;
}


static void funcinfo (lrt_Debug *ar, const TValue *cl) {
  if (!cl->isLClosure()) {
    ar->source = "=[C]";
    ar->srclen = LL("=[C]");
    ar->linedefined = -1;
    ar->lastlinedefined = -1;
    ar->what = "C";
  }
  else {
    const Proto *p = cl->lClosureValue()->getProto();
    if (p->getSource()) {
      ar->source = p->getSource()->c_str();
      ar->srclen = p->getSource()->length();
    }
    else {
      ar->source = "=?";
      ar->srclen = LL("=?");
    }
    ar->linedefined = p->getLineDefined();
    ar->lastlinedefined = p->getLastLineDefined();
    ar->what = (ar->linedefined == 0) ? "main" : "Lua";
  }
  lrtO_chunkid(ar->short_src, ar->source, ar->srclen);
}


static const char *getfuncname (lrt_State *L, CallInfo *ci, const char **name) {
  /* calling function is a known function? */
  if (ci != nullptr && !(ci->getCallStatus() & CIST_TAIL))
    return funcnamefromcall(L, ci->getPrevious(), name);
  else return nullptr;  /* no way to determine the name */
}


static int auxgetinfo (lrt_State *L, const char *what, lrt_Debug *ar,
                       const TValue *f, CallInfo *ci) {
  int status = 1;
  for (; *what; what++) {
    switch (*what) {
      case 'S': {
        funcinfo(ar, f);
        break;
      }
      case 'l': {
        ar->currentline = (ci && ci->isLua()) ? getcurrentline(L, ci) : -1;
        break;
      }
      case 'u': {
        if (f->isLClosure()) {
          const LClosure *cl = f->lClosureValue();
          ar->nups = cast_byte(cl->getNumUpvalues());
          ar->isvararg = cl->getProto()->isVararg();
          ar->nparams = cl->getProto()->getNumParams();
        }
        else {
          ar->nups = f->isCClosure()
                   ? cast_byte(f->cClosureValue()->getNumUpvalues()) : 0;
          ar->isvararg = 1;
          ar->nparams = 0;
        }
        break;
      }
      case 't': {
        ar->istailcall = (ci) ? ((ci->getCallStatus() & CIST_TAIL) != 0) : 0;
        break;
      }
      case 'n': {
        ar->namewhat = getfuncname(L, ci, &ar->name);
        if (ar->namewhat == nullptr) {
          ar->namewhat = "";  /* not found */
          ar->name = nullptr;
        }
        break;
      }
      case 'f':  /* handled by lrt_getinfo */
        break;
      default: status = 0;  /* invalid option */
    }
  }
  return status;
}


LRT_API int lrt_getinfo (lrt_State *L, const char *what, lrt_Debug *ar) {
  int status;
  CallInfo *ci;
  TValue func;
  if (*what == '>') {
    api_checknelems(L, 1);
    ci = nullptr;
    func = *L->s2v(L->getTop() - 1);
    api_check(L, func.isFunction(), "function expected");
    what++;  /* skip the '>' */
    L->setTop(L->getTop() - 1);  /* pop function */
  }
  else {
    ci = ar->i_ci;
    func = *L->s2v(ci->getFunc());
    lrt_assert(func.isFunction());
  }
  status = auxgetinfo(L, what, ar, &func, ci);
  if (std::strchr(what, 'f')) {
    *L->s2v(L->getTop()) = func;
    api_incr_top(L);
  }
  return status;
}

/* }====================================================== */


/*
** {======================================================
** Symbolic Execution
** =======================================================
*/

static const char *upvalname (const Proto *p, int uv) {
  TString *s = p->getUpvalues()[static_cast<size_t>(uv)].getName();
  if (s == nullptr) return "?";
  else return s->c_str();
}


static int filterpc (int pc, int jmptarget) {
  if (pc < jmptarget)  /* is code conditional (inside a jump)? */
    return -1;  /* cannot know who sets that register */
  else return pc;  /* current position sets that register */
}


/*
** Try to find last instruction before 'lastpc' that modified register 'reg'.
*/
static int findsetreg (const Proto *p, int lastpc, int reg) {
  int pc;
  int setreg = -1;  /* keep last instruction that changed 'reg' */
  int jmptarget = 0;  /* any code before this address is conditional */
  for (pc = 0; pc < lastpc; pc++) {
    InstructionView i(p->getCode()[static_cast<size_t>(pc)]);
    int op = i.opcode();
    int a = i.a();
    int change;  /* true if current instruction changed 'reg' */
    switch (op) {
      case OP_LOADNIL: {  /* set registers from 'a' to 'a+b' */
        int b = i.b();
        change = (a <= reg && reg <= a + b);
        break;
      }
      case OP_CALL:
      case OP_TAILCALL:
      case OP_VARARG: {  /* affect all registers above base */
        change = (reg >= a);
        break;
      }
      case OP_JMP: {  /* doesn't change registers, but changes 'jmptarget' */
        int dest = pc + 1 + i.sj();
        /* jump does not skip 'lastpc' and is larger than current one? */
        if (dest <= lastpc && dest > jmptarget)
          jmptarget = dest;  /* update 'jmptarget' */
        change = 0;
        break;
      }
      default:  /* any instruction that sets A */
        change = (testAMode(op) && reg == a);
        break;
    }
    if (change)
      setreg = filterpc(pc, jmptarget);
  }
  return setreg;
}


/*
** Find a "name" for the constant 'c'.
*/
static const char *kname (const Proto *p, int index, const char **name) {
  const TValue *kvalue = &p->getConstants()[static_cast<size_t>(index)];
  if (kvalue->isString()) {
    *name = kvalue->stringValue()->c_str();
    return "constant";
  }
  else {
    *name = "?";
    return nullptr;
  }
}


static const char *getobjname (const Proto *p, int lastpc, int reg,
                               const char **name) {
  int pc = findsetreg(p, lastpc, reg);
  if (pc != -1) {  /* could find instruction? */
    InstructionView i(p->getCode()[static_cast<size_t>(pc)]);
    switch (i.opcode()) {
      case OP_MOVE: {
        int b = i.b();  /* move from 'b' to 'a' */
        if (b < i.a())
          return getobjname(p, pc, b, name);  /* get name for 'b' */
        break;
      }
      case OP_GETUPVAL: {
        *name = upvalname(p, i.b());
        return "upvalue";
      }
      case OP_LOADK: {
        return kname(p, i.bx(), name);
      }
      case OP_GETGLOBAL: {
        kname(p, i.bx(), name);
        return "global";
      }
      case OP_GETFIELD: {
        kname(p, i.c(), name);
        return "field";
      }
      default: break;  /* go through to return nullptr */
    }
  }
  return nullptr;  /* could not find reasonable name */
}


/*
** Try to find a name for a function based on the code that called it.
** (Only works when function was called by a bytecode function.)
*/
static const char *funcnamefromcall (lrt_State *L, CallInfo *ci,
                                                   const char **name) {
  if (ci == nullptr || !ci->isLua())
    return nullptr;
  const Proto *p = L->ciFunc(ci)->getProto();
  int pc = lrtG_currentpc(L, ci);
  if (pc < 0)
    return nullptr;
  InstructionView i(p->getCode()[static_cast<size_t>(pc)]);
  switch (i.opcode()) {
    case OP_CALL:
    case OP_TAILCALL:
      return getobjname(p, pc, i.a(), name);  /* get function name */
    default:
      *name = "?";
      return "metamethod";  /* called by the interpreter for an operation */
  }
}

/* }====================================================== */


/*
** Check whether pointer 'o' points to some value in the stack frame of
** the current function and, if so, returns its index.
*/
static int instack (lrt_State *L, CallInfo *ci, const TValue *o) {
  StkId base = ci->getFunc() + 1;
  for (int pos = 0; base + pos < ci->getTop(); pos++) {
    if (o == L->s2v(base + pos))
      return pos;
  }
  return -1;  /* not found */
}


/*
** Checks whether value 'o' came from an upvalue.
*/
static const char *getupvalname (lrt_State *L, CallInfo *ci, const TValue *o,
                                 const char **name) {
  LClosure *c = L->ciFunc(ci);
  for (int i = 0; i < c->getNumUpvalues(); i++) {
    UpVal *uv = c->getUpval(i);
    if (uv != nullptr && uv->getValue() == o) {
      *name = upvalname(c->getProto(), i);
      return "upvalue";
    }
  }
  return nullptr;
}


static const char *formatvarinfo (lrt_State *L, const char *kind,
                                                const char *name) {
  if (kind == nullptr)
    return "";  /* no information */
  else
    return lrtO_pushfstring(L, " (%s '%s')", kind, name);
}


/*
** Build a string with a "description" for the value 'o', such as
** "variable 'x'" or "upvalue 'y'".
*/
static const char *varinfo (lrt_State *L, const TValue *o) {
  CallInfo *ci = L->getCI();
  const char *name = nullptr;  /* to avoid warnings */
  const char *kind = nullptr;
  if (ci->isLua()) {
    kind = getupvalname(L, ci, o, &name);  /* check whether 'o' is an upvalue */
    if (!kind) {  /* not an upvalue? */
      int reg = instack(L, ci, o);  /* try a register */
      if (reg >= 0)
        kind = getobjname(L->ciFunc(ci)->getProto(), lrtG_currentpc(L, ci),
                          reg, &name);
    }
  }
  return formatvarinfo(L, kind, name);
}


l_noret lrtG_typeerror (lrt_State *L, const TValue *o, const char *op) {
  const char *t = lrtT_objtypename(o);
  lrtG_runerror(L, "attempt to %s a %s value%s", op, t, varinfo(L, o));
}


l_noret lrtG_callerror (lrt_State *L, const TValue *o) {
  lrtG_typeerror(L, o, "call");
}


/*
** Error when both values are convertible to numbers, but not to integers
** or the operation fails for the first non-number operand.
*/
l_noret lrtG_opinterror (lrt_State *L, const TValue *p1,
                         const TValue *p2, const char *msg) {
  if (!p1->isNumber())  /* first operand is wrong? */
    p2 = p1;  /* now second is wrong too */
  lrtG_typeerror(L, p2, msg);
}


l_noret lrtG_ordererror (lrt_State *L, const TValue *p1, const TValue *p2) {
  const char *t1 = lrtT_objtypename(p1);
  const char *t2 = lrtT_objtypename(p2);
  if (std::strcmp(t1, t2) == 0)
    lrtG_runerror(L, "attempt to compare two %s values", t1);
  else
    lrtG_runerror(L, "attempt to compare %s with %s", t1, t2);
}


/* add src:line information to 'msg' */
const char *lrtG_addinfo (lrt_State *L, const char *msg, TString *src,
                                        int line) {
  char buff[LRT_IDSIZE];
  if (src)
    lrtO_chunkid(buff, src->c_str(), src->length());
  else {  /* no source available; use "?" instead */
    buff[0] = '?'; buff[1] = '\0';
  }
  return lrtO_pushfstring(L, "%s:%d: %s", buff, line, msg);
}


/*
** Raise the error object on the top of the stack, calling the message
** handler of the current protected call first. Memory errors skip the
** handler.
*/
l_noret lrtG_errormsg (lrt_State *L, int status) {
  if (L->getErrFunc() != 0 && status != LRT_ERRMEM) {  /* is there an error handling function? */
    StkId errfunc = L->getErrFunc();
    lrt_assert(L->s2v(errfunc)->isFunction());
    *L->s2v(L->getTop()) = *L->s2v(L->getTop() - 1);  /* move argument */
    *L->s2v(L->getTop() - 1) = *L->s2v(errfunc);  /* push function */
    L->getStackSubsystem().push();  /* assume EXTRA_STACK */
    L->callNoYield(L->getTop() - 2, 1);  /* call it */
  }
  L->doThrow(cast(TStatus, status));
}


/*
** Raise the message just pushed on the stack, adding position
** information when the error comes from bytecode.
*/
static l_noret raisepushed (lrt_State *L, int status, const char *msg) {
  CallInfo *ci = L->getCI();
  if (ci->isLua()) {  /* bytecode function? */
    lrtG_addinfo(L, msg, L->ciFunc(ci)->getProto()->getSource(),
                 getcurrentline(L, ci));
    *L->s2v(L->getTop() - 2) = *L->s2v(L->getTop() - 1);  /* remove 'msg' */
    L->setTop(L->getTop() - 1);
  }
  lrtG_errormsg(L, status);
}


l_noret lrtG_raise (lrt_State *L, int status, const char *fmt, ...) {
  const char *msg;
  va_list argp;
  va_start(argp, fmt);
  msg = lrtO_pushvfstring(L, fmt, argp);  /* format message */
  va_end(argp);
  raisepushed(L, status, msg);
}


l_noret lrtG_runerror (lrt_State *L, const char *fmt, ...) {
  const char *msg;
  va_list argp;
  va_start(argp, fmt);
  msg = lrtO_pushvfstring(L, fmt, argp);  /* format message */
  va_end(argp);
  raisepushed(L, LRT_ERRRUN, msg);
}
