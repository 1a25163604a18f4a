/*
** $Id: ldo.cpp $
** Stack and Call structure of the runtime
** See Copyright Notice in lrt.h
*/

#define ldo_c
#define LRT_CORE

#include <new>

#include "lrt.h"

#include "lapi.h"
#include "ldebug.h"
#include "ldo.h"
#include "lfunc.h"
#include "lmem.h"
#include "lobject.h"
#include "lstate.h"
#include "lstring.h"
#include "ltm.h"
#include "lvm.h"


/* maximum number of '__call' handlers chained for a single call */
inline constexpr int MAXCALLTM = 15;


/*
** {======================================================
** Error-recovery functions
** =======================================================
*/

void lrt_State::setErrorObj (TStatus errcode, StkId oldtop) {
  switch (errcode) {
    case LRT_ERRMEM: {  /* memory error? */
      s2v(oldtop)->setString(G(this)->getMemErrMsg());  /* reuse preregistered msg. */
      break;
    }
    case LRT_ERRERR: {
      s2v(oldtop)->setString(lrtS_newliteral(this, "error in error handling"));
      break;
    }
    case LRT_OK: {  /* special case only for closing upvalues */
      s2v(oldtop)->setNil();  /* no error message */
      break;
    }
    default: {
      lrt_assert(errorstatus(errcode));  /* real error */
      *s2v(oldtop) = *s2v(getTop() - 1);  /* error message on current top */
      break;
    }
  }
  setTop(oldtop + 1);
}


/*
** Throw an error. With a recover point active, the exception is
** addressed to it. Otherwise the thread is brought back to its base
** level: a coroutine dies and the error goes to the main thread when
** that one has a recover point; as a last resort the panic function
** runs and the exception leaves the runtime to reach the host.
*/
l_noret lrt_State::doThrow (TStatus errcode) {
  if (errorJmp) {  /* thread has an error handler? */
    errorJmp->status = errcode;  /* set status */
    throw LrtException(errcode, errorJmp);
  }
  throwBaseLevel(errcode);
}


l_noret lrt_State::throwBaseLevel (TStatus errcode) {
  global_State *g = G(this);
  lrt_State *mainth = g->getMainThread();
  errcode = lrtE_resetthread(this, errcode);  /* close all upvalues */
  if (this != mainth) {
    status = errcode;  /* mark it as dead */
    costatus = LRT_CODEAD;
  }
  if (mainth->getErrorJmp()) {  /* main thread has a handler? */
    *mainth->s2v(mainth->getTop()) = *s2v(getTop() - 1);  /* copy error obj. */
    mainth->inctop();
    mainth->doThrow(errcode);  /* re-throw in main thread */
  }
  else {  /* no handler at all */
    lrt_CFunction panic = g->getPanic();
    if (panic)  /* panic function? */
      panic(this);  /* call panic function (last chance to jump out) */
    lrtE_warnerror(this, "unprotected call");
    setNCcalls(0);  /* no native call of the runtime is active anymore */
    if (this == mainth)
      incnny(this);  /* main thread is always non yieldable */
    throw LrtException(errcode);  /* the host gets it */
  }
}


/*
** Raise an error while handling another error (or a stack overflow
** inside a message handler).
*/
l_noret lrt_State::errorError () {
  TString *msg = lrtS_newliteral(this, "error in error handling");
  s2v(getTop())->setString(msg);
  stack.push();  /* assume EXTRA_STACK */
  doThrow(LRT_ERRERR);
}


/*
** Run 'f' in protected mode. Exceptions addressed to this recover
** point stop here and give their status; 'std::bad_alloc' thrown by a
** container becomes a memory error. Any other exception keeps going
** after the state of the thread is restored.
*/
TStatus lrt_State::rawRunProtected (Pfunc f, void *ud) {
  l_uint32 oldnCcalls = nCcalls;
  lrt_longjmp lj;
  lj.status = LRT_OK;
  lj.previous = errorJmp;  /* chain new error handler */
  errorJmp = &lj;
  try {
    f(this, ud);
  }
  catch (const LrtException& ex) {
    if (ex.handler() != &lj) {  /* addressed to an outer level? */
      errorJmp = lj.previous;
      nCcalls = oldnCcalls;
      throw;
    }
    lj.status = cast(TStatus, ex.status());
  }
  catch (const std::bad_alloc&) {
    lj.status = LRT_ERRMEM;
  }
  catch (...) {  /* foreign exception: restore and propagate */
    errorJmp = lj.previous;
    nCcalls = oldnCcalls;
    throw;
  }
  errorJmp = lj.previous;  /* restore old error handler */
  nCcalls = oldnCcalls;
  return lj.status;
}

/* }====================================================== */


void lrt_State::inctop () {
  stack.incTop(this);
}


/*
** {==================================================================
** Function calls
** ===================================================================
*/

/*
** Check whether 'func' has a '__call' handler. If so, put it in the
** stack, below original 'func', so that 'preCall' can call it. Raise
** an error if there is no '__call' handler.
*/
StkId lrt_State::tryFuncTM (StkId func) {
  TValue tm;
  if (!lrtT_gettm(this, s2v(func), TMS::TM_CALL, &tm))  /* no handler? */
    lrtG_callerror(this, s2v(func));
  lrtD_checkstack(this, 1);  /* space for the handler */
  for (StkId p = getTop(); p > func; p--)  /* open space for handler */
    *s2v(p) = *s2v(p - 1);
  stack.push();  /* stack space pre-allocated by the caller */
  *s2v(func) = tm;  /* handler is the new function to be called */
  return func;
}


/* Generic case for 'moveResults' */
void lrt_State::genMoveResults (StkId res, int nres, int wanted) {
  StkId firstresult = getTop() - nres;  /* index of first result */
  int i;
  if (nres > wanted)  /* extra results? */
    nres = wanted;  /* don't need them */
  else if (nres < wanted)
    lrtD_checkstack(this, wanted - nres);
  for (i = 0; i < nres; i++)  /* move all results to correct place */
    *s2v(res + i) = *s2v(firstresult + i);
  for (; i < wanted; i++)  /* complete wanted number of results */
    s2v(res + i)->setNil();
  setTop(res + wanted);  /* top points after the last result */
}


/*
** Given 'nres' results at 'firstResult', move 'wanted' of them to 'res'.
** Handle most typical cases (zero results for commands, one result for
** expressions, multiple results for tail calls/single parameters)
** separated.
*/
void lrt_State::moveResults (StkId res, int nres, int wanted) {
  switch (wanted) {  /* handle typical cases separately */
    case 0:  /* no values needed */
      setTop(res);
      return;
    case 1:  /* one value needed */
      if (nres == 0)  /* no results? */
        s2v(res)->setNil();  /* adjust with nil */
      else  /* at least one result */
        *s2v(res) = *s2v(getTop() - nres);  /* move it to proper place */
      setTop(res + 1);
      return;
    case LRT_MULTRET:
      wanted = nres;  /* we want all results */
      break;
    default:
      break;
  }
  genMoveResults(res, nres, wanted);
}


/*
** Finishes a function call: moves the results to the function slot
** and goes back to the caller.
*/
void lrt_State::postCall (CallInfo *ci_arg, int nres) {
  int wanted = ci_arg->getNResults();
  moveResults(ci_arg->getFunc(), nres, wanted);
  lrt_assert(!(ci_arg->getCallStatus() & CIST_YPCALL));
  ci = ci_arg->getPrevious();  /* back to caller */
}


CallInfo* lrt_State::prepareCallInfo (StkId func, l_uint32 mask, StkId top) {
  CallInfo *nci = next_ci(this);  /* new frame */
  ci = nci;
  nci->funcRef() = func;
  nci->setCallStatus(mask);
  nci->topRef() = top;
  return nci;
}


/*
** precall for native functions
*/
int lrt_State::preCallC (StkId func, int nresults, lrt_CFunction f) {
  int n;  /* number of returns */
  lrtD_checkstack(this, LRT_MINSTACK);  /* ensure minimum stack size */
  CallInfo *nci = prepareCallInfo(func, cast(l_uint32, nresults + 1) | CIST_C,
                                  getTop() + LRT_MINSTACK);
  n = (*f)(this);  /* do the actual call */
  if (l_unlikely(n < 0 || n > getTop() - (nci->getFunc() + 1)))
    lrtG_runerror(this, "native function returned %d values, %d available",
                        n, getTop() - (nci->getFunc() + 1));
  postCall(nci, n);
  return n;
}


/*
** Raise a pending cancellation of the thread. A call boundary is the
** only point where it is observed; the request is consumed.
*/
static void checkcancel (lrt_State *L) {
  if (l_unlikely(L->isCancelled())) {
    L->setCancelled(false);
    lrtG_runerror(L, "thread cancelled");
  }
}


/*
** Prepare a function for a tail call, building its call info on top
** of the current call info. 'narg1' is the number of arguments plus 1
** (so that it includes the function itself). Return the number of
** results, if it was a native function, or -1 for a bytecode function.
*/
int lrt_State::preTailCall (CallInfo *cci, StkId func, int narg1, int delta) {
  int ncalltm = 0;
  checkcancel(this);
 retry:
  switch (s2v(func)->typeTag()) {
    case ValueTag::CCL:  /* native closure */
      return preCallC(func, LRT_MULTRET, s2v(func)->cClosureValue()->getFunction());
    case ValueTag::LCF:  /* light native function */
      return preCallC(func, LRT_MULTRET, s2v(func)->functionValue());
    case ValueTag::LCL: {  /* bytecode function */
      Proto *p = s2v(func)->lClosureValue()->getProto();
      int fsize = p->getMaxStackSize();  /* frame size */
      int nfixparams = p->getNumParams();
      lrtD_checkstack(this, fsize - delta);
      cci->funcRef() -= delta;  /* restore 'func' (if vararg) */
      for (int i = 0; i < narg1; i++)  /* move down function and arguments */
        *s2v(cci->getFunc() + i) = *s2v(func + i);
      func = cci->getFunc();  /* moved-down function */
      for (; narg1 <= nfixparams; narg1++)
        s2v(func + narg1)->setNil();  /* complete missing arguments */
      cci->topRef() = func + 1 + fsize;  /* top for new function */
      lrt_assert(cci->getTop() <= stack.getLast());
      cci->setSavedPC(p->getCode().data());  /* starting point */
      cci->callStatusRef() |= CIST_TAIL;
      setTop(func + narg1);  /* set top */
      return -1;
    }
    default: {  /* not a function */
      if (++ncalltm > MAXCALLTM)
        lrtG_runerror(this, "'__call' chain too long");
      func = tryFuncTM(func);  /* try to get '__call' handler */
      narg1++;
      goto retry;  /* try again */
    }
  }
}


/*
** Prepares the call to a function (native or bytecode). For native
** functions, also do the call. Returns the CallInfo to be executed, if
** it was a bytecode function, or nullptr after a native call.
*/
CallInfo* lrt_State::preCall (StkId func, int nresults) {
  int ncalltm = 0;
  checkcancel(this);
 retry:
  switch (s2v(func)->typeTag()) {
    case ValueTag::CCL:  /* native closure */
      preCallC(func, nresults, s2v(func)->cClosureValue()->getFunction());
      return nullptr;
    case ValueTag::LCF:  /* light native function */
      preCallC(func, nresults, s2v(func)->functionValue());
      return nullptr;
    case ValueTag::LCL: {  /* bytecode function */
      Proto *p = s2v(func)->lClosureValue()->getProto();
      int narg = getTop() - func - 1;  /* number of real arguments */
      int nfixparams = p->getNumParams();
      int fsize = p->getMaxStackSize();  /* frame size */
      lrtD_checkstack(this, fsize);
      CallInfo *nci = prepareCallInfo(func, cast(l_uint32, nresults + 1),
                                      func + 1 + fsize);
      nci->setSavedPC(p->getCode().data());  /* starting point */
      for (; narg < nfixparams; narg++) {
        s2v(getTop())->setNil();  /* complete missing arguments */
        stack.push();
      }
      lrt_assert(nci->getTop() <= stack.getLast());
      return nci;
    }
    default: {  /* not a function */
      if (++ncalltm > MAXCALLTM)
        lrtG_runerror(this, "'__call' chain too long");
      func = tryFuncTM(func);  /* try to get '__call' handler */
      goto retry;  /* try again with handler */
    }
  }
}


/*
** Call a function (native or bytecode) through native code. 'inc' can
** be 1 (increment number of recursive invocations in the native stack)
** or nyci (the same plus increment number of non-yieldable calls).
*/
void lrt_State::cCall (StkId func, int nResults, l_uint32 inc) {
  CallInfo *nci;
  nCcalls += inc;
  if (l_unlikely(getCcalls(this) >= LRTI_MAXCCALLS)) {
    lrtD_checkstack(this, 0);  /* free any use of EXTRA_STACK */
    lrtE_checkcstack(this);
  }
  if ((nci = preCall(func, nResults)) != nullptr) {  /* bytecode function? */
    nci->callStatusRef() |= CIST_FRESH;  /* mark that it is a "fresh" execute */
    VirtualMachine(this).execute(nci);  /* call it */
  }
  nCcalls -= inc;
}


/*
** External interface for 'cCall'
*/
void lrt_State::call (StkId func, int nResults) {
  cCall(func, nResults, 1);
}


/*
** Similar to 'call', but does not allow yields during the call.
*/
void lrt_State::callNoYield (StkId func, int nResults) {
  cCall(func, nResults, nyci);
}


/*
** Call a function in protected mode, restoring basic thread
** information ('ci', 'errfunc', 'top') in case of errors and leaving
** the error object at 'old_top'.
*/
TStatus lrt_State::pCall (Pfunc func, void *u, StkId old_top, StkId ef) {
  TStatus st;
  CallInfo *old_ci = ci;
  StkId old_errfunc = errfunc;
  errfunc = ef;
  st = rawRunProtected(func, u);
  if (l_unlikely(st != LRT_OK)) {  /* an error occurred? */
    ci = old_ci;
    lrtF_closeupval(this, old_top);
    setErrorObj(st, old_top);
    stack.shrink(this);  /* restore stack size in case of overflow */
  }
  errfunc = old_errfunc;
  return st;
}

/* }================================================================== */


/*
** {======================================================
** Coroutines
** =======================================================
*/

/*
** Completes the execution of a native function interrupted by an
** "error" or a "yield" inside a yieldable protected call.
*/
TStatus lrt_State::finishPCallK (CallInfo *pci) {
  TStatus st = cast(TStatus, pci->getRecoverStatus());  /* get original status */
  if (l_likely(st == LRT_OK))  /* no error? */
    st = LRT_YIELD;  /* was interrupted by an yield */
  else {  /* error */
    StkId func = pci->getFuncIdx();
    lrtF_closeupval(this, func);
    setErrorObj(st, func);
    stack.shrink(this);  /* restore stack size in case of overflow */
    pci->setRecoverStatus(LRT_OK);  /* clear original status */
  }
  pci->callStatusRef() &= ~CIST_YPCALL;
  errfunc = pci->getOldErrFunc();
  /* if it is here, there were errors or yields; unlike 'lrt_pcallk',
     do not change status */
  return st;
}


/*
** Completes the execution of a native function interrupted by a yield
** (or by an error inside a yieldable protected call): calls its
** continuation and finishes the call.
*/
void lrt_State::finishCCall (CallInfo *cci) {
  int n;  /* actual number of results from native function */
  TStatus st = LRT_YIELD;  /* default if there were no errors */
  lrt_assert(cci->getK() != nullptr && yieldable(this));
  if (cci->getCallStatus() & CIST_YPCALL)  /* was inside a 'lrt_pcallk'? */
    st = finishPCallK(cci);  /* finish it */
  adjustresults(this, LRT_MULTRET);  /* finish 'lrt_callk' */
  n = (*cci->getK())(this, st, cci->getCtx());  /* call continuation */
  api_checknelems(this, n);
  postCall(cci, n);  /* finish 'preCall' */
}


/*
** Executes "full continuation" (everything in the stack) of a
** previously interrupted coroutine until the stack is empty (or
** another interruption long-jumps out of the loop).
*/
void lrt_State::unrollContinuation (void *ud) {
  CallInfo *uci;
  UNUSED(ud);
  while ((uci = ci) != getBaseCI()) {  /* something in the stack */
    if (uci->isC())  /* native function? */
      finishCCall(uci);  /* complete its execution */
    else {  /* bytecode function */
      VirtualMachine vm(this);
      vm.finishOp();  /* finish interrupted instruction */
      vm.execute(uci);  /* execute down to higher native 'boundary' */
    }
  }
}


static void unroll (lrt_State *L, void *ud) {
  L->unrollContinuation(ud);
}


/*
** Try to find a suspended protected call (a "recover point") for the
** given thread.
*/
CallInfo* lrt_State::findPCall () {
  for (CallInfo *pci = ci; pci != nullptr; pci = pci->getPrevious()) {
    if (pci->getCallStatus() & CIST_YPCALL)
      return pci;
  }
  return nullptr;  /* no pending pcall */
}


/*
** Signal an error in the call to 'lrt_resume', not in the execution
** of the coroutine itself. The coroutine keeps its state.
*/
static int resume_error (lrt_State *L, int status, const char *msg, int narg) {
  L->setTop(L->getTop() - narg);  /* remove args from the stack */
  L->s2v(L->getTop())->setString(lrtS_new(L, msg));  /* push error message */
  api_incr_top(L);
  return status;
}


/*
** Do the work for 'lrt_resume' in protected mode. Most of the work
** depends on the status of the coroutine: initial state, or suspended
** by a yield.
*/
static void resume (lrt_State *L, void *ud) {
  int n = *(cast(int*, ud));  /* number of arguments */
  StkId firstArg = L->getTop() - n;  /* first argument */
  CallInfo *ci = L->getCI();
  if (L->getStatus() == LRT_OK)  /* starting a coroutine? */
    L->cCall(firstArg - 1, LRT_MULTRET, 0);  /* just call its body */
  else {  /* resuming from previous yield */
    lrt_assert(L->getStatus() == LRT_YIELD);
    L->setStatus(LRT_OK);  /* mark that it is running (again) */
    lrt_assert(ci->isC());  /* yields only happen inside native functions */
    if (ci->getK() != nullptr) {  /* does it have a continuation function? */
      n = (*ci->getK())(L, LRT_YIELD, ci->getCtx());  /* call continuation */
      api_checknelems(L, n);
    }
    L->postCall(ci, n);  /* finish 'preCall' */
    L->unrollContinuation(nullptr);  /* run continuation */
  }
}


/*
** Unrolls a coroutine in protected mode while there are recoverable
** errors, that is, errors inside a protected call. (Any error
** interrupts 'unroll', and this loop protects it again so it can
** continue.) Stops with a normal end (status OK), an yield (status
** YIELD), or an unprotected error ('findPCall' doesn't find a
** recover point).
*/
static TStatus precover (lrt_State *L, TStatus status) {
  CallInfo *ci;
  while (errorstatus(status) && (ci = L->findPCall()) != nullptr) {
    L->setCI(ci);  /* go down to recovery functions */
    ci->setRecoverStatus(status);  /* status to finish 'pcall' */
    status = L->rawRunProtected(unroll, nullptr);
  }
  return status;
}


LRT_API int lrt_resume (lrt_State *L, lrt_State *from, int nargs,
                                      int *nresults) {
  TStatus status;
  int co = L->getCoStatus();
  int fromco = LRT_CORUNNING;
  int needed = (co == LRT_COCREATED) ? nargs + 1 : nargs;
  if (l_unlikely(nargs < 0 ||
                 !L->getStackSubsystem().checkHasElements(L->getCI(), needed))) {
    /* the coroutine's stack is left as it is */
    if (from != nullptr)
      lrtG_raise(from, LRT_ERRINDEX,
                 "not enough values on the coroutine stack (%d needed)", needed);
    *nresults = 0;
    return LRT_ERRINDEX;
  }
  if (co == LRT_CORUNNING || co == LRT_CONORMAL)
    return resume_error(L, LRT_ERRCORO, "cannot resume non-suspended coroutine", nargs);
  else if (co == LRT_CODEAD || (L->getStatus() != LRT_OK && L->getStatus() != LRT_YIELD))
    return resume_error(L, LRT_ERRCORO, "cannot resume dead coroutine", nargs);
  else if (co == LRT_COCREATED) {  /* may be starting a coroutine */
    if (L->getCI() != L->getBaseCI())  /* running as a plain thread? */
      return resume_error(L, LRT_ERRCORO, "cannot resume non-suspended coroutine", nargs);
    if (L->getTop() - (L->getCI()->getFunc() + 1) == nargs)  /* no function? */
      return resume_error(L, LRT_ERRCORO, "cannot resume dead coroutine", nargs);
  }
  L->setNCcalls((from) ? getCcalls(from) : 0);
  if (getCcalls(L) >= LRTI_MAXCCALLS)
    return resume_error(L, LRT_ERRSTACK, "C stack overflow", nargs);
  L->getNCcallsRef()++;
  if (from != nullptr) {
    fromco = from->getCoStatus();
    from->setCoStatus(LRT_CONORMAL);
  }
  L->setCoStatus(LRT_CORUNNING);
  status = L->rawRunProtected(resume, &nargs);
  /* continue running after recoverable errors */
  status = precover(L, status);
  if (l_likely(!errorstatus(status)))
    lrt_assert(status == L->getStatus());  /* normal end or yield */
  else {  /* unrecoverable error */
    L->setStatus(status);  /* mark thread as 'dead' */
    L->setErrorObj(status, L->getTop());  /* push error message */
    L->getCI()->topRef() = L->getTop();
  }
  *nresults = (status == LRT_YIELD) ? L->getCI()->getNYield()
                                    : cast_int(L->getTop() - (L->getCI()->getFunc() + 1));
  L->setCoStatus((status == LRT_YIELD) ? LRT_COYIELDED : LRT_CODEAD);
  if (from != nullptr)
    from->setCoStatus(fromco);
  return APIstatus(status);
}


LRT_API int lrt_isyieldable (lrt_State *L) {
  return yieldable(L);
}


LRT_API int lrt_yieldk (lrt_State *L, int nresults, lrt_KContext ctx,
                        lrt_KFunction k) {
  CallInfo *ci = L->getCI();
  api_checknelems(L, nresults);
  if (l_unlikely(!yieldable(L) || L->getCoStatus() != LRT_CORUNNING)) {
    if (L == G(L)->getMainThread() || L->getCoStatus() != LRT_CORUNNING)
      lrtG_raise(L, LRT_ERRYIELD, "attempt to yield from outside a coroutine");
    else
      lrtG_raise(L, LRT_ERRYIELD, "attempt to yield across a C-call boundary");
  }
  L->setStatus(LRT_YIELD);
  ci->setNYield(nresults);  /* save number of results */
  lrt_assert(ci->isC());  /* yields only happen inside native functions */
  ci->setK(k);  /* save continuation */
  if (k != nullptr)
    ci->setCtx(ctx);  /* save context */
  L->doThrow(LRT_YIELD);
}

/* }====================================================== */


/*
** {======================================================
** Compilation
** =======================================================
*/

/* data to 'f_compile' */
struct SCompile {
  const char *text;
  size_t len;
  const char *name;
};


static void f_compile (lrt_State *L, void *ud) {
  SCompile *c = cast(SCompile *, ud);
  global_State *g = G(L);
  lrt_Compiler comp = g->getCompiler();
  if (comp == nullptr)
    lrtG_raise(L, LRT_ERRSYNTAX, "no compiler installed");
  StkId oldtop = L->getTop();
  int status = comp(L, g->getUdCompiler(), c->text, c->len, c->name);
  if (status != LRT_OK) {
    if (L->getTop() <= oldtop)  /* compiler did not push a message? */
      lrtG_raise(L, LRT_ERRSYNTAX, "%s: compilation failed", c->name);
    L->doThrow(cast(TStatus, errorstatus(status) ? status : LRT_ERRSYNTAX));
  }
  if (L->getTop() != oldtop + 1 || !L->s2v(oldtop)->isFunction())
    lrtG_raise(L, LRT_ERRSYNTAX, "%s: compiler did not produce a function", c->name);
}


TStatus lrtD_compile (lrt_State *L, const char *text, size_t len,
                      const char *chunkname) {
  SCompile c;
  TStatus status;
  c.text = text;
  c.len = len;
  c.name = chunkname;
  incnny(L);  /* cannot yield during compilation */
  status = L->pCall(f_compile, &c, L->getTop(), L->getErrFunc());
  decnny(L);
  return status;
}

/* }====================================================== */
