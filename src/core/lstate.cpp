/*
** $Id: lstate.cpp $
** Global State
** See Copyright Notice in lrt.h
*/

#define lstate_c
#define LRT_CORE

#include <cstddef>
#include <new>

#include "lrt.h"

#include "lapi.h"
#include "ldebug.h"
#include "ldo.h"
#include "lfunc.h"
#include "lgc.h"
#include "lmem.h"
#include "lstate.h"
#include "lstring.h"
#include "ltable.h"


CallInfo *lrtE_extendCI (lrt_State *L) {
  CallInfo *ci;
  lrt_assert(L->getCI()->getNext() == nullptr);
  ci = lrtM_construct<CallInfo>(L, sizeof(CallInfo));
  L->getCI()->setNext(ci);
  ci->setPrevious(L->getCI());
  ci->setNext(nullptr);
  L->getNCIRef()++;
  return ci;
}


/*
** free all CallInfo structures not in use by a thread
*/
void lrtE_freeCI (lrt_State *L) {
  CallInfo *ci = L->getCI();
  CallInfo *next = ci->getNext();
  ci->setNext(nullptr);
  while ((ci = next) != nullptr) {
    next = ci->getNext();
    lrtM_free(L, ci);
    L->getNCIRef()--;
  }
}


/*
** free half of the CallInfo structures not in use by a thread,
** keeping the first one.
*/
void lrtE_shrinkCI (lrt_State *L) {
  CallInfo *ci = L->getCI()->getNext();  /* first free CallInfo */
  CallInfo *next;
  if (ci == nullptr)
    return;  /* no extra elements */
  while ((next = ci->getNext()) != nullptr) {  /* two extra elements? */
    CallInfo *next2 = next->getNext();  /* next's next */
    ci->setNext(next2);  /* remove next from the list */
    L->getNCIRef()--;
    lrtM_free(L, next);  /* free next */
    if (next2 == nullptr)
      break;  /* no more elements */
    else {
      next2->setPrevious(ci);
      ci = next2;  /* continue */
    }
  }
}


/*
** Called when 'getCcalls(L)' larger or equal to LRTI_MAXCCALLS.
** If equal, raises an overflow error. If value is larger than
** LRTI_MAXCCALLS (which means it is handling an overflow) but
** not much larger, does not report an error (to allow overflow
** handling to work).
*/
void lrtE_checkcstack (lrt_State *L) {
  if (getCcalls(L) == LRTI_MAXCCALLS)
    lrtG_raise(L, LRT_ERRSTACK, "C stack overflow");
  else if (getCcalls(L) >= (LRTI_MAXCCALLS / 10 * 11))
    L->errorError();  /* error while handling stack error */
}


void lrtE_incCstack (lrt_State *L) {
  L->getNCcallsRef()++;
  if (l_unlikely(getCcalls(L) >= LRTI_MAXCCALLS))
    lrtE_checkcstack(L);
}


void lrt_State::resetCI () noexcept {
  CallInfo *bci = getBaseCI();
  ci = bci;
  bci->funcRef() = 0;
  s2v(0)->setNil();  /* 'function' entry for basic 'ci' */
  bci->topRef() = 1 + LRT_MINSTACK;  /* +1 for 'function' entry */
  bci->setK(nullptr);
  bci->setCallStatus(CIST_C);
  status = LRT_OK;
  errfunc = 0;  /* stack unwind can "throw away" the error function */
}


static void stack_init (lrt_State *L1, lrt_State *L) {
  L1->getStackSubsystem().init(L);  /* errors are raised on 'L' */
  L1->resetCI();
  L1->setTop(1);  /* +1 for 'function' entry */
}


static void freestack (lrt_State *L) {
  if (!L->getStackSubsystem().isAllocated())
    return;  /* stack not completely built yet */
  L->setCI(L->getBaseCI());  /* free the entire 'ci' list */
  lrtE_freeCI(L);
  lrt_assert(L->getNCI() == 0);
  L->getStackSubsystem().free();
}


/*
** Create registry table and its predefined values
*/
static void init_registry (lrt_State *L, global_State *g) {
  TValue aux;
  Table *registry = Table::create(L, LRT_RIDX_LAST, 0);
  g->getRegistry()->setTable(registry);
  /* registry[LRT_RIDX_MAINTHREAD] = L */
  aux.setThread(L);
  registry->setInt(L, LRT_RIDX_MAINTHREAD, &aux);
  /* registry[LRT_RIDX_GLOBALS] = new table (table of globals) */
  aux.setTable(Table::create(L, 0, 0));
  registry->setInt(L, LRT_RIDX_GLOBALS, &aux);
}


/*
** open parts of the state that may cause memory-allocation errors.
*/
static void f_open (lrt_State *L, void *ud) {
  UNUSED(ud);
  stack_init(L, L);
  lrtS_init(L);  /* memory-error message must exist before the registry */
  init_registry(L, G(L));  /* now state is complete */
}


static void close_state (lrt_State *L) {
  global_State *g = G(L);
  if (g->isComplete()) {  /* closing a fully built state? */
    L->resetCI();
    lrtF_closeupval(L, 1);  /* close all upvalues */
    L->setTop(1);
  }
  lrtC_freeallobjects(L);  /* collect all objects */
  freestack(L);
  lrt_Alloc f = g->getFrealloc();
  void *ud = g->getUd();
  g->~global_State();
  (*f)(ud, g, sizeof(global_State), 0);  /* free main block */
}


LRT_API lrt_State *lrt_newthread (lrt_State *L) {
  lrt_State *L1 = lrtC_newobj<lrt_State>(L, sizeof(lrt_State), G(L));
  /* anchor it on L stack */
  L->s2v(L->getTop())->setThread(L1);
  api_incr_top(L);
  L1->setCoStatus(LRT_COCREATED);
  stack_init(L1, L);
  return L1;
}


void lrtE_freethread (lrt_State *L, lrt_State *L1) {
  lrtF_closeupval(L1, 0);  /* close all upvalues */
  lrt_assert(L1->getOpenUpval() == nullptr);
  freestack(L1);
  lrtM_delete(L, L1, sizeof(lrt_State));
}


/*
** Bring a thread back to its base level: upvalues are closed and the
** stack keeps only the error object (if 'status' is an error).
*/
TStatus lrtE_resetthread (lrt_State *L, TStatus status) {
  L->resetCI();
  if (status == LRT_YIELD)
    status = LRT_OK;
  lrtF_closeupval(L, 1);
  if (status != LRT_OK)  /* errors? */
    L->setErrorObj(status, 1);
  else
    L->setTop(1);
  L->setCancelled(false);
  if (!L->getStackSubsystem().realloc(L, L->getCI()->getTop(), 0))
    status = LRT_ERRMEM;  /* stack reallocation failed */
  return status;
}


/*
** Reset a thread to the "created" state. A thread with active calls
** (running, or resuming another thread) cannot be reset.
*/
LRT_API int lrt_closethread (lrt_State *L, lrt_State *from) {
  TStatus status;
  int co = L->getCoStatus();
  if (L == from ||
      ((co == LRT_CORUNNING || co == LRT_CONORMAL) &&
       L->getCI() != L->getBaseCI()))
    lrtG_raise((from != nullptr) ? from : L, LRT_ERRCORO,
               "cannot close a %s coroutine",
               (co == LRT_CONORMAL) ? "normal" : "running");
  L->setNCcalls((from) ? getCcalls(from) : 0);
  if (L == G(L)->getMainThread())
    incnny(L);  /* main thread is always non yieldable */
  else
    L->setCoStatus(LRT_COCREATED);
  status = lrtE_resetthread(L, L->getStatus());
  return APIstatus(status);
}


LRT_API lrt_State *lrt_newstate (lrt_Alloc f, void *ud) {
  void *block = (*f)(ud, nullptr, 0, sizeof(global_State));
  if (block == nullptr) return nullptr;
  global_State *g = new (block) global_State(f, ud);
  lrt_State *L = g->getMainThread();
  L->setCoStatus(LRT_CORUNNING);  /* main thread is always running */
  incnny(L);  /* main thread is always non yieldable */
  if (L->rawRunProtected(f_open, nullptr) != LRT_OK) {
    /* memory allocation error: free partial state */
    close_state(L);
    L = nullptr;
  }
  return L;
}


LRT_API void lrt_close (lrt_State *L) {
  L = G(L)->getMainThread();  /* only the main thread can be closed */
  close_state(L);
}


void lrtE_warning (lrt_State *L, const char *msg, int tocont) {
  lrt_WarnFunction wf = G(L)->getWarnF();
  if (wf != nullptr)
    wf(G(L)->getUdWarn(), msg, tocont);
}


/*
** Generate a warning from an error message
*/
void lrtE_warnerror (lrt_State *L, const char *where) {
  const TValue *errobj = L->s2v(L->getTop() - 1);  /* error object */
  const char *msg = (errobj->isString())
                  ? errobj->stringValue()->c_str()
                  : "error object is not a string";
  /* produce warning "error in %s (%s)" (where, msg) */
  lrtE_warning(L, "error in ", 1);
  lrtE_warning(L, where, 1);
  lrtE_warning(L, " (", 1);
  lrtE_warning(L, msg, 1);
  lrtE_warning(L, ")", 0);
}
