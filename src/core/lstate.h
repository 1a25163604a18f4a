/*
** $Id: lstate.h $
** Global State
** See Copyright Notice in lrt.h
*/

#ifndef lstate_h
#define lstate_h

#include "lrt.h"


class global_State;

/* Type of protected functions, to be run by 'rawRunProtected' */
typedef void (*Pfunc) (lrt_State *L, void *ud);


#include "lobject.h"
#include "lstack.h"
#include "lstring.h"


/*
** About 'nCcalls': This count has two parts: the lower 16 bits counts
** the number of recursive invocations in the native stack; the higher
** 16 bits counts the number of non-yieldable calls in the stack.
** (They are together so that we can change and save both with one
** instruction.)
*/

/* Increments 'L->nCcalls' for a non-yieldable native call */
inline constexpr l_uint32 nyci = (0x10000 | 1);


/*
** Maximum expected number of results from a function
** (must fit in CIST_NRESULTS).
*/
inline constexpr int MAXRESULTS = 250;


/*
** Bits in CallInfo status
*/
/* bits 0-7 are the expected number of results from this function + 1 */
inline constexpr l_uint32 CIST_NRESULTS = 0xffu;

/* Bits 8-11 are used for CIST_RECST (see below) */
inline constexpr int CIST_RECST = 8;  /* the offset, not the mask */

/* call is running a native function */
inline constexpr l_uint32 CIST_C = (1u << (CIST_RECST + 4));
/* call is on a fresh "execute" frame */
inline constexpr l_uint32 CIST_FRESH = (CIST_C << 1);
/* doing a yieldable protected call */
inline constexpr l_uint32 CIST_YPCALL = (CIST_FRESH << 1);
/* call was tail called */
inline constexpr l_uint32 CIST_TAIL = (CIST_YPCALL << 1);


/*
** Information about a call.
** About union 'u':
** - field 'l' is used only for bytecode functions;
** - field 'c' is used only for native functions.
** About union 'u2':
** - field 'funcidx' is used only by native functions while doing a
** protected call;
** - field 'nyield' is used only while a function is "doing" an
** yield (from the yield until the next resume);
** - field 'nres' is used only while a native function returns after
** a yield inside a protected call.
** Field CIST_RECST of 'callstatus' stores the "recover status", used
** to keep the error status of a yieldable protected call while the
** thread unwinds back to it. (Four bits are enough for error status.)
*/
class CallInfo {
private:
  StkId func;  /* function index in the stack */
  StkId top;  /* top for this function */
  CallInfo *previous, *next;  /* dynamic call link */
  union {
    struct {  /* only for bytecode functions */
      const Instruction *savedpc;
      int nextraargs;  /* # of extra arguments in vararg functions */
    } l;
    struct {  /* only for native functions */
      lrt_KFunction k;  /* continuation in case of yields */
      StkId old_errfunc;
      lrt_KContext ctx;  /* context info. in case of yields */
    } c;
  } u;
  union {
    int funcidx;  /* called-function index */
    int nyield;  /* number of values yielded */
    int nres;  /* number of values returned */
  } u2;
  l_uint32 callstatus;

public:
  CallInfo() noexcept : func(0), top(0), previous(nullptr), next(nullptr),
                        callstatus(0) {
    u.l.savedpc = nullptr;
    u.l.nextraargs = 0;
    u2.funcidx = 0;
  }

  StkId& funcRef() noexcept { return func; }
  StkId getFunc() const noexcept { return func; }
  StkId& topRef() noexcept { return top; }
  StkId getTop() const noexcept { return top; }

  CallInfo* getPrevious() const noexcept { return previous; }
  void setPrevious(CallInfo* prev) noexcept { previous = prev; }

  CallInfo* getNext() const noexcept { return next; }
  void setNext(CallInfo* n) noexcept { next = n; }

  l_uint32 getCallStatus() const noexcept { return callstatus; }
  void setCallStatus(l_uint32 status) noexcept { callstatus = status; }
  l_uint32& callStatusRef() noexcept { return callstatus; }

  bool isLua() const noexcept { return (callstatus & CIST_C) == 0; }
  bool isC() const noexcept { return (callstatus & CIST_C) != 0; }

  int getRecoverStatus() const noexcept { return (callstatus >> CIST_RECST) & 15; }
  void setRecoverStatus(int st) noexcept {
    lrt_assert((st & 15) == st);  /* status must fit in four bits */
    callstatus = (callstatus & ~(15u << CIST_RECST)) | (cast(l_uint32, st) << CIST_RECST);
  }

  const Instruction* getSavedPC() const noexcept { return u.l.savedpc; }
  void setSavedPC(const Instruction* pc) noexcept { u.l.savedpc = pc; }

  int getExtraArgs() const noexcept { return u.l.nextraargs; }
  void setExtraArgs(int n) noexcept { u.l.nextraargs = n; }

  lrt_KFunction getK() const noexcept { return u.c.k; }
  void setK(lrt_KFunction kfunc) noexcept { u.c.k = kfunc; }

  StkId getOldErrFunc() const noexcept { return u.c.old_errfunc; }
  void setOldErrFunc(StkId ef) noexcept { u.c.old_errfunc = ef; }

  lrt_KContext getCtx() const noexcept { return u.c.ctx; }
  void setCtx(lrt_KContext context) noexcept { u.c.ctx = context; }

  int getFuncIdx() const noexcept { return u2.funcidx; }
  void setFuncIdx(int idx) noexcept { u2.funcidx = idx; }

  int getNYield() const noexcept { return u2.nyield; }
  void setNYield(int n) noexcept { u2.nyield = n; }

  int getNRes() const noexcept { return u2.nres; }
  void setNRes(int n) noexcept { u2.nres = n; }

  int getNResults() const noexcept { return cast_int(callstatus & CIST_NRESULTS) - 1; }
};


/*
** 'per thread' state
*/
class lrt_State : public GCObject {
private:
  ValueStack stack;

  CallInfo *ci;  /* call info for current function */
  CallInfo base_ci;  /* CallInfo for first level (host) */

  global_State *l_G;
  UpVal *openupval;  /* list of open upvalues in this stack */

  TStatus status;
  lu_byte costatus;  /* LRT_CO* state of this thread as a coroutine */
  lu_byte cancelled;  /* cancellation requested */
  struct lrt_longjmp *errorJmp;  /* current error recover point */
  StkId errfunc;  /* current message handler (stack index; 0 if none) */

  l_uint32 nCcalls;  /* number of nested (non-yieldable | native) calls */
  int nci;  /* number of items in 'ci' list */

public:
  explicit lrt_State(global_State* g) noexcept
    : GCObject(ValueTag::THREAD), stack(g), ci(nullptr), l_G(g),
      openupval(nullptr), status(LRT_OK), costatus(LRT_COCREATED),
      cancelled(0), errorJmp(nullptr), errfunc(0), nCcalls(0), nci(0) {}

  ValueStack& getStackSubsystem() noexcept { return stack; }
  const ValueStack& getStackSubsystem() const noexcept { return stack; }

  StkId getTop() const noexcept { return stack.getTop(); }
  void setTop(StkId t) noexcept { stack.setTop(t); }

  /* value at a stack slot */
  TValue* s2v(StkId o) noexcept { return stack.at(o); }
  const TValue* s2v(StkId o) const noexcept { return stack.at(o); }

  CallInfo* getCI() noexcept { return ci; }
  const CallInfo* getCI() const noexcept { return ci; }
  void setCI(CallInfo* c) noexcept { ci = c; }

  CallInfo* getBaseCI() noexcept { return &base_ci; }
  const CallInfo* getBaseCI() const noexcept { return &base_ci; }

  global_State* getGlobalState() const noexcept { return l_G; }

  UpVal* getOpenUpval() noexcept { return openupval; }
  void setOpenUpval(UpVal* uv) noexcept { openupval = uv; }
  UpVal** getOpenUpvalPtr() noexcept { return &openupval; }

  TStatus getStatus() const noexcept { return status; }
  void setStatus(TStatus s) noexcept { status = s; }

  int getCoStatus() const noexcept { return costatus; }
  void setCoStatus(int s) noexcept { costatus = cast_byte(s); }

  bool isCancelled() const noexcept { return cancelled != 0; }
  void setCancelled(bool c) noexcept { cancelled = c ? 1 : 0; }

  lrt_longjmp* getErrorJmp() noexcept { return errorJmp; }
  void setErrorJmp(lrt_longjmp* ej) noexcept { errorJmp = ej; }

  StkId getErrFunc() const noexcept { return errfunc; }
  void setErrFunc(StkId ef) noexcept { errfunc = ef; }

  l_uint32 getNCcalls() const noexcept { return nCcalls; }
  void setNCcalls(l_uint32 nc) noexcept { nCcalls = nc; }
  l_uint32& getNCcallsRef() noexcept { return nCcalls; }

  int getNCI() const noexcept { return nci; }
  void setNCI(int n) noexcept { nci = n; }
  int& getNCIRef() noexcept { return nci; }

  void incrementNonYieldable() noexcept { nCcalls += 0x10000; }
  void decrementNonYieldable() noexcept { nCcalls -= 0x10000; }

  /* bytecode closure running in 'c' */
  LClosure* ciFunc(const CallInfo* c) noexcept {
    return s2v(c->getFunc())->lClosureValue();
  }

  /* Stack operation methods (implemented in ldo.cpp) */
  void inctop();

  /* Error handling methods (implemented in ldo.cpp) */
  l_noret doThrow(TStatus errcode);
  l_noret errorError();
  void setErrorObj(TStatus errcode, StkId oldtop);

  /* Call operation methods (implemented in ldo.cpp) */
  CallInfo* preCall(StkId func, int nResults);
  void postCall(CallInfo *ci, int nres);
  int preTailCall(CallInfo *ci, StkId func, int narg1, int delta);
  void call(StkId func, int nResults);
  void callNoYield(StkId func, int nResults);

  /* Protected operation methods (implemented in ldo.cpp) */
  TStatus rawRunProtected(Pfunc f, void *ud);
  TStatus pCall(Pfunc func, void *u, StkId oldtop, StkId ef);

  /* Helpers used by resume and by protected calls (ldo.cpp) */
  void cCall(StkId func, int nResults, l_uint32 inc);
  void unrollContinuation(void *ud);
  TStatus finishPCallK(CallInfo *ci);
  void finishCCall(CallInfo *ci);
  CallInfo* findPCall();

  /* Thread reset (lstate.cpp) */
  void resetCI() noexcept;

private:
  StkId tryFuncTM(StkId func);
  void genMoveResults(StkId res, int nres, int wanted);
  void moveResults(StkId res, int nres, int wanted);
  CallInfo* prepareCallInfo(StkId func, l_uint32 status, StkId top);
  int preCallC(StkId func, int nresults, lrt_CFunction f);
  l_noret throwBaseLevel(TStatus errcode);
};


/* true if this thread does not have non-yieldable calls in the stack */
inline bool yieldable(const lrt_State* L) noexcept {
  return ((L->getNCcalls() & 0xffff0000) == 0);
}

/* real number of native calls */
inline l_uint32 getCcalls(const lrt_State* L) noexcept {
  return (L->getNCcalls() & 0xffff);
}

/* Increment the number of non-yieldable calls */
inline void incnny(lrt_State* L) noexcept {
  L->incrementNonYieldable();
}

/* Decrement the number of non-yieldable calls */
inline void decnny(lrt_State* L) noexcept {
  L->decrementNonYieldable();
}


/*
** global_State subsystems
*/

/* Memory allocation and accounting */
class MemoryAllocator {
private:
  lrt_Alloc frealloc;  /* function to reallocate memory */
  void *ud;            /* auxiliary data to 'frealloc' */
  l_mem totalbytes;    /* number of bytes currently allocated */

public:
  MemoryAllocator(lrt_Alloc f, void *u, l_mem initial) noexcept
    : frealloc(f), ud(u), totalbytes(initial) {}

  lrt_Alloc getFrealloc() const noexcept { return frealloc; }
  void* getUd() const noexcept { return ud; }
  l_mem getTotalBytes() const noexcept { return totalbytes; }
  l_mem& getTotalBytesRef() noexcept { return totalbytes; }
};


/* List of all collectable objects */
class ObjectList {
private:
  GCObject *allgc;
  lrt_AllocHook allochook;  /* called for each new object */
  void *ud_allochook;

public:
  ObjectList() noexcept : allgc(nullptr), allochook(nullptr), ud_allochook(nullptr) {}

  GCObject* getAllGC() const noexcept { return allgc; }
  void setAllGC(GCObject* o) noexcept { allgc = o; }
  GCObject** getAllGCPtr() noexcept { return &allgc; }

  lrt_AllocHook getAllocHook() const noexcept { return allochook; }
  void* getUdAllocHook() const noexcept { return ud_allochook; }
  void setAllocHook(lrt_AllocHook f, void* u) noexcept {
    allochook = f;
    ud_allochook = u;
  }
};


/* External collaborators installed by the host */
class Collaborators {
private:
  lrt_MetaResolver resolver;
  void *ud_resolver;
  lrt_Compiler compiler;
  void *ud_compiler;

public:
  Collaborators() noexcept
    : resolver(nullptr), ud_resolver(nullptr), compiler(nullptr),
      ud_compiler(nullptr) {}

  lrt_MetaResolver getResolver() const noexcept { return resolver; }
  void* getUdResolver() const noexcept { return ud_resolver; }
  void setResolver(lrt_MetaResolver f, void* u) noexcept {
    resolver = f;
    ud_resolver = u;
  }

  lrt_Compiler getCompiler() const noexcept { return compiler; }
  void* getUdCompiler() const noexcept { return ud_compiler; }
  void setCompiler(lrt_Compiler f, void* u) noexcept {
    compiler = f;
    ud_compiler = u;
  }
};


/* Runtime state and service functions */
class RuntimeServices {
private:
  lrt_CFunction panic;        /* called for unprotected errors */
  TString *memerrmsg;         /* message for memory-allocation errors */
  lrt_WarnFunction warnf;     /* warning function */
  void *ud_warn;              /* auxiliary data to 'warnf' */
  int stacklimit;             /* maximum size of a thread stack */

public:
  RuntimeServices() noexcept
    : panic(nullptr), memerrmsg(nullptr), warnf(nullptr), ud_warn(nullptr),
      stacklimit(LRTI_MAXSTACK) {}

  lrt_CFunction getPanic() const noexcept { return panic; }
  void setPanic(lrt_CFunction p) noexcept { panic = p; }

  TString* getMemErrMsg() const noexcept { return memerrmsg; }
  void setMemErrMsg(TString* msg) noexcept { memerrmsg = msg; }

  lrt_WarnFunction getWarnF() const noexcept { return warnf; }
  void* getUdWarn() const noexcept { return ud_warn; }
  void setWarnF(lrt_WarnFunction wf, void* u) noexcept {
    warnf = wf;
    ud_warn = u;
  }

  int getStackLimit() const noexcept { return stacklimit; }
  void setStackLimit(int l) noexcept { stacklimit = l; }
};


/*
** 'global state', shared by all threads of this state
*/
class global_State {
private:
  MemoryAllocator memory;        /* must come first: the others allocate */
  ObjectList objects;
  StringMap strt;                /* interned strings */
  TValue registry;
  TValue nilvalue;               /* canonical nil value */
  Collaborators collaborators;
  RuntimeServices runtime;
  lrt_State mainth;              /* main thread of this state */

public:
  global_State(lrt_Alloc f, void *ud) noexcept
    : memory(f, ud, static_cast<l_mem>(sizeof(global_State))),
      strt(0, std::hash<std::string_view>(), std::equal_to<std::string_view>(),
           StringMap::allocator_type(this)),
      registry(absentvalue), nilvalue(absentvalue), mainth(this) {}

  global_State(const global_State&) = delete;
  global_State& operator=(const global_State&) = delete;

  lrt_Alloc getFrealloc() const noexcept { return memory.getFrealloc(); }
  void* getUd() const noexcept { return memory.getUd(); }
  l_mem getTotalBytes() const noexcept { return memory.getTotalBytes(); }
  l_mem& getTotalBytesRef() noexcept { return memory.getTotalBytesRef(); }

  GCObject* getAllGC() const noexcept { return objects.getAllGC(); }
  void setAllGC(GCObject* o) noexcept { objects.setAllGC(o); }
  GCObject** getAllGCPtr() noexcept { return objects.getAllGCPtr(); }
  lrt_AllocHook getAllocHook() const noexcept { return objects.getAllocHook(); }
  void* getUdAllocHook() const noexcept { return objects.getUdAllocHook(); }
  void setAllocHook(lrt_AllocHook f, void* u) noexcept { objects.setAllocHook(f, u); }

  StringMap& getStringTable() noexcept { return strt; }

  TValue* getRegistry() noexcept { return &registry; }
  const TValue* getNilValue() const noexcept { return &nilvalue; }
  /* the registry is a table once the state is fully built */
  bool isComplete() const noexcept { return registry.isTable(); }

  lrt_MetaResolver getResolver() const noexcept { return collaborators.getResolver(); }
  void* getUdResolver() const noexcept { return collaborators.getUdResolver(); }
  void setResolver(lrt_MetaResolver f, void* u) noexcept { collaborators.setResolver(f, u); }
  lrt_Compiler getCompiler() const noexcept { return collaborators.getCompiler(); }
  void* getUdCompiler() const noexcept { return collaborators.getUdCompiler(); }
  void setCompiler(lrt_Compiler f, void* u) noexcept { collaborators.setCompiler(f, u); }

  lrt_CFunction getPanic() const noexcept { return runtime.getPanic(); }
  void setPanic(lrt_CFunction p) noexcept { runtime.setPanic(p); }
  TString* getMemErrMsg() const noexcept { return runtime.getMemErrMsg(); }
  void setMemErrMsg(TString* msg) noexcept { runtime.setMemErrMsg(msg); }
  lrt_WarnFunction getWarnF() const noexcept { return runtime.getWarnF(); }
  void* getUdWarn() const noexcept { return runtime.getUdWarn(); }
  void setWarnF(lrt_WarnFunction wf, void* u) noexcept { runtime.setWarnF(wf, u); }
  int getStackLimit() const noexcept { return runtime.getStackLimit(); }
  void setStackLimit(int l) noexcept { runtime.setStackLimit(l); }

  lrt_State* getMainThread() noexcept { return &mainth; }
};


inline global_State* G(const lrt_State* L) noexcept {
  return L->getGlobalState();
}


/* next free CallInfo, creating one if needed */
LRTI_FUNC CallInfo *lrtE_extendCI (lrt_State *L);

inline CallInfo* next_ci(lrt_State* L) {
  CallInfo *ci = L->getCI();
  return (ci->getNext() != nullptr) ? ci->getNext() : lrtE_extendCI(L);
}

LRTI_FUNC void lrtE_freeCI (lrt_State *L);
LRTI_FUNC void lrtE_shrinkCI (lrt_State *L);
LRTI_FUNC void lrtE_checkcstack (lrt_State *L);
LRTI_FUNC void lrtE_incCstack (lrt_State *L);
LRTI_FUNC void lrtE_warning (lrt_State *L, const char *msg, int tocont);
LRTI_FUNC void lrtE_warnerror (lrt_State *L, const char *where);
LRTI_FUNC TStatus lrtE_resetthread (lrt_State *L, TStatus status);
LRTI_FUNC void lrtE_freethread (lrt_State *L, lrt_State *L1);


#endif
