/*
** $Id: lgc.cpp $
** Collector hooks: object creation, roots, tracing, full collection
** See Copyright Notice in lrt.h
*/

#define lgc_c
#define LRT_CORE

#include <vector>

#include "lrt.h"

#include "ldebug.h"
#include "ldo.h"
#include "lfunc.h"
#include "lgc.h"
#include "lmem.h"
#include "lobject.h"
#include "lstate.h"
#include "lstring.h"
#include "ltable.h"


/*
** {======================================================
** Roots and children
** =======================================================
*/

void lrtC_markroots (global_State *g, GCVisitor &v) {
  v.visit(g->getMainThread());
  v.visitValue(g->getRegistry());
  if (g->getMemErrMsg() != nullptr)
    v.visit(g->getMemErrMsg());
}


/*
** A thread holds its live stack slots and its open upvalues. Slots
** above 'top' are dead.
*/
static void traversethread (lrt_State *th, GCVisitor &v) {
  if (!th->getStackSubsystem().isAllocated())
    return;  /* stack not completely built yet */
  for (StkId o = 0; o < th->getTop(); o++)
    v.visitValue(th->s2v(o));
  for (UpVal *uv = th->getOpenUpval(); uv != nullptr; uv = uv->getOpenNext())
    v.visit(uv);
}


static void traverseproto (Proto *f, GCVisitor &v) {
  if (f->getSource() != nullptr)
    v.visit(f->getSource());
  for (const TValue &k : f->getConstants())
    v.visitValue(&k);
  for (const Upvaldesc &uv : f->getUpvalues()) {
    if (uv.getName() != nullptr)
      v.visit(uv.getName());
  }
  for (Proto *p : f->getProtos()) {
    if (p != nullptr)
      v.visit(p);
  }
}


void lrtC_traverse (GCObject *o, GCVisitor &v) {
  switch (o->getType()) {
    case ValueTag::STRING:
    case ValueTag::USERDATA:
      break;  /* no children */
    case ValueTag::TABLE: {
      static_cast<Table*>(o)->forEachValue([&v](const TValue &tv) {
        v.visitValue(&tv);
      });
      break;
    }
    case ValueTag::LCL: {
      LClosure *cl = static_cast<LClosure*>(o);
      v.visit(cl->getProto());
      for (int i = 0; i < cl->getNumUpvalues(); i++) {
        UpVal *uv = cl->getUpval(i);
        if (uv != nullptr)
          v.visit(uv);
      }
      break;
    }
    case ValueTag::CCL: {
      CClosure *cl = static_cast<CClosure*>(o);
      for (int i = 0; i < cl->getNumUpvalues(); i++)
        v.visitValue(cl->getUpvalue(i));
      break;
    }
    case ValueTag::PROTO:
      traverseproto(static_cast<Proto*>(o), v);
      break;
    case ValueTag::UPVAL: {
      UpVal *uv = static_cast<UpVal*>(o);
      if (uv->isOpen())  /* value lives in the stack of its thread */
        v.visit(uv->getThread());
      else
        v.visitValue(uv->getClosedValue());
      break;
    }
    case ValueTag::THREAD:
      traversethread(static_cast<lrt_State*>(o), v);
      break;
    default: lrt_assert(0);
  }
}

/* }====================================================== */



/*
** {======================================================
** Full collection
** =======================================================
*/

/*
** Marks every object reachable from what it visits. Objects wait in
** 'gray' until their children are visited.
*/
class Marker : public GCVisitor {
private:
  std::vector<GCObject*> gray;

public:
  void visit(GCObject *o) override {
    if (!o->isMarked()) {
      o->setMarked(true);
      gray.push_back(o);
    }
  }

  void propagate() {
    while (!gray.empty()) {
      GCObject *o = gray.back();
      gray.pop_back();
      lrtC_traverse(o, *this);
    }
  }
};


static void freeobj (lrt_State *L, GCObject *o) {
  switch (o->getType()) {
    case ValueTag::STRING: {
      TString *ts = static_cast<TString*>(o);
      lrtS_remove(G(L), ts);  /* entry keys point into the string */
      lrtM_delete(L, ts, TString::allocSize(ts->length()));
      break;
    }
    case ValueTag::USERDATA: {
      Udata *u = static_cast<Udata*>(o);
      lrtM_delete(L, u, Udata::allocSize(u->getLen()));
      break;
    }
    case ValueTag::TABLE:
      lrtM_delete(L, static_cast<Table*>(o), sizeof(Table));
      break;
    case ValueTag::LCL: {
      LClosure *cl = static_cast<LClosure*>(o);
      lrtM_delete(L, cl, LClosure::allocSize(cl->getNumUpvalues()));
      break;
    }
    case ValueTag::CCL: {
      CClosure *cl = static_cast<CClosure*>(o);
      lrtM_delete(L, cl, CClosure::allocSize(cl->getNumUpvalues()));
      break;
    }
    case ValueTag::PROTO:
      lrtM_delete(L, static_cast<Proto*>(o), sizeof(Proto));
      break;
    case ValueTag::UPVAL:
      lrtM_delete(L, static_cast<UpVal*>(o), sizeof(UpVal));
      break;
    case ValueTag::THREAD:
      lrtE_freethread(L, static_cast<lrt_State*>(o));
      break;
    default: lrt_assert(0);
  }
}


/*
** Free a list of unlinked objects. Threads go first: freeing a thread
** closes its open upvalues, which may be in the same list.
*/
static void freelist (lrt_State *L, GCObject *dead) {
  for (GCObject *o = dead; o != nullptr; o = o->getNext()) {
    if (o->getType() == ValueTag::THREAD)
      lrtF_closeupval(static_cast<lrt_State*>(o), 0);
  }
  while (dead != nullptr) {
    GCObject *next = dead->getNext();
    freeobj(L, dead);
    dead = next;
  }
}


/*
** Unlink every unmarked object from 'allgc' and clear the marks of the
** survivors. Returns the list of unlinked objects.
*/
static GCObject *sweep (global_State *g) {
  GCObject *dead = nullptr;
  GCObject **p = g->getAllGCPtr();
  while (*p != nullptr) {
    GCObject *curr = *p;
    if (curr->isMarked()) {
      curr->setMarked(false);
      p = curr->getNextPtr();
    }
    else {
      *p = curr->getNext();  /* remove 'curr' from list */
      curr->setNext(dead);
      dead = curr;
    }
  }
  return dead;
}


/*
** Stop-the-world mark and sweep. 'L' is a root too: a coroutine can
** run without being reachable from the main thread.
*/
void lrtC_fullgc (lrt_State *L) {
  global_State *g = G(L);
  Marker marker;
  lrtC_markroots(g, marker);
  marker.visit(L);
  marker.propagate();
  GCObject *dead = sweep(g);
  g->getMainThread()->setMarked(false);  /* main thread is not in 'allgc' */
  L->setMarked(false);
  freelist(L, dead);
}


/*
** Free every object of the state (when closing it).
*/
void lrtC_freeallobjects (lrt_State *L) {
  global_State *g = G(L);
  GCObject *all = g->getAllGC();
  g->setAllGC(nullptr);
  freelist(L, all);
  lrt_assert(g->getStringTable().empty());
}


size_t lrtC_countobjects (global_State *g) noexcept {
  size_t n = 0;
  for (GCObject *o = g->getAllGC(); o != nullptr; o = o->getNext())
    n++;
  return n;
}

/* }====================================================== */
