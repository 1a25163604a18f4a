/*
** $Id: lgc.h $
** Collector hooks: object creation, roots, tracing, full collection
** See Copyright Notice in lrt.h
*/

#ifndef lgc_h
#define lgc_h


#include <cstddef>


#include "lmem.h"
#include "lobject.h"
#include "lstate.h"


/*
** Every collectable object is created by 'lrtC_newobj' and linked in
** the 'allgc' list of its state, which owns it from then on. The
** collector has no policy of its own: a full mark-and-sweep runs only
** when the host asks for one ('lrt_gc') and every object still in the
** list is freed when the state closes.
**
** Reachability is described by two hooks. 'lrtC_markroots' presents
** the root set (main thread, registry, preallocated error message) and
** 'lrtC_traverse' presents the direct children of one object. Both
** report through a 'GCVisitor'.
*/
class GCVisitor {
public:
  virtual ~GCVisitor() = default;

  virtual void visit(GCObject *o) = 0;

  void visitValue(const TValue *v) {
    if (v->isCollectable())
      visit(v->gcValue());
  }
};


/* basic type reported to the allocation hook for an object tag */
inline int gckind(ValueTag tt) noexcept {
  int t = novariant(tt);
  return (t < LRT_NUMTYPES) ? t : -1;  /* upvalues and prototypes are internal */
}


/* link a freshly built object in the list of all objects */
inline void lrtC_link(global_State *g, GCObject *o) noexcept {
  o->setNext(g->getAllGC());
  g->setAllGC(o);
}


/*
** Create an object of type T with 'size' bytes (T itself plus any
** trailing part), construct it with 'args' and give it to the
** collector.
*/
template<typename T, typename... Args>
inline T* lrtC_newobj(lrt_State *L, size_t size, Args&&... args) {
  global_State *g = G(L);
  T *o = lrtM_construct<T>(L, size, static_cast<Args&&>(args)...);
  lrtC_link(g, o);
  lrt_AllocHook hook = g->getAllocHook();
  if (hook != nullptr)
    hook(g->getUdAllocHook(), gckind(o->getType()), size);
  return o;
}


LRTI_FUNC void lrtC_markroots (global_State *g, GCVisitor &v);
LRTI_FUNC void lrtC_traverse (GCObject *o, GCVisitor &v);
LRTI_FUNC void lrtC_fullgc (lrt_State *L);
LRTI_FUNC void lrtC_freeallobjects (lrt_State *L);
[[nodiscard]] LRTI_FUNC size_t lrtC_countobjects (global_State *g) noexcept;


#endif
