/*
** $Id: lvm.h $
** Runtime interpreter
** See Copyright Notice in lrt.h
*/

#ifndef lvm_h
#define lvm_h


#include "ldo.h"
#include "lobject.h"
#include "ltm.h"
#include "ltable.h"


/* convert an object to a float (including string coercion) */
inline bool tonumber(const TValue* o, lrt_Number* n) noexcept {
  if (o->isFloat()) {
    *n = o->floatValue();
    return true;
  }
  return o->toNumber(n);
}


/* convert an object to a float (without string coercion) */
inline bool tonumberns(const TValue* o, lrt_Number& n) noexcept {
  if (o->isFloat()) {
    n = o->floatValue();
    return true;
  }
  if (o->isInteger()) {
    n = cast_num(o->intValue());
    return true;
  }
  return false;
}


/* convert an object to an integer (including string coercion) */
inline bool tointeger(const TValue* o, lrt_Integer* i) noexcept {
  if (l_likely(o->isInteger())) {
    *i = o->intValue();
    return true;
  }
  return o->toInteger(i, F2Imod::F2Ieq);
}


/*
** VirtualMachine - runs bytecode frames of one thread and implements
** the operations that may call metamethods (arithmetic, comparison,
** indexing). Cheap to build; holds only the thread.
*/
class VirtualMachine {
private:
  lrt_State* L;

public:
  explicit VirtualMachine(lrt_State* state) noexcept : L(state) {}

  VirtualMachine(const VirtualMachine&) = delete;
  VirtualMachine& operator=(const VirtualMachine&) = delete;

  /* execution (lvm.cpp) */
  void execute(CallInfo *ci);
  void finishOp();

  /* conversions (lvm_conversion.cpp) */
  static bool flttointeger(lrt_Number n, lrt_Integer *p, F2Imod mode) noexcept;
  static bool tointegerns(const TValue *obj, lrt_Integer *p, F2Imod mode) noexcept;

  /* arithmetic (lvm_arithmetic.cpp) */
  [[nodiscard]] lrt_Integer idiv(lrt_Integer m, lrt_Integer n);
  [[nodiscard]] lrt_Integer mod(lrt_Integer m, lrt_Integer n);
  [[nodiscard]] static lrt_Number modf(lrt_Number m, lrt_Number n) noexcept;
  void arith(int op, const TValue *p1, const TValue *p2, StkId res);

  /* comparisons (lvm_comparison.cpp) */
  [[nodiscard]] bool lessThan(const TValue *l, const TValue *r);
  [[nodiscard]] bool lessEqual(const TValue *l, const TValue *r);
  [[nodiscard]] bool equalObj(const TValue *t1, const TValue *t2);

  /* indexing (lvm_table.cpp) */
  void finishGet(const TValue *t, const TValue *key, StkId val);
  void finishSet(const TValue *t, const TValue *key, const TValue *val);
  void objlen(StkId ra, const TValue *rb);
};

#endif
