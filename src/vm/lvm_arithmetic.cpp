/*
** $Id: lvm_arithmetic.cpp $
** Arithmetic operations
** See Copyright Notice in lrt.h
*/

#define lvm_arithmetic_c
#define LRT_CORE

#include "lrt.h"

#include <cmath>

#include "ldebug.h"
#include "ldo.h"
#include "lobject.h"
#include "lstate.h"
#include "ltm.h"
#include "lvm.h"


/*
** Integer division; return 'm // n', that is, floor(m/n).
** C division truncates its result (rounds towards zero).
** 'floor(q) == trunc(q)' when 'q >= 0' or when 'q' is integer,
** otherwise 'floor(q) == trunc(q) - 1'.
*/
lrt_Integer VirtualMachine::idiv (lrt_Integer m, lrt_Integer n) {
  if (l_unlikely(l_castS2U(n) + 1u <= 1u)) {  /* special cases: -1 or 0 */
    if (n == 0)
      lrtG_runerror(L, "attempt to perform 'n//0'");
    return intop(-, 0, m);   /* n==-1; avoid overflow with 0x80000...//-1 */
  }
  else {
    lrt_Integer q = m / n;  /* perform C division */
    if ((m ^ n) < 0 && m % n != 0)  /* 'm/n' would be negative non-integer? */
      q -= 1;  /* correct result for different rounding */
    return q;
  }
}


/*
** Integer modulus; return 'm % n'. (Assume that C '%' with
** negative operands follows C99 behavior.)
*/
lrt_Integer VirtualMachine::mod (lrt_Integer m, lrt_Integer n) {
  if (l_unlikely(l_castS2U(n) + 1u <= 1u)) {  /* special cases: -1 or 0 */
    if (n == 0)
      lrtG_runerror(L, "attempt to perform 'n%%0'");
    return 0;   /* m % -1 == 0; avoid overflow with 0x80000...%-1 */
  }
  else {
    lrt_Integer r = m % n;
    if (r != 0 && (r ^ n) < 0)  /* 'm/n' would be non-integer negative? */
      r += n;  /* correct result for different rounding */
    return r;
  }
}


/*
** Float modulus
*/
lrt_Number VirtualMachine::modf (lrt_Number m, lrt_Number n) noexcept {
  return lrti_nummod(m, n);
}


/*
** Perform 'res = p1 op p2' (or 'res = -p1' for LRT_OPUNM, which
** ignores 'p2'). Numbers are handled directly; any other operand
** goes through the arithmetic handler of the operation.
*/
void VirtualMachine::arith (int op, const TValue *p1, const TValue *p2,
                            StkId res) {
  TValue result;
  if (lrtO_rawarith(L, op, p1, p2, &result))
    *L->s2v(res) = result;
  else
    lrtT_trybinTM(L, p1, p2, res, lrtT_arithevent(op));
}
