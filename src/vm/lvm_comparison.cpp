/*
** $Id: lvm_comparison.cpp $
** Equality and order comparisons
** See Copyright Notice in lrt.h
*/

#define lvm_comparison_c
#define LRT_CORE

#include "lrt.h"

#include <cfloat>

#include "ldebug.h"
#include "ldo.h"
#include "lobject.h"
#include "lstate.h"
#include "lstring.h"
#include "ltm.h"
#include "lvm.h"


/* limit for integers that fit in a float */
inline constexpr lrt_Unsigned MAXINTFITSF =
    (static_cast<lrt_Unsigned>(1) << DBL_MANT_DIG);


/*
** 'l_intfitsf' checks whether a given integer is in the interval
** [-MAXINTFITSF, MAXINTFITSF], so that it converts to a float without
** rounding.
*/
static inline bool l_intfitsf (lrt_Integer i) noexcept {
  return (MAXINTFITSF + l_castS2U(i)) <= (2 * MAXINTFITSF);
}


/*
** Check whether integer 'i' is less than float 'f'. If 'i' has an
** exact representation as a float, compare numbers as floats.
** Otherwise, use the equivalence 'i < f <=> i < ceil(f)'. If 'ceil(f)'
** is out of integer range, either 'f' is greater than all integers or
** less than all integers. When 'f' is NaN, comparisons must result in
** false.
*/
static bool LTintfloat (lrt_Integer i, lrt_Number f) {
  if (l_intfitsf(i))
    return lrti_numlt(cast_num(i), f);  /* compare them as floats */
  else {  /* i < f <=> i < ceil(f) */
    if (lrt_Integer fi; VirtualMachine::flttointeger(f, &fi, F2Imod::F2Iceil))
      return i < fi;   /* compare them as integers */
    else  /* 'f' is either greater or less than all integers */
      return f > 0;  /* greater? */
  }
}


/*
** Check whether integer 'i' is less than or equal to float 'f'.
*/
static bool LEintfloat (lrt_Integer i, lrt_Number f) {
  if (l_intfitsf(i))
    return lrti_numle(cast_num(i), f);
  else {  /* i <= f <=> i <= floor(f) */
    if (lrt_Integer fi; VirtualMachine::flttointeger(f, &fi, F2Imod::F2Ifloor))
      return i <= fi;
    else
      return f > 0;
  }
}


/*
** Check whether float 'f' is less than integer 'i'.
*/
static bool LTfloatint (lrt_Number f, lrt_Integer i) {
  if (l_intfitsf(i))
    return lrti_numlt(f, cast_num(i));
  else {  /* f < i <=> floor(f) < i */
    if (lrt_Integer fi; VirtualMachine::flttointeger(f, &fi, F2Imod::F2Ifloor))
      return fi < i;
    else
      return f < 0;  /* less? */
  }
}


/*
** Check whether float 'f' is less than or equal to integer 'i'.
*/
static bool LEfloatint (lrt_Number f, lrt_Integer i) {
  if (l_intfitsf(i))
    return lrti_numle(f, cast_num(i));
  else {  /* f <= i <=> ceil(f) <= i */
    if (lrt_Integer fi; VirtualMachine::flttointeger(f, &fi, F2Imod::F2Iceil))
      return fi <= i;
    else
      return f < 0;
  }
}


/*
** Return 'l < r', for numbers.
*/
static bool LTnum (const TValue *l, const TValue *r) {
  lrt_assert(l->isNumber() && r->isNumber());
  if (l->isInteger()) {
    lrt_Integer li = l->intValue();
    if (r->isInteger())
      return li < r->intValue();  /* both are integers */
    else  /* 'l' is int and 'r' is float */
      return LTintfloat(li, r->floatValue());
  }
  else {
    lrt_Number lf = l->floatValue();
    if (r->isFloat())
      return lrti_numlt(lf, r->floatValue());  /* both are float */
    else  /* 'l' is float and 'r' is int */
      return LTfloatint(lf, r->intValue());
  }
}


/*
** Return 'l <= r', for numbers.
*/
static bool LEnum (const TValue *l, const TValue *r) {
  lrt_assert(l->isNumber() && r->isNumber());
  if (l->isInteger()) {
    lrt_Integer li = l->intValue();
    if (r->isInteger())
      return li <= r->intValue();
    else
      return LEintfloat(li, r->floatValue());
  }
  else {
    lrt_Number lf = l->floatValue();
    if (r->isFloat())
      return lrti_numle(lf, r->floatValue());
    else
      return LEfloatint(lf, r->intValue());
  }
}


bool VirtualMachine::lessThan (const TValue *l, const TValue *r) {
  if (l->isNumber() && r->isNumber())
    return LTnum(l, r);
  else if (l->isString() && r->isString())
    return lrtS_cmp(l->stringValue(), r->stringValue()) < 0;
  else
    return lrtT_callorderTM(L, l, r, TMS::TM_LT);
}


bool VirtualMachine::lessEqual (const TValue *l, const TValue *r) {
  if (l->isNumber() && r->isNumber())
    return LEnum(l, r);
  else if (l->isString() && r->isString())
    return lrtS_cmp(l->stringValue(), r->stringValue()) <= 0;
  else
    return lrtT_callorderTM(L, l, r, TMS::TM_LE);
}


/*
** Main operation for equality of values. Tables and full userdata
** that are not the same object may still be equal through '__eq'.
*/
bool VirtualMachine::equalObj (const TValue *t1, const TValue *t2) {
  if (lrtO_rawequal(t1, t2))
    return true;
  if (t1->typeTag() != t2->typeTag() ||
      !(t1->isTable() || t1->isFullUserdata()))
    return false;  /* only tables and userdata have '__eq' */
  TValue v1 = *t1, v2 = *t2;
  TValue tm;
  if (!lrtT_gettm(L, &v1, TMS::TM_EQ, &tm) &&
      !lrtT_gettm(L, &v2, TMS::TM_EQ, &tm))
    return false;  /* no handler */
  StkId top = L->getTop();
  lrtT_callTMres(L, &tm, &v1, &v2, top);
  return !L->s2v(top)->isFalseLike();
}
