/*
** $Id: lvm_conversion.cpp $
** Value conversions used by the interpreter
** See Copyright Notice in lrt.h
*/

#define lvm_conversion_c
#define LRT_CORE

#include "lrt.h"

#include <cmath>

#include "lobject.h"
#include "lstate.h"
#include "lstring.h"
#include "lvm.h"


/*
** Try to convert a value from string to a number value. If the value
** is not a string or not a complete numeral, do not modify 'result'
** and return false.
*/
static bool l_strton (const TValue *obj, TValue *result) {
  lrt_assert(obj != result);
  if (!obj->isString())
    return false;
  const TString *st = obj->stringValue();
  return (lrtO_str2num(st->c_str(), result) == st->length() + 1);
}


/*
** try to convert a float to an integer, rounding according to 'mode'.
*/
bool VirtualMachine::flttointeger (lrt_Number n, lrt_Integer *p,
                                   F2Imod mode) noexcept {
  lrt_Number f = std::floor(n);
  if (n != f) {  /* not an integral value? */
    if (mode == F2Imod::F2Ieq) return false;  /* fails if mode demands integral value */
    else if (mode == F2Imod::F2Iceil)  /* needs ceil? */
      f += 1;  /* convert floor to ceil (remember: n != f) */
  }
  return lrt_numbertointeger(f, p);
}


/*
** try to convert a value to an integer, rounding according to 'mode',
** without string coercion.
*/
bool VirtualMachine::tointegerns (const TValue *obj, lrt_Integer *p,
                                  F2Imod mode) noexcept {
  if (obj->isFloat())
    return flttointeger(obj->floatValue(), p, mode);
  else if (obj->isInteger()) {
    *p = obj->intValue();
    return true;
  }
  else
    return false;
}


/*
** TValue conversion methods
*/
bool TValue::toNumber (lrt_Number* n) const {
  TValue v;
  if (isInteger()) {
    *n = cast_num(intValue());
    return true;
  }
  else if (l_strton(this, &v)) {  /* string coercible to number? */
    *n = v.numberValue();
    return true;
  }
  else
    return false;  /* conversion failed */
}


bool TValue::toInteger (lrt_Integer* p, F2Imod mode) const {
  TValue v;
  const TValue *obj = this;
  if (l_strton(obj, &v))  /* does 'obj' hold a numerical string? */
    obj = &v;  /* use its corresponding number */
  return VirtualMachine::tointegerns(obj, p, mode);
}


bool TValue::toIntegerNoString (lrt_Integer* p, F2Imod mode) const {
  return VirtualMachine::tointegerns(this, p, mode);
}
