/*
** $Id: ltvalue.h $
** Tagged Values (TValue class)
** See Copyright Notice in lrt.h
*/

#ifndef ltvalue_h
#define ltvalue_h

#include "llimits.h"
#include "lrt.h"


/*
** tags for Tagged Values have the following use of bits:
** bits 0-3: actual tag (a LRT_T* constant)
** bits 4-5: variant bits
** bit 6: whether value is collectable
*/

/* add variant bits to a type */
constexpr int makevariant(int t, int v) noexcept { return (t | (v << 4)); }


/*
** {==================================================================
** Variant tags for all value kinds
** ===================================================================
*/

enum class ValueTag : lu_byte {
  /* Nil variant */
  NIL     = makevariant(LRT_TNIL, 0),

  /* Boolean variants */
  VFALSE = makevariant(LRT_TBOOLEAN, 0),
  VTRUE  = makevariant(LRT_TBOOLEAN, 1),

  /* Number variants */
  NUMINT = makevariant(LRT_TNUMBER, 0),  /* integer numbers */
  NUMFLT = makevariant(LRT_TNUMBER, 1),  /* float numbers */

  /* String variant (all strings are interned) */
  STRING = makevariant(LRT_TSTRING, 0),

  /* Table variant */
  TABLE = makevariant(LRT_TTABLE, 0),

  /* Function variants */
  LCL = makevariant(LRT_TFUNCTION, 0),  /* bytecode closure */
  LCF = makevariant(LRT_TFUNCTION, 1),  /* light native function */
  CCL = makevariant(LRT_TFUNCTION, 2),  /* native closure */

  /* Userdata variant */
  USERDATA = makevariant(LRT_TUSERDATA, 0),

  /* Thread variant */
  THREAD = makevariant(LRT_TTHREAD, 0),

  /* Upvalue variant (collectable non-value) */
  UPVAL = makevariant(LRT_NUMTYPES, 0),

  /* Proto variant (collectable non-value) */
  PROTO = makevariant(LRT_NUMTYPES + 1, 0)
};

/* }================================================================== */


/* Bit mark for collectable types */
inline constexpr int BIT_ISCOLLECTABLE = (1 << 6);

/* mark a tag as collectable */
constexpr ValueTag ctb(ValueTag t) noexcept {
  return static_cast<ValueTag>(static_cast<int>(t) | BIT_ISCOLLECTABLE);
}

/* tag with no variants (bits 0-3) */
constexpr int novariant(ValueTag t) noexcept { return (static_cast<int>(t) & 0x0F); }

/* tag with variant bits, without the collectable bit */
constexpr ValueTag withvariant(ValueTag t) noexcept {
  return static_cast<ValueTag>(static_cast<int>(t) & 0x3F);
}


/*
** Rounding modes for float->integer coercion
*/
enum class F2Imod {
  F2Ieq,     /* no rounding; accepts only integral values */
  F2Ifloor,  /* takes the floor of the number */
  F2Iceil    /* takes the ceiling of the number */
};


class GCObject;
class TString;
class Udata;
class Table;
class LClosure;
class CClosure;


/*
** Union of all values
*/
typedef union Value {
  GCObject *gc;    /* collectable objects */
  lrt_CFunction f; /* light native functions */
  lrt_Integer i;   /* integer numbers */
  lrt_Number n;    /* float numbers */
  /* not used, but may avoid warnings for uninitialized value */
  lu_byte ub;
} Value;


/*
** Tagged Values. This is the basic representation of values: an actual
** value plus a tag with its type.
*/
class TValue {
private:
  Value value_;
  ValueTag tt_;

public:
  constexpr TValue(Value v, ValueTag t) noexcept : value_(v), tt_(t) {}

  TValue() = default;

  ValueTag getType() const noexcept { return tt_; }
  const Value& getValue() const noexcept { return value_; }

  lrt_Integer intValue() const noexcept { return value_.i; }
  lrt_Number floatValue() const noexcept { return value_.n; }
  GCObject* gcValue() const noexcept { return value_.gc; }
  lrt_CFunction functionValue() const noexcept { return value_.f; }

  TString* stringValue() const noexcept { return reinterpret_cast<TString*>(value_.gc); }
  Udata* userdataValue() const noexcept { return reinterpret_cast<Udata*>(value_.gc); }
  Table* tableValue() const noexcept { return reinterpret_cast<Table*>(value_.gc); }
  LClosure* lClosureValue() const noexcept { return reinterpret_cast<LClosure*>(value_.gc); }
  CClosure* cClosureValue() const noexcept { return reinterpret_cast<CClosure*>(value_.gc); }
  lrt_State* threadValue() const noexcept { return reinterpret_cast<lrt_State*>(value_.gc); }

  /* number value, converting integers to floats */
  lrt_Number numberValue() const noexcept {
    return isInteger() ? cast_num(value_.i) : value_.n;
  }

  void setNil() noexcept { tt_ = ValueTag::NIL; }
  void setFalse() noexcept { tt_ = ValueTag::VFALSE; }
  void setTrue() noexcept { tt_ = ValueTag::VTRUE; }
  void setBool(bool b) noexcept { tt_ = b ? ValueTag::VTRUE : ValueTag::VFALSE; }
  void setInt(lrt_Integer i) noexcept { value_.i = i; tt_ = ValueTag::NUMINT; }
  void setFloat(lrt_Number n) noexcept { value_.n = n; tt_ = ValueTag::NUMFLT; }
  void setFunction(lrt_CFunction f) noexcept { value_.f = f; tt_ = ValueTag::LCF; }
  void setString(TString* s) noexcept { setObject(reinterpret_cast<GCObject*>(s), ValueTag::STRING); }
  void setUserdata(Udata* u) noexcept { setObject(reinterpret_cast<GCObject*>(u), ValueTag::USERDATA); }
  void setTable(Table* t) noexcept { setObject(reinterpret_cast<GCObject*>(t), ValueTag::TABLE); }
  void setLClosure(LClosure* cl) noexcept { setObject(reinterpret_cast<GCObject*>(cl), ValueTag::LCL); }
  void setCClosure(CClosure* cl) noexcept { setObject(reinterpret_cast<GCObject*>(cl), ValueTag::CCL); }
  void setThread(lrt_State* th) noexcept { setObject(reinterpret_cast<GCObject*>(th), ValueTag::THREAD); }

  /*
  ** Conversions; return true on success. 'toNumber' and 'toInteger'
  ** accept strings with a valid numeral.
  */
  bool toNumber(lrt_Number* n) const;
  bool toInteger(lrt_Integer* p, F2Imod mode) const;
  bool toIntegerNoString(lrt_Integer* p, F2Imod mode) const;

  /* Type checks */
  constexpr bool isNil() const noexcept { return tt_ == ValueTag::NIL; }
  constexpr bool isBoolean() const noexcept { return baseType() == LRT_TBOOLEAN; }
  constexpr bool isFalse() const noexcept { return tt_ == ValueTag::VFALSE; }
  constexpr bool isTrue() const noexcept { return tt_ == ValueTag::VTRUE; }
  constexpr bool isFalseLike() const noexcept { return isFalse() || isNil(); }
  constexpr bool isNumber() const noexcept { return baseType() == LRT_TNUMBER; }
  constexpr bool isInteger() const noexcept { return tt_ == ValueTag::NUMINT; }
  constexpr bool isFloat() const noexcept { return tt_ == ValueTag::NUMFLT; }
  constexpr bool isString() const noexcept { return tt_ == ctb(ValueTag::STRING); }
  constexpr bool isTable() const noexcept { return tt_ == ctb(ValueTag::TABLE); }
  constexpr bool isFunction() const noexcept { return baseType() == LRT_TFUNCTION; }
  constexpr bool isLClosure() const noexcept { return tt_ == ctb(ValueTag::LCL); }
  constexpr bool isLightCFunction() const noexcept { return tt_ == ValueTag::LCF; }
  constexpr bool isCClosure() const noexcept { return tt_ == ctb(ValueTag::CCL); }
  constexpr bool isCFunction() const noexcept { return isLightCFunction() || isCClosure(); }
  constexpr bool isFullUserdata() const noexcept { return tt_ == ctb(ValueTag::USERDATA); }
  constexpr bool isThread() const noexcept { return tt_ == ctb(ValueTag::THREAD); }
  constexpr bool isCollectable() const noexcept {
    return (static_cast<int>(tt_) & BIT_ISCOLLECTABLE) != 0;
  }

  /* basic type (LRT_T*) */
  constexpr int baseType() const noexcept { return novariant(tt_); }
  /* tag with variant bits */
  constexpr ValueTag typeTag() const noexcept { return withvariant(tt_); }

private:
  void setObject(GCObject* o, ValueTag t) noexcept { value_.gc = o; tt_ = ctb(t); }
};


/*
** Entries in a thread stack are addressed by their absolute slot index,
** so that growing the stack never invalidates them.
*/
typedef int StkId;


/* a canonical nil, used for absent values */
inline constexpr TValue absentvalue{Value{nullptr}, ValueTag::NIL};

#endif
