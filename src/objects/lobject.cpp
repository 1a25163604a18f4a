/*
** $Id: lobject.cpp $
** Some generic functions over values and objects
** See Copyright Notice in lrt.h
*/

#define lobject_c
#define LRT_CORE

#include <cctype>
#include <clocale>
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include "lrt.h"

#include "ldebug.h"
#include "ldo.h"
#include "lobject.h"
#include "lstate.h"
#include "lstring.h"
#include "lvm.h"


/*
** {==================================================================
** Raw arithmetic
** ===================================================================
*/

static lrt_Integer intarith (lrt_State *L, int op, lrt_Integer v1,
                                                   lrt_Integer v2) {
  VirtualMachine vm(L);
  switch (op) {
    case LRT_OPADD: return intop(+, v1, v2);
    case LRT_OPSUB: return intop(-, v1, v2);
    case LRT_OPMUL: return intop(*, v1, v2);
    case LRT_OPMOD: return vm.mod(v1, v2);
    case LRT_OPIDIV: return vm.idiv(v1, v2);
    case LRT_OPUNM: return intop(-, 0, v1);
    default: lrt_assert(0); return 0;
  }
}


static lrt_Number numarith (int op, lrt_Number v1, lrt_Number v2) {
  switch (op) {
    case LRT_OPADD: return lrti_numadd(v1, v2);
    case LRT_OPSUB: return lrti_numsub(v1, v2);
    case LRT_OPMUL: return lrti_nummul(v1, v2);
    case LRT_OPDIV: return lrti_numdiv(v1, v2);
    case LRT_OPUNM: return lrti_numunm(v1);
    case LRT_OPIDIV: return lrti_numidiv(v1, v2);
    case LRT_OPMOD: return VirtualMachine::modf(v1, v2);
    default: lrt_assert(0); return 0;
  }
}


/*
** Arithmetic over numbers only (there is no coercion from strings).
** Returns false when some operand is not a number, so that the caller
** can try a metamethod.
*/
bool lrtO_rawarith (lrt_State *L, int op, const TValue *p1, const TValue *p2,
                    TValue *res) {
  switch (op) {
    case LRT_OPDIV: {  /* operates only on floats */
      lrt_Number n1; lrt_Number n2;
      if (tonumberns(p1, n1) && tonumberns(p2, n2)) {
        res->setFloat(numarith(op, n1, n2));
        return true;
      }
      else return false;  /* fail */
    }
    default: {  /* other operations */
      lrt_Number n1; lrt_Number n2;
      if (p1->isInteger() && p2->isInteger()) {
        res->setInt(intarith(L, op, p1->intValue(), p2->intValue()));
        return true;
      }
      else if (tonumberns(p1, n1) && tonumberns(p2, n2)) {
        res->setFloat(numarith(op, n1, n2));
        return true;
      }
      else return false;  /* fail */
    }
  }
}


/*
** Equality without metamethods. Numbers compare by their mathematical
** values; every other value compares by identity (strings are
** interned, so identity is content equality).
*/
bool lrtO_rawequal (const TValue *t1, const TValue *t2) noexcept {
  if (t1->typeTag() != t2->typeTag()) {  /* not the same variant? */
    if (t1->baseType() != t2->baseType() || t1->baseType() != LRT_TNUMBER)
      return false;  /* only numbers can be equal with different variants */
    else {  /* two numbers with different variants */
      lrt_Integer i1, i2;
      return (VirtualMachine::tointegerns(t1, &i1, F2Imod::F2Ieq) &&
              VirtualMachine::tointegerns(t2, &i2, F2Imod::F2Ieq) &&
              i1 == i2);
    }
  }
  switch (t1->typeTag()) {
    case ValueTag::NIL: case ValueTag::VFALSE: case ValueTag::VTRUE:
      return true;
    case ValueTag::NUMINT: return (t1->intValue() == t2->intValue());
    case ValueTag::NUMFLT: return lrti_numeq(t1->floatValue(), t2->floatValue());
    case ValueTag::LCF: return t1->functionValue() == t2->functionValue();
    default: return t1->gcValue() == t2->gcValue();
  }
}

/* }================================================================== */


/*
** {==================================================================
** Conversion from strings to numbers
** ===================================================================
*/

static int isneg (const char **s) {
  if (**s == '-') { (*s)++; return 1; }
  else if (**s == '+') (*s)++;
  return 0;
}


static int hexavalue (int c) {
  if (std::isdigit(c)) return c - '0';
  else return (std::tolower(c) - 'a') + 10;
}


/* maximum length of a numeral to be converted to a number */
#if !defined (L_MAXLENNUM)
#define L_MAXLENNUM	200
#endif

/*
** Convert string 's' to a float (decimal or hexadecimal). 'strtod'
** accepts 'inf' and 'nan', which are not numerals here, so any 'n'
** rejects the string.
*/
static const char *l_str2dloc (const char *s, lrt_Number *result) {
  char *endptr;
  *result = std::strtod(s, &endptr);
  if (endptr == s) return nullptr;  /* nothing recognized? */
  while (std::isspace(cast_uchar(*endptr))) endptr++;  /* skip trailing spaces */
  return (*endptr == '\0') ? endptr : nullptr;  /* OK iff no trailing chars */
}


static const char *l_str2d (const char *s, lrt_Number *result) {
  const char *endptr;
  const char *pmode = std::strpbrk(s, ".xXnN");  /* look for special chars */
  int mode = pmode ? (std::tolower(cast_uchar(*pmode))) : 0;
  if (mode == 'n')  /* reject 'inf' and 'nan' */
    return nullptr;
  endptr = l_str2dloc(s, result);
  if (endptr == nullptr) {  /* failed? may be a different locale */
    char buff[L_MAXLENNUM + 1];
    const char *pdot = std::strchr(s, '.');
    if (pdot == nullptr || std::strlen(s) > L_MAXLENNUM)
      return nullptr;  /* string too long or no dot; fail */
    std::strcpy(buff, s);  /* copy string to buffer */
    buff[pdot - s] = std::localeconv()->decimal_point[0];  /* correct dot */
    endptr = l_str2dloc(buff, result);  /* try again */
    if (endptr != nullptr)
      endptr = s + (endptr - buff);  /* make relative to 's' */
  }
  return endptr;
}


#define MAXBY10		cast(lrt_Unsigned, LRT_MAXINTEGER / 10)
#define MAXLASTD	cast_int(LRT_MAXINTEGER % 10)

/*
** Decimal integers that do not fit are not integers (they become
** floats); hexadecimal integers wrap around.
*/
static const char *l_str2int (const char *s, lrt_Integer *result) {
  lrt_Unsigned a = 0;
  int empty = 1;
  int neg;
  while (std::isspace(cast_uchar(*s))) s++;  /* skip initial spaces */
  neg = isneg(&s);
  if (s[0] == '0' &&
      (s[1] == 'x' || s[1] == 'X')) {  /* hex? */
    s += 2;  /* skip '0x' */
    for (; std::isxdigit(cast_uchar(*s)); s++) {
      a = a * 16 + cast(lrt_Unsigned, hexavalue(cast_uchar(*s)));
      empty = 0;
    }
  }
  else {  /* decimal */
    for (; std::isdigit(cast_uchar(*s)); s++) {
      int d = *s - '0';
      if (a >= MAXBY10 && (a > MAXBY10 || d > MAXLASTD + neg))  /* overflow? */
        return nullptr;  /* do not accept it (as integer) */
      a = a * 10 + cast(lrt_Unsigned, d);
      empty = 0;
    }
  }
  while (std::isspace(cast_uchar(*s))) s++;  /* skip trailing spaces */
  if (empty || *s != '\0') return nullptr;  /* something wrong in the numeral */
  else {
    *result = l_castU2S((neg) ? 0u - a : a);
    return s;
  }
}


/*
** Convert a numeral to a value. Returns the size of the numeral plus
** one (counting the final '\0') on success, or 0 if 's' is not a
** valid numeral.
*/
size_t lrtO_str2num (const char *s, TValue *o) {
  lrt_Integer i; lrt_Number n;
  const char *e;
  if ((e = l_str2int(s, &i)) != nullptr) {  /* try as an integer */
    o->setInt(i);
  }
  else if ((e = l_str2d(s, &n)) != nullptr) {  /* else try as a float */
    o->setFloat(n);
  }
  else
    return 0;  /* conversion failed */
  return static_cast<size_t>(e - s) + 1;  /* success; return string size */
}

/* }================================================================== */


/*
** {==================================================================
** Conversion from numbers to strings
** ===================================================================
*/

/*
** Convert a number object to a string, adding it to a buffer. Floats
** that look like integers get a '.0' suffix, so that they read back
** as floats.
*/
unsigned lrtO_tostringbuff (const TValue *obj, char *buff) {
  int len;
  lrt_assert(obj->isNumber());
  if (obj->isInteger())
    len = std::snprintf(buff, MAXNUMBER2STR, LRT_INTEGER_FMT, obj->intValue());
  else {
    len = std::snprintf(buff, MAXNUMBER2STR, LRT_NUMBER_FMT, obj->floatValue());
    if (buff[std::strspn(buff, "-0123456789")] == '\0') {  /* looks like an int? */
      buff[len++] = '.';
      buff[len++] = '0';  /* adds '.0' to result */
    }
  }
  return cast_uint(len);
}


/*
** Convert a number object to a string in place
*/
void lrtO_tostring (lrt_State *L, TValue *obj) {
  char buff[MAXNUMBER2STR];
  unsigned len = lrtO_tostringbuff(obj, buff);
  obj->setString(lrtS_newlstr(L, buff, len));
}

/* }================================================================== */


/*
** {==================================================================
** 'lrtO_pushvfstring'
** ===================================================================
*/

/*
** Accepts only the options '%d' (int), '%I' (lrt_Integer), '%f'
** (lrt_Number), '%s' (zero-terminated string), '%p' (pointer), '%c'
** (char as an int) and '%%'. The result is pushed on the stack.
*/
const char *lrtO_pushvfstring (lrt_State *L, const char *fmt, va_list argp) {
  std::string buff;
  const char *e;  /* points to next '%' */
  while ((e = std::strchr(fmt, '%')) != nullptr) {
    buff.append(fmt, cast_sizet(e - fmt));  /* add 'fmt' up to '%' */
    switch (*(e + 1)) {  /* conversion specifier */
      case 's': {  /* zero-terminated string */
        const char *s = va_arg(argp, char *);
        if (s == nullptr) s = "(null)";
        buff.append(s);
        break;
      }
      case 'c': {  /* an 'int' as a character */
        buff.push_back(static_cast<char>(cast_uchar(va_arg(argp, int))));
        break;
      }
      case 'd': {  /* an 'int' */
        TValue num;
        char nb[MAXNUMBER2STR];
        num.setInt(va_arg(argp, int));
        buff.append(nb, lrtO_tostringbuff(&num, nb));
        break;
      }
      case 'I': {  /* a 'lrt_Integer' */
        TValue num;
        char nb[MAXNUMBER2STR];
        num.setInt(cast_Integer(va_arg(argp, lrt_Integer)));
        buff.append(nb, lrtO_tostringbuff(&num, nb));
        break;
      }
      case 'f': {  /* a 'lrt_Number' */
        TValue num;
        char nb[MAXNUMBER2STR];
        num.setFloat(cast_num(va_arg(argp, lrt_Number)));
        buff.append(nb, lrtO_tostringbuff(&num, nb));
        break;
      }
      case 'p': {  /* a pointer */
        char nb[3 * sizeof(void*) + 8];
        void *p = va_arg(argp, void *);
        int len = std::snprintf(nb, sizeof(nb), "%p", p);
        buff.append(nb, cast_sizet(len));
        break;
      }
      case '%': {
        buff.push_back('%');
        break;
      }
      default: {
        lrtG_runerror(L, "invalid option '%%%c' to 'lrt_pushfstring'",
                         *(e + 1));
      }
    }
    fmt = e + 2;  /* skip '%' and the specifier */
  }
  buff.append(fmt);  /* rest of 'fmt' */
  TString *ts = lrtS_newlstr(L, buff.data(), buff.size());
  L->s2v(L->getTop())->setString(ts);
  L->inctop();
  return ts->c_str();
}


const char *lrtO_pushfstring (lrt_State *L, const char *fmt, ...) {
  const char *msg;
  va_list argp;
  va_start(argp, fmt);
  msg = lrtO_pushvfstring(L, fmt, argp);
  va_end(argp);
  return msg;
}

/* }================================================================== */


#define RETS	"..."
#define PRE	"[string \""
#define POS	"\"]"

#define addstr(a,b,l)	( std::memcpy(a,b,(l) * sizeof(char)), a += (l) )

/*
** Build a printable description of a chunk name in 'out' (of size
** LRT_IDSIZE): '=name' is used as is, '@file' names a file, anything
** else is shown as a string source.
*/
void lrtO_chunkid (char *out, const char *source, size_t srclen) {
  size_t bufflen = LRT_IDSIZE;  /* free space in buffer */
  if (*source == '=') {  /* 'literal' source */
    if (srclen <= bufflen)  /* small enough? */
      std::memcpy(out, source + 1, srclen * sizeof(char));
    else {  /* truncate it */
      addstr(out, source + 1, bufflen - 1);
      *out = '\0';
    }
  }
  else if (*source == '@') {  /* file name */
    if (srclen <= bufflen)  /* small enough? */
      std::memcpy(out, source + 1, srclen * sizeof(char));
    else {  /* add '...' before rest of name */
      addstr(out, RETS, LL(RETS));
      bufflen -= LL(RETS);
      std::memcpy(out, source + 1 + srclen - bufflen, bufflen * sizeof(char));
    }
  }
  else {  /* string; format as [string "source"] */
    const char *nl = std::strchr(source, '\n');  /* find first new line (if any) */
    addstr(out, PRE, LL(PRE));  /* add prefix */
    bufflen -= LL(PRE RETS POS) + 1;  /* save space for prefix+suffix+'\0' */
    if (srclen < bufflen && nl == nullptr) {  /* small one-line source? */
      addstr(out, source, srclen);  /* keep it */
    }
    else {
      if (nl != nullptr) srclen = cast_sizet(nl - source);  /* stop at first newline */
      if (srclen > bufflen) srclen = bufflen;
      addstr(out, source, srclen);
      addstr(out, RETS, LL(RETS));
    }
    std::memcpy(out, POS, (LL(POS) + 1) * sizeof(char));
  }
}

