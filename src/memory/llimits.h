/*
** $Id: llimits.h $
** Limits, basic types, and some other 'installation-dependent' definitions
** See Copyright Notice in lrt.h
*/

#ifndef llimits_h
#define llimits_h


#include <climits>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>


#include "lrt.h"


#define l_numbits(t)	cast_int(sizeof(t) * CHAR_BIT)

/*
** 'l_mem' is a signed integer big enough to count the total memory
** used by a state. 'lu_mem' is a corresponding unsigned type.
*/
typedef ptrdiff_t l_mem;
typedef size_t lu_mem;

#define MAX_LMEM  \
	cast(l_mem, (cast(lu_mem, 1) << (l_numbits(l_mem) - 1)) - 1)


/* chars used as small naturals (so that 'char' is reserved for characters) */
typedef unsigned char lu_byte;
typedef signed char ls_byte;


/* Type for thread status/error codes */
typedef lu_byte TStatus;

/* The API still uses 'int' for status/error codes */
#define APIstatus(st)	cast_int(st)

/* true for all statuses that represent a raised error */
inline constexpr bool errorstatus(int s) noexcept { return s > LRT_YIELD; }

/* maximum value for size_t */
inline constexpr size_t MAX_SIZET = ((size_t)(~(size_t)0));

/* maximum value for int */
inline constexpr int MAX_INT = INT_MAX;


/*
** Maximum size for strings and userdata visible to scripts; should be
** representable as a lrt_Integer and as a size_t.
*/
#define MAX_SIZE	(sizeof(size_t) < sizeof(lrt_Integer) ? MAX_SIZET \
			  : cast_sizet(LRT_MAXINTEGER))


/*
** test whether an unsigned value is a power of 2 (or zero)
*/
template<typename T>
inline constexpr bool ispow2(T x) noexcept {
	return ((x) & ((x) - 1)) == 0;
}


/* number of chars of a literal string without the ending \0 */
template<size_t N>
inline constexpr size_t LL(const char (&)[N]) noexcept {
	return N - 1;
}


/*
** conversion of pointer to unsigned integer: this is for hashing only;
** there is no problem if the integer cannot hold the whole pointer
** value.
*/
#define L_P2I	uintptr_t


/*
** Internal assertions for in-house debugging
*/
#if defined LRTI_ASSERT
#undef NDEBUG
#include <cassert>
#define lrt_assert(c)           assert(c)
#define assert_code(c)		c
#endif

#if !defined(lrt_assert)
#define lrt_assert(c)		((void)0)
#define assert_code(c)		((void)0)
#endif

#define check_exp(c,e)		(lrt_assert(c), (e))


/* macro to avoid warnings about unused variables */
#if !defined(UNUSED)
#define UNUSED(x)	((void)(x))
#endif


/*
** type casts
*/
#define cast(t, exp)	((t)(exp))

#define cast_void(i)	static_cast<void>(i)

constexpr inline lrt_Number cast_num(auto i) noexcept {
	return static_cast<lrt_Number>(i);
}

constexpr inline int cast_int(auto i) noexcept {
	return static_cast<int>(i);
}

constexpr inline unsigned int cast_uint(auto i) noexcept {
	return static_cast<unsigned int>(i);
}

constexpr inline lu_byte cast_byte(auto i) noexcept {
	return static_cast<lu_byte>(i);
}

constexpr inline unsigned char cast_uchar(auto i) noexcept {
	return static_cast<unsigned char>(i);
}

constexpr inline lrt_Integer cast_Integer(auto i) noexcept {
	return static_cast<lrt_Integer>(i);
}

#define cast_sizet(i)	cast(size_t, (i))
#define cast_voidp(i)	cast(void*, (i))
#define cast_charp(i)	cast(char*, (i))

template<typename T>
inline constexpr unsigned int point2uint(T* p) noexcept {
	return cast_uint(reinterpret_cast<L_P2I>(p) & UINT_MAX);
}


/*
** cast a lrt_Unsigned to a signed lrt_Integer and back; these casts are
** only used for wrap-around integer arithmetic.
*/
#define l_castS2U(i)	((lrt_Unsigned)(i))
#define l_castU2S(i)	((lrt_Integer)(i))

/* integer arithmetic with wrap-around */
#define intop(op,v1,v2) l_castU2S(l_castS2U(v1) op l_castS2U(v2))


/*
** non-return type
*/
#if defined(__GNUC__)
#define l_noret		void __attribute__((noreturn))
#elif defined(_MSC_VER)
#define l_noret		void __declspec(noreturn)
#else
#define l_noret		void
#endif


/*
** type for virtual-machine instructions;
** must be an unsigned with (at least) 4 bytes (see details in lopcodes.h)
*/
typedef uint32_t l_uint32;
typedef l_uint32 Instruction;


/*
** The lrti_num* operations define the primitive operations over numbers.
*/

/* float division */
inline lrt_Number lrti_numdiv(lrt_Number a, lrt_Number b) noexcept {
	return a / b;
}

/* floor division (defined as 'floor(a/b)') */
inline lrt_Number lrti_numidiv(lrt_Number a, lrt_Number b) noexcept {
	return std::floor(lrti_numdiv(a, b));
}

/*
** modulo: defined as 'a - floor(a/b)*b'; the direct computation
** using this definition has several problems with rounding errors,
** so it is better to use 'fmod'. 'fmod' gives the result of
** 'a - trunc(a/b)*b', and therefore must be corrected when
** 'trunc(a/b) ~= floor(a/b)'. That happens when the division has a
** non-integer negative result: non-integer result is equivalent to
** a non-zero remainder 'm'; negative result is equivalent to 'a' and
** 'b' with different signs, or 'm' and 'b' with different signs
** (as the result 'm' of 'fmod' has the same sign of 'a').
*/
inline lrt_Number lrti_nummod(lrt_Number a, lrt_Number b) noexcept {
	lrt_Number m = std::fmod(a, b);
	if ((m > 0) ? b < 0 : (m < 0 && b != m))
		m += b;
	return m;
}

inline lrt_Number lrti_numadd(lrt_Number a, lrt_Number b) noexcept { return a + b; }
inline lrt_Number lrti_numsub(lrt_Number a, lrt_Number b) noexcept { return a - b; }
inline lrt_Number lrti_nummul(lrt_Number a, lrt_Number b) noexcept { return a * b; }
inline lrt_Number lrti_numunm(lrt_Number a) noexcept { return -a; }
inline bool lrti_numeq(lrt_Number a, lrt_Number b) noexcept { return a == b; }
inline bool lrti_numlt(lrt_Number a, lrt_Number b) noexcept { return a < b; }
inline bool lrti_numle(lrt_Number a, lrt_Number b) noexcept { return a <= b; }
inline bool lrti_numisnan(lrt_Number a) noexcept { return !lrti_numeq(a, a); }


/*
** lrt_numbertointeger converts a float number with an integral value
** to an integer, or returns false if the float is not within the range
** of a lrt_Integer. (The range comparisons are tricky because of
** rounding. The tests here assume a two-complement representation,
** where MININTEGER always has an exact representation as a float;
** MAXINTEGER may not have one, and therefore its conversion to float
** may have an ill-defined value.)
*/
inline bool lrt_numbertointeger(lrt_Number n, lrt_Integer *p) noexcept {
  if (n >= cast_num(LRT_MININTEGER) && n < -cast_num(LRT_MININTEGER)) {
    *p = static_cast<lrt_Integer>(n);
    return true;
  }
  return false;
}


/*
** LRTI_FUNC is a mark for all extern functions that are not to be
** exported to outside modules.
*/
#if !defined(LRTI_FUNC)
#define LRTI_FUNC	extern
#endif


#if defined(__GNUC__)
#define l_likely(x)	(__builtin_expect(((x) != 0), 1))
#define l_unlikely(x)	(__builtin_expect(((x) != 0), 0))
#else
#define l_likely(x)	(x)
#define l_unlikely(x)	(x)
#endif


/* print an error message */
#if !defined(lrt_writestringerror)
#define lrt_writestringerror(s,p) \
        (std::fprintf(stderr, (s), (p)), std::fflush(stderr))
#endif

#endif
