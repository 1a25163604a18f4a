/*
** $Id: lrtconf.h $
** Configuration file for lrt
** See Copyright Notice in lrt.h
*/


#ifndef lrtconf_h
#define lrtconf_h

#include <climits>
#include <cstddef>
#include <cstdint>


/*
** {====================================================================
** Number types
** =====================================================================
*/

/* type of integer values */
#define LRT_INTEGER		long long
#define LRT_INTEGER_FMT		"%lld"
#define LRT_MAXINTEGER		LLONG_MAX
#define LRT_MININTEGER		LLONG_MIN
#define LRT_UNSIGNED		unsigned long long

/* type of float values */
#define LRT_NUMBER		double
#define LRT_NUMBER_FMT		"%.14g"

/* type used by continuation functions to keep context */
#define LRT_KCONTEXT		intptr_t

/* }==================================================================== */


/*
** {====================================================================
** Limits
** =====================================================================
*/

/*
@@ LRTI_MAXSTACK is the default upper bound for the number of slots of a
** thread stack. Each state can lower it with 'lrt_setstacklimit'. It
** must fit into INT_MAX/2.
*/
#if !defined(LRTI_MAXSTACK)
#define LRTI_MAXSTACK		1000000
#endif


/*
@@ LRTI_MAXCCALLS limits the number of nested native calls (and also
** of nested resumes), which use the C stack.
*/
#if !defined(LRTI_MAXCCALLS)
#define LRTI_MAXCCALLS		200
#endif


/*
@@ LRT_IDSIZE gives the maximum size for the description of the source
** of a function in debug information.
*/
#define LRT_IDSIZE		60

/* }==================================================================== */


/*
@@ LRT_API is a mark for all core API functions.
*/
#define LRT_API		extern


/*
** LRTI_ASSERT turns on internal consistency checks ('lrt_assert').
** LRT_USE_APICHECK turns on checks of API arguments ('api_check').
*/
#if defined(LRT_USE_APICHECK) && !defined(LRTI_ASSERT)
#define LRTI_ASSERT
#endif

#endif
