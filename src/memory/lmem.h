/*
** $Id: lmem.h $
** Interface to Memory Manager
** See Copyright Notice in lrt.h
*/

#ifndef lmem_h
#define lmem_h


#include <cstddef>
#include <new>

#include "llimits.h"
#include "lrt.h"


class global_State;


#define lrtM_error(L)	(L)->doThrow(LRT_ERRMEM)

LRTI_FUNC l_noret lrtM_toobig (lrt_State *L);

/* raw allocation through the state allocator, with accounting; no errors */
LRTI_FUNC void *lrtM_galloc (global_State *g, void *block, size_t oldsize,
                                                          size_t size);

LRTI_FUNC void *lrtM_realloc_ (lrt_State *L, void *block, size_t oldsize,
                                                          size_t size);
LRTI_FUNC void *lrtM_saferealloc_ (lrt_State *L, void *block, size_t oldsize,
                                                              size_t size);
LRTI_FUNC void lrtM_free_ (lrt_State *L, void *block, size_t osize);
LRTI_FUNC void *lrtM_malloc_ (lrt_State *L, size_t size);


/*
** This function tests whether it is safe to multiply 'n' by the size of
** type 't' without overflows.
*/
template<typename T>
inline constexpr bool lrtM_testsize(T n, size_t e) noexcept {
	return sizeof(n) >= sizeof(size_t) && cast_sizet(n) + 1 > MAX_SIZET / e;
}

template<typename T>
inline void lrtM_checksize(lrt_State* L, T n, size_t e) {
	if (lrtM_testsize(n, e))
		lrtM_toobig(L);
}


/* Free a single object of type T */
template<typename T>
inline void lrtM_free(lrt_State* L, T* b) noexcept {
	lrtM_free_(L, static_cast<void*>(b), sizeof(T));
}

/* Free an array of n objects of type T */
template<typename T>
inline void lrtM_freearray(lrt_State* L, T* b, size_t n) noexcept {
	lrtM_free_(L, static_cast<void*>(b), n * sizeof(T));
}

/* Allocate an array of n objects of type T */
template<typename T>
inline T* lrtM_newvector(lrt_State* L, size_t n) {
	lrtM_checksize(L, n, sizeof(T));
	return static_cast<T*>(lrtM_malloc_(L, cast_sizet(n) * sizeof(T)));
}


/*
** Build an object of type T in memory from the state allocator. The
** object is destroyed with 'lrtM_delete', passing the same size.
*/
template<typename T, typename... Args>
inline T* lrtM_construct(lrt_State* L, size_t size, Args&&... args) {
	return new (lrtM_malloc_(L, size)) T(static_cast<Args&&>(args)...);
}

template<typename T>
inline void lrtM_delete(lrt_State* L, T* o, size_t size) noexcept {
	o->~T();
	lrtM_free_(L, static_cast<void*>(o), size);
}

#endif
