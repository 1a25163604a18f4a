/*
** $Id: lmem.cpp $
** Interface to Memory Manager
** See Copyright Notice in lrt.h
*/

#define lmem_c
#define LRT_CORE

#include "lrt.h"

#include "ldebug.h"
#include "ldo.h"
#include "lmem.h"
#include "lstate.h"


/*
** About the realloc function:
** void *frealloc (void *ud, void *ptr, size_t osize, size_t nsize);
** ('osize' is the old size, 'nsize' is the new size)
**
** - frealloc(ud, p, x, 0) frees the block 'p' and returns NULL.
** Particularly, frealloc(ud, NULL, 0, 0) does nothing,
** which is equivalent to free(NULL) in ISO C.
**
** - frealloc(ud, NULL, x, s) creates a new block of size 's'
** (no matter 'x'). Returns NULL if it cannot create the new block.
**
** - otherwise, frealloc(ud, b, x, y) reallocates the block 'b' from
** size 'x' to size 'y'. Returns NULL if it cannot reallocate the
** block to the new size.
*/


l_noret lrtM_toobig (lrt_State *L) {
  lrtG_raise(L, LRT_ERRMEM, "memory allocation error: block too big");
}


/*
** Generic allocation routine. Every block that belongs to a state goes
** through here, so 'totalbytes' always reflects the memory in use.
*/
void *lrtM_galloc (global_State *g, void *block, size_t osize, size_t nsize) {
  void *newblock;
  lrt_assert((osize == 0) == (block == nullptr));
  newblock = (*g->getFrealloc())(g->getUd(), block, osize, nsize);
  if (l_unlikely(newblock == nullptr && nsize > 0))
    return nullptr;  /* do not update 'totalbytes' */
  g->getTotalBytesRef() += cast(l_mem, nsize) - cast(l_mem, osize);
  return newblock;
}


void lrtM_free_ (lrt_State *L, void *block, size_t osize) {
  if (block != nullptr)
    lrtM_galloc(G(L), block, osize, 0);
}


void *lrtM_realloc_ (lrt_State *L, void *block, size_t osize, size_t nsize) {
  if (block == nullptr)
    osize = 0;
  return lrtM_galloc(G(L), block, osize, nsize);
}


void *lrtM_saferealloc_ (lrt_State *L, void *block, size_t osize,
                                                    size_t nsize) {
  void *newblock = lrtM_realloc_(L, block, osize, nsize);
  if (l_unlikely(newblock == nullptr && nsize > 0))  /* allocation failed? */
    lrtM_error(L);
  return newblock;
}


void *lrtM_malloc_ (lrt_State *L, size_t size) {
  if (size == 0)
    return nullptr;  /* that's all */
  else {
    void *newblock = lrtM_galloc(G(L), nullptr, 0, size);
    if (l_unlikely(newblock == nullptr))
      lrtM_error(L);
    return newblock;
  }
}
