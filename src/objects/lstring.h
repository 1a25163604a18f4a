/*
** $Id: lstring.h $
** String table (keeps all strings handled by the runtime)
** See Copyright Notice in lrt.h
*/

#ifndef lstring_h
#define lstring_h

#include <functional>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "lobject.h"
#include "lrtallocator.h"


/*
** Memory-allocation error message must be preallocated (it cannot
** be created after memory is exhausted)
*/
#define MEMERRMSG       "not enough memory"


/*
** The string table maps the contents of each live string to its only
** object. Keys are views over the object's own contents, so an entry
** must be removed before its string is freed.
*/
using StringMap = std::unordered_map<std::string_view, TString*,
                                     std::hash<std::string_view>,
                                     std::equal_to<std::string_view>,
                                     LrtAllocator<std::pair<const std::string_view, TString*>>>;


LRTI_FUNC TString *lrtS_newlstr (lrt_State *L, const char *str, size_t l);
LRTI_FUNC TString *lrtS_new (lrt_State *L, const char *str);
LRTI_FUNC void lrtS_remove (global_State *g, TString *ts) noexcept;
[[nodiscard]] LRTI_FUNC int lrtS_cmp (const TString *ts1, const TString *ts2);
[[nodiscard]] LRTI_FUNC Udata *lrtS_newudata (lrt_State *L, size_t s, int tag);
LRTI_FUNC void lrtS_init (lrt_State *L);


/* create a string from a literal */
template<size_t N>
inline TString* lrtS_newliteral(lrt_State *L, const char (&s)[N]) {
  return lrtS_newlstr(L, s, N - 1);
}


#endif
