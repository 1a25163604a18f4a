/*
** $Id: ltable.h $
** Runtime tables (array part plus hash part)
** See Copyright Notice in lrt.h
*/

#ifndef ltable_h
#define ltable_h

#include <unordered_map>
#include <utility>
#include <vector>

#include "lobject.h"


/*
** Hashing and equality for keys of the hash part. Keys are always
** normalized before they reach the hash part (integral floats become
** integers, nil and NaN never get there), so raw tag-and-payload
** equality is enough.
*/
struct TValueHasher {
  size_t operator()(const TValue& k) const noexcept;
};

struct TValueKeyEq {
  bool operator()(const TValue& a, const TValue& b) const noexcept;
};


/*
** {==================================================================
** Tables
** ===================================================================
*/

/*
** Keys 1..n live in 'array' (key i in array[i - 1]); every other key
** lives in 'node'. The last element of 'array' is never nil and key
** n + 1 is never present in 'node', so the size of the array part is
** always a border of the table.
*/
class Table : public GCObject {
public:
  using ArrayPart = std::vector<TValue, LrtAllocator<TValue>>;
  using HashPart = std::unordered_map<TValue, TValue, TValueHasher, TValueKeyEq,
                        LrtAllocator<std::pair<const TValue, TValue>>>;

private:
  ArrayPart array;
  HashPart node;

public:
  explicit Table(global_State* g);

  [[nodiscard]] static Table* create(lrt_State* L, int narr, int nrec);

  /* lookups return 'absentvalue' for missing keys */
  const TValue* get(const TValue* key) const;
  const TValue* getInt(lrt_Integer key) const;
  const TValue* getStr(TString* key) const;

  void set(lrt_State* L, const TValue* key, const TValue* value);
  void setInt(lrt_State* L, lrt_Integer key, const TValue* value);
  void setStr(lrt_State* L, TString* key, const TValue* value);

  lrt_Unsigned length() const noexcept { return array.size(); }

  size_t arraySize() const noexcept { return array.size(); }
  size_t hashSize() const noexcept { return node.size(); }

  /* calls 'f' with every value reachable from the table (keys included) */
  template<typename F>
  void forEachValue(F&& f) const {
    for (const TValue& v : array)
      f(v);
    for (const auto& entry : node) {
      f(entry.first);
      f(entry.second);
    }
  }

private:
  void setHash(const TValue& key, const TValue* value);
  void migrateFromHash();
};

/* }================================================================== */


#endif
