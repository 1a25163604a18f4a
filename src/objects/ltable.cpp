/*
** $Id: ltable.cpp $
** Runtime tables (array part plus hash part)
** See Copyright Notice in lrt.h
*/

#define ltable_c
#define LRT_CORE

#include "lrt.h"

#include <cmath>
#include <functional>

#include "ldebug.h"
#include "lgc.h"
#include "lstate.h"
#include "ltable.h"
#include "lvm.h"


size_t TValueHasher::operator() (const TValue& k) const noexcept {
  switch (k.typeTag()) {
    case ValueTag::NUMINT:
      return std::hash<lrt_Integer>()(k.intValue());
    case ValueTag::NUMFLT:
      return std::hash<lrt_Number>()(k.floatValue());
    case ValueTag::VFALSE: return 0;
    case ValueTag::VTRUE: return 1;
    case ValueTag::LCF:
      return std::hash<const void*>()(reinterpret_cast<const void*>(k.functionValue()));
    default:
      return std::hash<const void*>()(k.gcValue());
  }
}


bool TValueKeyEq::operator() (const TValue& a, const TValue& b) const noexcept {
  if (a.getType() != b.getType())
    return false;
  switch (a.typeTag()) {
    case ValueTag::NUMINT: return a.intValue() == b.intValue();
    case ValueTag::NUMFLT: return a.floatValue() == b.floatValue();
    case ValueTag::VFALSE: case ValueTag::VTRUE: return true;
    case ValueTag::LCF: return a.functionValue() == b.functionValue();
    default: return a.gcValue() == b.gcValue();
  }
}


Table::Table (global_State* g)
    : GCObject(ValueTag::TABLE), array(LrtAllocator<TValue>(g)),
      node(0, TValueHasher(), TValueKeyEq(),
           LrtAllocator<std::pair<const TValue, TValue>>(g)) {}


Table* Table::create (lrt_State* L, int narr, int nrec) {
  Table* t = lrtC_newobj<Table>(L, sizeof(Table), G(L));
  if (narr > 0)
    t->array.reserve(static_cast<size_t>(narr));
  if (nrec > 0)
    t->node.reserve(static_cast<size_t>(nrec));
  return t;
}


/*
** Key normalization: a float with an integral value is the same key as
** the corresponding integer. Returns false for keys that cannot index a
** table (nil and NaN).
*/
static bool normkey (const TValue* key, TValue* res) {
  if (key->isFloat()) {
    lrt_Number n = key->floatValue();
    lrt_Integer i;
    if (std::isnan(n))
      return false;
    if (VirtualMachine::flttointeger(n, &i, F2Imod::F2Ieq)) {
      res->setInt(i);
      return true;
    }
  }
  else if (key->isNil())
    return false;
  *res = *key;
  return true;
}


const TValue* Table::getInt (lrt_Integer key) const {
  if (l_castS2U(key) - 1u < array.size())
    return &array[static_cast<size_t>(key - 1)];
  TValue k;
  k.setInt(key);
  auto it = node.find(k);
  return (it == node.end()) ? &absentvalue : &it->second;
}


const TValue* Table::getStr (TString* key) const {
  TValue k;
  k.setString(key);
  auto it = node.find(k);
  return (it == node.end()) ? &absentvalue : &it->second;
}


const TValue* Table::get (const TValue* key) const {
  TValue k;
  if (!normkey(key, &k))
    return &absentvalue;
  if (k.isInteger())
    return getInt(k.intValue());
  auto it = node.find(k);
  return (it == node.end()) ? &absentvalue : &it->second;
}


/*
** Move keys that now follow the array part from the hash part into it.
*/
void Table::migrateFromHash () {
  TValue k;
  for (;;) {
    k.setInt(cast_Integer(array.size()) + 1);
    auto it = node.find(k);
    if (it == node.end())
      break;
    array.push_back(it->second);
    node.erase(it);
  }
}


void Table::setHash (const TValue& key, const TValue* value) {
  if (value->isNil())
    node.erase(key);
  else
    node.insert_or_assign(key, *value);
}


void Table::setInt (lrt_State* L, lrt_Integer key, const TValue* value) {
  size_t n = array.size();
  UNUSED(L);
  if (l_castS2U(key) - 1u < n) {  /* key in the array part? */
    array[static_cast<size_t>(key - 1)] = *value;
    if (value->isNil() && static_cast<size_t>(key) == n) {
      while (!array.empty() && array.back().isNil())
        array.pop_back();  /* keep the last element non nil */
    }
  }
  else if (l_castS2U(key) == n + 1) {  /* key extends the array part? */
    if (!value->isNil()) {
      array.push_back(*value);
      migrateFromHash();
    }
  }
  else {
    TValue k;
    k.setInt(key);
    setHash(k, value);
  }
}


void Table::setStr (lrt_State* L, TString* key, const TValue* value) {
  TValue k;
  UNUSED(L);
  k.setString(key);
  setHash(k, value);
}


void Table::set (lrt_State* L, const TValue* key, const TValue* value) {
  TValue k;
  if (l_unlikely(!normkey(key, &k))) {
    if (key->isNil())
      lrtG_runerror(L, "index is nil");
    else
      lrtG_runerror(L, "index is NaN");
  }
  if (k.isInteger())
    setInt(L, k.intValue(), value);
  else
    setHash(k, value);
}
