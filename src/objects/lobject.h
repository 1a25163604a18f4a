/*
** $Id: lobject.h $
** Collectable objects of the runtime
** See Copyright Notice in lrt.h
*/


#ifndef lobject_h
#define lobject_h


#include <cstdarg>
#include <cstddef>
#include <string_view>
#include <vector>

#include "llimits.h"
#include "lrt.h"
#include "lrtallocator.h"
#include "ltvalue.h"


/*
** {==================================================================
** Collectable Objects
** ===================================================================
*/

/*
** Common base for all collectable objects. Objects are allocated with
** 'lrtC_newobj', which links them in the 'allgc' list of the state
** through field 'next'. The tag never carries the collectable bit.
*/
class GCObject {
protected:
  GCObject *next;     /* 'allgc' list linkage */
  ValueTag tt;
  lu_byte marked;     /* reachability bit for a full collection */

public:
  explicit GCObject(ValueTag t) noexcept : next(nullptr), tt(t), marked(0) {}

  GCObject* getNext() const noexcept { return next; }
  void setNext(GCObject* n) noexcept { next = n; }
  GCObject** getNextPtr() noexcept { return &next; }

  ValueTag getType() const noexcept { return tt; }
  int baseType() const noexcept { return novariant(tt); }

  bool isMarked() const noexcept { return marked != 0; }
  void setMarked(bool m) noexcept { marked = m ? 1 : 0; }
};

/* }================================================================== */


/*
** {==================================================================
** Strings
** ===================================================================
*/

/*
** Header for a string value. All strings are interned in the string
** table of their state, so two strings are equal iff they are the
** same object. The contents follow the header in the same block,
** always ending with a '\0'.
*/
class TString : public GCObject {
private:
  size_t len;  /* number of bytes, not counting the final '\0' */

public:
  explicit TString(size_t l) noexcept : GCObject(ValueTag::STRING), len(l) {}

  size_t length() const noexcept { return len; }

  char* contents() noexcept { return reinterpret_cast<char*>(this + 1); }
  const char* c_str() const noexcept {
    return reinterpret_cast<const char*>(this + 1);
  }
  std::string_view view() const noexcept { return std::string_view(c_str(), len); }

  /* size of the block holding a string with 'l' bytes */
  static constexpr size_t allocSize(size_t l) noexcept {
    return sizeof(TString) + l + 1;
  }
};

/* }================================================================== */


/*
** {==================================================================
** Userdata
** ===================================================================
*/

/*
** Header for a full userdata: a raw memory block owned by the runtime,
** plus an integer tag the host uses to tell its kinds of blocks apart.
** The block follows the header, aligned for any type.
*/
class Udata : public GCObject {
private:
  size_t len;  /* number of bytes */
  int tag;     /* host-defined type tag */

public:
  Udata(size_t l, int t) noexcept : GCObject(ValueTag::USERDATA), len(l), tag(t) {}

  size_t getLen() const noexcept { return len; }
  int getTag() const noexcept { return tag; }

  static constexpr size_t memOffset() noexcept {
    return (sizeof(Udata) + alignof(std::max_align_t) - 1)
           & ~(alignof(std::max_align_t) - 1);
  }

  static constexpr size_t allocSize(size_t l) noexcept { return memOffset() + l; }

  void* getMemory() noexcept { return reinterpret_cast<char*>(this) + memOffset(); }
  const void* getMemory() const noexcept {
    return reinterpret_cast<const char*>(this) + memOffset();
  }
};

/* }================================================================== */


/*
** {==================================================================
** Prototypes
** ===================================================================
*/

/*
** Description of an upvalue for function prototypes
*/
class Upvaldesc {
private:
  TString *name;  /* upvalue name (for debug information) */
  lu_byte instack;  /* whether it is in stack (register) */
  lu_byte idx;  /* index of upvalue (in stack or in outer function's list) */

public:
  Upvaldesc(TString* n, bool s, int i) noexcept
    : name(n), instack(s ? 1 : 0), idx(cast_byte(i)) {}

  TString* getName() const noexcept { return name; }
  bool isInStack() const noexcept { return instack != 0; }
  lu_byte getIndex() const noexcept { return idx; }
};


template<typename T>
using ProtoVector = std::vector<T, LrtAllocator<T>>;


/*
** Function Prototypes
*/
class Proto : public GCObject {
private:
  lu_byte numparams;  /* number of fixed (named) parameters */
  lu_byte is_vararg;
  lu_byte maxstacksize;  /* number of registers needed by this function */
  int linedefined;
  int lastlinedefined;
  TString *source;  /* chunk name */
  ProtoVector<TValue> k;  /* constants used by the function */
  ProtoVector<Instruction> code;
  ProtoVector<Proto*> p;  /* functions defined inside the function */
  ProtoVector<Upvaldesc> upvalues;
  ProtoVector<int> lineinfo;  /* source line of each instruction */

public:
  explicit Proto(global_State* g) noexcept
    : GCObject(ValueTag::PROTO), numparams(0), is_vararg(0), maxstacksize(2),
      linedefined(0), lastlinedefined(0), source(nullptr),
      k(LrtAllocator<TValue>(g)), code(LrtAllocator<Instruction>(g)),
      p(LrtAllocator<Proto*>(g)), upvalues(LrtAllocator<Upvaldesc>(g)),
      lineinfo(LrtAllocator<int>(g)) {}

  lu_byte getNumParams() const noexcept { return numparams; }
  void setNumParams(int n) noexcept { numparams = cast_byte(n); }
  bool isVararg() const noexcept { return is_vararg != 0; }
  void setVararg(bool v) noexcept { is_vararg = v ? 1 : 0; }
  lu_byte getMaxStackSize() const noexcept { return maxstacksize; }
  void setMaxStackSize(int n) noexcept { maxstacksize = cast_byte(n); }

  int getLineDefined() const noexcept { return linedefined; }
  void setLineDefined(int l) noexcept { linedefined = l; }
  int getLastLineDefined() const noexcept { return lastlinedefined; }
  void setLastLineDefined(int l) noexcept { lastlinedefined = l; }
  TString* getSource() const noexcept { return source; }
  void setSource(TString* s) noexcept { source = s; }

  ProtoVector<TValue>& getConstants() noexcept { return k; }
  const ProtoVector<TValue>& getConstants() const noexcept { return k; }
  ProtoVector<Instruction>& getCode() noexcept { return code; }
  const ProtoVector<Instruction>& getCode() const noexcept { return code; }
  ProtoVector<Proto*>& getProtos() noexcept { return p; }
  const ProtoVector<Proto*>& getProtos() const noexcept { return p; }
  ProtoVector<Upvaldesc>& getUpvalues() noexcept { return upvalues; }
  const ProtoVector<Upvaldesc>& getUpvalues() const noexcept { return upvalues; }
  ProtoVector<int>& getLineInfo() noexcept { return lineinfo; }

  int getCodeSize() const noexcept { return cast_int(code.size()); }
  int getUpvaluesSize() const noexcept { return cast_int(upvalues.size()); }

  /* source line of instruction 'pc', or -1 without line information */
  int getLine(int pc) const noexcept {
    if (pc < 0 || static_cast<size_t>(pc) >= lineinfo.size())
      return -1;
    return lineinfo[static_cast<size_t>(pc)];
  }
};

/* }================================================================== */


/*
** {==================================================================
** Closures
** ===================================================================
*/

/*
** Upvalues for bytecode closures. While open, the value lives in slot
** 'level' of the stack of 'thread'; once closed, it is kept in 'value'.
*/
class UpVal : public GCObject {
private:
  lrt_State *thread;  /* owning thread while open; null when closed */
  StkId level;  /* stack slot while open */
  UpVal *opennext;  /* next open upvalue of the same thread */
  TValue value;  /* the value (when closed) */

public:
  UpVal() noexcept
    : GCObject(ValueTag::UPVAL), thread(nullptr), level(0), opennext(nullptr),
      value(absentvalue) {}

  bool isOpen() const noexcept { return thread != nullptr; }
  lrt_State* getThread() const noexcept { return thread; }
  StkId getLevel() const noexcept { return level; }
  UpVal* getOpenNext() const noexcept { return opennext; }
  void setOpenNext(UpVal* uv) noexcept { opennext = uv; }
  UpVal** getOpenNextPtr() noexcept { return &opennext; }

  void open(lrt_State* th, StkId lvl) noexcept { thread = th; level = lvl; }
  void close(const TValue& v) noexcept { value = v; thread = nullptr; }

  /* current location of the value (valid until the stack moves) */
  TValue* getValue() noexcept;
  const TValue* getClosedValue() const noexcept { return &value; }
};


/*
** Bytecode closure: a prototype plus its upvalues, which follow the
** header in the same block.
*/
class LClosure : public GCObject {
private:
  lu_byte nupvalues;
  Proto *p;

public:
  LClosure(Proto* pr, int nup) noexcept
    : GCObject(ValueTag::LCL), nupvalues(cast_byte(nup)), p(pr) {
    for (int i = 0; i < nup; i++)
      getUpvals()[i] = nullptr;
  }

  int getNumUpvalues() const noexcept { return nupvalues; }
  Proto* getProto() const noexcept { return p; }

  UpVal** getUpvals() noexcept { return reinterpret_cast<UpVal**>(this + 1); }
  UpVal* getUpval(int i) noexcept { return getUpvals()[i]; }
  void setUpval(int i, UpVal* uv) noexcept { getUpvals()[i] = uv; }

  static constexpr size_t allocSize(int nup) noexcept {
    return sizeof(LClosure) + sizeof(UpVal*) * static_cast<size_t>(nup);
  }
};


/*
** Native closure: a native function plus its upvalues, which are plain
** values stored after the header.
*/
class CClosure : public GCObject {
private:
  lu_byte nupvalues;
  lrt_CFunction f;

public:
  CClosure(lrt_CFunction fn, int nup) noexcept
    : GCObject(ValueTag::CCL), nupvalues(cast_byte(nup)), f(fn) {
    for (int i = 0; i < nup; i++)
      new (&getUpvalues()[i]) TValue(absentvalue);
  }

  int getNumUpvalues() const noexcept { return nupvalues; }
  lrt_CFunction getFunction() const noexcept { return f; }

  TValue* getUpvalues() noexcept { return reinterpret_cast<TValue*>(this + 1); }
  TValue* getUpvalue(int i) noexcept { return &getUpvalues()[i]; }

  static constexpr size_t allocSize(int nup) noexcept {
    return sizeof(CClosure) + sizeof(TValue) * static_cast<size_t>(nup);
  }
};

/* }================================================================== */


/* size of buffer for 'lrtO_tostringbuff' */
inline constexpr int MAXNUMBER2STR = 44;


/*
** {==================================================================
** Functions over objects and values
** ===================================================================
*/

LRTI_FUNC size_t lrtO_str2num (const char *s, TValue *o);
LRTI_FUNC unsigned lrtO_tostringbuff (const TValue *obj, char *buff);
LRTI_FUNC void lrtO_tostring (lrt_State *L, TValue *obj);
LRTI_FUNC bool lrtO_rawarith (lrt_State *L, int op, const TValue *p1,
                              const TValue *p2, TValue *res);
LRTI_FUNC bool lrtO_rawequal (const TValue *t1, const TValue *t2) noexcept;
LRTI_FUNC const char *lrtO_pushvfstring (lrt_State *L, const char *fmt,
                                                       va_list argp);
LRTI_FUNC const char *lrtO_pushfstring (lrt_State *L, const char *fmt, ...);
LRTI_FUNC void lrtO_chunkid (char *out, const char *source, size_t srclen);

/* }================================================================== */


#endif

