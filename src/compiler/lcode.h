/*
** $Id: lcode.h $
** Function builder: assembles prototypes for the interpreter
** See Copyright Notice in lrt.h
*/

#ifndef lcode_h
#define lcode_h

#include "lobject.h"
#include "lopcodes.h"


/*
** Marks a jump whose target is not known yet.
*/
inline constexpr int NO_JUMP = -1;


/*
** FuncBuilder assembles one function prototype: code with line
** information, constants, upvalue descriptors and nested prototypes.
** It is the back end a compiler drives; hosts and tests drive it
** directly. A builder for a nested function is created from the
** builder of its enclosing function, and its 'finish' registers the
** new prototype in the parent.
**
** The prototype under construction is not a root for the collector,
** so a full collection must not run while a builder is open.
*/
class FuncBuilder {
private:
  lrt_State *L;
  Proto *f;  /* current function header */
  FuncBuilder *prev;  /* enclosing function */
  int currentline;  /* line attached to new instructions */
  int maxreg;  /* highest register seen so far, plus one */

public:
  FuncBuilder(lrt_State *L, const char *source, int numparams = 0,
              bool vararg = false);
  FuncBuilder(FuncBuilder &parent, int numparams = 0, bool vararg = false);

  FuncBuilder(const FuncBuilder&) = delete;
  FuncBuilder& operator=(const FuncBuilder&) = delete;

  lrt_State* getState() const noexcept { return L; }
  Proto* getProto() const noexcept { return f; }
  FuncBuilder* getPrev() const noexcept { return prev; }
  int getPC() const noexcept { return f->getCodeSize(); }

  void setLine(int line) noexcept { currentline = line; }
  void setLineDefined(int first, int last) noexcept {
    f->setLineDefined(first);
    f->setLastLineDefined(last);
  }
  /* make sure the function has at least 'n' registers */
  void reserveRegisters(int n);

  /* instruction emission; all return the position of the instruction */
  int code(Instruction i);
  int codeABCk(OpCode o, int A, int B, int C, int k);
  int codeABC(OpCode o, int A, int B, int C) { return codeABCk(o, A, B, C, 0); }
  int codeABx(OpCode o, int A, int Bx);
  int codeAsBx(OpCode o, int A, int sBx);
  int codesJ(OpCode o, int sj);

  /* jumps */
  int jump() { return codesJ(OP_JMP, NO_JUMP); }
  void fixjump(int position, int dest);
  void patchtohere(int position) { fixjump(position, getPC()); }

  /* constants */
  int addk(const TValue &v);
  int stringK(const char *s);
  int intK(lrt_Integer n);
  int numberK(lrt_Number n);

  /* common instruction sequences */
  int loadInt(int reg, lrt_Integer n);
  int loadString(int reg, const char *s);
  int getGlobal(int reg, const char *name);
  int setGlobal(int reg, const char *name);
  int call(int func, int nargs, int nresults);
  int tailcall(int func, int nargs);
  int ret(int first, int nret);

  /* upvalues and nested functions */
  int addUpvalue(const char *name, bool instack, int idx);
  int addProto(Proto *p);

  /*
  ** Check the finished code and close the prototype. For a nested
  ** builder, the prototype is added to the parent and its index is
  ** returned; otherwise returns 0.
  */
  int finish();

  /* finish a main function and push a closure for it */
  void pushClosure();

private:
  void checklimit(int v, int l, const char *what);
  void touchRegister(int reg);
};


#endif
