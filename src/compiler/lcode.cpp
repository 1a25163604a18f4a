/*
** $Id: lcode.cpp $
** Function builder: assembles prototypes for the interpreter
** See Copyright Notice in lrt.h
*/

#define lcode_c
#define LRT_CORE

#include "lrt.h"

#include "lcode.h"
#include "ldebug.h"
#include "lfunc.h"
#include "lobject.h"
#include "lopcodes.h"
#include "lstate.h"
#include "lstring.h"


FuncBuilder::FuncBuilder (lrt_State *l, const char *source, int numparams,
                          bool vararg)
    : L(l), f(lrtF_newproto(l)), prev(nullptr), currentline(0), maxreg(0) {
  f->setSource(lrtS_new(L, source));
  checklimit(numparams, MAX_FSTACK - 1, "parameters");
  f->setNumParams(numparams);
  f->setVararg(vararg);
  maxreg = numparams;
}


FuncBuilder::FuncBuilder (FuncBuilder &parent, int numparams, bool vararg)
    : L(parent.L), f(lrtF_newproto(parent.L)), prev(&parent),
      currentline(parent.currentline), maxreg(0) {
  f->setSource(parent.f->getSource());
  checklimit(numparams, MAX_FSTACK - 1, "parameters");
  f->setNumParams(numparams);
  f->setVararg(vararg);
  maxreg = numparams;
}


void FuncBuilder::checklimit (int v, int l, const char *what) {
  if (v > l)
    lrtG_raise(L, LRT_ERRSYNTAX, "function at line %d has more than %d %s",
                                 f->getLineDefined(), l, what);
}


void FuncBuilder::touchRegister (int reg) {
  checklimit(reg, MAX_FSTACK - 1, "registers");
  if (reg + 1 > maxreg)
    maxreg = reg + 1;
}


void FuncBuilder::reserveRegisters (int n) {
  if (n > 0)
    touchRegister(n - 1);
}


/*
** Emit instruction 'i', saving the current line for it. Keeps track of
** the registers the instruction may write, to size the frame.
*/
int FuncBuilder::code (Instruction i) {
  InstructionView view(i);
  int op = view.opcode();
  if (getOpMode(op) != OpMode::isJ)
    touchRegister(view.a());
  switch (op) {
    case OP_LOADNIL:
      touchRegister(view.a() + view.b());
      break;
    case OP_CALL:
      if (view.b() > 1)
        touchRegister(view.a() + view.b() - 1);
      if (view.c() > 1)
        touchRegister(view.a() + view.c() - 2);
      break;
    case OP_TAILCALL:
      if (view.b() > 1)
        touchRegister(view.a() + view.b() - 1);
      break;
    case OP_VARARG:
      if (view.c() > 1)
        touchRegister(view.a() + view.c() - 2);
      break;
    default: break;
  }
  f->getCode().push_back(i);
  f->getLineInfo().push_back(currentline);
  return getPC() - 1;  /* index of new instruction */
}


int FuncBuilder::codeABCk (OpCode o, int A, int B, int C, int k) {
  lrt_assert(getOpMode(o) == OpMode::iABC);
  lrt_assert(A <= MAXARG_A && B <= MAXARG_B &&
             C <= MAXARG_C && (k & ~1) == 0);
  return code(CREATE_ABCk(o, A, B, C, k));
}


int FuncBuilder::codeABx (OpCode o, int A, int Bx) {
  lrt_assert(getOpMode(o) == OpMode::iABx);
  lrt_assert(A <= MAXARG_A && Bx <= MAXARG_Bx);
  return code(CREATE_ABx(o, A, Bx));
}


int FuncBuilder::codeAsBx (OpCode o, int A, int sBx) {
  lrt_assert(getOpMode(o) == OpMode::iAsBx);
  lrt_assert(-OFFSET_sBx <= sBx && sBx <= MAXARG_Bx - OFFSET_sBx);
  return code(CREATE_ABx(o, A, sBx + OFFSET_sBx));
}


int FuncBuilder::codesJ (OpCode o, int sj) {
  lrt_assert(getOpMode(o) == OpMode::isJ);
  lrt_assert(-OFFSET_sJ <= sj && sj <= MAXARG_sJ - OFFSET_sJ);
  return code(CREATE_sJ(o, sj));
}


/*
** Fix jump instruction at position 'position' to jump to 'dest'.
** (Jump addresses are relative to the next instruction.)
*/
void FuncBuilder::fixjump (int position, int dest) {
  Instruction *jmp = &f->getCode()[static_cast<size_t>(position)];
  int offset = dest - (position + 1);
  lrt_assert(InstructionView(*jmp).opcode() == OP_JMP);
  if (!(-OFFSET_sJ <= offset && offset <= MAXARG_sJ - OFFSET_sJ))
    lrtG_raise(L, LRT_ERRSYNTAX, "control structure too long");
  SETARG_sJ(*jmp, offset);
}


/*
** Add constant 'v' to the prototype's list of constants, reusing an
** equal constant of the same variant when there is one.
*/
int FuncBuilder::addk (const TValue &v) {
  ProtoVector<TValue> &k = f->getConstants();
  for (size_t i = 0; i < k.size(); i++) {
    if (k[i].getType() == v.getType() && lrtO_rawequal(&k[i], &v))
      return cast_int(i);
  }
  checklimit(cast_int(k.size()), MAXARG_Bx, "constants");
  k.push_back(v);
  return cast_int(k.size()) - 1;
}


int FuncBuilder::stringK (const char *s) {
  TValue o;
  o.setString(lrtS_new(L, s));
  return addk(o);
}


int FuncBuilder::intK (lrt_Integer n) {
  TValue o;
  o.setInt(n);
  return addk(o);
}


int FuncBuilder::numberK (lrt_Number n) {
  TValue o;
  o.setFloat(n);
  return addk(o);
}


/*
** Integers that fit in 'sBx' are loaded directly; others go through
** the constant list.
*/
int FuncBuilder::loadInt (int reg, lrt_Integer n) {
  if (-OFFSET_sBx <= n && n <= MAXARG_Bx - OFFSET_sBx)
    return codeAsBx(OP_LOADI, reg, cast_int(n));
  else
    return codeABx(OP_LOADK, reg, intK(n));
}


int FuncBuilder::loadString (int reg, const char *s) {
  return codeABx(OP_LOADK, reg, stringK(s));
}


int FuncBuilder::getGlobal (int reg, const char *name) {
  return codeABx(OP_GETGLOBAL, reg, stringK(name));
}


int FuncBuilder::setGlobal (int reg, const char *name) {
  return codeABx(OP_SETGLOBAL, reg, stringK(name));
}


/* 'nargs' and 'nresults' may be LRT_MULTRET */
int FuncBuilder::call (int func, int nargs, int nresults) {
  checklimit(nargs + 1, MAXARG_B, "arguments");
  checklimit(nresults + 1, MAXARG_C, "results");
  return codeABC(OP_CALL, func, nargs + 1, nresults + 1);
}


/*
** A tail call is always followed by a 'return' of all values from
** 'func': it returns the results when the callee is a native function
** that yielded.
*/
int FuncBuilder::tailcall (int func, int nargs) {
  checklimit(nargs + 1, MAXARG_B, "arguments");
  int pc = codeABC(OP_TAILCALL, func, nargs + 1, 0);
  codeABC(OP_RETURN, func, 0, 0);
  return pc;
}


int FuncBuilder::ret (int first, int nret) {
  checklimit(nret + 1, MAXARG_B, "returns");
  return codeABC(OP_RETURN, first, nret + 1, 0);
}


int FuncBuilder::addUpvalue (const char *name, bool instack, int idx) {
  ProtoVector<Upvaldesc> &up = f->getUpvalues();
  checklimit(cast_int(up.size()) + 1, MAXUPVAL, "upvalues");
  up.push_back(Upvaldesc(lrtS_new(L, name), instack, idx));
  return cast_int(up.size()) - 1;
}


int FuncBuilder::addProto (Proto *p) {
  ProtoVector<Proto*> &ps = f->getProtos();
  checklimit(cast_int(ps.size()), MAXARG_Bx, "functions");
  ps.push_back(p);
  return cast_int(ps.size()) - 1;
}


/*
** Check that the code can run: jumps land inside the function, tests
** are followed by jumps, open results are consumed by the next
** instruction, and operands refer to existing constants, upvalues,
** prototypes and (for enclosed upvalues) enclosing registers.
*/
int FuncBuilder::finish () {
  ProtoVector<Instruction> &insts = f->getCode();
  if (insts.empty() || InstructionView(insts.back()).opcode() != OP_RETURN)
    ret(0, 0);  /* final 'return' */
  int n = getPC();
  int nk = cast_int(f->getConstants().size());
  for (int pc = 0; pc < n; pc++) {
    Instruction i = insts[static_cast<size_t>(pc)];
    InstructionView view(i);
    int op = view.opcode();
    int prevop = (pc > 0) ? InstructionView(insts[static_cast<size_t>(pc - 1)]).opcode()
                          : -1;
    if (prevop == OP_TAILCALL) {
      if (op != OP_RETURN || view.a() != InstructionView(insts[static_cast<size_t>(pc - 1)]).a()
                          || view.b() != 0)
        lrtG_raise(L, LRT_ERRSYNTAX, "tail call at instruction %d not followed by its return",
                                     pc);
    }
    else if (pc > 0 && lrtP_isOT(insts[static_cast<size_t>(pc - 1)]) != lrtP_isIT(i))
      lrtG_raise(L, LRT_ERRSYNTAX, "invalid use of open results at instruction %d (%s)",
                                   pc + 1, lrtP_opnames[op]);
    if (testTMode(op) &&
        (pc + 1 >= n ||
         InstructionView(insts[static_cast<size_t>(pc + 1)]).opcode() != OP_JMP))
      lrtG_raise(L, LRT_ERRSYNTAX, "test at instruction %d not followed by a jump",
                                   pc + 1);
    switch (op) {
      case OP_JMP: {
        int dest = pc + 1 + view.sj();
        if (dest < 0 || dest >= n || dest == pc)
          lrtG_raise(L, LRT_ERRSYNTAX, "invalid jump at instruction %d", pc + 1);
        break;
      }
      case OP_LOADK: case OP_GETGLOBAL: case OP_SETGLOBAL: {
        if (view.bx() >= nk)
          lrtG_raise(L, LRT_ERRSYNTAX, "invalid constant at instruction %d", pc + 1);
        if (op != OP_LOADK &&
            !f->getConstants()[static_cast<size_t>(view.bx())].isString())
          lrtG_raise(L, LRT_ERRSYNTAX, "global name at instruction %d is not a string",
                                       pc + 1);
        break;
      }
      case OP_GETFIELD: case OP_EQK: case OP_SETFIELD: case OP_SETTABLE: {
        int idx = (op == OP_GETFIELD) ? view.c() : view.b();
        bool isk = (op != OP_SETTABLE);
        if (op == OP_SETTABLE || op == OP_SETFIELD) {  /* RK(C) operand */
          if (view.k() && view.c() >= nk)
            lrtG_raise(L, LRT_ERRSYNTAX, "invalid constant at instruction %d", pc + 1);
        }
        if (isk && idx >= nk)
          lrtG_raise(L, LRT_ERRSYNTAX, "invalid constant at instruction %d", pc + 1);
        break;
      }
      case OP_GETUPVAL: case OP_SETUPVAL: {
        if (view.b() >= f->getUpvaluesSize())
          lrtG_raise(L, LRT_ERRSYNTAX, "invalid upvalue at instruction %d", pc + 1);
        break;
      }
      case OP_CLOSURE: {
        if (view.bx() >= cast_int(f->getProtos().size()))
          lrtG_raise(L, LRT_ERRSYNTAX, "invalid function at instruction %d", pc + 1);
        break;
      }
      case OP_VARARG: case OP_VARARGPREP: {
        if (!f->isVararg())
          lrtG_raise(L, LRT_ERRSYNTAX, "vararg instruction in a fixed-arity function");
        break;
      }
      default: break;
    }
  }
  if (f->isVararg() &&
      (n == 0 || InstructionView(insts[0]).opcode() != OP_VARARGPREP))
    lrtG_raise(L, LRT_ERRSYNTAX, "vararg function must start with VARARGPREP");
  f->setMaxStackSize(maxreg < 2 ? 2 : maxreg);
  if (prev != nullptr) {
    for (const Upvaldesc &uv : f->getUpvalues()) {  /* check enclosing references */
      if (uv.isInStack() ? uv.getIndex() >= prev->maxreg
                         : uv.getIndex() >= prev->f->getUpvaluesSize())
        lrtG_raise(L, LRT_ERRSYNTAX, "invalid upvalue description");
    }
    return prev->addProto(f);
  }
  return 0;
}


void FuncBuilder::pushClosure () {
  lrt_assert(prev == nullptr);
  finish();
  LClosure *cl = lrtF_newLclosure(L, f);
  lrtF_initupvals(L, cl);
  L->s2v(L->getTop())->setLClosure(cl);
  L->inctop();
}
