/*
** $Id: lvm.cpp $
** Runtime interpreter
** See Copyright Notice in lrt.h
*/

#define lvm_c
#define LRT_CORE

#include "lrt.h"

#include "lapi.h"
#include "ldebug.h"
#include "ldo.h"
#include "lfunc.h"
#include "lobject.h"
#include "lopcodes.h"
#include "lstate.h"
#include "lstring.h"
#include "ltable.h"
#include "ltm.h"
#include "lvm.h"


/*
** Create a new bytecode closure for prototype 'p', capturing the
** upvalues its descriptors name: open upvalues over the frame at
** 'base' or upvalues of the enclosing closure 'encl'.
*/
static void pushclosure (lrt_State *L, Proto *p, LClosure *encl, StkId base,
                         StkId ra) {
  int nup = p->getUpvaluesSize();
  const Upvaldesc *uv = p->getUpvalues().data();
  LClosure *ncl = lrtF_newLclosure(L, p);
  for (int i = 0; i < nup; i++) {  /* fill in its upvalues */
    if (uv[i].isInStack())  /* upvalue refers to local variable? */
      ncl->setUpval(i, lrtF_findupval(L, base + uv[i].getIndex()));
    else  /* get upvalue from enclosing function */
      ncl->setUpval(i, encl->getUpval(uv[i].getIndex()));
  }
  L->s2v(ra)->setLClosure(ncl);  /* anchor new closure in stack */
}


/*
** The globals table, kept in the registry.
*/
static TValue globaltable (lrt_State *L) {
  const TValue *gt = G(L)->getRegistry()->tableValue()->getInt(LRT_RIDX_GLOBALS);
  lrt_assert(gt->isTable());
  return *gt;
}


/*
** Finish the execution of an opcode interrupted by a yield. Only
** native functions yield, so the interrupted instruction is a call;
** its results are already in place.
*/
void VirtualMachine::finishOp () {
  CallInfo *ci = L->getCI();
  InstructionView inst(*(ci->getSavedPC() - 1));  /* interrupted instruction */
  switch (inst.opcode()) {
    case OP_CALL: {
      if (inst.c() - 1 >= 0)  /* fixed number of results? */
        L->setTop(ci->getTop());  /* restore frame top */
      break;
    }
    case OP_TAILCALL: {
      /* results go through the 'return' that follows */
      break;
    }
    default: {
      lrt_assert(0);
      break;
    }
  }
}




/*
** {==================================================================
** Function 'execute': main interpreter loop
** ===================================================================
*/

#define vmdispatch(o)	switch(o)
#define vmcase(l)	case l:
#define vmbreak		break


void VirtualMachine::execute (CallInfo *ci) {
  LClosure *cl;
  const TValue *k;
  StkId base;
  const Instruction *pc;
 startfunc:
  lrt_assert(ci == L->getCI() && ci->isLua());
  cl = L->ciFunc(ci);
  k = cl->getProto()->getConstants().data();
  pc = ci->getSavedPC();
  base = ci->getFunc() + 1;
  /* main loop of interpreter */
  for (;;) {
    const Instruction i = *pc++;
    ci->setSavedPC(pc);  /* errors and calls see the current position */
    const InstructionView inst(i);
    const int op = inst.opcode();
    const StkId ra = base + inst.a();
    /* unless it consumes open results, an instruction runs with the
       full frame as the stack top */
    if (!(testITMode(op) && inst.b() == 0) && op != OP_VARARGPREP)
      L->setTop(ci->getTop());
    lrt_assert(base <= L->getTop() &&
               L->getTop() <= L->getStackSubsystem().getLast());
    vmdispatch (op) {
      vmcase(OP_MOVE) {
        *L->s2v(ra) = *L->s2v(base + inst.b());
        vmbreak;
      }
      vmcase(OP_LOADI) {
        L->s2v(ra)->setInt(inst.sbx());
        vmbreak;
      }
      vmcase(OP_LOADF) {
        L->s2v(ra)->setFloat(cast_num(inst.sbx()));
        vmbreak;
      }
      vmcase(OP_LOADK) {
        *L->s2v(ra) = k[inst.bx()];
        vmbreak;
      }
      vmcase(OP_LOADFALSE) {
        L->s2v(ra)->setBool(false);
        vmbreak;
      }
      vmcase(OP_LOADTRUE) {
        L->s2v(ra)->setBool(true);
        vmbreak;
      }
      vmcase(OP_LOADNIL) {
        for (int b = inst.b(), r = 0; r <= b; r++)
          L->s2v(ra + r)->setNil();
        vmbreak;
      }
      vmcase(OP_GETUPVAL) {
        *L->s2v(ra) = *cl->getUpval(inst.b())->getValue();
        vmbreak;
      }
      vmcase(OP_SETUPVAL) {
        *cl->getUpval(inst.b())->getValue() = *L->s2v(ra);
        vmbreak;
      }
      vmcase(OP_GETGLOBAL) {
        TValue gt = globaltable(L);
        finishGet(&gt, &k[inst.bx()], ra);
        vmbreak;
      }
      vmcase(OP_SETGLOBAL) {
        TValue gt = globaltable(L);
        finishSet(&gt, &k[inst.bx()], L->s2v(ra));
        vmbreak;
      }
      vmcase(OP_GETTABLE) {
        finishGet(L->s2v(base + inst.b()), L->s2v(base + inst.c()), ra);
        vmbreak;
      }
      vmcase(OP_GETFIELD) {
        finishGet(L->s2v(base + inst.b()), &k[inst.c()], ra);
        vmbreak;
      }
      vmcase(OP_SETTABLE) {
        const TValue *rc = inst.k() ? &k[inst.c()] : L->s2v(base + inst.c());
        finishSet(L->s2v(ra), L->s2v(base + inst.b()), rc);
        vmbreak;
      }
      vmcase(OP_SETFIELD) {
        const TValue *rc = inst.k() ? &k[inst.c()] : L->s2v(base + inst.c());
        finishSet(L->s2v(ra), &k[inst.b()], rc);
        vmbreak;
      }
      vmcase(OP_NEWTABLE) {
        Table *t = Table::create(L, inst.b(), inst.c());
        L->s2v(ra)->setTable(t);
        vmbreak;
      }
      vmcase(OP_ADDI) {
        const TValue *rb = L->s2v(base + inst.b());
        int imm = inst.sc();
        if (rb->isInteger())
          L->s2v(ra)->setInt(intop(+, rb->intValue(), imm));
        else if (rb->isFloat())
          L->s2v(ra)->setFloat(lrti_numadd(rb->floatValue(), cast_num(imm)));
        else {  /* try the handler with the immediate as an integer */
          TValue vimm;
          vimm.setInt(imm);
          arith(LRT_OPADD, rb, &vimm, ra);
        }
        vmbreak;
      }
      vmcase(OP_ADD)
      vmcase(OP_SUB)
      vmcase(OP_MUL)
      vmcase(OP_MOD)
      vmcase(OP_DIV)
      vmcase(OP_IDIV) {
        /* ORDER OP: opcodes follow the API operators */
        arith(op - OP_ADD + LRT_OPADD, L->s2v(base + inst.b()),
              L->s2v(base + inst.c()), ra);
        vmbreak;
      }
      vmcase(OP_UNM) {
        const TValue *rb = L->s2v(base + inst.b());
        arith(LRT_OPUNM, rb, rb, ra);
        vmbreak;
      }
      vmcase(OP_NOT) {
        bool res = L->s2v(base + inst.b())->isFalseLike();
        L->s2v(ra)->setBool(res);
        vmbreak;
      }
      vmcase(OP_LEN) {
        objlen(ra, L->s2v(base + inst.b()));
        vmbreak;
      }
      vmcase(OP_CLOSE) {
        lrtF_closeupval(L, ra);
        vmbreak;
      }
      vmcase(OP_JMP) {
        pc += inst.sj();
        vmbreak;
      }
      vmcase(OP_EQ) {
        bool cond = equalObj(L->s2v(ra), L->s2v(base + inst.b()));
        if (cond != static_cast<bool>(inst.k()))
          pc++;  /* skip the jump */
        vmbreak;
      }
      vmcase(OP_LT) {
        bool cond = lessThan(L->s2v(ra), L->s2v(base + inst.b()));
        if (cond != static_cast<bool>(inst.k()))
          pc++;
        vmbreak;
      }
      vmcase(OP_LE) {
        bool cond = lessEqual(L->s2v(ra), L->s2v(base + inst.b()));
        if (cond != static_cast<bool>(inst.k()))
          pc++;
        vmbreak;
      }
      vmcase(OP_EQK) {
        /* basic types do not use '__eq'; we can use raw equality */
        bool cond = lrtO_rawequal(L->s2v(ra), &k[inst.b()]);
        if (cond != static_cast<bool>(inst.k()))
          pc++;
        vmbreak;
      }
      vmcase(OP_EQI) {
        const TValue *va = L->s2v(ra);
        int im = inst.sb();
        bool cond;
        if (va->isInteger())
          cond = (va->intValue() == im);
        else if (va->isFloat())
          cond = lrti_numeq(va->floatValue(), cast_num(im));
        else
          cond = false;  /* other types cannot be equal to a number */
        if (cond != static_cast<bool>(inst.k()))
          pc++;
        vmbreak;
      }
      vmcase(OP_TEST) {
        bool cond = !L->s2v(ra)->isFalseLike();
        if (cond != static_cast<bool>(inst.k()))
          pc++;
        vmbreak;
      }
      vmcase(OP_CALL) {
        CallInfo *newci;
        int b = inst.b();
        int nresults = inst.c() - 1;
        if (b != 0)  /* fixed number of arguments? */
          L->setTop(ra + b);  /* top signals number of arguments */
        /* else previous instruction set top */
        if ((newci = L->preCall(ra, nresults)) != nullptr) {  /* bytecode? */
          ci = newci;  /* run it in this same loop */
          goto startfunc;
        }
        vmbreak;  /* native call already done */
      }
      vmcase(OP_TAILCALL) {
        Proto *p = cl->getProto();
        int b = inst.b();  /* number of arguments + 1 (function) */
        int n;  /* number of results when calling a native function */
        /* delta is virtual 'func' - real 'func' (vararg functions) */
        int delta = p->isVararg() ? ci->getExtraArgs() + p->getNumParams() + 1
                                  : 0;
        if (b != 0)
          L->setTop(ra + b);
        else  /* previous instruction set top */
          b = L->getTop() - ra;
        lrtF_closeupval(L, base);  /* close upvalues from current call */
        if ((n = L->preTailCall(ci, ra, b, delta)) < 0)  /* bytecode function? */
          goto startfunc;  /* execute the callee */
        else {  /* native function */
          ci->funcRef() -= delta;  /* restore 'func' (if vararg) */
          L->postCall(ci, n);  /* finish caller */
          goto ret;  /* caller returns after the tail call */
        }
      }
      vmcase(OP_RETURN) {
        Proto *p = cl->getProto();
        int n = inst.b() - 1;  /* number of results */
        if (n < 0)  /* not fixed? */
          n = L->getTop() - ra;  /* get what is available */
        lrtF_closeupval(L, base);
        if (p->isVararg())  /* restore 'func' below the extra arguments */
          ci->funcRef() -= ci->getExtraArgs() + p->getNumParams() + 1;
        L->setTop(ra + n);  /* set call for 'postCall' */
        L->postCall(ci, n);
        goto ret;
      }
      vmcase(OP_CLOSURE) {
        Proto *p = cl->getProto()->getProtos()[static_cast<size_t>(inst.bx())];
        pushclosure(L, p, cl, base, ra);
        vmbreak;
      }
      vmcase(OP_VARARG) {
        int n = inst.c() - 1;  /* required results */
        lrtT_getvarargs(L, ci, ra, n);
        vmbreak;
      }
      vmcase(OP_VARARGPREP) {
        lrtT_adjustvarargs(L, inst.a(), ci, cl->getProto());
        base = ci->getFunc() + 1;  /* frame moved above the extra arguments */
        vmbreak;
      }
      default: {
        lrtG_runerror(L, "invalid opcode %d", op);
      }
    }
    continue;
 ret:  /* return from a bytecode function */
    if (ci->getCallStatus() & CIST_FRESH)
      return;  /* end this frame */
    ci = ci->getPrevious();
    goto startfunc;  /* continue running caller in this frame */
  }
}

/* }================================================================== */
