/*
** $Id: lopcodes.h $
** Opcodes for the bytecode interpreter
** See Copyright Notice in lrt.h
*/

#ifndef lopcodes_h
#define lopcodes_h

#include "llimits.h"


/*===========================================================================
  We assume that instructions are unsigned 32-bit integers.
  All instructions have an opcode in the first 7 bits.
  Instructions can have the following formats:

        3 3 2 2 2 2 2 2 2 2 2 2 1 1 1 1 1 1 1 1 1 1 0 0 0 0 0 0 0 0 0 0
        1 0 9 8 7 6 5 4 3 2 1 0 9 8 7 6 5 4 3 2 1 0 9 8 7 6 5 4 3 2 1 0
iABC          C(8)     |      B(8)     |k|     A(8)      |   Op(7)     |
iABx                Bx(17)               |     A(8)      |   Op(7)     |
iAsBx              sBx (signed)(17)      |     A(8)      |   Op(7)     |
isJ                           sJ (signed)(25)            |   Op(7)     |

  ('s' stands for "signed", 'x' for "extended".)
  A signed argument is represented in excess K: The represented value is
  the written unsigned value minus K, where K is half (rounded down) the
  maximum value for the corresponding unsigned argument.
===========================================================================*/


/* basic instruction formats */
enum class OpMode {iABC, iABx, iAsBx, isJ};


/*
** size and position of opcode arguments.
*/
inline constexpr int SIZE_C = 8;
inline constexpr int SIZE_B = 8;
inline constexpr int SIZE_Bx = (SIZE_C + SIZE_B + 1);
inline constexpr int SIZE_A = 8;
inline constexpr int SIZE_sJ = (SIZE_Bx + SIZE_A);
inline constexpr int SIZE_OP = 7;

inline constexpr int POS_OP = 0;
inline constexpr int POS_A = (POS_OP + SIZE_OP);
inline constexpr int POS_k = (POS_A + SIZE_A);
inline constexpr int POS_B = (POS_k + 1);
inline constexpr int POS_C = (POS_B + SIZE_B);
inline constexpr int POS_Bx = POS_k;
inline constexpr int POS_sJ = POS_A;


/*
** limits for opcode arguments.
** we use (signed) 'int' to manipulate most arguments,
** so they must fit in ints.
*/
inline constexpr int MAXARG_Bx = ((1 << SIZE_Bx) - 1);
inline constexpr int OFFSET_sBx = (MAXARG_Bx >> 1);  /* 'sBx' is signed */

inline constexpr int MAXARG_sJ = ((1 << SIZE_sJ) - 1);
inline constexpr int OFFSET_sJ = (MAXARG_sJ >> 1);

inline constexpr int MAXARG_A = ((1 << SIZE_A) - 1);
inline constexpr int MAXARG_B = ((1 << SIZE_B) - 1);
inline constexpr int MAXARG_C = ((1 << SIZE_C) - 1);
inline constexpr int OFFSET_sC = (MAXARG_C >> 1);

inline constexpr int int2sC(int i) noexcept {
	return i + OFFSET_sC;
}

inline constexpr int sC2int(int i) noexcept {
	return i - OFFSET_sC;
}


inline constexpr Instruction cast_Inst(auto i) noexcept {
	return static_cast<Instruction>(i);
}

/* creates a mask with 'n' 1 bits at position 'p' */
inline constexpr Instruction MASK1(int n, int p) noexcept {
	return (~((~(Instruction)0) << n)) << p;
}

/* creates a mask with 'n' 0 bits at position 'p' */
inline constexpr Instruction MASK0(int n, int p) noexcept {
	return ~MASK1(n, p);
}


inline constexpr int getarg(Instruction i, int pos, int size) noexcept {
	return cast_int((i >> pos) & MASK1(size, 0));
}

inline void setarg(Instruction& i, unsigned int v, int pos, int size) noexcept {
	i = ((i & MASK0(size, pos)) | ((cast_Inst(v) << pos) & MASK1(size, pos)));
}

inline void SETARG_sJ(Instruction& i, int j) noexcept {
	setarg(i, cast_uint(j + OFFSET_sJ), POS_sJ, SIZE_sJ);
}

inline void SETARG_sBx(Instruction& i, int b) noexcept {
	setarg(i, cast_uint(b + OFFSET_sBx), POS_Bx, SIZE_Bx);
}


/*
** InstructionView - read access to the fields of an instruction
*/
class InstructionView {
private:
	Instruction inst_;

public:
	constexpr InstructionView(Instruction i) noexcept : inst_(i) {}

	constexpr Instruction raw() const noexcept { return inst_; }

	constexpr int opcode() const noexcept {
		return cast_int((inst_ >> POS_OP) & MASK1(SIZE_OP, 0));
	}

	constexpr int a() const noexcept { return getarg(inst_, POS_A, SIZE_A); }
	constexpr int b() const noexcept { return getarg(inst_, POS_B, SIZE_B); }
	constexpr int sb() const noexcept { return sC2int(b()); }
	constexpr int c() const noexcept { return getarg(inst_, POS_C, SIZE_C); }
	constexpr int sc() const noexcept { return sC2int(c()); }
	constexpr int k() const noexcept { return getarg(inst_, POS_k, 1); }

	constexpr int bx() const noexcept { return getarg(inst_, POS_Bx, SIZE_Bx); }
	constexpr int sbx() const noexcept {
		return getarg(inst_, POS_Bx, SIZE_Bx) - OFFSET_sBx;
	}
	constexpr int sj() const noexcept {
		return getarg(inst_, POS_sJ, SIZE_sJ) - OFFSET_sJ;
	}
};


inline constexpr Instruction CREATE_ABCk(int o, int a, int b, int c, int k) noexcept {
	return (cast_Inst(o) << POS_OP)
		| (cast_Inst(a) << POS_A)
		| (cast_Inst(b) << POS_B)
		| (cast_Inst(c) << POS_C)
		| (cast_Inst(k) << POS_k);
}

inline constexpr Instruction CREATE_ABx(int o, int a, int bc) noexcept {
	return (cast_Inst(o) << POS_OP)
		| (cast_Inst(a) << POS_A)
		| (cast_Inst(bc) << POS_Bx);
}

inline constexpr Instruction CREATE_sJ(int o, int j) noexcept {
	return (cast_Inst(o) << POS_OP)
		| (cast_Inst(j + OFFSET_sJ) << POS_sJ);
}


/*
** Maximum size for the stack of a bytecode function. It must fit in
** 8 bits. The highest valid register is one less than this value.
*/
inline constexpr int MAX_FSTACK = MAXARG_A;


/*
** R[x] - register
** K[x] - constant (in constant table)
** RK(x) == if k(i) then K[x] else R[x]
** G[x] - entry of the globals table
*/

/*
** Grep "ORDER OP" if you change these enums. Opcodes marked with a (*)
** has extra descriptions in the notes after the enumeration.
*/

typedef enum {
/*----------------------------------------------------------------------
  name		args	description
------------------------------------------------------------------------*/
OP_MOVE,/*	A B	R[A] := R[B]					*/
OP_LOADI,/*	A sBx	R[A] := sBx					*/
OP_LOADF,/*	A sBx	R[A] := (lrt_Number)sBx				*/
OP_LOADK,/*	A Bx	R[A] := K[Bx]					*/
OP_LOADFALSE,/*	A	R[A] := false					*/
OP_LOADTRUE,/*	A	R[A] := true					*/
OP_LOADNIL,/*	A B	R[A], R[A+1], ..., R[A+B] := nil		*/
OP_GETUPVAL,/*	A B	R[A] := UpValue[B]				*/
OP_SETUPVAL,/*	A B	UpValue[B] := R[A]				*/

OP_GETGLOBAL,/*	A Bx	R[A] := G[K[Bx]:string]				*/
OP_SETGLOBAL,/*	A Bx	G[K[Bx]:string] := R[A]				*/

OP_GETTABLE,/*	A B C	R[A] := R[B][R[C]]				*/
OP_GETFIELD,/*	A B C	R[A] := R[B][K[C]:string]			*/
OP_SETTABLE,/*	A B C k	R[A][R[B]] := RK(C)				*/
OP_SETFIELD,/*	A B C k	R[A][K[B]:string] := RK(C)			*/

OP_NEWTABLE,/*	A B C	R[A] := {}	(array hint B, hash hint C)	*/

OP_ADDI,/*	A B sC	R[A] := R[B] + sC				*/

OP_ADD,/*	A B C	R[A] := R[B] + R[C]				*/
OP_SUB,/*	A B C	R[A] := R[B] - R[C]				*/
OP_MUL,/*	A B C	R[A] := R[B] * R[C]				*/
OP_MOD,/*	A B C	R[A] := R[B] % R[C]				*/
OP_DIV,/*	A B C	R[A] := R[B] / R[C]				*/
OP_IDIV,/*	A B C	R[A] := R[B] // R[C]				*/

OP_UNM,/*	A B	R[A] := -R[B]					*/
OP_NOT,/*	A B	R[A] := not R[B]				*/
OP_LEN,/*	A B	R[A] := #R[B] (raw length)			*/

OP_CLOSE,/*	A	close all upvalues >= R[A]			*/
OP_JMP,/*	sJ	pc += sJ					*/
OP_EQ,/*	A B k	if ((R[A] == R[B]) ~= k) then pc++		*/
OP_LT,/*	A B k	if ((R[A] <  R[B]) ~= k) then pc++		*/
OP_LE,/*	A B k	if ((R[A] <= R[B]) ~= k) then pc++		*/

OP_EQK,/*	A B k	if ((R[A] == K[B]) ~= k) then pc++		*/
OP_EQI,/*	A sB k	if ((R[A] == sB) ~= k) then pc++		*/

OP_TEST,/*	A k	if (not R[A] == k) then pc++			*/

OP_CALL,/*	A B C	R[A], ... ,R[A+C-2] := R[A](R[A+1], ... ,R[A+B-1]) */
OP_TAILCALL,/*	A B	return R[A](R[A+1], ... ,R[A+B-1])		*/

OP_RETURN,/*	A B	return R[A], ... ,R[A+B-2]	(see note)	*/

OP_CLOSURE,/*	A Bx	R[A] := closure(KPROTO[Bx])			*/

OP_VARARG,/*	A C	R[A], R[A+1], ..., R[A+C-2] = vararg		*/

OP_VARARGPREP/*	A	(adjust vararg parameters)			*/
} OpCode;


inline constexpr int NUM_OPCODES = ((int)(OP_VARARGPREP) + 1);



/*===========================================================================
  Notes:

  (*) In OP_CALL, if (B == 0) then B = top - A. If (C == 0), then
  'top' is set to last_result+1, so next open instruction (OP_CALL,
  OP_RETURN) may use 'top'.

  (*) In OP_VARARG, if (C == 0) then use actual number of varargs and
  set top (like in OP_CALL with C == 0).

  (*) In OP_RETURN and OP_TAILCALL, if (B == 0) then use values up
  to 'top'. Both close the upvalues of the returning frame.

  (*) For comparisons, k specifies what condition the test should accept
  (true or false).

  (*) All 'skips' (pc++) assume that next instruction is a jump.

===========================================================================*/


/*
** masks for instruction properties. The format is:
** bits 0-2: op mode
** bit 3: instruction set register A
** bit 4: operator is a test (next instruction must be a jump)
** bit 5: instruction uses 'top' set by previous instruction (when B == 0)
** bit 6: instruction sets 'top' for next instruction (when C == 0)
*/

LRTI_FUNC const lu_byte lrtP_opmodes[NUM_OPCODES];
LRTI_FUNC const char *const lrtP_opnames[NUM_OPCODES];

inline OpMode getOpMode(int m) noexcept {
	return static_cast<OpMode>(lrtP_opmodes[m] & 7);
}

inline bool testAMode(int m) noexcept {
	return (lrtP_opmodes[m] & (1 << 3)) != 0;
}

inline bool testTMode(int m) noexcept {
	return (lrtP_opmodes[m] & (1 << 4)) != 0;
}

inline bool testITMode(int m) noexcept {
	return (lrtP_opmodes[m] & (1 << 5)) != 0;
}

inline bool testOTMode(int m) noexcept {
	return (lrtP_opmodes[m] & (1 << 6)) != 0;
}


LRTI_FUNC int lrtP_isOT (Instruction i);
LRTI_FUNC int lrtP_isIT (Instruction i);


#endif
