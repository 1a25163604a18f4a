/*
** $Id: lopcodes.cpp $
** Opcodes for the bytecode interpreter
** See Copyright Notice in lrt.h
*/

#define lopcodes_c
#define LRT_CORE

#include "lrt.h"

#include "lopcodes.h"


#define opmode(ot,it,t,a,m)  \
    (((ot) << 6) | ((it) << 5) | ((t) << 4) | ((a) << 3) | static_cast<int>(m))


/* ORDER OP */

const lu_byte lrtP_opmodes[NUM_OPCODES] = {
/*       OT IT T  A  mode		   opcode  */
  opmode(0, 0, 0, 1, OpMode::iABC)		/* OP_MOVE */
 ,opmode(0, 0, 0, 1, OpMode::iAsBx)		/* OP_LOADI */
 ,opmode(0, 0, 0, 1, OpMode::iAsBx)		/* OP_LOADF */
 ,opmode(0, 0, 0, 1, OpMode::iABx)		/* OP_LOADK */
 ,opmode(0, 0, 0, 1, OpMode::iABC)		/* OP_LOADFALSE */
 ,opmode(0, 0, 0, 1, OpMode::iABC)		/* OP_LOADTRUE */
 ,opmode(0, 0, 0, 1, OpMode::iABC)		/* OP_LOADNIL */
 ,opmode(0, 0, 0, 1, OpMode::iABC)		/* OP_GETUPVAL */
 ,opmode(0, 0, 0, 0, OpMode::iABC)		/* OP_SETUPVAL */
 ,opmode(0, 0, 0, 1, OpMode::iABx)		/* OP_GETGLOBAL */
 ,opmode(0, 0, 0, 0, OpMode::iABx)		/* OP_SETGLOBAL */
 ,opmode(0, 0, 0, 1, OpMode::iABC)		/* OP_GETTABLE */
 ,opmode(0, 0, 0, 1, OpMode::iABC)		/* OP_GETFIELD */
 ,opmode(0, 0, 0, 0, OpMode::iABC)		/* OP_SETTABLE */
 ,opmode(0, 0, 0, 0, OpMode::iABC)		/* OP_SETFIELD */
 ,opmode(0, 0, 0, 1, OpMode::iABC)		/* OP_NEWTABLE */
 ,opmode(0, 0, 0, 1, OpMode::iABC)		/* OP_ADDI */
 ,opmode(0, 0, 0, 1, OpMode::iABC)		/* OP_ADD */
 ,opmode(0, 0, 0, 1, OpMode::iABC)		/* OP_SUB */
 ,opmode(0, 0, 0, 1, OpMode::iABC)		/* OP_MUL */
 ,opmode(0, 0, 0, 1, OpMode::iABC)		/* OP_MOD */
 ,opmode(0, 0, 0, 1, OpMode::iABC)		/* OP_DIV */
 ,opmode(0, 0, 0, 1, OpMode::iABC)		/* OP_IDIV */
 ,opmode(0, 0, 0, 1, OpMode::iABC)		/* OP_UNM */
 ,opmode(0, 0, 0, 1, OpMode::iABC)		/* OP_NOT */
 ,opmode(0, 0, 0, 1, OpMode::iABC)		/* OP_LEN */
 ,opmode(0, 0, 0, 0, OpMode::iABC)		/* OP_CLOSE */
 ,opmode(0, 0, 0, 0, OpMode::isJ)		/* OP_JMP */
 ,opmode(0, 0, 1, 0, OpMode::iABC)		/* OP_EQ */
 ,opmode(0, 0, 1, 0, OpMode::iABC)		/* OP_LT */
 ,opmode(0, 0, 1, 0, OpMode::iABC)		/* OP_LE */
 ,opmode(0, 0, 1, 0, OpMode::iABC)		/* OP_EQK */
 ,opmode(0, 0, 1, 0, OpMode::iABC)		/* OP_EQI */
 ,opmode(0, 0, 1, 0, OpMode::iABC)		/* OP_TEST */
 ,opmode(1, 1, 0, 1, OpMode::iABC)		/* OP_CALL */
 ,opmode(0, 1, 0, 1, OpMode::iABC)		/* OP_TAILCALL */
 ,opmode(0, 1, 0, 0, OpMode::iABC)		/* OP_RETURN */
 ,opmode(0, 0, 0, 1, OpMode::iABx)		/* OP_CLOSURE */
 ,opmode(1, 0, 0, 1, OpMode::iABC)		/* OP_VARARG */
 ,opmode(0, 0, 0, 1, OpMode::iABC)		/* OP_VARARGPREP */
};


const char *const lrtP_opnames[NUM_OPCODES] = {
  "MOVE", "LOADI", "LOADF", "LOADK", "LOADFALSE", "LOADTRUE", "LOADNIL",
  "GETUPVAL", "SETUPVAL", "GETGLOBAL", "SETGLOBAL", "GETTABLE", "GETFIELD",
  "SETTABLE", "SETFIELD", "NEWTABLE", "ADDI", "ADD", "SUB", "MUL", "MOD",
  "DIV", "IDIV", "UNM", "NOT", "LEN", "CLOSE", "JMP", "EQ", "LT", "LE",
  "EQK", "EQI", "TEST", "CALL", "TAILCALL", "RETURN", "CLOSURE", "VARARG",
  "VARARGPREP"
};


/*
** Check whether instruction sets top for next instruction, that is,
** it results in multiple values.
*/
int lrtP_isOT (Instruction i) {
  InstructionView view(i);
  return testOTMode(view.opcode()) && view.c() == 0;
}


/*
** Check whether instruction uses top from previous instruction, that is,
** it accepts multiple results.
*/
int lrtP_isIT (Instruction i) {
  InstructionView view(i);
  return testITMode(view.opcode()) && view.b() == 0;
}
