/*\
 *  LC-3 VM
 *  Derived from the LC-3 Simulator
 *  Copyright (C) 2004  Anthony Liguori <aliguori@cs.utexas.edu>
 *
 *  This program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
\*/

#ifndef _LC3VM_CPU_HPP
#define _LC3VM_CPU_HPP

#include <stdint.h>
#include "memory.hpp"

namespace LC3VM {

class Traps;

// Outcome of one instruction cycle.
enum Status
{
  stRunning,
  stHalted,
  stStopped,
  stUnimplementedOpcode,
  stIOError,
  stUnknownTrap
};

const char *status_name(Status status);

enum ConditionFlag
{
  FL_POS = 1 << 0,
  FL_ZRO = 1 << 1,
  FL_NEG = 1 << 2
};

enum Register
{
  R_R0 = 0,
  R_R1,
  R_R2,
  R_R3,
  R_R4,
  R_R5,
  R_R6,
  R_R7,
  R_PC,
  R_COND,
  R_COUNT
};

enum Opcode
{
  OP_BR = 0,
  OP_ADD,
  OP_LD,
  OP_ST,
  OP_JSR,
  OP_AND,
  OP_LDR,
  OP_STR,
  OP_RTI,
  OP_NOT,
  OP_LDI,
  OP_STI,
  OP_JMP,
  OP_RES,
  OP_LEA,
  OP_TRAP
};

class CPU
{
public:
  enum { PC_START = 0x3000 };

  CPU(Memory &mem, Traps &traps);
  void reset();
  Status cycle();
  Status decode(uint16_t IR);
  void update_flags(uint16_t value);

  // R0-R7, then PC and COND (see Register).  Throws std::out_of_range
  // past R_COND.
  uint16_t &reg(unsigned index);

  uint16_t PC;
  uint16_t COND;
  uint16_t R[8];

  // Last fetched instruction and the address it came from.
  uint16_t IR;
  uint16_t IR_address;

private:
  Memory &mem;
  Traps &traps;
};

}

#endif
