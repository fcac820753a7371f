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

#include <stdexcept>
#include "cpu.hpp"
#include "traps.hpp"
#include "util.hpp"

namespace LC3VM {

const char *status_name(Status status)
{
  switch (status) {
  case stRunning:             return "running";
  case stHalted:              return "halted";
  case stStopped:             return "stopped";
  case stUnimplementedOpcode: return "unimplemented opcode";
  case stIOError:             return "input error";
  case stUnknownTrap:         return "unknown trap vector";
  }
  return "unknown status";
}

CPU::CPU(Memory &mem, Traps &traps) : mem(mem), traps(traps)
{
  reset();
}

void CPU::reset()
{
  for (int i = 0; i < 8; i++) {
    R[i] = 0;
  }
  PC = PC_START;
  COND = 0;
  IR = 0;
  IR_address = 0;
}

uint16_t &CPU::reg(unsigned index)
{
  if (index == R_PC) {
    return PC;
  }
  if (index == R_COND) {
    return COND;
  }
  if (index >= R_PC) {
    throw std::out_of_range("no such register");
  }
  return R[index];
}

void CPU::update_flags(uint16_t value)
{
  if (value == 0) {
    COND = FL_ZRO;
  } else if (value & 0x8000) {
    COND = FL_NEG;
  } else {
    COND = FL_POS;
  }
}

Status CPU::cycle()
{
  IR_address = PC;
  IR = mem[PC];
  PC++;

  return decode(IR);
}

Status CPU::decode(uint16_t IR)
{
  uint16_t DR = field_DR(IR);
  uint16_t SR1 = field_SR1(IR);
  uint16_t address;

  switch (opcode(IR)) {
  case OP_BR:
    // n, z and p sit at bits 11..9 in the same order as FL_NEG..FL_POS
    if (((IR >> 9) & 0x7) & COND) {
      PC += SEXT(IR, 9);
    }
    break;

  case OP_ADD:
    if (bit(IR, 5)) {
      R[DR] = R[SR1] + SEXT(IR, 5);
    } else {
      R[DR] = R[SR1] + R[field_SR2(IR)];
    }
    update_flags(R[DR]);
    break;

  case OP_LD:
    R[DR] = mem[PC + SEXT(IR, 9)];
    update_flags(R[DR]);
    break;

  case OP_ST:
    mem[PC + SEXT(IR, 9)] = R[DR];
    break;

  case OP_JSR:
    R[7] = PC;
    PC = bit(IR, 11) ? PC + SEXT(IR, 11) : R[SR1];
    break;

  case OP_AND:
    if (bit(IR, 5)) {
      R[DR] = R[SR1] & SEXT(IR, 5);
    } else {
      R[DR] = R[SR1] & R[field_SR2(IR)];
    }
    update_flags(R[DR]);
    break;

  case OP_LDR:
    R[DR] = mem[R[SR1] + SEXT(IR, 6)];
    update_flags(R[DR]);
    break;

  case OP_STR:
    mem[R[SR1] + SEXT(IR, 6)] = R[DR];
    break;

  case OP_NOT:
    R[DR] = ~R[SR1];
    update_flags(R[DR]);
    break;

  case OP_LDI:
    address = mem[PC + SEXT(IR, 9)];
    R[DR] = mem[address];
    update_flags(R[DR]);
    break;

  case OP_STI:
    address = mem[PC + SEXT(IR, 9)];
    mem[address] = R[DR];
    break;

  case OP_JMP:
    PC = R[SR1];
    break;

  case OP_LEA:
    R[DR] = PC + SEXT(IR, 9);
    update_flags(R[DR]);
    break;

  case OP_TRAP:
    return traps.dispatch(*this, IR & 0xFF);

  case OP_RTI:
  case OP_RES:
  default:
    return stUnimplementedOpcode;
  }

  return stRunning;
}

}

// vim: sw=2 si:
