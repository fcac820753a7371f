/*\
 *  This file is part of LC-3 VM.
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

#include <stdio.h>
#include "machine.hpp"

namespace LC3VM {

Machine::Machine(CharInput &input, CharOutput &output) :
  traps(mem, input, output), cpu(mem, traps), instructions(0),
  kbsr(mem, input)
{
  mem.register_dma(KeyboardStatus::ADDRESS, &kbsr);
}

Machine::~Machine()
{
  mem.unregister_dma(KeyboardStatus::ADDRESS);
}

uint16_t Machine::load(const std::string &filename, unsigned *words)
{
  return mem.load(filename, words);
}

Status Machine::step()
{
  instructions++;
  return cpu.cycle();
}

/*
 * Runs until HALT, a fault, or a stop request.  The request is only looked
 * at between instructions, so an instruction is never cut in half.
 */
Status Machine::run(const StopFlag &stop)
{
  Status status = stRunning;

  while (status == stRunning) {
    if (stop.requested()) {
      return stStopped;
    }
    status = step();
  }

  return status;
}

std::string Machine::describe(Status status) const
{
  char buf[128];

  switch (status) {
  case stUnimplementedOpcode:
    snprintf(buf, sizeof(buf), "unimplemented opcode 0x%x (instruction 0x%04x at 0x%04x)",
             cpu.IR >> 12, cpu.IR, cpu.IR_address);
    break;
  case stUnknownTrap:
    snprintf(buf, sizeof(buf), "unknown trap vector 0x%02x at 0x%04x",
             cpu.IR & 0xFF, cpu.IR_address);
    break;
  case stIOError:
    snprintf(buf, sizeof(buf), "input failed during trap 0x%02x at 0x%04x",
             cpu.IR & 0xFF, cpu.IR_address);
    break;
  default:
    snprintf(buf, sizeof(buf), "%s at 0x%04x", status_name(status), cpu.PC);
    break;
  }

  return buf;
}

}
