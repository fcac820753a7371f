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

#include "traps.hpp"

namespace LC3VM {

const char *const Traps::IN_PROMPT = "Enter a character: ";
const char *const Traps::HALT_NOTICE = "HALT\n";

Traps::Traps(Memory &mem, CharInput &input, CharOutput &output)
  : mem(mem), input(input), output(output)
{
}

Status Traps::dispatch(CPU &cpu, uint8_t vector)
{
  switch (vector) {
  case GETC:
    return read_char(cpu);

  case OUT:
    output.put_char(cpu.R[0] & 0xFF);
    output.flush();
    break;

  case PUTS:
    write_string(cpu.R[0]);
    output.flush();
    break;

  case IN:
    output.put_string(IN_PROMPT);
    output.flush();
    return read_char(cpu);

  case PUTSP:
    write_packed_string(cpu.R[0]);
    output.flush();
    break;

  case HALT:
    output.put_string(HALT_NOTICE);
    output.flush();
    return stHalted;

  default:
    return stUnknownTrap;
  }

  return stRunning;
}

Status Traps::read_char(CPU &cpu)
{
  int c = input.get_char();

  if (c < 0) {
    return stIOError;
  }
  cpu.R[0] = (uint16_t)c;

  return stRunning;
}

// One character per word, in the low byte.
void Traps::write_string(uint16_t address)
{
  for (uint16_t word = mem.read(address); word; word = mem.read(++address)) {
    output.put_char(word & 0xFF);
  }
}

// Two characters per word, low byte first.
void Traps::write_packed_string(uint16_t address)
{
  for (;; address++) {
    uint16_t word = mem.read(address);
    uint8_t low = word & 0xFF;
    uint8_t high = word >> 8;

    if (!low) {
      break;
    }
    output.put_char(low);
    if (!high) {
      break;
    }
    output.put_char(high);
  }
}

}
