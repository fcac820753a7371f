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

#ifndef _LC3VM_TRAPS_HPP
#define _LC3VM_TRAPS_HPP

#include <stdint.h>
#include "cpu.hpp"
#include "console.hpp"

namespace LC3VM {

/*
 * Native service routines behind the TRAP instruction.  They run in the
 * host, so no R7 linkage and no supervisor stack is involved.
 */
class Traps
{
public:
  enum Vector
  {
    GETC  = 0x20,
    OUT   = 0x21,
    PUTS  = 0x22,
    IN    = 0x23,
    PUTSP = 0x24,
    HALT  = 0x25
  };

  static const char *const IN_PROMPT;
  static const char *const HALT_NOTICE;

  Traps(Memory &mem, CharInput &input, CharOutput &output);
  Status dispatch(CPU &cpu, uint8_t vector);

private:
  Status read_char(CPU &cpu);
  void write_string(uint16_t address);
  void write_packed_string(uint16_t address);

  Memory &mem;
  CharInput &input;
  CharOutput &output;
};

}

#endif
