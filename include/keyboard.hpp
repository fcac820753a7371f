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

#ifndef _LC3VM_KEYBOARD_HPP
#define _LC3VM_KEYBOARD_HPP

#include "memory.hpp"
#include "console.hpp"

namespace LC3VM {

/*
 * KBSR.  Every read polls the input; a pending character is moved into
 * KBDR and bit 15 of KBSR is set, otherwise KBSR reads 0.  KBDR itself is
 * a plain memory word.
 */
class KeyboardStatus : public MappedWord
{
public:
  enum { ADDRESS = 0xFE00 };
  enum { DATA_ADDRESS = 0xFE02 };
  enum { READY = 0x8000 };

  KeyboardStatus(Memory &mem, CharInput &input);
  uint16_t read(uint16_t &cell);

private:
  Memory &mem;
  CharInput &input;
};

}

#endif
