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

#include "keyboard.hpp"

namespace LC3VM {

KeyboardStatus::KeyboardStatus(Memory &mem, CharInput &input)
  : mem(mem), input(input)
{
}

uint16_t KeyboardStatus::read(uint16_t &cell)
{
  int c = -1;

  if (input.key_available()) {
    c = input.get_char();
  }
  if (c >= 0) {
    cell = READY;
    mem.cell(DATA_ADDRESS) = (uint16_t)c;
  } else {
    cell = 0;
  }

  return cell;
}

}
