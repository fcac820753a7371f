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

#ifndef _LC3VM_CONSOLE_HPP
#define _LC3VM_CONSOLE_HPP

#include <stdint.h>

namespace LC3VM {

/*
 * Keyboard side of the console.  key_available() must never block;
 * get_char() blocks until a character arrives and returns -1 when the
 * input is exhausted or broken.
 */
class CharInput
{
public:
  virtual ~CharInput() { }
  virtual bool key_available() = 0;
  virtual int get_char() = 0;
};

class CharOutput
{
public:
  virtual ~CharOutput() { }
  virtual void put_char(uint8_t c) = 0;
  virtual void flush() { }

  void put_string(const char *s)
  {
    while (*s) {
      put_char((uint8_t)*s++);
    }
  }
};

}

#endif
