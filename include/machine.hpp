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

#ifndef _LC3VM_MACHINE_HPP
#define _LC3VM_MACHINE_HPP

#include <string>
#include "memory.hpp"
#include "keyboard.hpp"
#include "traps.hpp"
#include "cpu.hpp"
#include "stop_flag.hpp"

namespace LC3VM {

class Machine
{
public:
  Machine(CharInput &input, CharOutput &output);
  ~Machine();

  uint16_t load(const std::string &filename, unsigned *words = 0);
  Status step();
  Status run(const StopFlag &stop);
  std::string describe(Status status) const;

  Memory mem;
  Traps traps;
  CPU cpu;
  unsigned long instructions;

private:
  Machine(const Machine &);
  Machine &operator=(const Machine &);

  KeyboardStatus kbsr;
};

}

#endif
