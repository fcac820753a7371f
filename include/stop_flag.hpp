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

#ifndef _LC3VM_STOP_FLAG_HPP
#define _LC3VM_STOP_FLAG_HPP

#include <atomic>

namespace LC3VM {

// Set from a signal handler or another thread, polled by the run loop
// once per instruction.
class StopFlag
{
public:
  StopFlag() : flag(false) { }

  void request() { flag.store(true); }
  void clear() { flag.store(false); }
  bool requested() const { return flag.load(); }

private:
  StopFlag(const StopFlag &);
  StopFlag &operator=(const StopFlag &);

  std::atomic<bool> flag;
};

}

#endif
