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

#ifndef _LC3VM_ERROR_HPP
#define _LC3VM_ERROR_HPP

#include <stdexcept>
#include <string>

namespace LC3VM {

class Error : public std::runtime_error
{
public:
  explicit Error(const std::string &what) : std::runtime_error(what) { }
};

// The program image could not be placed in memory.
class LoadError : public Error
{
public:
  LoadError(const std::string &filename, const std::string &reason)
    : Error(filename + ": " + reason), filename(filename) { }
  ~LoadError() throw () { }

  std::string filename;
};

}

#endif
