/*\
 *  LC-3 VM
 *  Derived from the LC-3 Simulator
 *  Copyright (C) 2004  Anthony Liguori <aliguori@cs.utexas.edu>
 *  Modifications 2010  Edgar Lakis <edgar.lakis@gmail.com>
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

#ifndef _LC3VM_MEMORY_HPP
#define _LC3VM_MEMORY_HPP

#include <string>
#include <map>
#include <stdint.h>

namespace LC3VM {

struct MappedWord;
class Memory;

struct Word
{
  Word(Memory &mem, uint16_t address);

  operator uint16_t() const;
  Word &operator=(uint16_t rhs);

private:
  uint16_t &value;
  MappedWord *mapped;
};

class Memory {
public:
  enum { SIZE = 0x10000 };

  Memory();
  ~Memory();

  Word operator[](uint16_t index);
  uint16_t read(uint16_t address);
  void write(uint16_t address, uint16_t value);

  // The stored word, bypassing any device mapped at the address.
  uint16_t &cell(uint16_t address) { return mem[address]; }

  uint16_t load(const std::string &filename, unsigned *words = 0);
  uint16_t load(int fd, const std::string &name, unsigned *words = 0);
  void clear();
  void register_dma(uint16_t address, MappedWord *word);
  void unregister_dma(uint16_t address);

private:
  Memory(const Memory &);
  Memory &operator=(const Memory &);

  MappedWord *mapped_word(uint16_t index);
  typedef std::map<uint16_t, MappedWord *> dma_map_t;
  dma_map_t dma;
  friend struct Word;

  uint16_t *mem;
};

/*
 * A device register living at a fixed address.  The cell passed in is the
 * backing word in memory, so a device may keep its state there.
 */
struct MappedWord
{
  virtual ~MappedWord() = 0;
  virtual uint16_t read(uint16_t &cell) { return cell; }
  virtual void write(uint16_t &cell, uint16_t value) { cell = value; }
};

}

#endif
