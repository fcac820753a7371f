/*\
 *  LC-3 VM
 *  Derived from the LC-3 Simulator
 *  Copyright (C) 2004  Anthony Liguori <aliguori@cs.utexas.edu>
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

#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <string.h>
#include "memory.hpp"
#include "error.hpp"

namespace LC3VM {

MappedWord::~MappedWord() { }

Word::Word(Memory &mem, uint16_t address)
  : value(mem.mem[address]), mapped(mem.mapped_word(address))
{
}

Word::operator uint16_t() const
{
  if (mapped) {
    return mapped->read(value);
  }

  return value;
}

Word &Word::operator=(uint16_t rhs)
{
  if (mapped) {
    mapped->write(value, rhs);
  } else {
    value = rhs;
  }

  return *this;
}

Word Memory::operator[](uint16_t index)
{
  return Word(*this, index);
}

uint16_t Memory::read(uint16_t address)
{
  return (*this)[address];
}

void Memory::write(uint16_t address, uint16_t value)
{
  (*this)[address] = value;
}

MappedWord *Memory::mapped_word(uint16_t index)
{
  dma_map_t::iterator i = dma.find(index);
  if (i != dma.end()) {
    return i->second;
  }
  return 0;
}

Memory::Memory()
{
  mem = new uint16_t[SIZE];
  clear();
}

Memory::~Memory()
{
  delete [] mem;
}

void Memory::clear()
{
  for (int i = 0; i < SIZE; i++) {
    mem[i] = 0;
  }
}

static ssize_t read_fully(int fd, uint8_t *buf, size_t len)
{
  size_t done = 0;

  while (done < len) {
    ssize_t ret = ::read(fd, buf + done, len - done);
    if (ret == 0) {
      break;
    }
    if (ret == -1) {
      if (errno == EINTR) {
        continue;
      }
      return -1;
    }
    done += ret;
  }

  return done;
}

uint16_t Memory::load(const std::string &filename, unsigned *words)
{
  int fd = open(filename.c_str(), O_RDONLY);
  struct stat stats;

  if (fd == -1) {
    throw LoadError(filename, strerror(errno));
  }
  if (fstat(fd, &stats) == -1) {
    int err = errno;
    close(fd);
    throw LoadError(filename, strerror(err));
  }
  if (S_ISDIR(stats.st_mode)) {
    close(fd);
    throw LoadError(filename, strerror(EISDIR));
  }

  uint16_t origin;
  try {
    origin = load(fd, filename, words);
  } catch (const LoadError &) {
    close(fd);
    throw;
  }
  close(fd);

  return origin;
}

/*
 * Image format: big-endian words, the first one is the origin and the rest
 * are stored from the origin upwards.  A dangling odd byte at the end is
 * ignored.  An image running past 0xFFFF is refused instead of wrapping
 * into low memory.
 */
uint16_t Memory::load(int fd, const std::string &name, unsigned *words)
{
  uint8_t buf[4096];
  ssize_t got;

  got = read_fully(fd, buf, 2);
  if (got == -1) {
    throw LoadError(name, strerror(errno));
  }
  if (got < 2) {
    throw LoadError(name, "missing origin word");
  }

  uint16_t origin = (buf[0] << 8) | buf[1];
  uint32_t address = origin;

  do {
    got = read_fully(fd, buf, sizeof(buf));
    if (got == -1) {
      throw LoadError(name, strerror(errno));
    }
    for (ssize_t i = 0; i + 1 < got; i += 2) {
      if (address >= SIZE) {
        throw LoadError(name, "image extends past the end of memory");
      }
      mem[address++] = (buf[i] << 8) | buf[i + 1];
    }
  } while (got == (ssize_t)sizeof(buf));

  if (words) {
    *words = address - origin;
  }

  return origin;
}

void Memory::register_dma(uint16_t address, MappedWord *word)
{
  dma[address] = word;
}

void Memory::unregister_dma(uint16_t address)
{
  dma.erase(address);
}

}

// vim: sw=2 si:
