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

#ifndef _LC3VM_UTIL_HPP
#define _LC3VM_UTIL_HPP

#include <stdint.h>

namespace LC3VM {

// Instruction fields.  Offsets and immediates are always in the low bits.
inline uint16_t opcode(uint16_t IR) { return IR >> 12; }
inline uint16_t field_DR(uint16_t IR) { return (IR >> 9) & 0x7; }
inline uint16_t field_SR1(uint16_t IR) { return (IR >> 6) & 0x7; }
inline uint16_t field_SR2(uint16_t IR) { return IR & 0x7; }
inline bool bit(uint16_t IR, int n) { return (IR >> n) & 0x1; }

inline uint16_t mask(int bit_count)
{
  return (uint16_t)((1u << bit_count) - 1);
}

/*
 * Widen the low bit_count bits of x to 16 bits, copying the top bit of the
 * field into every bit above it.
 */
inline uint16_t sign_extend(uint16_t x, int bit_count)
{
  if ((x >> (bit_count - 1)) & 1) {
    x |= (uint16_t)(0xFFFF << bit_count);
  }
  return x;
}

inline uint16_t SEXT(uint16_t IR, int bit_count)
{
  return sign_extend(IR & mask(bit_count), bit_count);
}

}

#endif
