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

#include <thread>
#include "test_util.hpp"
#include "keyboard.hpp"

// Announces its single key only after a number of polls.
class DelayedInput : public CharInput
{
public:
  DelayedInput(int delay, char key) : delay(delay), key(key), polls(0), taken(false) { }

  bool key_available() { return !taken && ++polls > delay; }
  int get_char() { taken = true; return (unsigned char)key; }

  int delay;
  char key;
  int polls;
  bool taken;
};

// Raises the stop flag as soon as anything is printed.
class StoppingOutput : public CharOutput
{
public:
  explicit StoppingOutput(StopFlag &stop) : stop(stop) { }
  void put_char(uint8_t c) { text += (char)c; stop.request(); }

  StopFlag &stop;
  std::string text;
};

static void test_run_until_halt()
{
  ReadSpy spy;
  ScriptedInput in;
  CapturedOutput out;
  Machine vm(in, out);
  StopFlag stop;
  static const uint16_t prog[] = { ADDi(0, 0, 1), ADDi(0, 0, 1), TRAP(Traps::HALT), ADDi(0, 0, 1) };
  PUT_PROGRAM(vm, 0x3000, prog);
  vm.mem.register_dma(0x3003, &spy);

  assert(vm.run(stop) == stHalted);
  assert(vm.cpu.R[0] == 2);
  assert(vm.cpu.COND == FL_POS);
  assert(vm.cpu.PC == 0x3003);
  assert(vm.instructions == 3);
  assert(spy.reads == 0);
  assert(out.text == "HALT\n");
  vm.mem.unregister_dma(0x3003);
}

static void test_stop_between_cycles()
{
  ReadSpy spy;
  ScriptedInput in;
  StopFlag stop;
  StoppingOutput out(stop);
  Machine vm(in, out);
  static const uint16_t prog[] = {
    ADDi(0, 0, 7), TRAP(Traps::OUT), ADDi(0, 0, 1), TRAP(Traps::HALT)
  };
  PUT_PROGRAM(vm, 0x3000, prog);
  vm.mem.register_dma(0x3002, &spy);

  // the OUT completes, the next fetch never happens
  assert(vm.run(stop) == stStopped);
  assert(out.text == "\x07");
  assert(vm.cpu.R[0] == 7);
  assert(vm.cpu.PC == 0x3002);
  assert(vm.instructions == 2);
  assert(spy.reads == 0);

  // clearing the request resumes where it left off
  vm.mem.unregister_dma(0x3002);
  stop.clear();
  assert(vm.run(stop) == stHalted);
  assert(vm.cpu.R[0] == 8);
  assert(out.text == "\x07HALT\n");
}

static void test_stop_before_first_fetch()
{
  ScriptedInput in;
  CapturedOutput out;
  Machine vm(in, out);
  StopFlag stop;
  stop.request();

  assert(vm.run(stop) == stStopped);
  assert(vm.instructions == 0);
  assert(vm.cpu.PC == 0x3000);
}

static void request_later(StopFlag *stop)
{
  usleep(10000);
  stop->request();
}

// Stop requested from another thread while the program spins.
static void test_stop_from_thread()
{
  ScriptedInput in;
  CapturedOutput out;
  Machine vm(in, out);
  StopFlag stop;
  static const uint16_t prog[] = { ADDi(1, 1, 1), BR(N | Z | P, -2) };
  PUT_PROGRAM(vm, 0x3000, prog);

  std::thread stopper(request_later, &stop);
  assert(vm.run(stop) == stStopped);
  stopper.join();
  assert(vm.instructions > 0);
  assert(vm.cpu.PC == 0x3000 || vm.cpu.PC == 0x3001);
}

static void test_keyboard_registers()
{
  ScriptedInput in("k");
  CapturedOutput out;
  Machine vm(in, out);

  assert(vm.mem.read(KeyboardStatus::ADDRESS) == 0x8000);
  assert(vm.mem.cell(KeyboardStatus::DATA_ADDRESS) == 'k');
  assert(in.polls == 1);

  // KBDR is plain memory and does not poll
  assert(vm.mem.read(KeyboardStatus::DATA_ADDRESS) == 'k');
  assert(in.polls == 1);

  assert(vm.mem.read(KeyboardStatus::ADDRESS) == 0);
  assert(vm.mem.read(KeyboardStatus::DATA_ADDRESS) == 'k');
  assert(in.polls == 2);

  // stores go straight to the cell
  vm.mem.write(KeyboardStatus::ADDRESS, 0x1234);
  assert(vm.mem.cell(KeyboardStatus::ADDRESS) == 0x1234);
  assert(vm.mem.read(KeyboardStatus::ADDRESS) == 0);

  // other addresses never touch the keyboard
  vm.mem.read(0x3000);
  vm.mem.read(0xFE01);
  assert(in.polls == 3);
}

static void test_keyboard_polling_program()
{
  DelayedInput in(3, 'q');
  CapturedOutput out;
  Machine vm(in, out);
  StopFlag stop;
  static const uint16_t prog[] = {
    LDI(1, 4),              // 3000 R1 = KBSR
    BR(Z | P, -2),          // 3001 not ready yet
    LDI(0, 3),              // 3002 R0 = KBDR
    TRAP(Traps::OUT),       // 3003
    TRAP(Traps::HALT),      // 3004
    0xFE00,                 // 3005
    0xFE02,                 // 3006
  };
  PUT_PROGRAM(vm, 0x3000, prog);

  assert(vm.run(stop) == stHalted);
  assert(in.polls == 3 + 1);
  assert(vm.cpu.R[0] == 'q');
  assert(vm.cpu.R[1] == 0x8000);
  assert(out.text == "qHALT\n");
}

static void test_independent_machines()
{
  ScriptedInput in;
  CapturedOutput out;
  Machine a(in, out);
  Machine b(in, out);

  a.mem.write(0x3000, 0xAAAA);
  a.cpu.R[3] = 3;
  assert(b.mem.read(0x3000) == 0);
  assert(b.cpu.R[3] == 0);
}

int main()
{
  test_run_until_halt();
  test_stop_between_cycles();
  test_stop_before_first_fetch();
  test_stop_from_thread();
  test_keyboard_registers();
  test_keyboard_polling_program();
  test_independent_machines();

  printf("[machine] ok\n");
  return 0;
}
