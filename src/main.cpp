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
 *
 * vim: sw=2 si:
\*/

#include <stdio.h>
#include <unistd.h>
#include <getopt.h>
#include <stdlib.h>
#include <signal.h>

#include "machine.hpp"
#include "terminal.hpp"
#include "error.hpp"

using namespace LC3VM;

enum {
  EXIT_HALTED = 0,
  EXIT_FAULT = 1,
  EXIT_USAGE = 2,
  EXIT_INTERRUPTED = 130
};

const char * PROGRAM = "lc3vm 1.0";
const char * INFO =
"lc3vm is free software, covered by the GNU General Public License, and\n"
"you are welcome to change it and/or distribute copies of it under\n"
"certain conditions.  There is absolutely no warranty for lc3vm.";

static StopFlag stop_requested;

static void sigproc(int sig)
{
  signal(SIGINT, sigproc); /* reset for portability */
  stop_requested.request();
}

static void usage(FILE *out, const char *argv0)
{
  fprintf(out,
          "Usage: %s [OPTION]... IMAGE\n"
          "Runs an LC-3 program image.\n"
          "\n"
          "  -q, --quiet              do not print informational messages\n"
          "  -v, --verbose            report load details and a run summary\n"
          "  -h, --help               displays this help screen\n"
          "  -V, --version            print version information and exit\n"
          "\n"
          "Setting LC3VM_QUIET in the environment has the same effect as --quiet.\n"
          , argv0);
}

int main(int argc, char **argv)
{
  struct option longopts[] = {
    {"quiet"   , 0, 0, 'q'},
    {"verbose" , 0, 0, 'v'},
    {"help"    , 0, 0, 'h'},
    {"version" , 0, 0, 'V'},
    {NULL      , 0, 0, 0}
  };
  int ch;
  int index = 0;
  bool quiet = false;
  bool verbose = false;

  const char *env_quiet = getenv("LC3VM_QUIET");
  if (env_quiet && *env_quiet) {
    quiet = true;
  }

  while (-1 != (ch = getopt_long(argc, argv, "qvhV", longopts, &index))) {
    switch (ch) {
    case 'q':
      quiet = true;
      verbose = false;
      break;
    case 'v':
      verbose = true;
      quiet = false;
      break;
    case 'h':
      usage(stdout, *argv);
      return EXIT_HALTED;
    case 'V':
      printf("%s\n%s\n", PROGRAM, INFO);
      return EXIT_HALTED;
    default:
      usage(stderr, *argv);
      return EXIT_USAGE;
    }
  }

  if (optind != argc - 1) {
    fprintf(stderr, "%s: exactly one program image expected\n", *argv);
    usage(stderr, *argv);
    return EXIT_USAGE;
  }
  const char *image = argv[optind];

  Status status;
  {
    Terminal term(fileno(stdin), fileno(stdout));
    Machine vm(term, term);

    try {
      unsigned words = 0;
      if (!quiet) {
        fprintf(stderr, "Loading %s\n", image);
      }
      uint16_t origin = vm.load(image, &words);
      if (verbose) {
        fprintf(stderr, "origin 0x%04x, %u words\n", origin, words);
      }
    } catch (const LoadError &e) {
      fprintf(stderr, "%s: %s\n", *argv, e.what());
      return EXIT_FAULT;
    }

    signal(SIGINT, sigproc);
    status = vm.run(stop_requested);
    signal(SIGINT, SIG_DFL);

    term.flush();
    if (status == stStopped && !quiet) {
      fprintf(stderr, "<Interrupted>\n");
    }
    if (verbose) {
      fprintf(stderr, "%s after %lu instructions, PC=0x%04x\n",
              status_name(status), vm.instructions, vm.cpu.PC);
    }
    if (status != stHalted && status != stStopped) {
      fprintf(stderr, "%s: %s\n", *argv, vm.describe(status).c_str());
    }
    if (term.write_failed()) {
      fprintf(stderr, "%s: error writing program output\n", *argv);
      return EXIT_FAULT;
    }
  }

  switch (status) {
  case stHalted:
    return EXIT_HALTED;
  case stStopped:
    return EXIT_INTERRUPTED;
  default:
    return EXIT_FAULT;
  }
}
