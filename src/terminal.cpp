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

#include <stdio.h>
#include <errno.h>
#include <termios.h>
#include <sys/types.h>
#include <sys/time.h>
#include <sys/select.h>
#include <unistd.h>
#include <string>
#include "terminal.hpp"

namespace LC3VM {

static bool data_available(int fd)
{
  struct timeval tv;
  fd_set rdfs;

  tv.tv_sec = 0;
  tv.tv_usec = 0;

  FD_ZERO(&rdfs);
  FD_SET(fd, &rdfs);

  int ret = select(fd + 1, &rdfs, NULL, NULL, &tv);
  return ret > 0 && FD_ISSET(fd, &rdfs);
}

class Terminal::Implementation
{
public:
  Implementation(int ifd, int ofd) :
    ifd(ifd), ofd(ofd), tty_saved(false), write_failed(false)
  {
    setup_input_tty();
  }
  ~Implementation() {
    if (tty_saved) {
      // restore previous settings
      tcsetattr(ifd, TCSANOW, &termios_original);
    }
  }

  void setup_input_tty() {
    struct termios new_termios;

    if (!isatty(ifd) || tcgetattr(ifd, &new_termios) == -1) {
      return;
    }
    termios_original = new_termios;
    tty_saved = true;
    new_termios.c_lflag &= ~(ICANON | ECHO);
    tcsetattr(ifd, TCSANOW, &new_termios);
  }

  void flush() {
    size_t done = 0;

    while (done < pending.size()) {
      ssize_t ret = write(ofd, pending.data() + done, pending.size() - done);
      if (ret == -1) {
        if (errno == EINTR) {
          continue;
        }
        write_failed = true;
        break;
      }
      done += ret;
    }
    pending.clear();
  }

  int ifd;
  int ofd;
  bool tty_saved;
  bool write_failed;
  struct termios termios_original;
  std::string pending;
};

Terminal::Terminal(int ifd, int ofd) :
  impl(new Implementation(ifd, ofd))
{
}

Terminal::~Terminal()
{
  impl->flush();
  delete impl;
}

bool Terminal::key_available()
{
  return data_available(impl->ifd);
}

int Terminal::get_char()
{
  unsigned char c;

  for (;;) {
    ssize_t ret = read(impl->ifd, &c, 1);
    if (ret == 1) {
      return c;
    }
    if (ret == -1 && errno == EINTR) {
      continue;
    }
    return -1;
  }
}

void Terminal::put_char(uint8_t c)
{
  impl->pending += (char)c;
}

void Terminal::flush()
{
  impl->flush();
}

bool Terminal::write_failed() const
{
  return impl->write_failed;
}

}

// vim: sw=2 si:
