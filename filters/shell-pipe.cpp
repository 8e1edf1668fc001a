//  shell-pipe.cpp -- run image data through an external command
//  Copyright (C) 2014, 2015  SEIKO EPSON CORPORATION
//  Copyright (C) 2026  Kami developers
//
//  License: GPL-3.0+
//
//  This file is part of the 'Kami' package.
//  This package is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License or, at
//  your option, any later version.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//  You ought to have received a copy of the GNU General Public License
//  along with this package.  If not, see <http://www.gnu.org/licenses/>.

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <signal.h>
#include <sys/select.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <boost/throw_exception.hpp>

#include "kami/log.hpp"

#include "shell-pipe.hpp"

#ifndef SHELL
#define SHELL "/bin/sh"
#endif

namespace kami {
namespace _flt_ {

namespace {

void
close_(int& fd)
{
  if (-1 == fd) return;

  if (0 > close (fd))
    log::error ("close: %1%") % strerror (errno);

  fd = -1;
}

void
log_process_exit_(const std::string& cmd, const siginfo_t& info)
{
  switch (info.si_code)
    {
    case CLD_EXITED:
      if (EXIT_SUCCESS == info.si_status)
        log::trace ("%1% exited (pid: %2%)") % cmd % info.si_pid;
      else
        log::error ("%1% failed (pid: %2%, status: %3%)")
          % cmd % info.si_pid % info.si_status;
      break;
    case CLD_KILLED:
    case CLD_DUMPED:
      log::error ("%1% killed (pid: %2%, signal: %3%)")
        % cmd % info.si_pid % info.si_status;
      break;
    default:
      log::error ("%1% ended (pid: %2%, code: %3%)")
        % cmd % info.si_pid % info.si_code;
    }
}

//! Makes \a fd the non-blocking, close-on-exec replacement of \a pipe
void
adopt_(int& pipe, int fd)
{
  close_(pipe);
  pipe = fd;
  fcntl (pipe, F_SETFL, O_NONBLOCK);
  fcntl (pipe, F_SETFD, FD_CLOEXEC);
}

// How long to wait for the child process' pipes to become ready
const long poll_interval_ns = 20 * 1000 * 1000;

//! Ignores SIGPIPE for as long as an instance lives
/*! A child that exits before it has read all of its input must not
 *  take us down when we write to its stdin.  The broken pipe shows up
 *  as an EPIPE error instead.
 */
class sigpipe_ignorer
{
public:
  sigpipe_ignorer ()
  {
    struct sigaction sa;
    sa.sa_handler = SIG_IGN;
    sa.sa_flags = 0;
    sigemptyset (&sa.sa_mask);

    active_ = (0 == sigaction (SIGPIPE, &sa, &saved_));
    if (!active_)
      log::error ("cannot ignore SIGPIPE: %1%") % strerror (errno);
  }

  ~sigpipe_ignorer ()
  {
    if (active_) sigaction (SIGPIPE, &saved_, NULL);
  }

private:
  struct sigaction saved_;
  bool active_;
};

}       // namespace

shell_pipe::shell_pipe (const std::string& command)
  : command_(command)
  , process_(-1)
  , i_pipe_(-1)
  , o_pipe_(-1)
  , e_pipe_(-1)
  , buffer_(default_buffer_size, octet ())
{}

shell_pipe::~shell_pipe ()
{
  close_(i_pipe_);
  close_(o_pipe_);
  close_(e_pipe_);
  if (0 < process_) waitid (P_PID, process_, NULL, WEXITED);
}

void
shell_pipe::mark (traits::int_type c, const context& ctx)
{
  output::mark (c, ctx);        // sets last_marker_ via the hooks

  output_->mark (last_marker_, ctx_);
}

streamsize
shell_pipe::write (const octet *data, streamsize n)
{
  if (-1 == i_pipe_) return n;  // process is gone, drop the data

  return service_pipes_(data, n);
}

void
shell_pipe::bos (const context& ctx)
{
  ctx_ = estimate (ctx);
  last_marker_ = traits::bos ();
}

void
shell_pipe::boi (const context& ctx)
{
  ctx_ = estimate (ctx);
  last_marker_ = exec_process_(ctx);
}

void
shell_pipe::eoi (const context& ctx)
{
  close_(i_pipe_);              // signals end of input to the process

  while (-1 != o_pipe_)
    service_pipes_(NULL, 0);

  ctx_ = finalize (ctx);
  traits::int_type rv = (0 < process_ ? reap_process_() : traits::eof ());

  if (traits::eof () != last_marker_)
    last_marker_ = rv;
}

void
shell_pipe::eos (const context& ctx)
{
  ctx_ = finalize (ctx);
  last_marker_ = traits::eos ();
}

void
shell_pipe::eof (const context& ctx)
{
  close_(i_pipe_);
  close_(o_pipe_);

  ctx_ = finalize (ctx);
  if (0 < process_)
    {
      kill (process_, SIGTERM);
      reap_process_();
    }
  last_marker_ = traits::eof ();
}

context
shell_pipe::estimate (const context& ctx)
{
  return ctx;
}

context
shell_pipe::finalize (const context& ctx)
{
  return estimate (ctx);
}

std::string
shell_pipe::arguments (const context&)
{
  return std::string ();
}

void
shell_pipe::checked_write (octet *data, streamsize n)
{
  while (0 < n)
    {
      streamsize m = output_->write (data, n);
      data += m;
      n    -= m;
    }
}

traits::int_type
shell_pipe::exec_process_(const context& ctx)
{
  std::string command_line (command_ + ' ' + arguments (ctx));

  if (0 < process_)
    BOOST_THROW_EXCEPTION
      (std::logic_error ("shell pipe process already running"));

  int in [2] = { -1, -1 };
  int out[2] = { -1, -1 };
  int err[2] = { -1, -1 };

  if (   -1 == pipe (err)
      || -1 == pipe (out)
      || -1 == pipe (in)
      ||  0 > (process_ = fork ()))
    {
      log::error ("%1%: %2%") % command_ % strerror (errno);

      close_(in[0]) ; close_(in[1]) ;
      close_(out[0]); close_(out[1]);
      close_(err[0]); close_(err[1]);
      process_ = -1;

      return traits::eof ();
    }

  if (0 == process_)            // child
    {
      close (in[1]);
      close (out[0]);
      close (err[0]);

      if (   0 <= dup2 (err[1], STDERR_FILENO)
          && 0 <= dup2 (out[1], STDOUT_FILENO)
          && 0 <= dup2 (in[0] , STDIN_FILENO))
        {
          close (in[0]);
          close (out[1]);
          close (err[1]);

          setenv ("LC_NUMERIC", "C", 1);
          ::signal (SIGPIPE, SIG_DFL);

          execl (SHELL, SHELL, "-c", command_line.c_str (), (char *) NULL);
        }

      log::fatal ("%1%: execl: %2%") % command_ % strerror (errno);
      _exit (127);
    }

  close (in[0]);                // parent
  close (out[1]);
  close (err[1]);

  adopt_(e_pipe_, err[0]);
  adopt_(o_pipe_, out[0]);
  adopt_(i_pipe_, in[1]);

  log::trace ("%1% started (pid: %2%)") % command_ % process_;
  log::debug ("invocation: %1%") % command_line;

  return traits::boi ();
}

traits::int_type
shell_pipe::reap_process_()
{
  if (-1 != e_pipe_)
    {
      fcntl (e_pipe_, F_SETFL, 0);
      ssize_t rv;
      while (0 < (rv = ::read (e_pipe_, &buffer_[0], buffer_.size ())))
        message_.append (buffer_, 0, rv);
      if (0 > rv)
        log::error ("%1% (pid: %2%): %3%")
          % command_ % process_ % strerror (errno);
      close_(e_pipe_);
    }
  flush_message_();

  siginfo_t info;
  memset (&info, 0, sizeof (info));
  info.si_code   = CLD_KILLED;          // be pessimistic
  info.si_status = EXIT_FAILURE;

  int ec;
  do
    {
      ec = 0;
      if (0 == waitid (P_PID, process_, &info, WEXITED))
        log_process_exit_(command_, info);
      else
        {
          ec = errno;
          if (EINTR != ec)
            log::error ("waitid (%1%): %2%") % process_ % strerror (ec);
        }
    }
  while (EINTR == ec);

  process_ = -1;

  return ((   CLD_EXITED   == info.si_code
           && EXIT_SUCCESS == info.si_status)
          ? traits::eoi ()
          : traits::eof ());
}

streamsize
shell_pipe::service_pipes_(const octet *data, streamsize n)
{
  fd_set r_fds;
  fd_set w_fds;
  int fd_max = -1;

  FD_ZERO (&r_fds);
  FD_ZERO (&w_fds);

  if (-1 != i_pipe_ && 0 < n)
    {
      FD_SET (i_pipe_, &w_fds);
      fd_max = std::max (i_pipe_, fd_max);
    }
  if (-1 != o_pipe_)
    {
      FD_SET (o_pipe_, &r_fds);
      fd_max = std::max (o_pipe_, fd_max);
    }
  if (-1 != e_pipe_)
    {
      FD_SET (e_pipe_, &r_fds);
      fd_max = std::max (e_pipe_, fd_max);
    }

  if (-1 == fd_max) return n;

  struct timespec timeout = { 0, poll_interval_ns };
  int fds = pselect (fd_max + 1, &r_fds, &w_fds, NULL, &timeout, NULL);

  if (-1 == fds && EINTR == errno)
    return 0;
  if (-1 == fds)
    BOOST_THROW_EXCEPTION (std::runtime_error (strerror (errno)));

  ssize_t rv;

  if (-1 != e_pipe_ && FD_ISSET (e_pipe_, &r_fds))
    {
      rv = ::read (e_pipe_, &buffer_[0], buffer_.size ());

      /**/ if (0 < rv) { message_.append (buffer_, 0, rv); }
      else if (0 > rv) { handle_error_(errno, e_pipe_); }
      else             { close_(e_pipe_); flush_message_(); }
    }

  if (-1 != o_pipe_ && FD_ISSET (o_pipe_, &r_fds))
    {
      rv = ::read (o_pipe_, &buffer_[0], buffer_.size ());

      /**/ if (0 < rv) { checked_write (&buffer_[0], rv); }
      else if (0 > rv) { handle_error_(errno, o_pipe_); }
      else             { close_(o_pipe_); }
    }

  if (-1 != i_pipe_ && 0 < n && FD_ISSET (i_pipe_, &w_fds))
    {
      int ec = 0;
      {
        sigpipe_ignorer guard;
        rv = ::write (i_pipe_, data, n);
        if (0 > rv) ec = errno;
      }

      if (0 <= rv) return rv;
      handle_error_(ec, i_pipe_);
      if (-1 == i_pipe_) return n;      // nobody is listening any more
    }

  return 0;                     // caller holds on to the data
}

void
shell_pipe::handle_error_(int ec, int& fd)
{
  if (EINTR == ec || EAGAIN == ec || EWOULDBLOCK == ec)
    {
      log::debug ("%1% (pid: %2%): %3%")
        % command_ % process_ % strerror (ec);
      return;
    }

  log::error ("%1% (pid: %2%): %3%")
    % command_ % process_ % strerror (ec);

  if (e_pipe_ != fd)
    last_marker_ = traits::eof ();

  close_(fd);
}

void
shell_pipe::flush_message_()
{
  if (message_.empty ()) return;

  log::error ("%1% (pid: %2%): %3%") % command_ % process_ % message_;
  message_.clear ();
}

}       // namespace _flt_
}       // namespace kami
