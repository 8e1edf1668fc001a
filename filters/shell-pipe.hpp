//  shell-pipe.hpp -- run image data through an external command
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

#ifndef filters_shell_pipe_hpp_
#define filters_shell_pipe_hpp_

#include <string>

#include <sys/types.h>

#include "kami/filter.hpp"

namespace kami {
namespace _flt_ {

//! Feeds each image to a shell command and passes on what it outputs
/*! A fresh process is started at the beginning of every image.  The
 *  image data is written to the process' standard input and whatever
 *  it writes to standard output is handed to the next output in the
 *  stream.  Anything on standard error ends up in the log.
 *
 *  A process that cannot be started or that exits unsuccessfully
 *  turns the end of image into a traits::eof() marker.
 */
class shell_pipe
  : public filter
{
public:
  ~shell_pipe ();

  void mark (traits::int_type c, const context& ctx);
  streamsize write (const octet *data, streamsize n);

protected:
  explicit shell_pipe (const std::string& command);

  void bos (const context& ctx);
  void boi (const context& ctx);
  void eoi (const context& ctx);
  void eos (const context& ctx);
  void eof (const context& ctx);

  //! Context of the command's output, as far as known upfront
  virtual context estimate (const context& ctx);
  //! Context of the command's output once it has finished
  virtual context finalize (const context& ctx);

  //! Command line arguments for processing an image with \a ctx
  virtual std::string arguments (const context& ctx);

  virtual void checked_write (octet *data, streamsize n);

private:
  traits::int_type exec_process_(const context& ctx);
  traits::int_type reap_process_();

  streamsize service_pipes_(const octet *data, streamsize n);
  void handle_error_(int ec, int& fd);
  void flush_message_();

  std::string command_;
  std::string message_;
  pid_t       process_;

  int i_pipe_;
  int o_pipe_;
  int e_pipe_;

  octets buffer_;
};

}       // namespace _flt_
}       // namespace kami

#endif  /* filters_shell_pipe_hpp_ */
