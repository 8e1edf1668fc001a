//  file.cpp -- file based devices
//  Copyright (C) 2012-2015  SEIKO EPSON CORPORATION
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

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ios>
#include <iomanip>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/throw_exception.hpp>

#include "kami/file.hpp"
#include "kami/log.hpp"
#include "kami/regex.hpp"

namespace fs = boost::filesystem;

using std::ios_base;

namespace kami {

namespace {

const regex pattern_re ("(([^%]|%%)*)%0*([0-9]*)i(([^%]|%%)*)");

std::string
unescape_(const std::string& s)
{
  std::string rv;
  for (std::string::size_type i = 0; i < s.size (); ++i)
    {
      rv += s[i];
      if ('%' == s[i] && i + 1 < s.size () && '%' == s[i + 1]) ++i;
    }
  return rv;
}

}       // namespace

path_generator::path_generator ()
  : width_(0), offset_(1), valid_(false)
{}

path_generator::path_generator (const std::string& pattern)
  : width_(0), offset_(1), valid_(false)
{
  fs::path p (pattern);

  std::string filename = p.filename ().string ();
  smatch m;

  if (regex_match (filename, m, pattern_re))
    {
      parent_ = p.parent_path ().string ();
      prefix_ = unescape_(m.str (1));
      suffix_ = unescape_(m.str (4));
      if (m.str (3).length ())
        width_ = boost::lexical_cast< int > (m.str (3));
      if (prefix_.empty () && suffix_.empty ())
        suffix_ = ".pbm";
      valid_ = true;
    }
}

path_generator::operator bool () const
{
  return valid_;
}

std::string
path_generator::operator() ()
{
  std::ostringstream os;
  os << prefix_
     << std::setw (width_) << std::setfill ('0') << offset_
     << suffix_;
  ++offset_;

  return (fs::path (parent_) / os.str ()).string ();
}

bool
path_generator::is_pattern (const std::string& pattern)
{
  return path_generator (pattern);
}

file_idevice::file_idevice (const std::string& filename)
  : filename_(filename)
  , used_(true)
{}

file_idevice::file_idevice (const path_generator& generator)
  : generator_(generator)
  , used_(true)
{}

file_idevice::~file_idevice ()
{
  file_.close ();
}

bool
file_idevice::is_consecutive () const
{
  return generator_;
}

bool
file_idevice::obtain_media ()
{
  if (is_consecutive () && used_)
    {
      filename_ = generator_();
    }
  return used_ = fs::exists (filename_);
}

bool
file_idevice::set_up_image ()
{
  if (!file_.open (filename_.c_str (),
                   ios_base::binary | ios_base::in))
    {
      BOOST_THROW_EXCEPTION
        (ios_base::failure (filename_ + ": cannot open for reading"));
    }
  ctx_ = context ();
  ctx_.content_type ("application/octet-stream");
  return true;
}

void
file_idevice::finish_image ()
{
  file_.close ();
}

streamsize
file_idevice::sgetn (octet *data, streamsize n)
{
  return file_.sgetn (data, n);
}

file_odevice::file_odevice (const std::string& filename)
  : filename_(filename)
  , fd_(-1)
  , count_(0)
{}

file_odevice::file_odevice (const path_generator& generator)
  : generator_(generator)
  , fd_(-1)
  , count_(0)
{}

file_odevice::~file_odevice ()
{
  close ();
}

void
file_odevice::open ()
{
  if (-1 != fd_)
    {
      log::trace ("file_odevice: may be leaking a file descriptor");
    }

  // Create non-executable files, subject to the process' umask()
  const int fd_perms = (  S_IRUSR | S_IWUSR
                        | S_IRGRP | S_IWGRP
                        | S_IROTH | S_IWOTH
                        );

  fd_ = ::open (filename_.c_str (),
                O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, fd_perms);

  if (-1 == fd_)
    {
      BOOST_THROW_EXCEPTION
        (ios_base::failure (filename_ + ": " + strerror (errno)));
    }
  log::trace ("opened %1%") % filename_;
}

void
file_odevice::close ()
{
  if (-1 == fd_) return;

  if (-1 == ::close (fd_))
    {
      // Error conditions upon closing are for diagnostic purposes
      // only.  Do NOT throw an exception here.
      log::alert (strerror (errno));
    }
  fd_ = -1;
}

streamsize
file_odevice::write (const octet *data, streamsize n)
{
  if (-1 == fd_)
    {
      BOOST_THROW_EXCEPTION
        (ios_base::failure ("file_odevice::write(): " + std::string
                            (strerror (EBADF))));
    }

  errno = 0;
  ssize_t rv = ::write (fd_, data, n);
  int ec = errno;

  if (0 < rv) return rv;

  if (0 == rv || EINTR == ec || EAGAIN == ec) return 0;

  eof (ctx_);
  BOOST_THROW_EXCEPTION (ios_base::failure (strerror (ec)));
}

void
file_odevice::bos (const context&)
{
  count_ = 0;
  if (!generator_)
    {
      open ();
    }
}

void
file_odevice::boi (const context& ctx)
{
  ctx_ = ctx;
  if (generator_)
    {
      filename_ = generator_();
      open ();
    }
}

void
file_odevice::eoi (const context&)
{
  if (generator_)
    {
      close ();
    }
  ++count_;
}

void
file_odevice::eos (const context&)
{
  if (!generator_)
    {
      close ();
    }
}

void
file_odevice::eof (const context&)
{
  if (-1 == fd_) return;

  close ();
  if (-1 == remove (filename_.c_str ()))
    {
      log::alert (strerror (errno));
    }
}

}       // namespace kami
