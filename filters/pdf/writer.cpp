//  writer.cpp -- PDF file structure writer
//  Copyright (C) 2012, 2015  SEIKO EPSON CORPORATION
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

#include <iomanip>
#include <ios>
#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "kami/format.hpp"

#include "writer.hpp"

namespace kami {
namespace _flt_ {
namespace _pdf_ {

using std::logic_error;

writer::writer ()
  : octets_seen_(0)
  , stream_start_(0)
  , mode_(object_mode)
{}

streamsize
writer::write (output::ptr& output)
{
  const std::string s (buffer_.str ());
  streamsize rv = output->write (s.data (), s.size ());

  if (streamsize (s.size ()) != rv)
    BOOST_THROW_EXCEPTION
      (std::ios_base::failure ("PDF output octet count mismatch"));

  buffer_.str (std::string ());
  return rv;
}

void
writer::write (object& obj)
{
  require_(object_mode, "write an object");

  std::ostringstream os;
  os << obj.obj_num () << " 0 obj\n" << obj << "\nendobj\n";

  xref_[obj.obj_num ()] = octets_seen_;
  append_(os.str ());
}

void
writer::begin_stream (dictionary& dict)
{
  require_(object_mode, "begin a stream");

  stream_len_ = primitive ();
  dict.insert ("Length", object (stream_len_.obj_num ()));

  std::ostringstream os;
  os << dict.obj_num () << " 0 obj\n" << dict << "\nstream\n";

  xref_[dict.obj_num ()] = octets_seen_;
  append_(os.str ());

  stream_start_ = octets_seen_;
  mode_ = stream_mode;
}

void
writer::write (const octet *data, streamsize n)
{
  require_(stream_mode, "write stream data");

  buffer_.write (data, n);
  octets_seen_ += n;
}

void
writer::write (const std::string& s)
{
  write (s.data (), s.size ());
}

void
writer::end_stream ()
{
  require_(stream_mode, "end a stream");

  std::size_t length = octets_seen_ - stream_start_;
  append_("\nendstream\nendobj\n");
  mode_ = object_mode;

  std::size_t num = stream_len_.obj_num ();
  stream_len_ = primitive (length);
  xref_[num] = octets_seen_;
  append_((format ("%1% 0 obj\n%2%\nendobj\n") % num % length).str ());
}

void
writer::header ()
{
  require_(object_mode, "write the header");

  // the comment line marks the file as binary
  append_("%PDF-1.4\n%\xe2\xe3\xcf\xd3\n");
}

void
writer::trailer (dictionary& trailer_dict)
{
  require_(object_mode, "write the trailer");

  const std::size_t xref_pos = octets_seen_;
  std::ostringstream os;

  os << "xref\n";

  // one subsection per run of consecutive object numbers
  std::map< std::size_t, std::size_t >::const_iterator it = xref_.begin ();
  os << "0 1\n" << "0000000000 65535 f \n";
  while (xref_.end () != it)
    {
      std::map< std::size_t, std::size_t >::const_iterator end = it;
      std::size_t count = 0;
      while (xref_.end () != end && end->first == it->first + count)
        {
          ++end;
          ++count;
        }
      os << it->first << " " << count << "\n";
      for (; it != end; ++it)
        {
          os << std::setw (10) << std::setfill ('0') << it->second
             << " 00000 n \n";
        }
    }

  std::size_t size = (xref_.empty () ? 0 : xref_.rbegin ()->first) + 1;
  trailer_dict.insert ("Size", primitive (size));

  os << "trailer\n" << trailer_dict << "\n"
     << "startxref\n" << xref_pos << "\n"
     << "%%EOF\n";

  append_(os.str ());
}

void
writer::require_(mode_type mode, const char *what) const
{
  if (mode != mode_)
    BOOST_THROW_EXCEPTION
      (logic_error ((format ("cannot %1% in %2% mode")
                     % what
                     % (object_mode == mode_ ? "object" : "stream")).str ()));
}

void
writer::append_(const std::string& s)
{
  buffer_ << s;
  octets_seen_ += s.size ();
}

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace kami
