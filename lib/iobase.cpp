//  iobase.cpp -- page stream producer and consumer interfaces
//  Copyright (C) 2012, 2013  SEIKO EPSON CORPORATION
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

#include <vector>

#include "kami/iobase.hpp"

namespace kami {

input::input (const context& ctx)
  : ctx_(ctx)
{}

input::~input ()
{}

context
input::get_context () const
{
  return ctx_;
}

output::output ()
{}

output::~output ()
{}

void
output::mark (traits::int_type c, const context& ctx)
{
  /**/ if (traits::bos () == c) bos (ctx);
  else if (traits::boi () == c) boi (ctx);
  else if (traits::eoi () == c) eoi (ctx);
  else if (traits::eos () == c) eos (ctx);
  else if (traits::eof () == c) eof (ctx);
}

context
output::get_context () const
{
  return ctx_;
}

void output::bos (const context&) {}
void output::boi (const context&) {}
void output::eoi (const context&) {}
void output::eos (const context&) {}
void output::eof (const context&) {}

streamsize
operator| (input& iref, output& oref)
{
  streamsize rv = iref.marker ();
  if (traits::bos () != rv) return rv;

  oref.mark (rv, iref.get_context ());
  do
    {
      rv = iref >> oref;
    }
  while (traits::eoi () == rv);

  // an aborted image has been marked already
  if (traits::eof () != rv)
    oref.mark (rv, iref.get_context ());
  return rv;
}

streamsize
operator>> (input& iref, output& oref)
{
  streamsize n = iref.marker ();
  if (traits::boi () != n) return n;

  std::vector< octet > buffer (default_buffer_size);

  oref.mark (n, iref.get_context ());
  while (0 < (n = iref.read (&buffer[0], buffer.size ())))
    {
      const octet *p = &buffer[0];
      while (0 < n)
        {
          streamsize m = oref.write (p, n);
          p += m;
          n -= m;
        }
    }
  oref.mark (n, iref.get_context ());
  return n;
}

}       // namespace kami
