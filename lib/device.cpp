//  device.cpp -- page stream sources and sinks
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

#include <exception>

#include "kami/device.hpp"

namespace kami {

idevice::idevice (const context& ctx)
  : input (ctx)
  , marker_(traits::eos ())
{}

streamsize
idevice::read (octet *data, streamsize n)
{
  try
    {
      if (traits::boi () != marker_)
        {
          marker_ = next_marker_();
          return marker_;
        }
      if (0 >= n) return marker_;

      streamsize rv = sgetn (data, n);
      if (0 < rv) return rv;

      finish_image ();
      marker_ = (0 == rv ? traits::eoi () : traits::eof ());
      return marker_;
    }
  catch (const std::exception&)
    {
      marker_ = traits::eof ();
      throw;
    }
}

streamsize
idevice::marker ()
{
  return read (NULL, 0);
}

traits::int_type
idevice::next_marker_()
{
  if (traits::bos () == marker_)
    return (set_up_image () ? traits::boi () : traits::eos ());

  if (traits::eoi () == marker_)
    return (is_consecutive () && obtain_media () && set_up_image ()
            ? traits::boi () : traits::eos ());

  // a finished or aborted stream starts over
  return (obtain_media () ? traits::bos () : traits::eof ());
}

bool
idevice::is_consecutive () const
{
  return false;
}

bool
idevice::obtain_media ()
{
  return true;
}

bool
idevice::set_up_image ()
{
  return false;
}

void
idevice::finish_image ()
{}

streamsize
idevice::sgetn (octet *, streamsize)
{
  return 0;
}

}       // namespace kami
