//  stream.cpp -- image data consuming streams
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

#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "kami/stream.hpp"

namespace kami {

using std::logic_error;

streamsize
stream::write (const octet *data, streamsize n)
{
  if (!device_)
    BOOST_THROW_EXCEPTION (logic_error ("stream has no device"));

  return bottom_->write (data, n);
}

void
stream::mark (traits::int_type c, const context& ctx)
{
  if (!device_)
    BOOST_THROW_EXCEPTION (logic_error ("stream has no device"));

  bottom_->mark (c, ctx);
}

void
stream::push (odevice::ptr device)
{
  attach_(device);
  device_ = device;
}

void
stream::push (filter::ptr filter)
{
  attach_(filter);
  filter_ = filter;
}

odevice::ptr
stream::get_device () const
{
  return device_;
}

void
stream::attach_(output::ptr out)
{
  if (device_)
    BOOST_THROW_EXCEPTION
      (logic_error ("cannot push onto a capped stream"));

  if (filter_)
    filter_->open (out);
  else
    bottom_ = out;
}

}       // namespace kami
