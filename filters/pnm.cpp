//  pnm.cpp -- portable any map output
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

#include <stdexcept>

#include <boost/scoped_array.hpp>
#include <boost/throw_exception.hpp>

#include "kami/format.hpp"

#include "pnm.hpp"

namespace kami {
namespace _flt_ {

streamsize
pnm::write (const octet *data, streamsize n)
{
  flush_header_();

  if (!ctx_.is_mono ())
    return output_->write (data, n);

  boost::scoped_array< octet > tmp (new octet[n]);
  for (streamsize i = 0; i < n; ++i)
    {
      tmp[i] = ~data[i];
    }
  return output_->write (tmp.get (), n);
}

void
pnm::boi (const context& ctx)
{
  using std::logic_error;

  if (context::unknown_size == ctx.width ()
      || context::unknown_size == ctx.height ())
    BOOST_THROW_EXCEPTION
      (logic_error ("PNM output needs to know the image size upfront"));

  format fmt;
  switch (ctx.type ())
    {
    case context::MONO:  fmt = format ("P4 %1% %2%\n");     break;
    case context::GRAY8: fmt = format ("P5 %1% %2% 255\n"); break;
    case context::RGB8:  fmt = format ("P6 %1% %2% 255\n"); break;
    }

  ctx_ = ctx;
  ctx_.content_type ("image/x-portable-anymap");

  header_ = (fmt % ctx_.width () % ctx_.height ()).str ();
}

void
pnm::eoi (const context&)
{
  flush_header_();
}

void
pnm::flush_header_()
{
  const octet *p = header_.data ();
  streamsize n = header_.size ();

  while (0 < n)
    {
      streamsize m = output_->write (p, n);
      p += m;
      n -= m;
    }
  header_.clear ();
}

}       // namespace _flt_
}       // namespace kami
