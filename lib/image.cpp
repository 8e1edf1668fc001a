//  image.cpp -- in-memory raster images
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
#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "kami/image.hpp"

namespace kami {

using std::logic_error;

namespace {

streamsize
known_size (const context& ctx)
{
  if (context::unknown_size == ctx.octets_per_image ())
    BOOST_THROW_EXCEPTION
      (logic_error ("image size needs to be known"));
  return ctx.octets_per_image ();
}

}       // namespace

image::image ()
  : ctx_(0, 0, context::GRAY8)
{}

image::image (const context& ctx)
  : ctx_(ctx)
  , data_(known_size (ctx), '\xff')
{}

image::image (const context& ctx, const octets& data)
  : ctx_(ctx)
  , data_(data)
{
  if (ctx.octets_per_image () != streamsize (data_.size ()))
    BOOST_THROW_EXCEPTION
      (logic_error ("image data does not match its context"));
}

const context&
image::get_context () const
{
  return ctx_;
}

const octets&
image::data () const
{
  return data_;
}

octets&
image::data ()
{
  return data_;
}

image::size_type
image::width () const
{
  return ctx_.width ();
}

image::size_type
image::height () const
{
  return ctx_.height ();
}

bool
image::empty () const
{
  return data_.empty ();
}

int
image::gray (size_type x, size_type y) const
{
  const octet *line = data_.data () + y * ctx_.octets_per_line ();

  switch (ctx_.type ())
    {
    case context::MONO:
      return ((line[x / 8] >> (7 - x % 8)) & 0x01 ? 0xff : 0x00);
    case context::GRAY8:
      return traits::to_int_type (line[x]);
    case context::RGB8:
      {
        const octet *p = line + 3 * x;
        return (  299 * traits::to_int_type (p[0])
                + 587 * traits::to_int_type (p[1])
                + 114 * traits::to_int_type (p[2])) / 1000;
      }
    }
  return 0;
}

bool
image::is_white (size_type x, size_type y) const
{
  return 128 <= gray (x, y);
}

void
image::set (size_type x, size_type y, bool white)
{
  if (!ctx_.is_mono ())
    BOOST_THROW_EXCEPTION
      (logic_error ("image::set() needs a monochrome image"));

  octet& o = data_[y * ctx_.octets_per_line () + x / 8];
  const octet bit = 0x80 >> (x % 8);

  if (white) o |=  bit;
  else       o &= ~bit;
}

void
image::blit (const image& src, size_type x, size_type y,
             size_type w, size_type h)
{
  if (0 >= w || 0 >= h || src.empty ()) return;

  for (size_type j = std::max< size_type > (0, -y); j < h; ++j)
    {
      if (height () <= y + j) break;

      size_type sy = j * src.height () / h;
      for (size_type i = std::max< size_type > (0, -x); i < w; ++i)
        {
          if (width () <= x + i) break;

          size_type sx = i * src.width () / w;
          set (x + i, y + j, src.is_white (sx, sy));
        }
    }
}

image
image::to_gray () const
{
  if (context::GRAY8 == ctx_.type ()) return *this;

  context ctx (ctx_);
  ctx.type (context::GRAY8);

  image rv (ctx);
  for (size_type y = 0; y < height (); ++y)
    {
      octet *line = &rv.data_[y * ctx.octets_per_line ()];
      for (size_type x = 0; x < width (); ++x)
        line[x] = gray (x, y);
    }
  return rv;
}

image_idevice::image_idevice (const std::vector< image >& images)
  : images_(images)
  , next_(0)
  , offset_(0)
{}

bool
image_idevice::is_consecutive () const
{
  return true;
}

bool
image_idevice::obtain_media ()
{
  return next_ < images_.size ();
}

bool
image_idevice::set_up_image ()
{
  if (next_ >= images_.size ()) return false;

  ctx_ = images_[next_].get_context ();
  offset_ = 0;
  return true;
}

streamsize
image_idevice::sgetn (octet *data, streamsize n)
{
  const octets& src (images_[next_].data ());
  streamsize rv = std::min (n, streamsize (src.size ()) - offset_);

  if (0 < rv)
    {
      traits::copy (data, src.data () + offset_, rv);
      offset_ += rv;
    }
  if (0 == rv) ++next_;

  return rv;
}

}       // namespace kami
