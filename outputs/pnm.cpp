//  pnm.cpp -- collect PNM images in memory
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
#include <cctype>
#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "kami/format.hpp"
#include "kami/log.hpp"

#include "pnm.hpp"

namespace kami {
namespace _out_ {

using std::runtime_error;

namespace {

class parser
{
public:
  parser (const octets& data, const context& ctx)
    : data_(data), pos_(0), ctx_(ctx)
  {}

  bool at_end ()
  {
    skip_space_();
    return pos_ >= data_.size ();
  }

  image next ()
  {
    if (pos_ + 2 > data_.size () || 'P' != data_[pos_])
      fail_("not a PNM image");

    const char magic = data_[pos_ + 1];
    if ('4' != magic && '5' != magic && '6' != magic)
      fail_((format ("unsupported PNM variant P%1%") % magic).str ());
    pos_ += 2;

    context::size_type width  = number_();
    context::size_type height = number_();
    long maxval = ('4' == magic ? 1 : number_());

    if (0 >= width || 0 >= height)
      fail_("invalid image size");
    if (0 >= maxval || 255 < maxval)
      fail_((format ("unsupported maximum sample value %1%")
             % maxval).str ());

    ++pos_;                     // single whitespace before the raster

    context ctx (width, height, ('4' == magic ? context::MONO
                                 : '5' == magic ? context::GRAY8
                                 : context::RGB8));
    ctx.resolution (ctx_.x_resolution (), ctx_.y_resolution ());

    const octets::size_type n = ctx.octets_per_image ();
    if (pos_ + n > data_.size ())
      fail_((format ("truncated image data (%1% of %2% octets)")
             % (data_.size () - std::min (pos_, data_.size ())) % n).str ());

    octets raster (data_, pos_, n);
    pos_ += n;

    if ('4' == magic)
      {
        // PBM inks its ones
        for (octets::iterator it = raster.begin (); raster.end () != it; ++it)
          *it = ~*it;
        return image (ctx, raster).to_gray ();
      }

    if (255 != maxval)
      {
        for (octets::iterator it = raster.begin (); raster.end () != it; ++it)
          *it = octet (traits::to_int_type (*it) * 255 / maxval);
      }
    return image (ctx, raster);
  }

private:
  const octets& data_;
  octets::size_type pos_;
  context ctx_;

  void skip_space_()
  {
    while (pos_ < data_.size ())
      {
        int c = traits::to_int_type (data_[pos_]);
        if ('#' == c)
          {
            while (pos_ < data_.size () && '\n' != data_[pos_]) ++pos_;
          }
        else if (isspace (c))
          ++pos_;
        else
          break;
      }
  }

  long number_()
  {
    skip_space_();

    long rv = 0;
    octets::size_type start = pos_;
    while (pos_ < data_.size ()
           && isdigit (traits::to_int_type (data_[pos_])))
      {
        rv = 10 * rv + (data_[pos_] - '0');
        if (rv > (1L << 24)) fail_("header value out of range");
        ++pos_;
      }
    if (start == pos_) fail_("malformed PNM header");
    return rv;
  }

  void fail_(const std::string& msg) const
  {
    BOOST_THROW_EXCEPTION
      (runtime_error ((format ("PNM data at offset %1%: %2%")
                       % pos_ % msg).str ()));
  }
};

}       // namespace

pnm_odevice::pnm_odevice ()
  : failed_(false)
{}

streamsize
pnm_odevice::write (const octet *data, streamsize n)
{
  data_.append (data, n);
  return n;
}

const std::vector< image >&
pnm_odevice::images () const
{
  return images_;
}

bool
pnm_odevice::failed () const
{
  return failed_;
}

void
pnm_odevice::bos (const context& ctx)
{
  images_.clear ();
  failed_ = false;
}

void
pnm_odevice::boi (const context& ctx)
{
  ctx_ = ctx;
  data_.clear ();
}

void
pnm_odevice::eoi (const context& ctx)
{
  parser p (data_, ctx_);
  std::vector< image >::size_type count = images_.size ();

  while (!p.at_end ())
    images_.push_back (p.next ());

  log::trace ("collected %1% image(s) from %2% octets")
    % (images_.size () - count) % data_.size ();
  data_.clear ();
}

void
pnm_odevice::eof (const context& ctx)
{
  data_.clear ();
  failed_ = true;
}

}       // namespace _out_
}       // namespace kami
