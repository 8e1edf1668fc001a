//  context.cpp -- geometry and layout of page image data
//  Copyright (C) 2012, 2013, 2015  SEIKO EPSON CORPORATION
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

#include "kami/context.hpp"

namespace kami {

namespace {

const std::string raster_type ("image/x-raster");

context::pixel_type
checked (const context::pixel_type& type)
{
  if (   context::MONO  != type
      && context::GRAY8 != type
      && context::RGB8  != type)
    BOOST_THROW_EXCEPTION
      (std::invalid_argument ("unsupported pixel type"));
  return type;
}

}       // namespace

context::context (const size_type& width, const size_type& height,
                  const pixel_type& type)
  : content_type_(raster_type)
  , type_(checked (type))
  , width_(width)
  , height_(height)
  , x_resolution_(0)
  , y_resolution_(0)
{}

std::string
context::content_type () const
{
  return content_type_;
}

void
context::content_type (const std::string& type)
{
  content_type_ = type;
}

context::pixel_type
context::type () const
{
  return type_;
}

void
context::type (const pixel_type& type)
{
  type_ = checked (type);
}

context::size_type
context::depth () const
{
  return (MONO == type_ ? 1 : 8);
}

context::size_type
context::octets_per_line () const
{
  if (unknown_size == width_) return unknown_size;

  return (MONO == type_
          ? (width_ + 7) / 8
          : width_ * type_);
}

context::size_type
context::octets_per_image () const
{
  if (   unknown_size == height_
      || unknown_size == width_)
    return unknown_size;

  return height_ * octets_per_line ();
}

void
context::resolution (const size_type& res)
{
  resolution (res, res);
}

void
context::resolution (const size_type& x_res, const size_type& y_res)
{
  x_resolution_ = x_res;
  y_resolution_ = y_res;
}

}       // namespace kami
