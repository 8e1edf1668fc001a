//  magick.cpp -- rasterize image files with ImageMagick
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include "magick.hpp"

#ifndef MAGICK_CONVERT_PROGRAM
#define MAGICK_CONVERT_PROGRAM "convert"
#endif

namespace kami {
namespace _flt_ {

magick::magick ()
  : shell_pipe (MAGICK_CONVERT_PROGRAM)
{}

context
magick::estimate (const context& ctx)
{
  context rv (context::unknown_size, context::unknown_size, context::GRAY8);
  rv.content_type ("image/x-portable-graymap");
  return rv;
}

std::string
magick::arguments (const context&)
{
  // read stdin, guessing the format from its magic number
  return "- -colorspace Gray -depth 8 pgm:-";
}

}       // namespace _flt_
}       // namespace kami
