//  context.hpp -- geometry and layout of page image data
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

#ifndef kami_context_hpp_
#define kami_context_hpp_

#include <string>

#include <sys/types.h>

namespace kami {

//! Describes the image data flowing through a page stream
/*! Scan lines are always octet aligned.  In the monochrome case, the
 *  leftmost pixel of a scan line lives in the most significant bit of
 *  the first octet and a set bit means "white".
 *
 *  Data that is not raster image data, a PDF document on its way to
 *  Ghostscript for example, is flagged by its content type.
 */
class context
{
public:
  typedef ssize_t size_type;

  enum {
    unknown_size = -1,
  };

  enum pixel_type {
    MONO  = 0,                  // 8 pixels to the octet
    GRAY8 = 1,
    RGB8  = 3,                  // octets per pixel
  };

  context (const size_type& width  = unknown_size,
           const size_type& height = unknown_size,
           const pixel_type& type = GRAY8);

  //! A content type identifier as specified in RFC 2046
  std::string content_type () const;
  void content_type (const std::string& type);

  pixel_type type () const;
  void type (const pixel_type& type);

  bool is_mono () const { return MONO == type_; }
  bool is_rgb () const { return RGB8 == type_; }

  size_type width () const { return width_; }
  size_type height () const { return height_; }
  void width (const size_type& pixels) { width_ = pixels; }
  void height (const size_type& pixels) { height_ = pixels; }

  //! Bits per colour component
  size_type depth () const;

  //! \c unknown_size unless the width is known
  size_type octets_per_line () const;
  //! \c unknown_size unless both width and height are known
  size_type octets_per_image () const;

  size_type x_resolution () const { return x_resolution_; }
  size_type y_resolution () const { return y_resolution_; }
  void resolution (const size_type& res);
  void resolution (const size_type& x_res, const size_type& y_res);

private:
  std::string content_type_;
  pixel_type  type_;

  size_type width_;
  size_type height_;
  size_type x_resolution_;
  size_type y_resolution_;
};

}       // namespace kami

#endif  /* kami_context_hpp_ */
