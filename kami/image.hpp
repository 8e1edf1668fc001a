//  image.hpp -- in-memory raster images
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

#ifndef kami_image_hpp_
#define kami_image_hpp_

#include <vector>

#include "context.hpp"
#include "device.hpp"
#include "octet.hpp"

namespace kami {

//! A raster image held in memory
/*! The image data is laid out exactly as it flows through a stream:
 *  row-major, octet aligned scan lines in the format described by
 *  the image's context.
 */
class image
{
public:
  typedef context::size_type size_type;

  image ();
  //! Creates an all white image for \a ctx
  explicit image (const context& ctx);
  image (const context& ctx, const octets& data);

  const context& get_context () const;
  const octets& data () const;
  octets& data ();

  size_type width () const;
  size_type height () const;

  bool empty () const;

  //! Light intensity at (\a x, \a y), \c 0 (black) to \c 255 (white)
  int gray (size_type x, size_type y) const;

  //! Tells whether the pixel at (\a x, \a y) counts as white
  /*! Gray and color pixels are thresholded at the midpoint.
   */
  bool is_white (size_type x, size_type y) const;

  //! Sets a monochrome pixel
  void set (size_type x, size_type y, bool white);

  //! Copies \a src onto a monochrome image with its top-left at (x, y)
  /*! The source is resampled to \a w by \a h pixels, using nearest
   *  neighbours.  Pixels falling outside this image are ignored.
   */
  void blit (const image& src, size_type x, size_type y,
             size_type w, size_type h);

  //! Returns a \c GRAY8 version of this image
  image to_gray () const;

private:
  context ctx_;
  octets  data_;
};

//! Produces a sequence of in-memory images
class image_idevice
  : public idevice
{
public:
  explicit image_idevice (const std::vector< image >& images);

protected:
  bool is_consecutive () const;
  bool obtain_media ();
  bool set_up_image ();
  streamsize sgetn (octet *data, streamsize n);

private:
  const std::vector< image >& images_;
  std::vector< image >::size_type next_;
  streamsize offset_;
};

}       // namespace kami

#endif  /* kami_image_hpp_ */
