//  raster-strategy.hpp -- backups as page filling bit rasters
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

#ifndef kami_raster_strategy_hpp_
#define kami_raster_strategy_hpp_

#include <string>
#include <vector>

#include "geometry.hpp"
#include "strategy.hpp"

namespace kami {

//! Writes one payload bit per pixel over the usable area of pages
/*! The payload consists of a header followed by the compressed file.
 *
 *  \code
 *  STPRv1-BITS|<sha256hex>|<size>|<compressed octets>
 *  \endcode
 *
 *  Bits are taken most significant first and placed in row-major
 *  order, page after page.  A one bit is a white pixel, a zero bit a
 *  black one.  The last page is padded with white.  There is no error
 *  correction and no page numbering so pages must be decoded in the
 *  order they were printed.  The file name is not recorded.
 */
class raster_strategy
  : public strategy
{
public:
  static const std::string marker;

  explicit raster_strategy (const page_geometry& geometry);

  //! Header and compressed data for \a data
  octets payload (const octets& data) const;

  //! Spreads \a payload over as many pages as needed, at least one
  /*! Each image covers a page's usable area.
   */
  std::vector< image > pack (const octets& payload) const;

  //! Collects the bits from \a pages in page order
  /*! Images the size of the usable area are read directly.  Any other
   *  image is taken to show a full page, scanned at an arbitrary
   *  resolution, and is sampled at the positions of the usable area.
   *  A trailing partial octet is dropped.  Progress is reported once
   *  per page.
   */
  octets unpack (const std::vector< image >& pages) const;

  //! Locates the header in \a stream and recovers the file
  /*! Anything ahead of the header is skipped.
   *
   *  \throw header_not_found, corruption_error
   */
  restoration restore (const octets& stream) const;

  unit_set encode (const octets& data, const std::string& name);
  restoration decode (const std::vector< image >& pages);

private:
  page_geometry geometry_;
};

}       // namespace kami

#endif  /* kami_raster_strategy_hpp_ */
