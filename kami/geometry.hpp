//  geometry.hpp -- printed page geometry
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

#ifndef kami_geometry_hpp_
#define kami_geometry_hpp_

#include <string>

#include "context.hpp"

namespace kami {

//! Page size, resolution and margins, all in device pixels
/*! The usable area is what remains after removing the margin from
 *  all four sides of the page.
 */
class page_geometry
{
public:
  typedef context::size_type size_type;

  //! Creates a geometry for a paper size given in millimetres
  page_geometry (double width_mm, double height_mm,
                 unsigned dpi = 300, double margin_mm = 8);

  static page_geometry a4 (unsigned dpi = 300, double margin_mm = 8);
  static page_geometry letter (unsigned dpi = 300, double margin_mm = 8);

  //! Creates a geometry by paper name, \c a4 or \c letter
  static page_geometry paper (const std::string& name,
                              unsigned dpi = 300, double margin_mm = 8);

  //! Creates a geometry directly from pixel dimensions
  static page_geometry pixels (size_type width, size_type height,
                               size_type margin, unsigned dpi = 300);

  size_type width () const { return width_; }
  size_type height () const { return height_; }
  size_type margin () const { return margin_; }
  unsigned  dpi () const { return dpi_; }

  size_type usable_width () const;
  size_type usable_height () const;

  //! Number of bits a single page can carry
  size_type capacity () const;

  //! Converts \a px device pixels to PDF points
  double to_points (double px) const;

  //! Converts \a mm millimetres to device pixels
  size_type to_pixels (double mm) const;

  //! Context for a full page monochrome image
  context page_context () const;

  //! Context for a monochrome image covering the usable area
  context usable_context () const;

private:
  page_geometry ();

  size_type width_;
  size_type height_;
  size_type margin_;
  unsigned  dpi_;

  void check_() const;
};

}       // namespace kami

#endif  /* kami_geometry_hpp_ */
