//  page-renderer.hpp -- lay out backup units on printable pages
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

#ifndef src_page_renderer_hpp_
#define src_page_renderer_hpp_

#include <string>
#include <vector>

#include "kami/geometry.hpp"
#include "kami/signal.hpp"
#include "kami/strategy.hpp"

namespace kami {

//! Puts the units of an encoded backup on pages and writes them out
/*! Symbols are placed on a grid of \c rows by \c columns cells inside
 *  the page margins, left to right and top to bottom.  Each symbol is
 *  centered in its cell and shrunk when it takes up more than 95% of
 *  the cell.  Symbol images are taken to have been made for a 300 dpi
 *  device.  Full page units are placed at the top-left corner of the
 *  usable area.
 */
class page_renderer
{
public:
  typedef signal< void (streamsize, streamsize) > update_signal_type;

  static const unsigned symbol_dpi = 300;

  explicit page_renderer (const page_geometry& geometry,
                          unsigned rows = 7, unsigned columns = 5);

  //! Monochrome page images for \a units
  std::vector< image > layout (const unit_set& units) const;

  //! Writes the pages for \a units to \a path
  /*! A \a path containing a \c %i pattern results in one PBM file per
   *  page, any other \a path in a PDF document.  The PDF's first page
   *  carries the backup's caption.
   */
  void render (const unit_set& units, const std::string& path) const;

  //! Progress as (units placed, units in total)
  connection connect_update (const update_signal_type::slot_type& slot) const;

private:
  page_geometry geometry_;
  unsigned rows_;
  unsigned columns_;

  mutable update_signal_type signal_update_;

  void place_grid_(const unit_set& units, std::vector< image >& pages) const;
  void place_full_(const unit_set& units, std::vector< image >& pages) const;
};

}       // namespace kami

#endif  /* src_page_renderer_hpp_ */
