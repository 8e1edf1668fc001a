//  page-renderer.cpp -- lay out backup units on printable pages
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
#include <ios>
#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "kami/file.hpp"
#include "kami/log.hpp"
#include "kami/stream.hpp"

#include "../filters/pdf.hpp"
#include "../filters/pnm.hpp"

#include "page-renderer.hpp"

namespace kami {

namespace {

const double cell_fill = 0.95;

// net downward shift of grid content, making room for the caption
const double content_shift_mm = 2.0;

}       // namespace

page_renderer::page_renderer (const page_geometry& geometry,
                              unsigned rows, unsigned columns)
  : geometry_(geometry)
  , rows_(rows)
  , columns_(columns)
{
  if (0 == rows_ || 0 == columns_)
    BOOST_THROW_EXCEPTION
      (std::invalid_argument ("grid needs at least one row and column"));
}

connection
page_renderer::connect_update (const update_signal_type::slot_type& slot) const
{
  return signal_update_.connect (slot);
}

std::vector< image >
page_renderer::layout (const unit_set& units) const
{
  std::vector< image > pages;

  if (unit_set::grid == units.layout)
    place_grid_(units, pages);
  else
    place_full_(units, pages);

  log::brief ("%1% unit(s) on %2% page(s)")
    % units.units.size () % pages.size ();
  return pages;
}

void
page_renderer::render (const unit_set& units, const std::string& path) const
{
  std::vector< image > pages (layout (units));

  stream str;
  if (path_generator::is_pattern (path))
    {
      str.push (make_shared< _flt_::pnm > ());
      str.push (make_shared< file_odevice > (path_generator (path)));
    }
  else
    {
      shared_ptr< _flt_::pdf > pdf (make_shared< _flt_::pdf > ());
      pdf->caption (units.caption (),
                    geometry_.to_points (geometry_.margin ()),
                    geometry_.to_points (geometry_.margin ()));
      str.push (pdf);
      str.push (make_shared< file_odevice > (path));
    }

  image_idevice dev (pages);
  if (traits::eos () != (dev | str))
    BOOST_THROW_EXCEPTION
      (std::ios_base::failure (path + ": page output was aborted"));

  log::brief ("wrote %1% page(s) to %2%") % pages.size () % path;
}

void
page_renderer::place_grid_(const unit_set& units,
                           std::vector< image >& pages) const
{
  const double cell_w = double (geometry_.usable_width ()) / columns_;
  const double cell_h = double (geometry_.usable_height ()) / rows_;
  const double shift  = geometry_.to_pixels (content_shift_mm);
  const double ratio  = double (geometry_.dpi ()) / symbol_dpi;
  const std::vector< image >::size_type per_page = rows_ * columns_;
  const std::vector< image >::size_type total = units.units.size ();

  for (std::vector< image >::size_type i = 0; i < total; ++i)
    {
      if (0 == i % per_page)
        pages.push_back (image (geometry_.page_context ()));

      const image& unit = units.units[i];
      const unsigned cell = i % per_page;
      const unsigned row  = cell / columns_;
      const unsigned col  = cell % columns_;

      double w = unit.width () * ratio;
      double h = unit.height () * ratio;
      const double scale = std::min (std::min (cell_fill * cell_w / w,
                                               cell_fill * cell_h / h),
                                     1.0);
      w *= scale;
      h *= scale;

      const double x = geometry_.margin () + col * cell_w + (cell_w - w) / 2;
      const double y = (geometry_.margin () + row * cell_h
                        + (cell_h - h) / 2 + shift);

      pages.back ().blit (unit, image::size_type (x), image::size_type (y),
                          image::size_type (w), image::size_type (h));
      signal_update_(i + 1, total);
    }
}

void
page_renderer::place_full_(const unit_set& units,
                           std::vector< image >& pages) const
{
  const std::vector< image >::size_type total = units.units.size ();

  for (std::vector< image >::size_type i = 0; i < total; ++i)
    {
      const image& unit = units.units[i];

      pages.push_back (image (geometry_.page_context ()));
      pages.back ().blit (unit, geometry_.margin (), geometry_.margin (),
                          unit.width (), unit.height ());
      signal_update_(i + 1, total);
    }
}

}       // namespace kami
