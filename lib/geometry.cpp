//  geometry.cpp -- printed page geometry
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

#include <cmath>
#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "kami/format.hpp"
#include "kami/geometry.hpp"

namespace kami {

using std::invalid_argument;

namespace {

const double mm_per_inch = 25.4;
const double pt_per_inch = 72.0;

}       // namespace

page_geometry::page_geometry ()
  : width_(0), height_(0), margin_(0), dpi_(0)
{}

page_geometry::page_geometry (double width_mm, double height_mm,
                              unsigned dpi, double margin_mm)
  : dpi_(dpi)
{
  if (0 == dpi)
    BOOST_THROW_EXCEPTION (invalid_argument ("resolution must be positive"));
  if (0 > margin_mm)
    BOOST_THROW_EXCEPTION (invalid_argument ("margin must not be negative"));

  width_  = to_pixels (width_mm);
  height_ = to_pixels (height_mm);
  margin_ = to_pixels (margin_mm);
  check_();
}

page_geometry
page_geometry::a4 (unsigned dpi, double margin_mm)
{
  return page_geometry (210.0, 297.0, dpi, margin_mm);
}

page_geometry
page_geometry::letter (unsigned dpi, double margin_mm)
{
  return page_geometry (215.9, 279.4, dpi, margin_mm);
}

page_geometry
page_geometry::paper (const std::string& name,
                      unsigned dpi, double margin_mm)
{
  /**/ if ("a4" == name || "A4" == name)
    return a4 (dpi, margin_mm);
  else if ("letter" == name)
    return letter (dpi, margin_mm);

  BOOST_THROW_EXCEPTION
    (invalid_argument ((format ("unknown paper size: %1%")
                        % name).str ()));
}

page_geometry
page_geometry::pixels (size_type width, size_type height,
                       size_type margin, unsigned dpi)
{
  if (0 == dpi)
    BOOST_THROW_EXCEPTION (invalid_argument ("resolution must be positive"));

  page_geometry rv;
  rv.width_  = width;
  rv.height_ = height;
  rv.margin_ = margin;
  rv.dpi_    = dpi;
  rv.check_();
  return rv;
}

page_geometry::size_type
page_geometry::usable_width () const
{
  return width_ - 2 * margin_;
}

page_geometry::size_type
page_geometry::usable_height () const
{
  return height_ - 2 * margin_;
}

page_geometry::size_type
page_geometry::capacity () const
{
  return usable_width () * usable_height ();
}

double
page_geometry::to_points (double px) const
{
  return px * pt_per_inch / dpi_;
}

page_geometry::size_type
page_geometry::to_pixels (double mm) const
{
  return size_type (std::floor (mm * dpi_ / mm_per_inch + 0.5));
}

context
page_geometry::page_context () const
{
  context ctx (width_, height_, context::MONO);
  ctx.resolution (dpi_);
  return ctx;
}

context
page_geometry::usable_context () const
{
  context ctx (usable_width (), usable_height (), context::MONO);
  ctx.resolution (dpi_);
  return ctx;
}

void
page_geometry::check_() const
{
  if (0 > margin_ || 0 >= usable_width () || 0 >= usable_height ())
    BOOST_THROW_EXCEPTION
      (invalid_argument ((format ("margin of %1% pixels leaves no room "
                                  "on a %2%x%3% page")
                          % margin_ % width_ % height_).str ()));
}

}       // namespace kami
