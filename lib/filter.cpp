//  filter.cpp -- interface for page stream filters
//  Copyright (C) 2012  SEIKO EPSON CORPORATION
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

#include "kami/filter.hpp"

namespace kami {

filter::filter ()
  : last_marker_(traits::eos ())
{}

void
filter::mark (traits::int_type c, const context& ctx)
{
  if (!output_)
    BOOST_THROW_EXCEPTION
      (std::logic_error ("filter has no output to mark"));

  if (!traits::is_marker (c)) return;

  output::mark (c, ctx);
  output_->mark (c, ctx_);
  last_marker_ = c;
}

void
filter::open (output::ptr output)
{
  output_ = output;
}

}       // namespace kami
