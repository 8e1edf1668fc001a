//  filter.hpp -- interface for page stream filters
//  Copyright (C) 2012, 2013  SEIKO EPSON CORPORATION
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

#ifndef kami_filter_hpp_
#define kami_filter_hpp_

#include "iobase.hpp"
#include "memory.hpp"

namespace kami {

//! Transforms a page stream on its way to another %output
/*! Subclasses implement write() and whichever marker hooks they need.
 *  The default mark() runs the hooks and then passes the marker on,
 *  together with the filter's own context, to the underlying %output.
 */
class filter
  : public output
{
public:
  typedef shared_ptr< filter > ptr;

  void mark (traits::int_type c, const context& ctx);

  //! Sets a filter's underlying output object
  virtual void open (output::ptr output);

protected:
  filter ();

  output::ptr output_;
  traits::int_type last_marker_;  //!< most recently passed on
};

}       // namespace kami

#endif  /* kami_filter_hpp_ */
