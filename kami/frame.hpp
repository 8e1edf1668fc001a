//  frame.hpp -- self-describing symbol payloads
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

#ifndef kami_frame_hpp_
#define kami_frame_hpp_

#include <string>

#include <boost/optional.hpp>

#include "descriptor.hpp"

namespace kami {

//! Text payload carried by a single symbol
/*! Two kinds of frame exist, with byte exact text forms
 *
 *  \code
 *  STPRv1-META|<name>|<total>|<size>|<sha256hex>
 *  STPRv1-PART|<name>|<total>|<index>|<base64 chunk>
 *  \endcode
 *
 *  The metadata frame is logically unit zero.  Parts are numbered
 *  from one up to and including \c total-1.  Fields are located from
 *  the right so file names may contain the separator.
 */
struct frame
{
  enum kind_type {
    META,
    PART,
  };

  static const std::string meta_marker;
  static const std::string part_marker;
  static const char separator = '|';

  kind_type   kind;
  std::string name;
  unsigned    total;
  unsigned    index;
  descriptor::size_type size;   //!< META only
  std::string digest;           //!< META only
  std::string chunk;            //!< PART only

  frame ();

  static frame metadata (const descriptor& info, unsigned total);
  static frame part (const std::string& name, unsigned total,
                     unsigned index, const std::string& chunk);

  descriptor info () const;

  std::string str () const;

  //! Recovers a frame from its text form
  /*! Text that is not a well-formed frame yields an empty optional.
   */
  static boost::optional< frame > parse (const std::string& text);
};

}       // namespace kami

#endif  /* kami_frame_hpp_ */
