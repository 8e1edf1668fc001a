//  symbol-codec.hpp -- text payload to symbol image conversion
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

#ifndef kami_symbol_codec_hpp_
#define kami_symbol_codec_hpp_

#include <iosfwd>
#include <string>
#include <vector>

#include "image.hpp"
#include "memory.hpp"

namespace kami {

//! Converts between text payloads and machine readable symbols
class symbol_codec
{
public:
  typedef shared_ptr< symbol_codec > ptr;

  //! How much damage a symbol should survive
  enum tolerance {
    low,                        //!< about 7% of the symbol
    medium,                     //!< about 15%
    quartile,                   //!< about 25%
    high,                       //!< about 30%
  };

  virtual ~symbol_codec ();

  //! Renders \a text as a single symbol image
  virtual image render (const std::string& text, tolerance level) const = 0;

  //! Returns the payloads of all symbols found on a \a page
  /*! The order of the payloads is unspecified.  Pages without any
   *  readable symbols yield an empty list.
   */
  virtual std::vector< std::string > scan (const image& page) const = 0;
};

//! Reads a tolerance given as \c L, \c M, \c Q, \c H or by name
std::istream& operator>> (std::istream& is, symbol_codec::tolerance& level);
std::ostream& operator<< (std::ostream& os,
                          const symbol_codec::tolerance& level);

}       // namespace kami

#endif  /* kami_symbol_codec_hpp_ */
