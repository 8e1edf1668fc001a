//  octet.hpp -- octet and page stream marker definitions
//  Copyright (C) 2012, 2013, 2015  SEIKO EPSON CORPORATION
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

#ifndef kami_octet_hpp_
#define kami_octet_hpp_

#include <ios>
#include <string>

namespace kami {

//! A set of eight bits with no particular interpretation attached
/*! Backup payloads, compressed streams and image data are all handled
 *  as sequences of octets.  Plain \c char is used so that octet data
 *  can be moved in and out of \c std::string without conversion.
 */
typedef char octet;

//! A sequence of octets, the currency of the codec
typedef std::basic_string< octet > octets;

//! Signed integral type that can be used to count octets
using std::streamsize;

//! Octet traits with the markers that delimit a page stream
/*! A page stream is framed as
 *
 *  \code
 *  bos (boi <image octets> eoi)* eos
 *  \endcode
 *
 *  and a producer that cannot deliver all of its images ends the
 *  stream with eof() instead.  All markers sit just below the
 *  standard eof() value, outside the range of to_int_type().
 */
struct traits
  : std::char_traits< octet >
{
  //! Maps \a c onto the range [0,255]
  static int_type to_int_type (const char_type& c);

  //! Aborted page stream
  static int_type eof ();
  //! End of page stream
  static int_type eos ();
  //! End of image
  static int_type eoi ();
  //! Begin of image
  static int_type boi ();
  //! Begin of page stream
  static int_type bos ();

  static bool is_marker (const int_type& i);
};

}       // namespace kami

#endif  /* kami_octet_hpp_ */
