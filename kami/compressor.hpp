//  compressor.hpp -- deflate compression of backup payloads
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

#ifndef kami_compressor_hpp_
#define kami_compressor_hpp_

#include "octet.hpp"

namespace kami {

//! Deflate based compression in the zlib container format
/*! Output is deterministic for a given level.  The default level asks
 *  for the best compression zlib can achieve.
 */
class compressor
{
public:
  explicit compressor (int level = 9);

  octets compress (const octets& data) const;

  //! Inflates a zlib stream
  /*! Octets following the end of the compressed stream are ignored.
   *  A mismatching zlib checksum is only logged.  Whatever could be
   *  inflated is returned so that the caller's digest check can report
   *  the damage.
   *
   *  \throw corruption_error if \a data is not a zlib stream or ends
   *         before the end of the stream
   */
  octets decompress (const octets& data) const;

private:
  int level_;
};

}       // namespace kami

#endif  /* kami_compressor_hpp_ */
