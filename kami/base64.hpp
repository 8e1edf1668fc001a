//  base64.hpp -- base64 transfer encoding
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

#ifndef kami_base64_hpp_
#define kami_base64_hpp_

#include <string>

#include "octet.hpp"

namespace kami {

//! Standard alphabet base64 text for \a data, \c = padded
std::string base64_encode (const octets& data);

//! Decodes \a text produced by base64_encode()
/*! \throw corruption_error when \a text is not well-formed
 */
octets base64_decode (const std::string& text);

}       // namespace kami

#endif  /* kami_base64_hpp_ */
