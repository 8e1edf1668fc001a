//  qrcode.hpp -- QR Code symbols via libqrencode and zbar
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

#ifndef codecs_qrcode_hpp_
#define codecs_qrcode_hpp_

#include "kami/symbol-codec.hpp"

namespace kami {
namespace _cdc_ {

//! QR Code symbols
/*! Symbols are encoded in 8-bit byte mode with the smallest version
 *  that fits the payload.  Rendering uses libqrencode, scanning the
 *  zbar library.
 */
class qrcode
  : public symbol_codec
{
public:
  //! Sets up rendering with \a module_size pixels per module and a
  //! quiet zone of \a border modules
  explicit qrcode (unsigned module_size = 4, unsigned border = 1);

  image render (const std::string& text, tolerance level) const;
  std::vector< std::string > scan (const image& page) const;

private:
  unsigned module_size_;
  unsigned border_;
};

}       // namespace _cdc_
}       // namespace kami

#endif  /* codecs_qrcode_hpp_ */
