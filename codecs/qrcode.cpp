//  qrcode.cpp -- QR Code symbols via libqrencode and zbar
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

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <boost/throw_exception.hpp>

#include <qrencode.h>
#include <zbar.h>

#include "kami/format.hpp"
#include "kami/log.hpp"

#include "qrcode.hpp"

namespace kami {
namespace _cdc_ {

namespace {

QRecLevel
to_level (symbol_codec::tolerance level)
{
  switch (level)
    {
    case symbol_codec::low:      return QR_ECLEVEL_L;
    case symbol_codec::medium:   return QR_ECLEVEL_M;
    case symbol_codec::quartile: return QR_ECLEVEL_Q;
    case symbol_codec::high:     return QR_ECLEVEL_H;
    }
  return QR_ECLEVEL_Q;
}

}       // namespace

qrcode::qrcode (unsigned module_size, unsigned border)
  : module_size_(module_size)
  , border_(border)
{
  if (0 == module_size_)
    BOOST_THROW_EXCEPTION
      (std::invalid_argument ("module size must be at least one pixel"));
}

image
qrcode::render (const std::string& text, tolerance level) const
{
  QRcode *code = QRcode_encodeData
    (text.size (), reinterpret_cast< const unsigned char * > (text.data ()),
     0, to_level (level));

  if (!code)
    {
      int ec = errno;
      BOOST_THROW_EXCEPTION
        (std::runtime_error
         ((format ("cannot encode %1% octets as a QR Code: %2%")
           % text.size ()
           % (ERANGE == ec ? "payload too large" : strerror (ec))).str ()));
    }

  const int modules = code->width;
  const image::size_type side = (modules + 2 * border_) * module_size_;

  image rv (context (side, side, context::MONO));
  for (int my = 0; my < modules; ++my)
    {
      for (int mx = 0; mx < modules; ++mx)
        {
          if (!(code->data[my * modules + mx] & 0x01)) continue;

          const image::size_type x0 = (mx + border_) * module_size_;
          const image::size_type y0 = (my + border_) * module_size_;
          for (unsigned dy = 0; dy < module_size_; ++dy)
            for (unsigned dx = 0; dx < module_size_; ++dx)
              rv.set (x0 + dx, y0 + dy, false);
        }
    }
  log::debug ("QR Code version %1%: %2% modules for %3% octets")
    % code->version % modules % text.size ();

  QRcode_free (code);
  return rv;
}

std::vector< std::string >
qrcode::scan (const image& page) const
{
  image gray (page.to_gray ());

  zbar::ImageScanner scanner;
  scanner.set_config (zbar::ZBAR_NONE, zbar::ZBAR_CFG_ENABLE, 0);
  scanner.set_config (zbar::ZBAR_QRCODE, zbar::ZBAR_CFG_ENABLE, 1);

  zbar::Image img (gray.width (), gray.height (), "Y800",
                   gray.data ().data (), gray.data ().size ());

  int n = scanner.scan (img);
  if (0 > n)
    BOOST_THROW_EXCEPTION
      (std::runtime_error ("zbar failed to scan the page"));

  std::vector< std::string > rv;
  for (zbar::Image::SymbolIterator it = img.symbol_begin ();
       img.symbol_end () != it; ++it)
    {
      rv.push_back (it->get_data ());
    }
  img.set_data (NULL, 0);

  return rv;
}

}       // namespace _cdc_
}       // namespace kami
