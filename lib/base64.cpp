//  base64.cpp -- base64 transfer encoding
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

#include <cstring>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/throw_exception.hpp>

#include "kami/base64.hpp"
#include "kami/exception.hpp"

namespace kami {

namespace it = boost::archive::iterators;

namespace {

const char alphabet[] =
  "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

}       // namespace

std::string
base64_encode (const octets& data)
{
  typedef it::base64_from_binary
    < it::transform_width< octets::const_iterator, 6, 8 > > encoder;

  std::string rv (encoder (data.begin ()), encoder (data.end ()));
  rv.append ((3 - data.size () % 3) % 3, '=');
  return rv;
}

octets
base64_decode (const std::string& text)
{
  if (0 != text.size () % 4)
    BOOST_THROW_EXCEPTION
      (corruption_error ("base64 text length is not a multiple of 4"));

  std::string::size_type pad = 0;
  while (pad < 2 && pad < text.size ()
         && '=' == text[text.size () - 1 - pad])
    ++pad;

  for (std::string::size_type i = 0; i < text.size () - pad; ++i)
    {
      if ('\0' == text[i] || !strchr (alphabet, text[i]))
        BOOST_THROW_EXCEPTION
          (corruption_error ("invalid character in base64 text"));
    }

  typedef it::transform_width
    < it::binary_from_base64< std::string::const_iterator >, 8, 6 > decoder;

  std::string tmp (text);
  tmp.replace (tmp.size () - pad, pad, pad, 'A');

  octets rv (decoder (tmp.begin ()), decoder (tmp.end ()));
  rv.erase (rv.size () - pad);
  return rv;
}

}       // namespace kami
