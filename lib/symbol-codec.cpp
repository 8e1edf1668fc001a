//  symbol-codec.cpp -- text payload to symbol image conversion
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

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

#include "kami/symbol-codec.hpp"

namespace kami {

symbol_codec::~symbol_codec ()
{}

namespace {

const char *names[] = { "low", "medium", "quartile", "high" };
const char  codes[] = "LMQH";

}       // namespace

std::istream&
operator>> (std::istream& is, symbol_codec::tolerance& level)
{
  std::string token;
  is >> token;
  std::transform (token.begin (), token.end (), token.begin (), ::tolower);

  for (int i = 0; i < 4; ++i)
    {
      if (token == names[i]
          || (1 == token.size () && tolower (codes[i]) == token[0]))
        {
          level = symbol_codec::tolerance (i);
          return is;
        }
    }
  is.setstate (std::ios_base::failbit);
  return is;
}

std::ostream&
operator<< (std::ostream& os, const symbol_codec::tolerance& level)
{
  return os << codes[level];
}

}       // namespace kami
