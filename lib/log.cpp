//  log.cpp -- prioritised, formatted log messages
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
#include <iostream>

#include "kami/log.hpp"

namespace kami {

log::priority log::threshold = log::ERROR;
std::ostream *log::os_ = &std::clog;

namespace {

const char *names[] = {
  "fatal", "alert", "error", "brief", "trace", "debug",
};

const int name_count = sizeof (names) / sizeof (*names);

}       // namespace

std::istream&
operator>> (std::istream& is, log::priority& level)
{
  std::string token;
  is >> token;
  std::transform (token.begin (), token.end (), token.begin (),
                  ::tolower);

  for (int i = 0; i < name_count; ++i)
    {
      if (token == names[i]
          || (1 == token.size () && '0' + i == token[0]))
        {
          level = log::priority (i);
          return is;
        }
    }
  is.setstate (std::ios_base::failbit);
  return is;
}

std::ostream&
operator<< (std::ostream& os, const log::priority& level)
{
  if (0 <= level && level < name_count)
    return os << names[level];

  return os << int (level);
}

}       // namespace kami
