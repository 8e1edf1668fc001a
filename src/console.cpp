//  console.cpp -- terminal feedback for the command-line utility
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

#include <ostream>

#include "kami/format.hpp"

#include "console.hpp"

namespace kami {

namespace {

const int bar_length = 40;

const char *green  = "\033[92m";
const char *yellow = "\033[93m";
const char *red    = "\033[91m";
const char *reset  = "\033[0m";

}       // namespace

console::console (std::ostream& os, bool quiet, bool color)
  : os_(os)
  , quiet_(quiet)
  , color_(color)
{}

void
console::status (status_type type, const std::string& message)
{
  if (quiet_) return;

  if (color_)
    os_ << (done == type ? green : failed == type ? red : yellow)
        << message << reset << "\n";
  else
    os_ << message << "\n";
  os_.flush ();
}

void
console::progress (streamsize done, streamsize total)
{
  if (quiet_ || 0 >= total) return;

  if (color_) os_ << yellow;
  os_ << bar (done, total);
  if (color_) os_ << reset;
  os_ << (done < total ? "\r" : "\n");
  os_.flush ();
}

std::string
console::bar (streamsize done, streamsize total)
{
  if (0 >= total) return std::string ();

  const int filled = bar_length * done / total;
  return (format ("[%1%/%2%] [%3%%4%] %5$.2f%%")
          % done % total
          % std::string (filled, '=')
          % std::string (bar_length - filled, '-')
          % (100.0 * done / total)).str ();
}

}       // namespace kami
