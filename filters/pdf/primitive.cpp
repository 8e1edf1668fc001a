//  primitive.cpp -- PDF names, numbers and strings
//  Copyright (C) 2012, 2015  SEIKO EPSON CORPORATION
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

#include "primitive.hpp"

namespace kami {
namespace _flt_ {
namespace _pdf_ {

primitive::primitive ()
{}

primitive::primitive (const char *s)
  : str_(s)
{}

primitive::primitive (const std::string& s)
  : str_(s)
{}

primitive
primitive::text (const std::string& s)
{
  std::string rv ("(");
  for (std::string::const_iterator it = s.begin (); s.end () != it; ++it)
    {
      if ('(' == *it || ')' == *it || '\\' == *it)
        rv += '\\';
      rv += *it;
    }
  rv += ')';
  return primitive (rv);
}

const std::string&
primitive::str () const
{
  return str_;
}

void
primitive::operator>> (std::ostream& os) const
{
  os << str_;
}

bool
primitive::operator== (const primitive& that) const
{
  return str_ == that.str_;
}

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace kami
