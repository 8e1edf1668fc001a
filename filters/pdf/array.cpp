//  array.cpp -- PDF array objects
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

#include "array.hpp"

namespace kami {
namespace _flt_ {
namespace _pdf_ {

void
array::insert (object::ptr obj)
{
  store_.push_back (obj);
}

void
array::insert (const primitive& obj)
{
  insert (make_shared< primitive > (obj));
}

void
array::insert (const object& obj)
{
  insert (make_shared< object > (obj));
}

std::size_t
array::size () const
{
  return store_.size ();
}

const object&
array::operator[] (std::size_t index) const
{
  return *store_.at (index);
}

void
array::operator>> (std::ostream& os) const
{
  // long arrays get one element per line
  const char *sep = (4 < store_.size () ? "\n" : " ");

  os << "[";
  std::vector< object::ptr >::const_iterator it;
  for (it = store_.begin (); store_.end () != it; ++it)
    {
      os << sep << **it;
    }
  os << sep << "]";
}

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace kami
