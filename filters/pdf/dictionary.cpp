//  dictionary.cpp -- PDF dictionary objects
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

#include "dictionary.hpp"

namespace kami {
namespace _flt_ {
namespace _pdf_ {

void
dictionary::insert (const std::string& key, object::ptr value)
{
  store_[key] = value;
}

void
dictionary::insert (const std::string& key, const primitive& value)
{
  insert (key, make_shared< primitive > (value));
}

void
dictionary::insert (const std::string& key, const object& value)
{
  insert (key, make_shared< object > (value));
}

std::size_t
dictionary::size () const
{
  return store_.size ();
}

object::ptr
dictionary::operator[] (const std::string& key) const
{
  std::map< std::string, object::ptr >::const_iterator it
    = store_.find (key);

  return (store_.end () != it ? it->second : object::ptr ());
}

void
dictionary::operator>> (std::ostream& os) const
{
  const char *sep = (1 < store_.size () ? "\n" : " ");

  os << "<<";
  std::map< std::string, object::ptr >::const_iterator it;
  for (it = store_.begin (); store_.end () != it; ++it)
    {
      os << sep << "/" << it->first << " " << *it->second;
    }
  os << sep << ">>";
}

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace kami
