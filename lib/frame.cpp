//  frame.cpp -- self-describing symbol payloads
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

#include <boost/lexical_cast.hpp>

#include "kami/digest.hpp"
#include "kami/frame.hpp"
#include "kami/log.hpp"

namespace kami {

const std::string frame::meta_marker ("STPRv1-META");
const std::string frame::part_marker ("STPRv1-PART");
const char frame::separator;

namespace {

template< typename T >
bool
to_number_(const std::string& s, T& value)
{
  if (s.empty () || std::string::npos != s.find_first_not_of ("0123456789"))
    return false;

  try
    {
      value = boost::lexical_cast< T > (s);
    }
  catch (const boost::bad_lexical_cast&)
    {
      return false;
    }
  return true;
}

//! Splits off the right-most field of \a rest
bool
pop_field_(std::string& rest, std::string& field)
{
  std::string::size_type pos = rest.rfind (frame::separator);
  if (std::string::npos == pos) return false;

  field = rest.substr (pos + 1);
  rest.erase (pos);
  return true;
}

}       // namespace

frame::frame ()
  : kind (META), total (0), index (0), size (0)
{}

frame
frame::metadata (const descriptor& info, unsigned total)
{
  frame f;
  f.kind   = META;
  f.name   = info.name;
  f.total  = total;
  f.size   = info.size;
  f.digest = info.digest;
  return f;
}

frame
frame::part (const std::string& name, unsigned total,
             unsigned index, const std::string& chunk)
{
  frame f;
  f.kind  = PART;
  f.name  = name;
  f.total = total;
  f.index = index;
  f.chunk = chunk;
  return f;
}

descriptor
frame::info () const
{
  return descriptor (name, size, digest);
}

std::string
frame::str () const
{
  std::string rv (META == kind ? meta_marker : part_marker);
  rv += separator + name;
  rv += separator + boost::lexical_cast< std::string > (total);
  if (META == kind)
    {
      rv += separator + boost::lexical_cast< std::string > (size);
      rv += separator + digest;
    }
  else
    {
      rv += separator + boost::lexical_cast< std::string > (index);
      rv += separator + chunk;
    }
  return rv;
}

boost::optional< frame >
frame::parse (const std::string& text)
{
  frame f;

  /**/ if (0 == text.compare (0, meta_marker.size () + 1,
                             meta_marker + separator))
    f.kind = META;
  else if (0 == text.compare (0, part_marker.size () + 1,
                             part_marker + separator))
    f.kind = PART;
  else
    {
      log::debug ("dropping payload without frame marker");
      return boost::none;
    }

  std::string rest (text.substr (meta_marker.size () + 1));
  std::string last, third, second;

  if (!(   pop_field_(rest, last)
        && pop_field_(rest, third)
        && pop_field_(rest, second)))
    {
      log::debug ("dropping frame with too few fields");
      return boost::none;
    }
  f.name = rest;

  if (!to_number_(second, f.total) || 0 == f.total)
    {
      log::debug ("dropping frame with bad unit count: %1%") % second;
      return boost::none;
    }

  if (META == f.kind)
    {
      if (!to_number_(third, f.size) || !is_hex_digest (last))
        {
          log::debug ("dropping malformed metadata frame");
          return boost::none;
        }
      f.digest = last;
      std::transform (f.digest.begin (), f.digest.end (),
                      f.digest.begin (), ::tolower);
    }
  else
    {
      if (!to_number_(third, f.index)
          || 0 == f.index || f.total <= f.index)
        {
          log::debug ("dropping part with bad index: %1%") % third;
          return boost::none;
        }
      f.chunk = last;
    }

  return f;
}

}       // namespace kami
