//  octet.cpp -- unit tests for octet and marker traits
//  Copyright (C) 2012  SEIKO EPSON CORPORATION
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

#include <set>

#include <boost/test/unit_test.hpp>

#include "kami/octet.hpp"

using kami::octets;
using kami::traits;

namespace {

std::set< traits::int_type >
markers ()
{
  std::set< traits::int_type > rv;
  rv.insert (traits::bos ());
  rv.insert (traits::boi ());
  rv.insert (traits::eoi ());
  rv.insert (traits::eos ());
  rv.insert (traits::eof ());
  return rv;
}

}       // namespace

BOOST_AUTO_TEST_CASE (distinct_markers)
{
  BOOST_CHECK_EQUAL (5, markers ().size ());
}

BOOST_AUTO_TEST_CASE (markers_outside_octet_range)
{
  std::set< traits::int_type > m (markers ());

  for (std::set< traits::int_type >::const_iterator it = m.begin ();
       m.end () != it; ++it)
    {
      BOOST_CHECK (traits::is_marker (*it));
      BOOST_CHECK (*it < 0 || 255 < *it);
    }
  BOOST_CHECK (!traits::is_marker (traits::bos () - 1));
}

BOOST_AUTO_TEST_CASE (octets_are_not_markers)
{
  for (int i = -128; i < 256; ++i)
    BOOST_CHECK (!traits::is_marker (traits::to_int_type (char (i))));
}

BOOST_AUTO_TEST_CASE (unsigned_conversion)
{
  const octets data ("\x00\x7f\x80\xff", 4);

  BOOST_CHECK_EQUAL (  0, traits::to_int_type (data[0]));
  BOOST_CHECK_EQUAL (127, traits::to_int_type (data[1]));
  BOOST_CHECK_EQUAL (128, traits::to_int_type (data[2]));
  BOOST_CHECK_EQUAL (255, traits::to_int_type (data[3]));
}

#include "kami/test/runner.ipp"
