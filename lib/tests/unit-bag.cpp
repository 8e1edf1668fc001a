//  unit-bag.cpp -- unit tests for frame collection
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

#include <functional>

#include <boost/test/unit_test.hpp>

#include "kami/digest.hpp"
#include "kami/thread.hpp"
#include "kami/unit-bag.hpp"

using namespace kami;

namespace {

frame
meta (unsigned total)
{
  return frame::metadata (descriptor ("f", 6, sha256::hex ("foobar")), total);
}

}       // namespace

BOOST_AUTO_TEST_CASE (without_metadata)
{
  unit_bag bag;
  bag.insert (frame::part ("f", 3, 1, "Zm9v"));

  BOOST_CHECK (!bag.metadata ());
  BOOST_CHECK_EQUAL (1, bag.size ());
  BOOST_CHECK_THROW (bag.missing (), metadata_absent);
  BOOST_CHECK_THROW (bag.assemble (), metadata_absent);
}

BOOST_AUTO_TEST_CASE (assembles_in_index_order)
{
  unit_bag bag;
  bag.insert (frame::part ("f", 4, 3, "C"));
  bag.insert (frame::part ("f", 4, 1, "A"));
  bag.insert (meta (4));
  bag.insert (frame::part ("f", 4, 2, "B"));

  BOOST_CHECK (bag.missing ().empty ());
  BOOST_CHECK_EQUAL ("ABC", bag.assemble ());
}

BOOST_AUTO_TEST_CASE (duplicates_replace)
{
  unit_bag bag;
  bag.insert (meta (3));
  bag.insert (frame::part ("f", 3, 1, "old"));
  bag.insert (frame::part ("f", 3, 2, "two"));
  bag.insert (frame::part ("f", 3, 1, "new"));

  BOOST_CHECK_EQUAL (2, bag.size ());
  BOOST_CHECK_EQUAL ("newtwo", bag.assemble ());
}

BOOST_AUTO_TEST_CASE (reports_missing_indices)
{
  unit_bag bag;
  bag.insert (meta (6));
  bag.insert (frame::part ("f", 6, 2, "x"));
  bag.insert (frame::part ("f", 6, 4, "y"));

  incomplete_backup::index_set expected;
  expected.insert (1);
  expected.insert (3);
  expected.insert (5);

  unit_bag::index_set gaps (bag.missing ());
  BOOST_CHECK_EQUAL_COLLECTIONS (gaps.begin (), gaps.end (),
                                 expected.begin (), expected.end ());

  try
    {
      bag.assemble ();
      BOOST_ERROR ("incomplete_backup not thrown");
    }
  catch (const incomplete_backup& e)
    {
      BOOST_CHECK_EQUAL_COLLECTIONS (e.missing ().begin (),
                                     e.missing ().end (),
                                     expected.begin (), expected.end ());
    }
}

BOOST_AUTO_TEST_CASE (metadata_only)
{
  unit_bag bag;
  bag.insert (meta (1));

  BOOST_CHECK (bag.missing ().empty ());
  BOOST_CHECK_EQUAL ("", bag.assemble ());
}

BOOST_AUTO_TEST_CASE (last_metadata_wins)
{
  unit_bag bag;
  bag.insert (meta (3));
  bag.insert (meta (2));

  BOOST_REQUIRE (bag.metadata ());
  BOOST_CHECK_EQUAL (2, bag.metadata ()->total);
}

namespace {

void
fill (unit_bag& bag, unsigned first, unsigned step, unsigned total)
{
  for (unsigned i = first; i < total; i += step)
    bag.insert (frame::part ("f", total, i, "."));
}

}       // namespace

BOOST_AUTO_TEST_CASE (concurrent_insertion)
{
  const unsigned total = 2001;
  unit_bag bag;

  thread t1 (fill, std::ref (bag), 1, 3, total);
  thread t2 (fill, std::ref (bag), 2, 3, total);
  thread t3 (fill, std::ref (bag), 3, 3, total);
  bag.insert (meta (total));
  t1.join ();
  t2.join ();
  t3.join ();

  BOOST_CHECK_EQUAL (total - 1, bag.size ());
  BOOST_CHECK_EQUAL (std::string (total - 1, '.'), bag.assemble ());
}

#include "kami/test/runner.ipp"
