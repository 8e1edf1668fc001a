//  symbol-strategy.cpp -- unit tests for symbol based backups
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
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>

#include "kami/base64.hpp"
#include "kami/compressor.hpp"
#include "kami/digest.hpp"
#include "kami/frame.hpp"
#include "kami/symbol-strategy.hpp"
#include "kami/test/symbol-codec.hpp"

using namespace kami;

namespace {

octets
sample (std::size_t n, unsigned long seed = 4711)
{
  octets rv;
  unsigned long x = seed;
  for (std::size_t i = 0; i < n; ++i)
    {
      x = 1103515245 * x + 12345;
      rv += octet ((i % 5) ? 'a' + (x >> 16) % 26 : (x >> 8));
    }
  return rv;
}

//! Incompressible octets, making deflate store them verbatim
octets
noise (std::size_t n)
{
  octets rv;
  unsigned long x = 271828;
  for (std::size_t i = 0; i < n; ++i)
    {
      x = 1103515245 * x + 12345;
      rv += octet (x >> 16);
    }
  return rv;
}

symbol_codec::ptr
codec ()
{
  return make_shared< text_codec > ();
}

//! Puts \a per_page symbols from \a units on each page
std::vector< image >
paginate (const std::vector< image >& units, unsigned per_page)
{
  std::vector< image > rv;
  for (std::vector< image >::size_type i = 0; i < units.size ();
       i += per_page)
    {
      std::vector< image > page
        (units.begin () + i,
         units.begin () + std::min< std::size_t > (i + per_page,
                                                    units.size ()));
      rv.push_back (text_codec::stack (page));
    }
  return rv;
}

struct progress
{
  std::vector< streamsize > done;
  streamsize total;

  progress () : total (0) {}

  void operator() (streamsize d, streamsize t)
  {
    done.push_back (d);
    total = t;
  }
};

}       // namespace

BOOST_AUTO_TEST_SUITE (framing)

BOOST_AUTO_TEST_CASE (metadata_first)
{
  octets data (sample (5000));
  symbol_strategy s (codec (), 100);
  std::vector< std::string > f (s.frames (data, "x.bin"));

  std::string text (base64_encode (compressor ().compress (data)));
  const unsigned parts = (text.size () + 99) / 100;

  BOOST_REQUIRE_EQUAL (parts + 1, f.size ());

  boost::optional< frame > meta (frame::parse (f[0]));
  BOOST_REQUIRE (meta);
  BOOST_CHECK_EQUAL (frame::META, meta->kind);
  BOOST_CHECK_EQUAL (parts + 1, meta->total);
  BOOST_CHECK_EQUAL (5000, meta->size);
  BOOST_CHECK_EQUAL (sha256::hex (data), meta->digest);

  std::string joined;
  for (unsigned i = 1; i < f.size (); ++i)
    {
      boost::optional< frame > part (frame::parse (f[i]));
      BOOST_REQUIRE (part);
      BOOST_CHECK_EQUAL (frame::PART, part->kind);
      BOOST_CHECK_EQUAL (i, part->index);
      BOOST_CHECK_EQUAL (parts + 1, part->total);
      BOOST_CHECK (100 >= part->chunk.size ());
      joined += part->chunk;
    }
  BOOST_CHECK_EQUAL (text, joined);
}

BOOST_AUTO_TEST_CASE (empty_input)
{
  symbol_strategy s (codec ());
  std::vector< std::string > f (s.frames (octets (), "e"));

  BOOST_REQUIRE_EQUAL (1, f.size ());
  BOOST_CHECK_EQUAL ("STPRv1-META|e|1|0|" + sha256::hex (octets ()), f[0]);
}

BOOST_AUTO_TEST_CASE (unbounded_chunk_size)
{
  octets data (5000, 'x');
  symbol_strategy s (codec (), std::string::npos);
  std::vector< std::string > f (s.frames (data, "big"));

  BOOST_REQUIRE_EQUAL (2, f.size ());

  boost::optional< frame > meta (frame::parse (f[0]));
  BOOST_REQUIRE (meta);
  BOOST_CHECK_EQUAL (2, meta->total);

  std::reverse (f.begin (), f.end ());
  restoration r (s.assemble (f));
  BOOST_CHECK (r.verified ());
  BOOST_CHECK (data == r.data);
}

BOOST_AUTO_TEST_CASE (zero_chunk_size)
{
  BOOST_CHECK_THROW (symbol_strategy (codec (), 0), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END ()

BOOST_AUTO_TEST_SUITE (assembly)

BOOST_AUTO_TEST_CASE (any_delivery_order)
{
  const std::string::size_type sizes[] = { 1, 3, 64, 800, 100000 };
  octets data (sample (3000));

  for (std::size_t k = 0; k < sizeof (sizes) / sizeof (*sizes); ++k)
    {
      symbol_strategy s (codec (), sizes[k]);
      std::vector< std::string > f (s.frames (data, "data"));

      std::reverse (f.begin (), f.end ());
      std::rotate (f.begin (), f.begin () + f.size () / 3, f.end ());

      restoration r (s.assemble (f));
      BOOST_CHECK (data == r.data);
      BOOST_CHECK (r.verified ());
      BOOST_CHECK_EQUAL ("data", r.info.name);
    }
}

BOOST_AUTO_TEST_CASE (binary_data)
{
  octets data;
  for (int i = 0; i < 4096; ++i)
    data += octet (i * 7 % 256);

  symbol_strategy s (codec (), 50);
  BOOST_CHECK (data == s.assemble (s.frames (data, "bin")).data);
}

BOOST_AUTO_TEST_CASE (duplicates_and_noise)
{
  octets data (sample (2000));
  symbol_strategy s (codec (), 120);
  std::vector< std::string > f (s.frames (data, "dup"));

  std::vector< std::string > delivered (f);
  delivered.insert (delivered.end (), f.begin () + 1, f.begin () + 4);
  delivered.push_back ("http://example.com/");
  delivered.push_back ("STPRv1-PART|dup|broken");
  delivered.push_back ("");

  restoration r (s.assemble (delivered));
  BOOST_CHECK (data == r.data);
  BOOST_CHECK (r.warnings.empty ());
}

BOOST_AUTO_TEST_CASE (missing_part)
{
  symbol_strategy s (codec (), 100);
  std::vector< std::string > f (s.frames (sample (4000), "gap"));
  BOOST_REQUIRE (5 < f.size ());

  f.erase (f.begin () + 4);

  try
    {
      s.assemble (f);
      BOOST_ERROR ("incomplete_backup not thrown");
    }
  catch (const incomplete_backup& e)
    {
      BOOST_REQUIRE_EQUAL (1, e.missing ().size ());
      BOOST_CHECK_EQUAL (4, *e.missing ().begin ());
    }
}

BOOST_AUTO_TEST_CASE (missing_metadata)
{
  symbol_strategy s (codec ());
  std::vector< std::string > f (s.frames (sample (1000), "nometa"));

  f.erase (f.begin ());
  BOOST_CHECK_THROW (s.assemble (f), metadata_absent);
  BOOST_CHECK_THROW (s.assemble (std::vector< std::string > ()),
                     metadata_absent);
}

BOOST_AUTO_TEST_CASE (metadata_only)
{
  symbol_strategy s (codec ());
  restoration r (s.assemble (s.frames (octets (), "empty.txt")));

  BOOST_CHECK (r.data.empty ());
  BOOST_CHECK (r.verified ());
  BOOST_CHECK_EQUAL ("empty.txt", r.info.name);
}

BOOST_AUTO_TEST_CASE (corrupted_chunk)
{
  octets data (noise (20000));
  symbol_strategy s (codec ());
  std::vector< std::string > f (s.frames (data, "flip"));
  BOOST_REQUIRE (11 < f.size ());

  char& c (f[10][f[10].size () - 400]);
  c = ('A' == c ? 'B' : 'A');

  restoration r (s.assemble (f));
  BOOST_CHECK_EQUAL (data.size (), r.data.size ());
  BOOST_CHECK (data != r.data);
  BOOST_CHECK (!r.verified ());
  BOOST_CHECK_EQUAL (1, r.warnings.size ());

  s.strict (true);
  BOOST_CHECK_THROW (s.assemble (f), digest_mismatch);
}

BOOST_AUTO_TEST_CASE (corrupted_stream_header)
{
  symbol_strategy s (codec (), 200);
  std::vector< std::string > f (s.frames (sample (3000), "flip"));
  BOOST_REQUIRE (2 < f.size ());

  std::string& part (f[1]);
  char& c (part[part.rfind ('|') + 1]);
  c = ('A' == c ? 'B' : 'A');
  BOOST_CHECK_THROW (s.assemble (f), corruption_error);
}

BOOST_AUTO_TEST_CASE (digest_mismatch_is_a_warning)
{
  octets data (sample (3000));
  symbol_strategy s (codec ());
  std::vector< std::string > f (s.frames (data, "tampered"));

  frame meta (*frame::parse (f[0]));
  meta.digest = sha256::hex ("something else");
  f[0] = meta.str ();

  restoration r (s.assemble (f));
  BOOST_CHECK (data == r.data);
  BOOST_CHECK (!r.verified ());
  BOOST_CHECK_EQUAL (1, r.warnings.size ());

  s.strict (true);
  BOOST_CHECK_THROW (s.assemble (f), digest_mismatch);
}

BOOST_AUTO_TEST_SUITE_END ()

BOOST_AUTO_TEST_SUITE (pages)

BOOST_AUTO_TEST_CASE (report_end_to_end)
{
  octets data (sample (50000, 1));
  symbol_strategy s (codec (), 800);

  unit_set units (s.encode (data, "report.bin"));
  BOOST_CHECK_EQUAL (unit_set::grid, units.layout);
  BOOST_CHECK_EQUAL ("report.bin", units.info.name);
  BOOST_CHECK_EQUAL (50000, units.info.size);
  BOOST_CHECK_EQUAL (s.frames (data, "report.bin").size (),
                     units.units.size ());

  std::vector< image > pages (paginate (units.units, 35));
  std::reverse (pages.begin (), pages.end ());

  restoration r (s.decode (pages));
  BOOST_CHECK (data == r.data);
  BOOST_CHECK_EQUAL ("report.bin", r.info.name);
  BOOST_CHECK_EQUAL (sha256::hex (data), r.info.digest);
  BOOST_CHECK (r.warnings.empty ());
}

BOOST_AUTO_TEST_CASE (encode_progress)
{
  symbol_strategy s (codec (), 100);
  progress p;
  s.connect_update ([&p] (streamsize d, streamsize t) { p (d, t); });

  unit_set units (s.encode (sample (2000), "p"));

  BOOST_REQUIRE_EQUAL (units.units.size (), p.done.size ());
  BOOST_CHECK_EQUAL (streamsize (units.units.size ()), p.total);
  BOOST_CHECK_EQUAL (streamsize (units.units.size ()), p.done.back ());
}

BOOST_AUTO_TEST_CASE (parallel_decode)
{
  octets data (sample (20000, 99));
  symbol_strategy s (codec (), 150);
  s.jobs (4);

  std::vector< image > pages (paginate (s.encode (data, "par").units, 3));
  BOOST_REQUIRE (4 < pages.size ());

  progress p;
  s.connect_update ([&p] (streamsize d, streamsize t) { p (d, t); });

  restoration r (s.decode (pages));
  BOOST_CHECK (data == r.data);
  BOOST_CHECK_EQUAL (streamsize (pages.size ()), p.total);
  BOOST_CHECK_EQUAL (pages.size (), p.done.size ());
  BOOST_CHECK (std::is_sorted (p.done.begin (), p.done.end ()));
}

BOOST_AUTO_TEST_CASE (unreadable_page)
{
  octets data (sample (6000));
  symbol_strategy s (codec (), 300);

  std::vector< image > pages (paginate (s.encode (data, "lost").units, 4));
  BOOST_REQUIRE (2 < pages.size ());

  pages[1] = image (context (20, 20, context::MONO));

  try
    {
      s.decode (pages);
      BOOST_ERROR ("incomplete_backup not thrown");
    }
  catch (const incomplete_backup& e)
    {
      BOOST_CHECK_EQUAL (4, e.missing ().size ());
      BOOST_CHECK_EQUAL (4, *e.missing ().begin ());
      BOOST_CHECK_EQUAL (7, *e.missing ().rbegin ());
    }
}

BOOST_AUTO_TEST_SUITE_END ()

#include "kami/test/runner.ipp"
