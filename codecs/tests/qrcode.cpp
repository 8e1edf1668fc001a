//  qrcode.cpp -- unit tests for QR Code symbols
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
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>

#include "../qrcode.hpp"

using namespace kami;
using _cdc_::qrcode;

BOOST_AUTO_TEST_CASE (render_and_scan)
{
  qrcode codec;
  const std::string text ("STPRv1-PART|notes.txt|3|1|eNrLSM3JyVcozy/KSQEAGgQEXQ==");

  image symbol (codec.render (text, symbol_codec::quartile));
  BOOST_CHECK_EQUAL (context::MONO, symbol.get_context ().type ());
  BOOST_CHECK_EQUAL (symbol.width (), symbol.height ());
  BOOST_CHECK_EQUAL (0, symbol.width () % 4);

  // leave a generous quiet zone, as a page would
  image page (context (symbol.width () + 80, symbol.height () + 80,
                       context::MONO));
  page.blit (symbol, 40, 40, symbol.width (), symbol.height ());

  std::vector< std::string > found (codec.scan (page));
  BOOST_REQUIRE_EQUAL (1, found.size ());
  BOOST_CHECK_EQUAL (text, found.front ());
}

BOOST_AUTO_TEST_CASE (several_symbols_per_page)
{
  qrcode codec;
  std::vector< std::string > texts;
  texts.push_back ("first symbol");
  texts.push_back ("second symbol");
  texts.push_back ("third symbol");

  image page (context (900, 300, context::MONO));
  for (std::size_t i = 0; i < texts.size (); ++i)
    {
      image s (codec.render (texts[i], symbol_codec::high));
      page.blit (s, 300 * i + 20, 20, 2 * s.width (), 2 * s.height ());
    }

  std::vector< std::string > found (codec.scan (page));
  std::sort (found.begin (), found.end ());
  std::sort (texts.begin (), texts.end ());
  BOOST_CHECK_EQUAL_COLLECTIONS (found.begin (), found.end (),
                                 texts.begin (), texts.end ());
}

BOOST_AUTO_TEST_CASE (blank_page)
{
  qrcode codec;
  image page (context (200, 200, context::GRAY8));

  BOOST_CHECK (codec.scan (page).empty ());
}

BOOST_AUTO_TEST_CASE (payload_too_large)
{
  qrcode codec;

  BOOST_CHECK_THROW (codec.render (std::string (4000, 'x'),
                                   symbol_codec::high),
                     std::runtime_error);
}

BOOST_AUTO_TEST_CASE (invalid_module_size)
{
  BOOST_CHECK_THROW (qrcode (0), std::invalid_argument);
}

#include "kami/test/runner.ipp"
