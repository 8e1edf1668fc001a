//  image.cpp -- unit tests for in-memory images
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

#include <stdexcept>
#include <vector>

#include <boost/test/unit_test.hpp>

#include "kami/image.hpp"
#include "kami/stream.hpp"
#include "kami/test/memory.hpp"

using namespace kami;

BOOST_AUTO_TEST_CASE (starts_out_white)
{
  image mono (context (13, 5, context::MONO));
  image gray (context (4, 4, context::GRAY8));

  BOOST_CHECK_EQUAL (2 * 5, mono.data ().size ());
  BOOST_CHECK_EQUAL (16, gray.data ().size ());
  BOOST_CHECK (mono.is_white (12, 4));
  BOOST_CHECK_EQUAL (255, gray.gray (3, 3));
}

BOOST_AUTO_TEST_CASE (size_mismatch)
{
  BOOST_CHECK_THROW (image (context (8, 2, context::MONO), octets (3, 0)),
                     std::logic_error);
  BOOST_CHECK_THROW (image ((context ())), std::logic_error);
  BOOST_CHECK_THROW (image (context (8, context::unknown_size)),
                     std::logic_error);
}

BOOST_AUTO_TEST_CASE (monochrome_pixels)
{
  image img (context (10, 2, context::MONO));

  img.set (0, 0, false);
  img.set (9, 1, false);

  BOOST_CHECK (!img.is_white (0, 0));
  BOOST_CHECK (img.is_white (1, 0));
  BOOST_CHECK (!img.is_white (9, 1));
  BOOST_CHECK_EQUAL (0x7f, traits::to_int_type (img.data ()[0]));

  img.set (0, 0, true);
  BOOST_CHECK (img.is_white (0, 0));
}

BOOST_AUTO_TEST_CASE (set_needs_monochrome)
{
  image img (context (2, 2, context::GRAY8));
  BOOST_CHECK_THROW (img.set (0, 0, false), std::logic_error);
}

BOOST_AUTO_TEST_CASE (color_threshold)
{
  const octet pixels[] = {
    '\xff', '\xff', '\xff',             // white
    '\x00', '\x00', '\x00',             // black
    '\xff', '\x00', '\x00',             // red, dark
    '\x00', '\xff', '\x00',             // green, light
  };
  octets data (pixels, sizeof (pixels));
  image img (context (4, 1, context::RGB8), data);

  BOOST_CHECK (img.is_white (0, 0));
  BOOST_CHECK (!img.is_white (1, 0));
  BOOST_CHECK (!img.is_white (2, 0));
  BOOST_CHECK (img.is_white (3, 0));
}

BOOST_AUTO_TEST_CASE (gray_conversion)
{
  image img (context (9, 1, context::MONO));
  img.set (8, 0, false);

  image gray (img.to_gray ());
  BOOST_CHECK_EQUAL (context::GRAY8, gray.get_context ().type ());
  BOOST_CHECK_EQUAL (9, gray.width ());
  BOOST_CHECK_EQUAL (255, gray.gray (7, 0));
  BOOST_CHECK_EQUAL (0, gray.gray (8, 0));
}

BOOST_AUTO_TEST_CASE (blit_scaled)
{
  image src (context (2, 2, context::MONO));
  src.set (1, 1, false);

  image dst (context (10, 10, context::MONO));
  dst.blit (src, 3, 3, 4, 4);

  BOOST_CHECK (dst.is_white (4, 4));
  BOOST_CHECK (dst.is_white (6, 3));
  BOOST_CHECK (!dst.is_white (5, 5));
  BOOST_CHECK (!dst.is_white (6, 6));
  BOOST_CHECK (dst.is_white (7, 7));
}

BOOST_AUTO_TEST_CASE (blit_clipped)
{
  image src (context (4, 4, context::MONO));
  for (int y = 0; y < 4; ++y)
    for (int x = 0; x < 4; ++x)
      src.set (x, y, false);

  image dst (context (5, 5, context::MONO));
  dst.blit (src, 3, -2, 4, 4);

  BOOST_CHECK (!dst.is_white (3, 0));
  BOOST_CHECK (!dst.is_white (4, 1));
  BOOST_CHECK (dst.is_white (4, 2));
  BOOST_CHECK (dst.is_white (2, 0));
}

BOOST_AUTO_TEST_CASE (image_sequence)
{
  std::vector< image > images;
  images.push_back (image (context (16, 2, context::MONO)));
  images.push_back (image (context (3, 3, context::GRAY8), octets (9, 'k')));

  image_idevice idev (images);
  memory_odevice odev;

  BOOST_CHECK_EQUAL (traits::eos (), idev | odev);
  BOOST_REQUIRE_EQUAL (2, odev.images.size ());
  BOOST_CHECK (images[0].data () == odev.images[0]);
  BOOST_CHECK (images[1].data () == odev.images[1]);
  BOOST_CHECK (odev.contexts[1] == images[1].get_context ());

  BOOST_CHECK_EQUAL (traits::bos (), odev.markers.front ());
  BOOST_CHECK_EQUAL (traits::eos (), odev.markers.back ());
  BOOST_CHECK_EQUAL (6, odev.markers.size ());
}

BOOST_AUTO_TEST_CASE (empty_sequence)
{
  std::vector< image > images;
  image_idevice idev (images);
  memory_odevice odev;

  idev | odev;
  BOOST_CHECK (odev.images.empty ());
}

BOOST_AUTO_TEST_CASE (filtered_stream)
{
  std::vector< image > images (3, image (context (8, 8, context::GRAY8),
                                         octets (64, 'z')));
  image_idevice idev (images);

  shared_ptr< memory_odevice > odev (make_shared< memory_odevice > ());
  stream str;
  str.push (make_shared< thru_filter > ());
  str.push (make_shared< thru_filter > ());
  str.push (odev);

  idev | str;

  BOOST_CHECK_EQUAL (3, odev->images.size ());
  BOOST_CHECK (octets (3 * 64, 'z') == odev->all ());
  BOOST_CHECK_THROW (str.push (make_shared< thru_filter > ()),
                     std::logic_error);
}

BOOST_AUTO_TEST_CASE (uncapped_stream)
{
  stream str;
  str.push (make_shared< thru_filter > ());

  BOOST_CHECK_THROW (str.mark (traits::bos (), context ()),
                     std::logic_error);
}

#include "kami/test/runner.ipp"
