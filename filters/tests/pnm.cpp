//  pnm.cpp -- unit tests for the PNM image format filter
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

#include <string>

#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>

#include "kami/file.hpp"
#include "kami/stream.hpp"
#include "kami/test/memory.hpp"

#include "../pnm.hpp"

namespace fs = boost::filesystem;

using namespace kami;
using _flt_::pnm;

namespace {

octets
run (idevice& idev, shared_ptr< memory_odevice > odev)
{
  stream str;
  str.push (make_shared< pnm > ());
  str.push (odev);

  idev | str;
  return odev->all ();
}

}       // namespace

BOOST_AUTO_TEST_CASE (gray_image)
{
  setmem_idevice idev (context (3, 2, context::GRAY8), 1, 'g');
  shared_ptr< memory_odevice > odev (make_shared< memory_odevice > ());

  BOOST_CHECK_EQUAL ("P5 3 2 255\ngggggg", run (idev, odev));
  BOOST_CHECK_EQUAL ("image/x-portable-anymap",
                     odev->contexts.front ().content_type ());
}

BOOST_AUTO_TEST_CASE (color_image)
{
  setmem_idevice idev (context (2, 1, context::RGB8), 1, 'c');
  shared_ptr< memory_odevice > odev (make_shared< memory_odevice > ());

  BOOST_CHECK_EQUAL ("P6 2 1 255\ncccccc", run (idev, odev));
}

BOOST_AUTO_TEST_CASE (mono_image_inverted)
{
  setmem_idevice idev (context (10, 2, context::MONO), 1, '\xf0');
  shared_ptr< memory_odevice > odev (make_shared< memory_odevice > ());

  BOOST_CHECK_EQUAL (octets ("P4 10 2\n") + octets (4, '\x0f'),
                     run (idev, odev));
}

BOOST_AUTO_TEST_CASE (image_per_page)
{
  setmem_idevice idev (context (4, 4, context::GRAY8), 3);
  shared_ptr< memory_odevice > odev (make_shared< memory_odevice > ());

  run (idev, odev);

  BOOST_REQUIRE_EQUAL (3, odev->images.size ());
  for (int i = 0; i < 3; ++i)
    BOOST_CHECK_EQUAL (std::string ("P5 4 4 255\n").size () + 16,
                       odev->images[i].size ());
}

BOOST_AUTO_TEST_CASE (unknown_size)
{
  string_idevice idev ("not an image");
  shared_ptr< memory_odevice > odev (make_shared< memory_odevice > ());

  BOOST_CHECK_THROW (run (idev, odev), std::logic_error);
}

BOOST_AUTO_TEST_CASE (numbered_files)
{
  fs::path dir (fs::temp_directory_path ()
                / fs::unique_path ("kami-pnm-%%%%-%%%%"));
  fs::create_directories (dir);

  setmem_idevice idev (context (100, 100, context::MONO), 2);

  stream str;
  str.push (make_shared< pnm > ());
  str.push (make_shared< file_odevice >
            (path_generator ((dir / "page-%i.pbm").string ())));
  idev | str;

  BOOST_CHECK_EQUAL (std::string ("P4 100 100\n").size () + 13 * 100,
                     fs::file_size (dir / "page-1.pbm"));
  BOOST_CHECK (fs::exists (dir / "page-2.pbm"));
  BOOST_CHECK (!fs::exists (dir / "page-3.pbm"));

  fs::remove_all (dir);
}

#include "kami/test/runner.ipp"
