//  shell-pipe.cpp -- unit tests for the shell pipe filter
//  Copyright (C) 2014  SEIKO EPSON CORPORATION
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

#include <signal.h>

#include "kami/stream.hpp"
#include "kami/test/memory.hpp"

#include "../shell-pipe.hpp"

using namespace kami;

namespace {

class shell_pipe
  : public _flt_::shell_pipe
{
public:
  shell_pipe (const std::string& command)
    : _flt_::shell_pipe (command)
  {}
};

//! Passes images through a command that announces their geometry
class sized_pipe
  : public _flt_::shell_pipe
{
public:
  sized_pipe ()
    : _flt_::shell_pipe ("cat")
  {}

protected:
  context estimate (const context& ctx)
  {
    context rv (ctx);
    rv.content_type ("text/plain");
    return rv;
  }

  std::string arguments (const context&)
  {
    return "-";
  }
};

shared_ptr< memory_odevice >
run (idevice& idev, unsigned pipes, const std::string& command = "cat")
{
  shared_ptr< memory_odevice > odev (make_shared< memory_odevice > ());

  stream str;
  for (unsigned i = 0; i < pipes; ++i)
    str.push (make_shared< shell_pipe > (command));
  str.push (odev);

  idev | str;
  return odev;
}

}       // namespace

BOOST_AUTO_TEST_CASE (throughput)
{
  const streamsize sizes[] = { 1, 4095, 65536, 65537, 300000 };

  for (std::size_t i = 0; i < sizeof (sizes) / sizeof (*sizes); ++i)
    {
      setmem_idevice idev (context (sizes[i], 1, context::GRAY8), 2, 'p');
      shared_ptr< memory_odevice > odev (run (idev, 1));

      BOOST_REQUIRE_EQUAL (2, odev->images.size ());
      BOOST_CHECK_EQUAL (sizes[i], streamsize (odev->images[0].size ()));
      BOOST_CHECK (octets (sizes[i], 'p') == odev->images[1]);
    }
}

BOOST_AUTO_TEST_CASE (chaining)
{
  setmem_idevice idev (context (150000, 1, context::GRAY8), 2, 'q');
  shared_ptr< memory_odevice > odev (run (idev, 3));

  BOOST_CHECK_EQUAL (2 * 150000, odev->all ().size ());
  BOOST_CHECK_EQUAL (traits::eos (), odev->markers.back ());
}

BOOST_AUTO_TEST_CASE (transforming_command)
{
  string_idevice idev ("abc");
  shared_ptr< memory_odevice > odev (run (idev, 1, "tr a-z A-Z"));

  BOOST_CHECK_EQUAL ("ABC", odev->all ());
}

BOOST_AUTO_TEST_CASE (failing_command)
{
  string_idevice idev ("ignored");
  shared_ptr< memory_odevice > odev (run (idev, 1, "cat >/dev/null; exit 3"));

  const std::vector< traits::int_type >& m (odev->markers);

  BOOST_CHECK (odev->all ().empty ());
  BOOST_CHECK_EQUAL (1, std::count (m.begin (), m.end (), traits::eof ()));
  BOOST_CHECK_EQUAL (0, std::count (m.begin (), m.end (), traits::eoi ()));
}

BOOST_AUTO_TEST_CASE (unread_input)
{
  struct sigaction before;
  struct sigaction after;
  BOOST_REQUIRE_EQUAL (0, sigaction (SIGPIPE, NULL, &before));

  setmem_idevice idev (context (300000, 1, context::GRAY8), 1, 'u');
  shared_ptr< memory_odevice > odev (run (idev, 1, "exit 0"));

  BOOST_CHECK (odev->all ().empty ());
  BOOST_REQUIRE_EQUAL (0, sigaction (SIGPIPE, NULL, &after));
  BOOST_CHECK (before.sa_handler == after.sa_handler);
}

BOOST_AUTO_TEST_CASE (command_arguments)
{
  string_idevice idev ("through");
  shared_ptr< memory_odevice > odev (make_shared< memory_odevice > ());

  stream str;
  str.push (make_shared< sized_pipe > ());
  str.push (odev);
  idev | str;

  BOOST_CHECK_EQUAL ("through", odev->all ());
  BOOST_REQUIRE (!odev->contexts.empty ());
  BOOST_CHECK_EQUAL ("text/plain", odev->contexts.front ().content_type ());
}

#include "kami/test/runner.ipp"
