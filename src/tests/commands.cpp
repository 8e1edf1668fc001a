//  commands.cpp -- unit tests for command settings
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

#include <boost/program_options.hpp>
#include <boost/test/unit_test.hpp>

#include "kami/raster-strategy.hpp"

#include "../../lib/run-time.ipp"
#include "../commands.hpp"

using namespace kami;

namespace {

struct fixture
{
  ~fixture ()
  {
    delete run_time::impl::instance_;
    run_time::impl::instance_ = 0;
  }
};

}       // namespace

BOOST_AUTO_TEST_CASE (defaults)
{
  settings s;

  BOOST_CHECK_EQUAL ("symbol", s.strategy);
  BOOST_CHECK_EQUAL (7, s.rows);
  BOOST_CHECK_EQUAL (5, s.columns);
  BOOST_CHECK_EQUAL (1, s.jobs);
  BOOST_CHECK (!s.strict);

  page_geometry g (s.geometry ());
  BOOST_CHECK_EQUAL (2480, g.width ());
  BOOST_CHECK_EQUAL (3508, g.height ());
}

BOOST_AUTO_TEST_CASE (raster_strategy_selection)
{
  settings s;
  s.strategy = "raster";
  s.strict = true;

  strategy::ptr p (s.make_strategy ());

  BOOST_REQUIRE (p);
  BOOST_CHECK (dynamic_cast< raster_strategy * > (p.get ()));
  BOOST_CHECK (p->strict ());
}

BOOST_AUTO_TEST_CASE (unknown_strategy)
{
  settings s;
  s.strategy = "braille";

  BOOST_CHECK_THROW (s.make_strategy (), std::invalid_argument);
}

#if !(HAVE_LIBQRENCODE && HAVE_ZBAR)
BOOST_AUTO_TEST_CASE (unsupported_strategy)
{
  settings s;

  BOOST_CHECK_THROW (s.make_strategy (), std::runtime_error);
}
#endif

BOOST_AUTO_TEST_CASE (unknown_paper)
{
  settings s;
  s.paper = "legal";

  BOOST_CHECK_THROW (s.geometry (), std::invalid_argument);
}

BOOST_FIXTURE_TEST_SUITE (arguments, fixture)

BOOST_AUTO_TEST_CASE (shared_options)
{
  const char *argv[] = {
    PACKAGE_TARNAME, "decode",
    "--paper", "letter",
    "--dpi", "150",
    "--strategy", "raster",
    "scans", "restored",
  };
  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  settings s;
  po::options_description opts;
  BOOST_REQUIRE (parse_arguments (rt, opts, s));

  BOOST_CHECK_EQUAL ("scans", s.input);
  BOOST_CHECK_EQUAL ("restored", s.output);
  BOOST_CHECK_EQUAL ("raster", s.strategy);
  BOOST_CHECK (!s.quiet);

  page_geometry g (s.geometry ());
  BOOST_CHECK_EQUAL (1275, g.width ());
  BOOST_CHECK_EQUAL (1650, g.height ());
}

BOOST_AUTO_TEST_CASE (command_options)
{
  const char *argv[] = {
    PACKAGE_TARNAME, "encode",
    "notes.txt",
    "--rows", "3",
    "--quiet",
    "notes.pdf",
  };
  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  settings s;
  po::options_description opts;
  opts.add_options ()
    ("rows", po::value< unsigned > (&s.rows))
    ;
  BOOST_REQUIRE (parse_arguments (rt, opts, s));

  BOOST_CHECK_EQUAL (3, s.rows);
  BOOST_CHECK (s.quiet);
  BOOST_CHECK_EQUAL ("notes.txt", s.input);
  BOOST_CHECK_EQUAL ("notes.pdf", s.output);
}

BOOST_AUTO_TEST_CASE (help_requested)
{
  const char *argv[] = { PACKAGE_TARNAME, "encode", "--help" };
  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  settings s;
  po::options_description opts;
  BOOST_CHECK (!parse_arguments (rt, opts, s));
}

BOOST_AUTO_TEST_CASE (missing_output)
{
  const char *argv[] = { PACKAGE_TARNAME, "encode", "notes.txt" };
  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  settings s;
  po::options_description opts;
  BOOST_CHECK_THROW (parse_arguments (rt, opts, s), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE (unknown_option)
{
  const char *argv[] = {
    PACKAGE_TARNAME, "encode", "--colour", "red", "a", "b",
  };
  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  settings s;
  po::options_description opts;
  BOOST_CHECK_THROW (parse_arguments (rt, opts, s), po::error);
}

BOOST_AUTO_TEST_SUITE_END ()

#include "kami/test/runner.ipp"
