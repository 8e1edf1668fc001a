//  run-time.cpp -- unit tests for the run-time information API
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

#include <cstdlib>

#include <boost/test/unit_test.hpp>

#include "kami/log.hpp"
#include "../run-time.ipp"

namespace {

using kami::log;
using kami::run_time;

struct fixture
{
  const char *program_name_;
  log::priority threshold_;

  fixture ()
    : program_name_("run-time-unit-test-runner")
    , threshold_(log::threshold)
  {
    unsetenv (PACKAGE_ENV_VAR_PREFIX "LOG_LEVEL");
  }

  ~fixture ()
  {
    delete run_time::impl::instance_;
    run_time::impl::instance_ = 0;
    log::threshold = threshold_;
    unsetenv (PACKAGE_ENV_VAR_PREFIX "LOG_LEVEL");
  }
};

BOOST_FIXTURE_TEST_SUITE (program_name, fixture)

BOOST_AUTO_TEST_CASE (unix_in_path)
{
  const char *argv[] = { PACKAGE_TARNAME };

  run_time rt (1, argv);

  BOOST_CHECK_EQUAL (PACKAGE_TARNAME, rt.program ());
  BOOST_CHECK_EQUAL ("", rt.command ());
}

BOOST_AUTO_TEST_CASE (unix_abs_path)
{
  const char *argv[] = { "/usr/bin/" PACKAGE_TARNAME };

  run_time rt (1, argv);

  BOOST_CHECK_EQUAL (PACKAGE_TARNAME, rt.program ());
}

BOOST_AUTO_TEST_CASE (command_prefix)
{
  const char *argv[] = { "/usr/bin/" PACKAGE_TARNAME "-decode" };

  run_time rt (1, argv);

  BOOST_CHECK_EQUAL (PACKAGE_TARNAME, rt.program ());
  BOOST_CHECK_EQUAL ("decode", rt.command ());
}

BOOST_AUTO_TEST_CASE (command_prefix_with_suffix)
{
  const char *argv[] = { "../" PACKAGE_TARNAME "-encode.exe" };

  run_time rt (1, argv);

  BOOST_CHECK_EQUAL ("encode", rt.command ());
}

BOOST_AUTO_TEST_CASE (single_initialisation)
{
  const char *argv[] = { PACKAGE_TARNAME };

  run_time rt (1, argv);

  BOOST_CHECK_THROW (run_time (1, argv), std::logic_error);
  BOOST_CHECK_NO_THROW (run_time ());
}

BOOST_AUTO_TEST_SUITE_END ()

BOOST_AUTO_TEST_CASE (uninitialised_access)
{
  BOOST_REQUIRE (!run_time::impl::instance_);
  BOOST_CHECK_THROW (run_time (), std::logic_error);
}

BOOST_FIXTURE_TEST_SUITE (command_line_options, fixture)

BOOST_AUTO_TEST_CASE (command_and_arguments)
{
  const char *argv[] = {
    program_name_,
    "encode",
    "--rows", "3",
    "notes.txt",
    "notes.pdf",
  };

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_EQUAL ("encode", rt.command ());
  BOOST_REQUIRE_EQUAL (4, rt.arguments ().size ());
  BOOST_CHECK_EQUAL ("--rows", rt.arguments ()[0]);
  BOOST_CHECK_EQUAL ("notes.pdf", rt.arguments ()[3]);
}

BOOST_AUTO_TEST_CASE (non_std_option)
{
  const char *argv[] = {
    program_name_,
    "--non-std-option",
  };

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_REQUIRE_EQUAL (0, rt.count ("non-std-option"));
  BOOST_CHECK_NE ("--non-std-option", rt.command ());
}

BOOST_AUTO_TEST_CASE (no_option_option_permutations)
{
  const char *argv[] = {
    program_name_,
    "--non-std-option",
    "--help",
  };

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_EQUAL (0, rt.count ("help"));
}

BOOST_AUTO_TEST_CASE (no_command_option_permutations)
{
  const char *argv[] = {
    program_name_,
    "decode",
    "--help",
  };

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_EQUAL (0, rt.count ("help"));
  BOOST_CHECK_EQUAL ("decode", rt.command ());
  BOOST_REQUIRE_EQUAL (1, rt.arguments ().size ());
  BOOST_CHECK_EQUAL ("--help", rt.arguments ().front ());
}

BOOST_AUTO_TEST_CASE (gnu_option)
{
  const char *argv[] = {
    program_name_,
    "--version",
  };

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_EQUAL (1, rt.count ("version"));
  BOOST_CHECK_EQUAL ("", rt.command ());
  BOOST_CHECK (rt.arguments ().empty ());
  BOOST_CHECK_EQUAL (0, rt.version ().find (PACKAGE_TARNAME " ("
                                            PACKAGE_NAME ") "
                                            PACKAGE_VERSION "\n"));
}

BOOST_AUTO_TEST_CASE (log_level)
{
  const char *argv[] = {
    program_name_,
    "--log-level", "trace",
    "decode",
  };

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_EQUAL (log::TRACE, log::threshold);
  BOOST_CHECK_EQUAL ("decode", rt.command ());
}

BOOST_AUTO_TEST_SUITE_END ()

BOOST_FIXTURE_TEST_SUITE (environment_variables, fixture)

BOOST_AUTO_TEST_CASE (log_level)
{
  const char *argv[] = {
    program_name_,
  };

  setenv (PACKAGE_ENV_VAR_PREFIX "LOG_LEVEL", "debug", 1);

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_NE (0, rt.count ("log-level"));
  BOOST_CHECK_EQUAL (log::DEBUG, log::threshold);
}

BOOST_AUTO_TEST_CASE (command_line_wins)
{
  const char *argv[] = {
    program_name_,
    "--log-level=alert",
  };

  setenv (PACKAGE_ENV_VAR_PREFIX "LOG_LEVEL", "debug", 1);

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_EQUAL (log::ALERT, log::threshold);
}

BOOST_AUTO_TEST_SUITE_END ()

} // namespace

#include "kami/test/runner.ipp"
