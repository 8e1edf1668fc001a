//  main.cpp -- entry point for the kami command-line utility
//  Copyright (C) 2012-2015  SEIKO EPSON CORPORATION
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

#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <boost/throw_exception.hpp>

#include "kami/format.hpp"
#include "kami/run-time.hpp"

#include "commands.hpp"

int
main (int argc, char *argv[])
{
  namespace po = boost::program_options;

  try
    {
      kami::run_time rt (argc, argv);

      po::options_description cli_cmds ("Supported commands");
      cli_cmds
        .add_options ()
        ("help"   , "display the help for a command and exit")
        ("version", "output version information and exit")
        ("encode" , "turn a file into printable pages")
        ("decode" , "recover a file from printed or captured pages")
        ;

      if (rt.count ("help") && rt.command ().empty ())
        {
          std::cout << rt.help ("paper backups for digital files")
                    << "\n"
                    << "Usage: " << rt.program ()
                    << " [OPTION]... COMMAND [ARG]...\n\n";

          // show commands without their leading dashes
          std::stringstream ss;
          ss << cli_cmds;
          std::string cmd_help (ss.str ());
          std::string::size_type i = cmd_help.find ("  --");
          while (std::string::npos != i)
            {
              cmd_help.erase (i + 2, 2);
              i = cmd_help.find ("  --", i);
            }

          std::cout << cmd_help << "\n"
                    << rt.options ();
          return EXIT_SUCCESS;
        }
      if (rt.count ("version"))
        {
          std::cout << rt.version ();
          return EXIT_SUCCESS;
        }

      const std::string cmd (rt.command ());

      if ("encode" == cmd) return kami::encode (rt);
      if ("decode" == cmd) return kami::decode (rt);

      BOOST_THROW_EXCEPTION
        (std::invalid_argument
         (cmd.empty ()
          ? std::string ("no command given, try --help")
          : (kami::format ("unknown command: %1%") % cmd).str ()));
    }
  catch (const boost::exception& e)
    {
      std::cerr << boost::diagnostic_information (e);
      return EXIT_FAILURE;
    }
  catch (const std::exception& e)
    {
      std::cerr << e.what () << "\n";
      return EXIT_FAILURE;
    }

  return EXIT_SUCCESS;
}
