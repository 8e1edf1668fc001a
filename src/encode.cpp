//  encode.cpp -- turn a file into printable pages
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
#include <functional>
#include <fstream>
#include <ios>
#include <iostream>
#include <iterator>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <boost/throw_exception.hpp>

#include <unistd.h>

#include "kami/format.hpp"
#include "kami/log.hpp"

#include "commands.hpp"
#include "console.hpp"
#include "page-renderer.hpp"

namespace kami {

namespace {

octets
read_file (const std::string& path)
{
  std::ifstream is (path.c_str (), std::ios_base::binary);
  if (!is)
    BOOST_THROW_EXCEPTION
      (std::ios_base::failure (path + ": cannot open for reading"));

  octets rv ((std::istreambuf_iterator< octet > (is)),
             std::istreambuf_iterator< octet > ());
  if (is.bad ())
    BOOST_THROW_EXCEPTION
      (std::ios_base::failure (path + ": read error"));
  return rv;
}

}       // namespace

int
encode (const run_time& rt)
{
  namespace fs = boost::filesystem;
  namespace po = boost::program_options;
  using std::placeholders::_1;
  using std::placeholders::_2;

  settings s;

  po::options_description cmd_opts ("Encode options");
  cmd_opts
    .add_options ()
    ("rows", po::value< unsigned > (&s.rows)
     ->default_value (s.rows),
     "symbol rows per page")
    ("columns", po::value< unsigned > (&s.columns)
     ->default_value (s.columns),
     "symbol columns per page")
    ("chunk-size", po::value< std::string::size_type > (&s.chunk_size)
     ->default_value (s.chunk_size),
     "base64 characters per symbol")
    ("tolerance", po::value< symbol_codec::tolerance > (&s.tolerance)
     ->default_value (s.tolerance),
     "symbol error correction level, L, M, Q or H")
    ;

  if (!parse_arguments (rt, cmd_opts, s)) return EXIT_SUCCESS;

  console con (std::cout, s.quiet, isatty (STDOUT_FILENO));

  con.status (console::busy, "Reading input file...");
  octets data (read_file (s.input));
  std::string name (fs::path (s.input).filename ().string ());

  page_geometry geometry (s.geometry ());
  strategy::ptr strategy (s.make_strategy ());
  page_renderer renderer (geometry, s.rows, s.columns);

  con.status (console::busy,
              (format ("Encoding %1% (%2% bytes)...")
               % name % data.size ()).str ());
  scoped_connection c1
    (strategy->connect_update (std::bind (&console::progress, &con,
                                          _1, _2)));
  unit_set units (strategy->encode (data, name));

  con.status (console::busy, "Building pages...");
  scoped_connection c2
    (renderer.connect_update (std::bind (&console::progress, &con,
                                         _1, _2)));
  renderer.render (units, s.output);

  con.status (console::done,
              (format ("Encoding complete! %1%. Written to %2%")
               % units.caption () % s.output).str ());
  return EXIT_SUCCESS;
}

}       // namespace kami
