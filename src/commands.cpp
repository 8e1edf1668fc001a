//  commands.cpp -- command implementations and their shared settings
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

#include <iostream>
#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "kami/format.hpp"
#include "kami/raster-strategy.hpp"
#include "kami/symbol-strategy.hpp"

#if HAVE_LIBQRENCODE && HAVE_ZBAR
#include "../codecs/qrcode.hpp"
#endif

#include "commands.hpp"

namespace po = boost::program_options;

namespace kami {

settings::settings ()
  : strategy ("symbol")
  , paper ("a4")
  , dpi (300)
  , margin (8)
  , rows (7)
  , columns (5)
  , chunk_size (symbol_strategy::default_chunk_size)
  , tolerance (symbol_codec::quartile)
  , jobs (1)
  , strict (false)
  , quiet (false)
{}

page_geometry
settings::geometry () const
{
  return page_geometry::paper (paper, dpi, margin);
}

strategy::ptr
settings::make_strategy () const
{
  strategy::ptr rv;

  if ("raster" == strategy)
    {
      rv = make_shared< raster_strategy > (geometry ());
    }
  else if ("symbol" == strategy)
    {
#if HAVE_LIBQRENCODE && HAVE_ZBAR
      rv = make_shared< symbol_strategy >
        (make_shared< _cdc_::qrcode > (), chunk_size, tolerance, jobs);
#else
      BOOST_THROW_EXCEPTION
        (std::runtime_error ("symbol strategy needs libqrencode and zbar,"
                             " which this build does not support"));
#endif
    }
  else
    {
      BOOST_THROW_EXCEPTION
        (std::invalid_argument ((format ("unknown strategy: %1%")
                                 % strategy).str ()));
    }

  rv->strict (strict);
  return rv;
}

bool
parse_arguments (const run_time& rt, po::options_description& cmd_opts,
                 settings& s)
{
  cmd_opts
    .add_options ()
    ("strategy", po::value< std::string > (&s.strategy)
     ->default_value (s.strategy),
     "symbol or raster")
    ("paper", po::value< std::string > (&s.paper)
     ->default_value (s.paper),
     "a4 or letter")
    ("dpi", po::value< unsigned > (&s.dpi)
     ->default_value (s.dpi),
     "resolution in dots per inch")
    ("margin", po::value< double > (&s.margin)
     ->default_value (s.margin),
     "page margin in millimetres")
    ("quiet", po::bool_switch (&s.quiet),
     "suppress progress output")
    ("help", "display this help and exit")
    ;

  po::options_description cmd_pos_opts;
  cmd_pos_opts
    .add_options ()
    ("INPUT" , po::value< std::string > (&s.input))
    ("OUTPUT", po::value< std::string > (&s.output))
    ;

  po::positional_options_description cmd_pos_args;
  cmd_pos_args
    .add ("INPUT" , 1)
    .add ("OUTPUT", 1)
    ;

  po::options_description cmd_line;
  cmd_line
    .add (cmd_opts)
    .add (cmd_pos_opts)
    ;

  po::variables_map vm;
  po::store (po::command_line_parser (rt.arguments ())
             .options (cmd_line)
             .positional (cmd_pos_args)
             .run (), vm);
  po::notify (vm);

  if (vm.count ("help"))
    {
      std::cout << (format ("Usage: %1% %2% INPUT OUTPUT [OPTION]...\n\n")
                    % rt.program () % rt.command ())
                << cmd_opts << "\n"
                << rt.options ();
      return false;
    }

  if (s.input.empty () || s.output.empty ())
    BOOST_THROW_EXCEPTION
      (std::invalid_argument ((format ("%1% needs both INPUT and OUTPUT")
                               % rt.command ()).str ()));
  return true;
}

}       // namespace kami
