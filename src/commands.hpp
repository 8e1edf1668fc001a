//  commands.hpp -- command implementations and their shared settings
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

#ifndef src_commands_hpp_
#define src_commands_hpp_

#include <string>

#include <boost/program_options.hpp>

#include "kami/geometry.hpp"
#include "kami/run-time.hpp"
#include "kami/strategy.hpp"
#include "kami/symbol-codec.hpp"

namespace kami {

//! What the encode and decode commands are told to do
struct settings
{
  std::string input;
  std::string output;

  std::string strategy;
  std::string paper;
  unsigned    dpi;
  double      margin;

  unsigned rows;
  unsigned columns;
  std::string::size_type chunk_size;
  symbol_codec::tolerance tolerance;

  unsigned jobs;
  bool     strict;
  bool     quiet;

  settings ();

  page_geometry geometry () const;

  //! Creates the strategy selected by name
  /*! \throw std::invalid_argument for unknown names
   *  \throw std::runtime_error if the strategy is not supported by
   *         this build
   */
  strategy::ptr make_strategy () const;
};

//! Parses a command's arguments into \a s
/*! Options shared by all commands are added to \a cmd_opts.  Returns
 *  \c false if help was requested and has been output.
 *
 *  \throw std::invalid_argument if either file argument is missing
 */
bool parse_arguments (const run_time& rt,
                      boost::program_options::options_description& cmd_opts,
                      settings& s);

int encode (const run_time& rt);
int decode (const run_time& rt);

}       // namespace kami

#endif  /* src_commands_hpp_ */
