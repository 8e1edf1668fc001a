//  run-time.hpp -- run-time information singleton
//  Copyright (C) 2012, 2013, 2015  SEIKO EPSON CORPORATION
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

#ifndef kami_run_time_hpp_
#define kami_run_time_hpp_

#include <map>
#include <string>
#include <vector>

#include <boost/program_options/variables_map.hpp>

namespace kami {

//! Singleton for access to a program's run-time information
/*! The run_time provides access to
 *
 *  - command-line arguments, including the program name
 *  - values of standard options, from the command-line or from
 *    \c KAMI_ prefixed environment variables
 *  - the command requested and its unprocessed arguments
 *
 *  Standard options take effect as soon as the singleton has been
 *  initialised.  In particular, the log::threshold is set from the
 *  \c --log-level option or the \c KAMI_LOG_LEVEL variable.
 */
class run_time
{
public:
  //! An implementation dependent forward iterable container
  typedef std::vector< std::string > sequence_type;

  typedef std::map< std::string,
                    boost::program_options::variable_value >::size_type
  size_type;

  //! Initialise program run-time environmental information
  /*! A program's \c main() should create a run_time instance using
   *  this constructor, passing all command-line arguments.  Unknown
   *  options are silently left for the command to deal with.
   *
   *  This constructor can only be used once.  Any additional use will
   *  throw a std::logic_error exception.
   */
  run_time (int argc, const char *const argv[]);

  //! Get access to run-time environmental information
  /*! Use of this constructor before the initialising one results in a
   *  std::logic_error exception.
   */
  run_time ();

  //! Retrieve the canonical program name
  std::string
  program () const;

  //! Obtain the command used in the command-line invocation
  /*! If no command was entered on the command-line, an empty string
   *  will be returned.
   */
  std::string
  command () const;

  //! Unprocessed command-line arguments
  const sequence_type&
  arguments () const;

  //! Number of times an \a option was encountered
  size_type
  count (const std::string& option) const;

  std::string
  help (const std::string& summary = std::string ()) const;

  //! Program name, version and license
  std::string
  version () const;

  //! Describes the standard options for help output
  std::string
  options () const;

  class impl;
};

} // namespace kami

#endif /* kami_run_time_hpp_ */
