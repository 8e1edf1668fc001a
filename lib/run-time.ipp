//  run-time.ipp -- implementation details
//  Copyright (C) 2012, 2013  SEIKO EPSON CORPORATION
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

#ifndef lib_run_time_ipp_
#define lib_run_time_ipp_

/*! \file
 *  \brief Expose enough detail to make run_time testable
 *
 *  Unit tests need to "reset" the singleton between tests, which the
 *  public API does not provide for.  Test fixtures can delete the
 *  instance_ and reset it to \c NULL.
 */

#include <boost/filesystem/path.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include "kami/run-time.hpp"

namespace kami {

namespace fs = boost::filesystem;
namespace po = boost::program_options;

//! Internal API to the run-time state information
class run_time::impl
{
public:
  //! Initialise the instance_ based on the command-line arguments
  /*! Parses \a argv, handling the standard options it encounters.
   *  Environment variables are dealt with as well.
   */
  impl (int argc, const char *const argv[]);

  static impl *instance_;

  run_time::sequence_type args_;

  fs::path    argzero_;
  std::string command_;

  po::variables_map vm_;
  po::options_description gnu_opts_;
  po::options_description std_opts_;

  run_time::sequence_type cmd_args_;

  struct unrecognize;
  struct env_var_mapper;
};

} // namespace kami

#endif /* lib_run_time_ipp_ */
