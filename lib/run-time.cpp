//  run-time.cpp -- run-time information singleton
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

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <boost/program_options.hpp>
#include <boost/throw_exception.hpp>

#include "kami/format.hpp"
#include "kami/log.hpp"
#include "kami/regex.hpp"

#include "run-time.ipp"

namespace kami {

namespace fs = boost::filesystem;
namespace po = boost::program_options;

using std::logic_error;

run_time::impl *run_time::impl::instance_(0);

run_time::run_time (int argc, const char *const argv[])
{
  if (impl::instance_)
    BOOST_THROW_EXCEPTION
      (logic_error ("run_time has been initialized already"));

  impl::instance_ = new impl (argc, argv);
}

run_time::run_time ()
{
  if (!impl::instance_)
    BOOST_THROW_EXCEPTION
      (logic_error ("run_time has not been initialized yet"));
}

std::string
run_time::program () const
{
  return PACKAGE_TARNAME;
}

std::string
run_time::command () const
{
  return impl::instance_->command_;
}

const run_time::sequence_type&
run_time::arguments () const
{
  return impl::instance_->cmd_args_;
}

run_time::size_type
run_time::count (const std::string& option) const
{
  return impl::instance_->vm_.count (option);
}

std::string
run_time::help (const std::string& summary) const
{
  format fmt (!command ().empty ()
              ? "%1% %2% -- %3%\n"
              : "%1% -- %3%\n");
  return (fmt
          % program ()
          % command ()
          % summary).str ();
}

std::string
run_time::version () const
{
  format fmt (!command ().empty ()
              ? "%1% %2% (%3%) %4%\n%5%\n"
              : "%1% (%3%) %4%\n%5%\n");
  return (fmt
          % program ()
          % command ()
          % PACKAGE_NAME
          % PACKAGE_VERSION
          % "Copyright (C) 2026  Kami developers\n"
            "License: GPL-3.0+").str ();
}

std::string
run_time::options () const
{
  std::ostringstream os;
  os << impl::instance_->gnu_opts_
     << "\n"
     << impl::instance_->std_opts_;
  return os.str ();
}

static
bool
is_option (const std::string& s)
{
  return (0 == s.find ("-"));
}

//! Marks everything from the first positional argument as unknown
/*! Options following the command belong to the command, even when
 *  their names clash with standard options.
 */
struct run_time::impl::unrecognize
{
  bool found_first_;

  unrecognize ()
    : found_first_(false)
  {}

  po::option
  operator() (po::option& item)
  {
    found_first_ |= item.string_key.empty ();
    found_first_ |= item.unregistered;

    item.unregistered = found_first_;
    return item;
  }
};

//! Maps \c KAMI_LOG_LEVEL style variables onto \c log-level options
struct run_time::impl::env_var_mapper
{
  const po::options_description& opts_;

  env_var_mapper (const po::options_description& opts)
    : opts_(opts)
  {}

  std::string
  operator() (const std::string& env_var) const
  {
    static const regex re (PACKAGE_ENV_VAR_PREFIX "(.*)");
    smatch m;

    if (!regex_match (env_var, m, re)) return std::string ();

    std::string name (m.str (1));
    std::transform (name.begin (), name.end (), name.begin (),
                    ::tolower);
    std::replace (name.begin (), name.end (), '_', '-');

    return (opts_.find_nothrow (name, false)
            ? name
            : std::string ());
  }
};

run_time::impl::impl (int argc, const char *const argv[])
  : gnu_opts_("GNU standard options")
  , std_opts_("Standard options")
{
  argzero_ = argv[0];
  args_.resize (argc - 1);
  std::copy (argv + 1, argv + argc, args_.begin ());

  gnu_opts_
    .add_options ()
    ("help"   , "display this help and exit")
    ("version", "output version information and exit")
    ;
  std_opts_
    .add_options ()
    ("log-level", po::value< log::priority > (&log::threshold),
     "fatal, alert, error, brief, trace or debug")
    ;

  po::options_description cli_args;
  cli_args
    .add (gnu_opts_)
    .add (std_opts_)
    ;

  po::parsed_options cmd_line (po::command_line_parser (args_)
                               .options (cli_args)
                               .allow_unregistered ()
                               .run ());
  std::transform (cmd_line.options.begin (), cmd_line.options.end (),
                  cmd_line.options.begin (), unrecognize ());

  po::store (cmd_line, vm_);
  po::store (po::parse_environment (std_opts_,
                                    env_var_mapper (std_opts_)), vm_);
  po::notify (vm_);

  cmd_args_ = po::collect_unrecognized (cmd_line.options,
                                        po::include_positional);

  // Support invocation as kami-encode, kami-decode and the like
  const std::string prefix (PACKAGE_TARNAME "-");
  std::string cmd_name (argzero_.stem ().string ());
  if (0 == cmd_name.find (prefix))
    command_ = cmd_name.substr (prefix.length ());

  if (command_.empty ())
    {
      if (!cmd_args_.empty ()
          && !is_option (cmd_args_.front ()))
        {
          command_ = cmd_args_.front ();
          cmd_args_.erase (cmd_args_.begin ());
        }
    }

  log::debug ("run_time: command '%1%' with %2% argument(s)")
    % command_ % cmd_args_.size ();
}

} // namespace kami
