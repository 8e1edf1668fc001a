//  decode.cpp -- recover a file from printed pages
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
#include <iostream>
#include <sstream>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <boost/throw_exception.hpp>

#include <unistd.h>

#include "kami/digest.hpp"
#include "kami/exception.hpp"
#include "kami/file.hpp"
#include "kami/format.hpp"
#include "kami/log.hpp"

#include "commands.hpp"
#include "console.hpp"
#include "page-rasterizer.hpp"

namespace kami {

namespace {

const std::string fallback_name ("restored.bin");

//! Writes \a data to \a path as a single image sequence
void
write_file (const std::string& path, const octets& data)
{
  file_odevice dev (path);
  context ctx;
  ctx.content_type ("application/octet-stream");

  dev.mark (traits::bos (), ctx);
  dev.mark (traits::boi (), ctx);

  const octet *p = data.data ();
  streamsize n = data.size ();
  while (0 < n)
    {
      streamsize m = dev.write (p, n);
      p += m;
      n -= m;
    }
  dev.mark (traits::eoi (), ctx);
  dev.mark (traits::eos (), ctx);
}

}       // namespace

int
decode (const run_time& rt)
{
  namespace fs = boost::filesystem;
  namespace po = boost::program_options;
  using std::placeholders::_1;
  using std::placeholders::_2;

  settings s;

  po::options_description cmd_opts ("Decode options");
  cmd_opts
    .add_options ()
    ("jobs", po::value< unsigned > (&s.jobs)
     ->default_value (s.jobs),
     "number of pages to scan for symbols concurrently")
    ("strict", po::bool_switch (&s.strict),
     "fail on a digest mismatch instead of warning")
    ;

  if (!parse_arguments (rt, cmd_opts, s)) return EXIT_SUCCESS;

  console con (std::cout, s.quiet, isatty (STDOUT_FILENO));

  con.status (console::busy, "Rasterizing pages...");
  std::vector< image > pages (page_rasterizer (s.dpi) (s.input));

  strategy::ptr strategy (s.make_strategy ());
  scoped_connection c
    (strategy->connect_update (std::bind (&console::progress, &con,
                                          _1, _2)));

  con.status (console::busy,
              (format ("Decoding %1% page(s)...") % pages.size ()).str ());

  restoration r;
  try
    {
      r = strategy->decode (pages);
    }
  catch (const incomplete_backup& e)
    {
      std::ostringstream missing;
      incomplete_backup::index_set::const_iterator it;
      for (it = e.missing ().begin (); e.missing ().end () != it; ++it)
        missing << (e.missing ().begin () == it ? "" : ", ") << *it;

      con.status (console::failed, "Missing parts: " + missing.str ());
      throw;
    }

  std::string path (s.output);
  if (fs::is_directory (path))
    {
      // never let a recorded name escape the output directory
      std::string name (fs::path (r.info.name).filename ().string ());
      if (name.empty () || "." == name || ".." == name)
        name = fallback_name;
      path = (fs::path (path) / name).string ();
    }

  for (std::vector< std::string >::const_iterator it = r.warnings.begin ();
       r.warnings.end () != it; ++it)
    {
      con.status (console::failed, "Warning: " + *it);
    }

  write_file (path, r.data);

  con.status (console::done,
              (format ("Wrote reconstructed file to %1% (%2% bytes). "
                       "SHA256 %3%.")
               % path % r.data.size () % sha256::hex (r.data)).str ());
  return EXIT_SUCCESS;
}

}       // namespace kami
