//  exception.cpp -- error conditions raised by the codec
//  Copyright (C) 2013  SEIKO EPSON CORPORATION
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

#include <sstream>

#include "kami/exception.hpp"

namespace kami {

namespace {

std::string
missing_message_(const incomplete_backup::index_set& missing)
{
  std::ostringstream os;
  os << "missing " << missing.size () << " unit"
     << (1 == missing.size () ? "" : "s") << ":";

  incomplete_backup::index_set::const_iterator it;
  for (it = missing.begin (); missing.end () != it; ++it)
    os << " " << *it;

  return os.str ();
}

}       // namespace

corruption_error::corruption_error (const std::string& message)
  : std::runtime_error (message)
{}

incomplete_backup::incomplete_backup (const index_set& missing)
  : std::runtime_error (missing_message_(missing))
  , missing_(missing)
{}

incomplete_backup::~incomplete_backup () throw ()
{}

const incomplete_backup::index_set&
incomplete_backup::missing () const
{
  return missing_;
}

header_not_found::header_not_found ()
  : std::runtime_error ("raster header marker not found")
{}

metadata_absent::metadata_absent ()
  : std::runtime_error ("no metadata symbol found")
{}

digest_mismatch::digest_mismatch (const std::string& expected,
                                  const std::string& actual)
  : std::runtime_error ("SHA-256 mismatch: expected " + expected
                        + ", got " + actual)
  , expected_(expected)
  , actual_(actual)
{}

digest_mismatch::~digest_mismatch () throw ()
{}

const std::string&
digest_mismatch::expected () const
{
  return expected_;
}

const std::string&
digest_mismatch::actual () const
{
  return actual_;
}

}       // namespace kami
