//  ghostscript.cpp -- rasterize PDF documents with Ghostscript
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

#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "kami/format.hpp"

#include "ghostscript.hpp"

#ifndef GHOSTSCRIPT_PROGRAM
#define GHOSTSCRIPT_PROGRAM "gs"
#endif

namespace kami {
namespace _flt_ {

ghostscript::ghostscript (unsigned dpi)
  : shell_pipe (GHOSTSCRIPT_PROGRAM)
  , dpi_(dpi)
{
  if (0 == dpi_)
    BOOST_THROW_EXCEPTION
      (std::invalid_argument ("resolution must be positive"));
}

context
ghostscript::estimate (const context& ctx)
{
  context rv (context::unknown_size, context::unknown_size, context::GRAY8);
  rv.content_type ("image/x-portable-graymap");
  rv.resolution (dpi_);
  return rv;
}

std::string
ghostscript::arguments (const context&)
{
  // -sOutputFile=- sends all messages to stderr
  return (format ("-q -dSAFER -dBATCH -dNOPAUSE -sDEVICE=pgmraw"
                  " -r%1% -sOutputFile=- -")
          % dpi_).str ();
}

}       // namespace _flt_
}       // namespace kami
