//  page-rasterizer.cpp -- turn documents and captures into page images
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
#include <ios>
#include <stdexcept>

#include <boost/filesystem.hpp>
#include <boost/throw_exception.hpp>

#include "kami/file.hpp"
#include "kami/log.hpp"
#include "kami/stream.hpp"

#include "../filters/ghostscript.hpp"
#include "../filters/magick.hpp"
#include "../outputs/pnm.hpp"

#include "page-rasterizer.hpp"

namespace fs = boost::filesystem;

namespace kami {

namespace {

std::string
extension (const std::string& path)
{
  std::string ext (fs::path (path).extension ().string ());
  std::transform (ext.begin (), ext.end (), ext.begin (), ::tolower);
  return ext;
}

//! Orders file names with embedded runs of digits by their value
/*! This puts \c page-2.pbm ahead of \c page-10.pbm, the way page
 *  files get numbered without any zero padding.
 */
bool
natural_less (const std::string& a, const std::string& b)
{
  static const char digits[] = "0123456789";

  std::string::size_type i = 0;
  std::string::size_type j = 0;

  while (i < a.size () && j < b.size ())
    {
      if (isdigit (static_cast< unsigned char > (a[i]))
          && isdigit (static_cast< unsigned char > (b[j])))
        {
          std::string::size_type a_end = a.find_first_not_of (digits, i);
          std::string::size_type b_end = b.find_first_not_of (digits, j);
          if (std::string::npos == a_end) a_end = a.size ();
          if (std::string::npos == b_end) b_end = b.size ();

          // leading zeros carry no value
          while (i < a_end && '0' == a[i]) ++i;
          while (j < b_end && '0' == b[j]) ++j;

          if (a_end - i != b_end - j)
            return a_end - i < b_end - j;

          int rv = a.compare (i, a_end - i, b, j, b_end - j);
          if (rv) return rv < 0;

          i = a_end;
          j = b_end;
        }
      else
        {
          if (a[i] != b[j])
            return (static_cast< unsigned char > (a[i])
                    < static_cast< unsigned char > (b[j]));
          ++i;
          ++j;
        }
    }

  if (i < a.size () || j < b.size ())
    return j < b.size () && i == a.size ();

  return a < b;
}

}       // namespace

page_rasterizer::page_rasterizer (unsigned dpi)
  : dpi_(dpi)
{
  if (0 == dpi_)
    BOOST_THROW_EXCEPTION
      (std::invalid_argument ("resolution must be positive"));
}

bool
page_rasterizer::is_pnm (const std::string& path)
{
  const std::string ext (extension (path));
  return (".pbm" == ext || ".pgm" == ext || ".ppm" == ext || ".pnm" == ext);
}

bool
page_rasterizer::is_picture (const std::string& path)
{
  const std::string ext (extension (path));
  return (".png" == ext || ".jpg" == ext || ".jpeg" == ext
          || ".tif" == ext || ".tiff" == ext
          || ".bmp" == ext || ".gif" == ext);
}

std::vector< image >
page_rasterizer::operator() (const std::string& path) const
{
  if (!fs::exists (path))
    BOOST_THROW_EXCEPTION
      (std::ios_base::failure (path + ": no such file or directory"));

  std::vector< image > pages;

  if (!fs::is_directory (path))
    {
      read_(path, pages);
      return pages;
    }

  std::vector< std::string > files;
  for (fs::directory_iterator it (path); fs::directory_iterator () != it; ++it)
    {
      if (!fs::is_regular_file (it->status ())) continue;

      std::string file (it->path ().string ());
      if (is_pnm (file) || is_picture (file))
        files.push_back (file);
      else
        log::brief ("skipping %1%") % file;
    }
  std::sort (files.begin (), files.end (), natural_less);

  for (std::vector< std::string >::const_iterator it = files.begin ();
       files.end () != it; ++it)
    {
      read_(*it, pages);
    }
  return pages;
}

void
page_rasterizer::read_(const std::string& file,
                       std::vector< image >& pages) const
{
  shared_ptr< _out_::pnm_odevice > sink
    (make_shared< _out_::pnm_odevice > ());

  stream str;
  if (is_picture (file))
    str.push (make_shared< _flt_::magick > ());
  else if (!is_pnm (file))
    str.push (make_shared< _flt_::ghostscript > (dpi_));
  str.push (sink);

  file_idevice dev (file);
  dev | str;

  if (sink->failed () || sink->images ().empty ())
    BOOST_THROW_EXCEPTION
      (std::runtime_error (file + ": cannot obtain any page images"));

  const std::vector< image >& images (sink->images ());
  for (std::vector< image >::const_iterator it = images.begin ();
       images.end () != it; ++it)
    {
      pages.push_back (it->to_gray ());
    }
  log::trace ("%1%: %2% page(s)") % file % images.size ();
}

}       // namespace kami
