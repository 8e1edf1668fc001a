//  page-rasterizer.hpp -- turn documents and captures into page images
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

#ifndef src_page_rasterizer_hpp_
#define src_page_rasterizer_hpp_

#include <string>
#include <vector>

#include "kami/image.hpp"

namespace kami {

//! Produces gray page images from whatever holds a printed backup
/*! A directory is taken to contain one image file per page.  They are
 *  read in file name order, comparing runs of digits by their value.
 *  PNM files are read as is, other image formats are converted with
 *  ImageMagick and files with any other extension are skipped.  Any
 *  path that is not a directory is rasterized, with Ghostscript unless
 *  it is an image file itself.
 */
class page_rasterizer
{
public:
  explicit page_rasterizer (unsigned dpi = 300);

  //! Returns \c GRAY8 images for every page found at \a path
  /*! \throw std::ios_base::failure if \a path does not exist
   *  \throw std::runtime_error if conversion fails
   */
  std::vector< image > operator() (const std::string& path) const;

  static bool is_pnm (const std::string& path);
  static bool is_picture (const std::string& path);

private:
  unsigned dpi_;

  void read_(const std::string& file, std::vector< image >& pages) const;
};

}       // namespace kami

#endif  /* src_page_rasterizer_hpp_ */
