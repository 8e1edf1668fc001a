//  pdf.hpp -- PDF output for rendered pages
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

#ifndef filters_pdf_hpp_
#define filters_pdf_hpp_

#include <string>

#include "kami/compressor.hpp"
#include "kami/filter.hpp"

#include "pdf/array.hpp"
#include "pdf/dictionary.hpp"
#include "pdf/writer.hpp"

namespace kami {
namespace _flt_ {

//! Turns a sequence of images into a single PDF document
/*! Every image becomes a page of its own, sized after the image and
 *  its resolution.  Image data is deflate compressed.  Monochrome
 *  images are kept at one bit per pixel and are never interpolated.
 *  A caption can be set to print a line of text on the first page.
 */
class pdf
  : public filter
{
public:
  pdf ();

  streamsize write (const octet *data, streamsize n);

  //! Prints \a text on the first page
  /*! The baseline starts at \a x points from the left and \a y points
   *  from the top of the page.  Text is set in 8 point Helvetica.
   */
  void caption (const std::string& text, double x, double y);

protected:
  void bos (const context& ctx);
  void boi (const context& ctx);
  void eoi (const context& ctx);
  void eos (const context& ctx);

private:
  _pdf_::writer doc_;
  compressor    compressor_;
  octets        image_;

  shared_ptr< _pdf_::dictionary > pages_;
  shared_ptr< _pdf_::array >      kids_;
  shared_ptr< _pdf_::dictionary > font_;

  unsigned    page_;
  std::string caption_;
  double      caption_x_;
  double      caption_y_;

  void write_image_object (_pdf_::dictionary& image);
};

}       // namespace _flt_
}       // namespace kami

#endif  /* filters_pdf_hpp_ */
