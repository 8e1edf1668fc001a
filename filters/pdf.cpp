//  pdf.cpp -- PDF output for rendered pages
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

#include <sstream>
#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "kami/format.hpp"
#include "kami/log.hpp"

#include "pdf.hpp"

namespace kami {
namespace _flt_ {

using _pdf_::array;
using _pdf_::dictionary;
using _pdf_::object;
using _pdf_::primitive;

namespace {

//! Converts \a pixels at \a res dots per inch to PDF points
double
to_points (context::size_type pixels, context::size_type res)
{
  return 72.0 * pixels / (0 < res ? res : 72);
}

}       // namespace

pdf::pdf ()
  : page_(0)
  , caption_x_(0)
  , caption_y_(0)
{}

streamsize
pdf::write (const octet *data, streamsize n)
{
  if (!data || 0 >= n) return 0;

  image_.append (data, n);
  return n;
}

void
pdf::caption (const std::string& text, double x, double y)
{
  caption_   = text;
  caption_x_ = x;
  caption_y_ = y;
}

void
pdf::bos (const context& ctx)
{
  object::reset_object_numbers ();
  doc_ = _pdf_::writer ();
  page_ = 0;

  pages_ = make_shared< dictionary > ();
  kids_  = make_shared< array > ();
  font_.reset ();
  pages_->obj_num ();

  // goes out together with the first page
  doc_.header ();
}

void
pdf::boi (const context& ctx)
{
  if (context::unknown_size == ctx.width ()
      || context::unknown_size == ctx.height ())
    BOOST_THROW_EXCEPTION
      (std::logic_error ("PDF output needs to know the image size upfront"));

  ctx_ = ctx;
  ctx_.content_type ("application/pdf");

  image_.clear ();
  image_.reserve (ctx.octets_per_image ());
}

void
pdf::eoi (const context& ctx)
{
  const double w = to_points (ctx_.width (),  ctx_.x_resolution ());
  const double h = to_points (ctx_.height (), ctx_.y_resolution ());
  const std::string name = (format ("Im%1%") % ++page_).str ();
  const bool captioned = (1 == page_ && !caption_.empty ());

  dictionary page;
  dictionary contents;
  dictionary image;

  kids_->insert (object (page.obj_num ()));

  shared_ptr< dictionary > xobjects = make_shared< dictionary > ();
  xobjects->insert (name, object (image.obj_num ()));

  shared_ptr< array > procset = make_shared< array > ();
  procset->insert (primitive ("/PDF"));
  procset->insert (primitive (ctx_.is_rgb () ? "/ImageC" : "/ImageB"));

  shared_ptr< dictionary > resources = make_shared< dictionary > ();
  resources->insert ("XObject", xobjects);
  resources->insert ("ProcSet", procset);

  if (captioned)
    {
      if (!font_)
        {
          font_ = make_shared< dictionary > ();
          font_->insert ("Type", primitive ("/Font"));
          font_->insert ("Subtype", primitive ("/Type1"));
          font_->insert ("BaseFont", primitive ("/Helvetica"));
          font_->insert ("Encoding", primitive ("/WinAnsiEncoding"));
          doc_.write (*font_);
        }
      shared_ptr< dictionary > fonts = make_shared< dictionary > ();
      fonts->insert ("F1", object (font_->obj_num ()));
      resources->insert ("Font", fonts);
      procset->insert (primitive ("/Text"));
    }

  shared_ptr< array > mbox = make_shared< array > ();
  mbox->insert (primitive (0));
  mbox->insert (primitive (0));
  mbox->insert (primitive (w));
  mbox->insert (primitive (h));

  page.insert ("Type", primitive ("/Page"));
  page.insert ("Parent", object (pages_->obj_num ()));
  page.insert ("Resources", resources);
  page.insert ("MediaBox", mbox);
  page.insert ("Contents", object (contents.obj_num ()));
  doc_.write (page);

  std::ostringstream ss;
  ss << "q\n"
     << w << " 0 0 " << h << " 0 0 cm\n"
     << "/" << name << " Do\n"
     << "Q\n";
  if (captioned)
    {
      ss << "BT\n"
         << "/F1 8 Tf\n"
         << caption_x_ << " " << h - caption_y_ << " Td\n"
         << primitive::text (caption_) << " Tj\n"
         << "ET\n";
    }

  doc_.begin_stream (contents);
  doc_.write (ss.str ());
  doc_.end_stream ();

  write_image_object (image);
  doc_.write (output_);

  log::trace ("PDF page %1%: %2%x%3% pixels, %4% octets")
    % page_ % ctx_.width () % ctx_.height () % image_.size ();

  image_.clear ();
}

void
pdf::eos (const context& ctx)
{
  pages_->insert ("Type", primitive ("/Pages"));
  pages_->insert ("Kids", kids_);
  pages_->insert ("Count", primitive (kids_->size ()));
  doc_.write (*pages_);

  dictionary info;
  info.insert ("Producer", primitive::text (PACKAGE_STRING));
  info.insert ("Creator", primitive::text (PACKAGE_STRING));
  doc_.write (info);

  dictionary catalog;
  catalog.insert ("Type", primitive ("/Catalog"));
  catalog.insert ("Pages", object (pages_->obj_num ()));
  doc_.write (catalog);

  dictionary trailer;
  trailer.insert ("Info", object (info.obj_num ()));
  trailer.insert ("Root", object (catalog.obj_num ()));
  doc_.trailer (trailer);

  doc_.write (output_);
}

void
pdf::write_image_object (dictionary& image)
{
  if (ctx_.octets_per_image () != streamsize (image_.size ()))
    log::error ("PDF image data: expected %1% octets, got %2%")
      % ctx_.octets_per_image () % image_.size ();

  octets data (compressor_.compress (image_));

  image.insert ("Type", primitive ("/XObject"));
  image.insert ("Subtype", primitive ("/Image"));
  image.insert ("Width", primitive (ctx_.width ()));
  image.insert ("Height", primitive (ctx_.height ()));
  image.insert ("ColorSpace",
                primitive (ctx_.is_rgb () ? "/DeviceRGB" : "/DeviceGray"));
  image.insert ("BitsPerComponent", primitive (ctx_.depth ()));
  image.insert ("Filter", primitive ("/FlateDecode"));
  image.insert ("Interpolate", primitive ("false"));

  doc_.begin_stream (image);
  doc_.write (data.data (), data.size ());
  doc_.end_stream ();
}

}       // namespace _flt_
}       // namespace kami
