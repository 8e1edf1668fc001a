//  memory.hpp -- in-memory devices for use in tests
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

#ifndef kami_test_memory_hpp_
#define kami_test_memory_hpp_

#include <algorithm>
#include <vector>

#include "../device.hpp"
#include "../filter.hpp"

namespace kami {

//!  Produces a number of images filled with a single octet \a value
class setmem_idevice : public idevice
{
  const unsigned image_count_;
  const octet    value_;

  streamsize octets_left_;
  unsigned   images_left_;

protected:
  bool is_consecutive () const
  { return 1 < image_count_; }
  bool obtain_media ()
  { return 0 < images_left_; }
  bool set_up_image ()
  {
    if (0 == images_left_) return false;
    --images_left_;
    octets_left_ = ctx_.octets_per_image ();
    return true;
  }
  streamsize sgetn (octet *data, streamsize n)
  {
    streamsize rv = std::min (octets_left_, n);
    traits::assign (data, rv, value_);
    octets_left_ -= rv;
    return rv;
  }

public:
  setmem_idevice (const context& ctx, unsigned image_count = 1,
                  octet value = 0x00)
    : idevice (ctx), image_count_(image_count), value_(value)
    , octets_left_(0), images_left_(image_count)
  {}
};

//!  Collects the octets of every image it is given
class memory_odevice : public odevice
{
public:
  std::vector< octets >  images;
  std::vector< context > contexts;
  std::vector< traits::int_type > markers;

  streamsize write (const octet *data, streamsize n)
  {
    images.back ().append (data, n);
    return n;
  }

  //!  Everything written for the whole sequence
  octets all () const
  {
    octets rv;
    for (std::vector< octets >::size_type i = 0; i < images.size (); ++i)
      rv += images[i];
    return rv;
  }

protected:
  void bos (const context&) { markers.push_back (traits::bos ()); }
  void boi (const context& ctx)
  {
    markers.push_back (traits::boi ());
    images.push_back (octets ());
    contexts.push_back (ctx);
  }
  void eoi (const context&) { markers.push_back (traits::eoi ()); }
  void eos (const context&) { markers.push_back (traits::eos ()); }
  void eof (const context&) { markers.push_back (traits::eof ()); }
};

//!  Feeds a fixed octet sequence as a single image
class string_idevice : public idevice
{
  const octets data_;
  streamsize offset_;

protected:
  bool set_up_image ()
  {
    offset_ = 0;
    ctx_ = context ();
    ctx_.content_type ("application/octet-stream");
    return true;
  }
  streamsize sgetn (octet *data, streamsize n)
  {
    streamsize rv = std::min (n, streamsize (data_.size ()) - offset_);
    traits::copy (data, data_.data () + offset_, rv);
    offset_ += rv;
    return rv;
  }

public:
  explicit string_idevice (const octets& data)
    : data_(data), offset_(0)
  {}
};

//!  Filters that %output their %input unchanged
class thru_filter : public filter
{
public:
  streamsize write (const octet *data, streamsize n)
  { return output_->write (data, n); }
};

}       // namespace kami

#endif  /* kami_test_memory_hpp_ */
