//  device.hpp -- page stream sources and sinks
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

#ifndef kami_device_hpp_
#define kami_device_hpp_

#include "iobase.hpp"
#include "memory.hpp"

namespace kami {

//! Base for page stream sources
/*! Subclasses describe where their images come from by implementing
 *  the protected hooks.  The read() function calls these as needed to
 *  walk through the markers of a page stream.  A stream that has come
 *  to an end, normally or not, starts over on the next read().
 */
class idevice
  : public input
{
public:
  typedef shared_ptr< idevice > ptr;

  streamsize read (octet *data, streamsize n);
  streamsize marker ();

protected:
  idevice (const context& ctx = context ());

  //! Says whether a stream may hold more than one image
  virtual bool is_consecutive () const;

  //! Says whether another image can be made available
  virtual bool obtain_media ();

  //! Prepares the next image, updating \c ctx_ as needed
  /*! The default implementation never succeeds.
   */
  virtual bool set_up_image ();

  //! Releases whatever set_up_image() and sgetn() acquired
  virtual void finish_image ();

  //! Produces up to \a n octets of image \a data
  /*! \return the number of octets produced, \c 0 at the end of the
   *          current image or a negative value to abort the stream
   */
  virtual streamsize sgetn (octet *data, streamsize n);

private:
  traits::int_type next_marker_();

  traits::int_type marker_;
};

//! Base for the page stream sinks that terminate a stream
class odevice
  : public output
{
public:
  typedef shared_ptr< odevice > ptr;
};

}       // namespace kami

#endif  /* kami_device_hpp_ */
