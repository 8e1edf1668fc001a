//  stream.hpp -- image data consuming streams
//  Copyright (C) 2012, 2013  SEIKO EPSON CORPORATION
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

#ifndef kami_stream_hpp_
#define kami_stream_hpp_

#include "device.hpp"
#include "filter.hpp"

namespace kami {

//!  Store an image data sequence
/*!  A %stream encapsulates zero or more filters capped by an output
 *   %device.  Filters and %device are maintained in a stack(-like)
 *   fashion.  The element that was pushed \e first faces the
 *   stream's API user.
 *
 *   A %stream may not be used for I/O activities until a %device has
 *   been pushed.  After that, nothing else can be pushed.
 */
class stream
  : public output
{
public:
  typedef shared_ptr< stream > ptr;

  streamsize write (const octet *data, streamsize n);
  void mark (traits::int_type c, const context& ctx);

  //!  Pushes a \a %device onto the object's %output stack
  void push (odevice::ptr device);

  //!  Pushes a \a %filter onto the object's %output stack
  /*!  Image data passed to write() is processed by all filters on the
   *   stack, starting with the \a %filter that was pushed \e first,
   *   before it is consumed by the object's %device.
   */
  void push (filter::ptr filter);

  odevice::ptr get_device () const;

private:
  void attach_(output::ptr out);

  output::ptr  bottom_;         //!< element facing the API user
  filter::ptr  filter_;         //!< top-most %filter on the stack
  odevice::ptr device_;         //!< %device that caps the stack
};

}       // namespace kami

#endif  /* kami_stream_hpp_ */
