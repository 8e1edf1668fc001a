//  iobase.hpp -- page stream producer and consumer interfaces
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

#ifndef kami_iobase_hpp_
#define kami_iobase_hpp_

#include "context.hpp"
#include "memory.hpp"
#include "octet.hpp"

namespace kami {

enum constants {
  default_buffer_size = 8192
};

//! Produces a page stream
class input
{
public:
  typedef shared_ptr< input > ptr;

  virtual ~input ();

  //! Produces up to \a n octets of image \a data
  /*! Returns the number of octets stored in \a data while inside an
   *  image.  Everywhere else, and once an image is exhausted, no data
   *  is stored and the marker for the next position in the stream is
   *  returned instead.  See traits for the markers' order.
   */
  virtual streamsize read (octet *data, streamsize n) = 0;

  //! Returns the current stream marker, same as \c read(NULL,0)
  virtual streamsize marker () = 0;

  //! Describes the image that is currently produced
  virtual context get_context () const;

protected:
  input (const context& ctx = context ());

  context ctx_;
};

//! Consumes a page stream
/*! The mark() function dispatches each marker to a hook that does
 *  nothing by default.  Consumers override whichever hooks they need.
 */
class output
{
public:
  typedef shared_ptr< output > ptr;

  virtual ~output ();

  //! \return the number of octets consumed
  virtual streamsize write (const octet *data, streamsize n) = 0;

  virtual void mark (traits::int_type c, const context& ctx);

  virtual context get_context () const;

protected:
  output ();

  virtual void bos (const context& ctx);
  virtual void boi (const context& ctx);
  virtual void eoi (const context& ctx);
  virtual void eos (const context& ctx);
  //! The producer gave up part way through the stream
  virtual void eof (const context& ctx);

  context ctx_;
};

//! Copies a whole page stream from \a iref to \a oref
/*! \return traits::eos() on success
 */
streamsize operator|  (input& iref, output& oref);

//! Copies a single image from \a iref to \a oref
/*! \return traits::eoi() on success
 */
streamsize operator>> (input& iref, output& oref);

}       // namespace kami

#endif  /* kami_iobase_hpp_ */
