//  strategy.hpp -- paper backup strategy interface
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

#ifndef kami_strategy_hpp_
#define kami_strategy_hpp_

#include <string>
#include <vector>

#include "compressor.hpp"
#include "descriptor.hpp"
#include "image.hpp"
#include "memory.hpp"
#include "signal.hpp"

namespace kami {

//! What an encoder hands to the page renderer
struct unit_set
{
  enum layout_type {
    grid,                       //!< several symbols per page
    full_page,                  //!< one image filling a page's usable area
  };

  descriptor  info;
  layout_type layout;
  std::vector< image > units;

  unit_set ();

  //! The caption line for the first page
  std::string caption () const;
};

//! What a decoder recovered
struct restoration
{
  descriptor info;
  octets     data;

  //! Integrity problems that did not stop the restoration
  std::vector< std::string > warnings;

  bool verified () const;
};

//! Turns files into printable units and captured pages back into files
class strategy
{
public:
  typedef shared_ptr< strategy > ptr;

  typedef signal< void (streamsize, streamsize) > update_signal_type;

  virtual ~strategy ();

  virtual unit_set encode (const octets& data, const std::string& name) = 0;

  //! Recovers a file from captured \a pages
  /*! \throw digest_mismatch in strict mode only
   */
  virtual restoration decode (const std::vector< image >& pages) = 0;

  //! Progress as (units done, units in total)
  connection connect_update (const update_signal_type::slot_type& slot) const;

  //! Treat digest mismatches as fatal
  void strict (bool flag);
  bool strict () const;

protected:
  strategy ();

  //! Checks \a r.data against the \a expected digest
  /*! A mismatch is recorded as a warning in \a r or thrown, depending
   *  on the verification policy.
   */
  void verify (restoration& r, const std::string& expected) const;

  compressor compressor_;
  bool strict_;

  mutable update_signal_type signal_update_;
};

}       // namespace kami

#endif  /* kami_strategy_hpp_ */
