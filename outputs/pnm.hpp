//  pnm.hpp -- collect PNM images in memory
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

#ifndef outputs_pnm_hpp_
#define outputs_pnm_hpp_

#include <vector>

#include "kami/device.hpp"
#include "kami/image.hpp"

namespace kami {
namespace _out_ {

//! Turns raw PBM, PGM and PPM data into in-memory images
/*! The data for a single image in the stream may hold any number of
 *  concatenated PNM images, as produced by rasterizing a multi-page
 *  document.  They are all parsed at the end of the image.  PBM data
 *  is converted to gray, other formats are kept as they are.
 */
class pnm_odevice
  : public odevice
{
public:
  pnm_odevice ();

  streamsize write (const octet *data, streamsize n);

  const std::vector< image >& images () const;

  //! Tells whether the sequence was aborted
  bool failed () const;

protected:
  void bos (const context& ctx);
  void boi (const context& ctx);
  void eoi (const context& ctx);
  void eof (const context& ctx);

private:
  octets data_;
  std::vector< image > images_;
  bool failed_;
};

}       // namespace _out_
}       // namespace kami

#endif  /* outputs_pnm_hpp_ */
