//  pnm.hpp -- portable any map output
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

#ifndef filters_pnm_hpp_
#define filters_pnm_hpp_

#include <string>

#include "kami/filter.hpp"

namespace kami {
namespace _flt_ {

//! Writes each image in a sequence as a raw PBM, PGM or PPM file
/*! Monochrome images become PBM, gray images PGM and color images
 *  PPM.  PBM is ink oriented, one meaning black, whereas a monochrome
 *  context uses one for white.  Monochrome data is inverted on its
 *  way through.
 *
 *  The header goes out with the first image data, once the output has
 *  seen the begin of image.
 */
class pnm
  : public filter
{
public:
  streamsize write (const octet *data, streamsize n);

protected:
  void boi (const context& ctx);
  void eoi (const context& ctx);

private:
  std::string header_;

  void flush_header_();
};

}       // namespace _flt_
}       // namespace kami

#endif  /* filters_pnm_hpp_ */
