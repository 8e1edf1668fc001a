//  magick.hpp -- rasterize image files with ImageMagick
//  Copyright (C) 2014, 2015  SEIKO EPSON CORPORATION
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

#ifndef filters_magick_hpp_
#define filters_magick_hpp_

#include "shell-pipe.hpp"

namespace kami {
namespace _flt_ {

//! Converts any image file format ImageMagick reads into raw PGM
/*! Every frame of a multi-frame input becomes a PGM image of its own.
 */
class magick
  : public shell_pipe
{
public:
  magick ();

protected:
  context estimate (const context& ctx);
  std::string arguments (const context& ctx);
};

}       // namespace _flt_
}       // namespace kami

#endif  /* filters_magick_hpp_ */
