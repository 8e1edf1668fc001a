//  ghostscript.hpp -- rasterize PDF documents with Ghostscript
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

#ifndef filters_ghostscript_hpp_
#define filters_ghostscript_hpp_

#include "shell-pipe.hpp"

namespace kami {
namespace _flt_ {

//! Renders every page of a PDF or PostScript document to raw PGM
class ghostscript
  : public shell_pipe
{
public:
  explicit ghostscript (unsigned dpi = 300);

protected:
  context estimate (const context& ctx);
  std::string arguments (const context& ctx);

private:
  unsigned dpi_;
};

}       // namespace _flt_
}       // namespace kami

#endif  /* filters_ghostscript_hpp_ */
