//  console.hpp -- terminal feedback for the command-line utility
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

#ifndef src_console_hpp_
#define src_console_hpp_

#include <iosfwd>
#include <string>

#include "kami/octet.hpp"

namespace kami {

//! Colored status lines and a progress bar on a terminal
/*! Nothing is output when quiet.  Colors are only used when the
 *  output stream is attached to a terminal.
 */
class console
{
public:
  enum status_type {
    busy,                       //!< something is in progress
    done,                       //!< something finished successfully
    failed,                     //!< something needs the user's attention
  };

  explicit console (std::ostream& os, bool quiet = false, bool color = false);

  void status (status_type type, const std::string& message);

  //! Redraws the progress bar for \a done out of \a total units
  /*! The line is finished once \a done reaches \a total.
   */
  void progress (streamsize done, streamsize total);

  //! Progress bar text without any decoration
  static std::string bar (streamsize done, streamsize total);

private:
  std::ostream& os_;
  bool quiet_;
  bool color_;
};

}       // namespace kami

#endif  /* src_console_hpp_ */
