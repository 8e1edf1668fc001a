//  primitive.hpp -- PDF names, numbers and strings
//  Copyright (C) 2012, 2015  SEIKO EPSON CORPORATION
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

#ifndef filters_pdf_primitive_hpp_
#define filters_pdf_primitive_hpp_

#include <sstream>
#include <string>

#include "object.hpp"

namespace kami {
namespace _flt_ {
namespace _pdf_ {

//! A name, number, boolean or string, output verbatim
class primitive
  : public object
{
public:
  primitive ();
  explicit primitive (const char *s);
  explicit primitive (const std::string& s);

  template< typename T >
  explicit primitive (const T& t)
  {
    std::ostringstream os;
    os << t;
    str_ = os.str ();
  }

  //! Creates a literal string, escaping as needed
  static primitive text (const std::string& s);

  const std::string& str () const;

  void operator>> (std::ostream& os) const;

  bool operator== (const primitive& that) const;

private:
  std::string str_;
};

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace kami

#endif  /* filters_pdf_primitive_hpp_ */
