//  array.hpp -- PDF array objects
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

#ifndef filters_pdf_array_hpp_
#define filters_pdf_array_hpp_

#include <vector>

#include "object.hpp"
#include "primitive.hpp"

namespace kami {
namespace _flt_ {
namespace _pdf_ {

class array
  : public object
{
public:
  void insert (object::ptr obj);
  void insert (const primitive& obj);
  void insert (const object& obj);

  std::size_t size () const;

  const object& operator[] (std::size_t index) const;

  void operator>> (std::ostream& os) const;

private:
  std::vector< object::ptr > store_;
};

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace kami

#endif  /* filters_pdf_array_hpp_ */
