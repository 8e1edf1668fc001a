//  object.hpp -- PDF object base class
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

#ifndef filters_pdf_object_hpp_
#define filters_pdf_object_hpp_

#include <cstddef>
#include <ostream>

#include "kami/memory.hpp"

namespace kami {
namespace _flt_ {
namespace _pdf_ {

//! Base class for all PDF objects
/*! Objects start out as direct objects.  Asking for an object number
 *  turns them into indirect ones.  A plain object constructed from a
 *  number only serves as a reference to the indirect object with that
 *  number.
 */
class object
{
public:
  typedef shared_ptr< object > ptr;

  object ();
  explicit object (std::size_t num);

  virtual ~object ();

  //! Returns the object number, allocating one if necessary
  std::size_t obj_num ();

  bool is_direct () const;

  //! Outputs the object's contents
  /*! Only a reference is output for plain objects.
   */
  virtual void operator>> (std::ostream& os) const;

  //! Restarts numbering for a new document
  static void reset_object_numbers ();

private:
  std::size_t obj_num_;

  static std::size_t next_obj_num_;
};

std::ostream& operator<< (std::ostream& os, const object& o);

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace kami

#endif  /* filters_pdf_object_hpp_ */
