//  dictionary.hpp -- PDF dictionary objects
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

#ifndef filters_pdf_dictionary_hpp_
#define filters_pdf_dictionary_hpp_

#include <map>
#include <string>

#include "object.hpp"
#include "primitive.hpp"

namespace kami {
namespace _flt_ {
namespace _pdf_ {

//! Maps names to objects
/*! Keys are given without their leading slash.  Inserting an existing
 *  key replaces its value.
 */
class dictionary
  : public object
{
public:
  void insert (const std::string& key, object::ptr value);
  void insert (const std::string& key, const primitive& value);
  void insert (const std::string& key, const object& value);

  std::size_t size () const;

  //! Returns the value for \a key or a null pointer
  object::ptr operator[] (const std::string& key) const;

  void operator>> (std::ostream& os) const;

private:
  std::map< std::string, object::ptr > store_;
};

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace kami

#endif  /* filters_pdf_dictionary_hpp_ */
