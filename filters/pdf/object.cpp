//  object.cpp -- PDF object base class
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "object.hpp"

namespace kami {
namespace _flt_ {
namespace _pdf_ {

std::size_t object::next_obj_num_ = 0;

object::object ()
  : obj_num_(0)
{}

object::object (std::size_t num)
  : obj_num_(num)
{}

object::~object ()
{}

std::size_t
object::obj_num ()
{
  if (is_direct ())
    {
      // cross-reference generation numbers are limited to 65535
      if (65535 == next_obj_num_)
        BOOST_THROW_EXCEPTION
          (std::runtime_error ("PDF object number overflow"));

      obj_num_ = ++next_obj_num_;
    }
  return obj_num_;
}

bool
object::is_direct () const
{
  return 0 == obj_num_;
}

void
object::operator>> (std::ostream& os) const
{
  os << obj_num_ << " 0 R";
}

void
object::reset_object_numbers ()
{
  next_obj_num_ = 0;
}

std::ostream&
operator<< (std::ostream& os, const object& o)
{
  o >> os;
  return os;
}

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace kami
