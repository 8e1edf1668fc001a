//  memory.hpp -- managed memory pointers
//  Copyright (C) 2012, 2013  SEIKO EPSON CORPORATION
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

#ifndef kami_memory_hpp_
#define kami_memory_hpp_

/*! \file
 *  \brief Make the C++11 managed memory pointers available in \c kami
 */

#include <memory>

namespace kami {

using std::dynamic_pointer_cast;
using std::static_pointer_cast;
using std::make_shared;
using std::shared_ptr;
using std::weak_ptr;

//! Support conversion to \c shared_ptr<T> for pointers that aren't
/*! Pass a null_deleter with a raw pointer to the \c shared_ptr<T>
 *  constructor when the pointee is owned elsewhere.
 */
struct null_deleter
{
  void operator() (const void *) const {}
};

}       // namespace kami

#endif  /* kami_memory_hpp_ */
