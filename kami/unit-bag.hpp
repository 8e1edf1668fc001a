//  unit-bag.hpp -- unordered collection of recovered units
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

#ifndef kami_unit_bag_hpp_
#define kami_unit_bag_hpp_

#include <map>
#include <string>

#include <boost/optional.hpp>

#include "exception.hpp"
#include "frame.hpp"
#include "mutex.hpp"

namespace kami {

//! Collects frames in whatever order they happen to be decoded
/*! The last metadata frame seen is kept.  Part frames are kept by
 *  index, a later part replacing an earlier one with the same index.
 *  Insertion is safe from multiple threads.
 */
class unit_bag
{
public:
  typedef incomplete_backup::index_set index_set;

  void insert (const frame& f);

  boost::optional< frame > metadata () const;

  //! Number of distinct part indices seen
  std::size_t size () const;

  //! Indices required by the metadata that have not been seen
  /*! \throw metadata_absent if no metadata frame has been seen
   */
  index_set missing () const;

  //! Concatenates the part chunks in ascending index order
  /*! \throw metadata_absent if no metadata frame has been seen
   *  \throw incomplete_backup if any part is missing
   */
  std::string assemble () const;

private:
  mutable mutex mutex_;

  boost::optional< frame > meta_;
  std::map< unsigned, std::string > parts_;

  index_set missing_() const;
};

}       // namespace kami

#endif  /* kami_unit_bag_hpp_ */
