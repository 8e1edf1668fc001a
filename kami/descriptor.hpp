//  descriptor.hpp -- what is known about a backed up file
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

#ifndef kami_descriptor_hpp_
#define kami_descriptor_hpp_

#include <string>

#include "octet.hpp"

namespace kami {

//! Identifies the file carried by a backup
struct descriptor
{
  typedef unsigned long long size_type;

  std::string name;
  size_type   size;
  std::string digest;           //!< lower case SHA-256 hex digest

  descriptor ();
  descriptor (const std::string& name, size_type size,
              const std::string& digest);

  //! Describes \a data, computing its digest
  static descriptor of (const octets& data, const std::string& name);

  //! One line summary as printed on the first page
  /*! Reads "<name> - <size> bytes - <units> <what> - SHA256: <hex>".
   */
  std::string caption (unsigned units,
                       const std::string& what = "QR codes") const;
};

}       // namespace kami

#endif  /* kami_descriptor_hpp_ */
