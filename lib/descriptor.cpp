//  descriptor.cpp -- what is known about a backed up file
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

#include "kami/descriptor.hpp"
#include "kami/digest.hpp"
#include "kami/format.hpp"

namespace kami {

descriptor::descriptor ()
  : size (0)
{}

descriptor::descriptor (const std::string& name, size_type size,
                        const std::string& digest)
  : name (name), size (size), digest (digest)
{}

descriptor
descriptor::of (const octets& data, const std::string& name)
{
  return descriptor (name, data.size (), sha256::hex (data));
}

std::string
descriptor::caption (unsigned units, const std::string& what) const
{
  return (format ("%1% - %2% bytes - %3% %4% - SHA256: %5%")
          % name % size % units % what % digest).str ();
}

}       // namespace kami
