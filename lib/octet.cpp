//  octet.cpp -- octet and page stream marker definitions
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

#include "kami/octet.hpp"

namespace kami {

namespace {

// distance of each marker below the standard end-of-file value
enum marker_offset {
  EOF_OFFSET,
  EOS_OFFSET,
  EOI_OFFSET,
  BOI_OFFSET,
  BOS_OFFSET,
};

traits::int_type
marker (marker_offset offset)
{
  return std::char_traits< octet >::eof () - offset;
}

}       // namespace

traits::int_type
traits::to_int_type (const char_type& c)
{
  return 0xff & static_cast< int_type > (c);
}

traits::int_type traits::eof () { return marker (EOF_OFFSET); }
traits::int_type traits::eos () { return marker (EOS_OFFSET); }
traits::int_type traits::eoi () { return marker (EOI_OFFSET); }
traits::int_type traits::boi () { return marker (BOI_OFFSET); }
traits::int_type traits::bos () { return marker (BOS_OFFSET); }

bool
traits::is_marker (const int_type& i)
{
  return marker (BOS_OFFSET) <= i && i <= marker (EOF_OFFSET);
}

}       // namespace kami
