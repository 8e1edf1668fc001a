//  symbol-codec.hpp -- deterministic symbol codec for use in tests
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

#ifndef kami_test_symbol_codec_hpp_
#define kami_test_symbol_codec_hpp_

#include <algorithm>
#include <string>
#include <vector>

#include "../symbol-codec.hpp"

namespace kami {

//!  Stores a payload verbatim in a single row of gray pixels
/*!  Pages can be put together from several symbols with stack().  Each
 *   row of a page is one symbol, padded with zero octets.
 */
class text_codec : public symbol_codec
{
public:
  image render (const std::string& text, tolerance) const
  {
    context ctx (text.size (), 1, context::GRAY8);
    return image (ctx, text);
  }

  std::vector< std::string > scan (const image& page) const
  {
    std::vector< std::string > rv;
    if (context::GRAY8 != page.get_context ().type ()) return rv;

    const octets& data (page.data ());
    const image::size_type w = page.width ();
    for (image::size_type y = 0; y < page.height (); ++y)
      {
        std::string row (data, y * w, w);
        row.erase (std::find (row.begin (), row.end (), '\0'), row.end ());
        if (!row.empty ()) rv.push_back (row);
      }
    return rv;
  }

  //!  Puts \a symbols on a single page, one per row
  static image stack (const std::vector< image >& symbols)
  {
    image::size_type w = 1;
    for (std::vector< image >::size_type i = 0; i < symbols.size (); ++i)
      w = std::max (w, symbols[i].width ());

    octets data;
    for (std::vector< image >::size_type i = 0; i < symbols.size (); ++i)
      {
        octets row (symbols[i].data ());
        row.resize (w, '\0');
        data += row;
      }
    return image (context (w, symbols.size (), context::GRAY8), data);
  }
};

}       // namespace kami

#endif  /* kami_test_symbol_codec_hpp_ */
