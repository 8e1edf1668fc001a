//  raster-strategy.cpp -- backups as page filling bit rasters
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

#include <algorithm>
#include <cctype>
#include <cmath>

#include <boost/lexical_cast.hpp>
#include <boost/throw_exception.hpp>

#include "kami/digest.hpp"
#include "kami/exception.hpp"
#include "kami/log.hpp"
#include "kami/raster-strategy.hpp"

namespace kami {

const std::string raster_strategy::marker = "STPRv1-BITS";

namespace {

const octet separator = '|';

//! Parses a header candidate starting at \a pos
/*! Returns the offset of the first compressed octet, or \c npos when
 *  the text at \a pos is not a well-formed header.
 */
octets::size_type
parse_header (const octets& s, octets::size_type pos,
              std::string& digest, descriptor::size_type& size)
{
  octets::size_type i = pos + raster_strategy::marker.size ();

  if (i >= s.size () || separator != s[i]) return octets::npos;
  ++i;

  if (i + sha256::hex_size >= s.size ()) return octets::npos;
  std::string hex (s, i, sha256::hex_size);
  if (!is_hex_digest (hex)) return octets::npos;
  i += sha256::hex_size;

  if (separator != s[i]) return octets::npos;
  ++i;

  octets::size_type end = s.find (separator, i);
  if (octets::npos == end || end == i) return octets::npos;
  for (octets::size_type j = i; j < end; ++j)
    if (!isdigit (traits::to_int_type (s[j]))) return octets::npos;

  try
    {
      size = boost::lexical_cast< descriptor::size_type >
        (s.substr (i, end - i));
    }
  catch (const boost::bad_lexical_cast&)
    {
      return octets::npos;
    }

  digest = hex;
  for (std::string::iterator it = digest.begin (); digest.end () != it; ++it)
    *it = tolower (traits::to_int_type (*it));

  return end + 1;
}

}       // namespace

raster_strategy::raster_strategy (const page_geometry& geometry)
  : geometry_(geometry)
{}

octets
raster_strategy::payload (const octets& data) const
{
  descriptor info (descriptor::of (data, std::string ()));

  octets rv (marker);
  rv += separator;
  rv += info.digest;
  rv += separator;
  rv += boost::lexical_cast< std::string > (info.size);
  rv += separator;
  rv += compressor_.compress (data);

  return rv;
}

std::vector< image >
raster_strategy::pack (const octets& payload) const
{
  const context ctx (geometry_.usable_context ());
  const streamsize w = ctx.width ();
  const streamsize capacity = geometry_.capacity ();
  const streamsize bits = 8 * streamsize (payload.size ());

  std::vector< image > rv;
  streamsize bit = 0;
  do
    {
      image page (ctx);
      const streamsize n = std::min (capacity, bits - bit);

      for (streamsize k = 0; k < n; ++k, ++bit)
        {
          int c = traits::to_int_type (payload[bit / 8]);
          if (!((c >> (7 - bit % 8)) & 0x01))
            page.set (k % w, k / w, false);
        }
      rv.push_back (page);
    }
  while (bit < bits);

  log::brief ("%1% payload bits on %2% page(s) of %3% bits")
    % bits % rv.size () % capacity;

  return rv;
}

octets
raster_strategy::unpack (const std::vector< image >& pages) const
{
  const streamsize uw = geometry_.usable_width ();
  const streamsize uh = geometry_.usable_height ();
  const streamsize margin = geometry_.margin ();

  octets rv;
  rv.reserve (pages.size () * geometry_.capacity () / 8);

  int c = 0;
  int n = 0;

  std::vector< image >::const_iterator it;
  for (it = pages.begin (); pages.end () != it; ++it)
    {
      const bool direct = (uw == it->width () && uh == it->height ());
      const double sx = double (it->width ())  / geometry_.width ();
      const double sy = double (it->height ()) / geometry_.height ();

      if (!direct)
        log::debug ("sampling %1%x%2% image as a %3%x%4% page")
          % it->width () % it->height ()
          % geometry_.width () % geometry_.height ();

      for (streamsize y = 0; y < uh; ++y)
        {
          streamsize py = y;
          if (!direct)
            {
              py = streamsize (std::floor ((margin + y + 0.5) * sy));
              if (py >= it->height ()) py = it->height () - 1;
            }

          for (streamsize x = 0; x < uw; ++x)
            {
              streamsize px = x;
              if (!direct)
                {
                  px = streamsize (std::floor ((margin + x + 0.5) * sx));
                  if (px >= it->width ()) px = it->width () - 1;
                }

              c = (c << 1) | (it->is_white (px, py) ? 1 : 0);
              if (8 == ++n)
                {
                  rv += octet (c);
                  c = 0;
                  n = 0;
                }
            }
        }
      signal_update_(it - pages.begin () + 1, pages.size ());
    }
  return rv;
}

restoration
raster_strategy::restore (const octets& stream) const
{
  octets::size_type pos = stream.find (marker);
  while (octets::npos != pos)
    {
      std::string digest;
      descriptor::size_type size = 0;
      octets::size_type start = parse_header (stream, pos, digest, size);

      if (octets::npos != start)
        {
          if (0 < pos)
            log::trace ("skipped %1% octets ahead of the header") % pos;

          restoration rv;
          rv.info = descriptor (std::string (), size, digest);
          rv.data = compressor_.decompress (stream.substr (start));
          if (rv.data.size () > size)
            rv.data.resize (size);

          verify (rv, digest);
          return rv;
        }
      log::debug ("ignoring malformed header candidate at %1%") % pos;
      pos = stream.find (marker, pos + 1);
    }

  BOOST_THROW_EXCEPTION (header_not_found ());
}

unit_set
raster_strategy::encode (const octets& data, const std::string& name)
{
  unit_set rv;
  rv.info   = descriptor::of (data, name);
  rv.layout = unit_set::full_page;
  rv.units  = pack (payload (data));

  for (std::vector< image >::size_type i = 0; i < rv.units.size (); ++i)
    signal_update_(i + 1, rv.units.size ());

  return rv;
}

restoration
raster_strategy::decode (const std::vector< image >& pages)
{
  return restore (unpack (pages));
}

}       // namespace kami
