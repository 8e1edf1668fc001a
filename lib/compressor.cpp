//  compressor.cpp -- deflate compression of backup payloads
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

#include <zlib.h>

#include <boost/throw_exception.hpp>

#include "kami/compressor.hpp"
#include "kami/exception.hpp"
#include "kami/format.hpp"
#include "kami/log.hpp"

namespace kami {

namespace {

const uInt chunk_size = 16384;

std::string
zlib_message_(const z_stream& strm, int ec)
{
  return (format ("zlib: %1% (%2%)")
          % (strm.msg ? strm.msg : "unknown error")
          % ec).str ();
}

}       // namespace

compressor::compressor (int level)
  : level_(level)
{
  if (Z_DEFAULT_COMPRESSION != level
      && (Z_NO_COMPRESSION > level || Z_BEST_COMPRESSION < level))
    BOOST_THROW_EXCEPTION
      (std::invalid_argument ("compression level out of range"));
}

octets
compressor::compress (const octets& data) const
{
  z_stream strm = z_stream ();

  int ec = deflateInit (&strm, level_);
  if (Z_OK != ec)
    BOOST_THROW_EXCEPTION (std::runtime_error (zlib_message_(strm, ec)));

  octets rv;
  rv.resize (deflateBound (&strm, data.size ()));

  strm.next_in   = reinterpret_cast< Bytef * >
    (const_cast< octet * > (data.data ()));
  strm.avail_in  = data.size ();
  strm.next_out  = reinterpret_cast< Bytef * > (&rv[0]);
  strm.avail_out = rv.size ();

  ec = deflate (&strm, Z_FINISH);
  rv.resize (strm.total_out);
  deflateEnd (&strm);

  if (Z_STREAM_END != ec)
    BOOST_THROW_EXCEPTION (std::runtime_error (zlib_message_(strm, ec)));

  log::debug ("compressed %1% octets to %2%") % data.size () % rv.size ();
  return rv;
}

octets
compressor::decompress (const octets& data) const
{
  // zlib header: deflate method, no preset dictionary
  if (2 > data.size ()
      || 8 != (traits::to_int_type (data[0]) & 0x0f)
      || (traits::to_int_type (data[1]) & 0x20)
      || (  traits::to_int_type (data[0]) * 256
          + traits::to_int_type (data[1])) % 31)
    BOOST_THROW_EXCEPTION
      (corruption_error ("not a zlib compressed stream"));

  z_stream strm = z_stream ();

  int ec = inflateInit2 (&strm, -MAX_WBITS);
  if (Z_OK != ec)
    BOOST_THROW_EXCEPTION (std::runtime_error (zlib_message_(strm, ec)));

  strm.next_in  = reinterpret_cast< Bytef * >
    (const_cast< octet * > (data.data () + 2));
  strm.avail_in = data.size () - 2;

  octets rv;
  octet buf[chunk_size];

  do
    {
      strm.next_out  = reinterpret_cast< Bytef * > (buf);
      strm.avail_out = chunk_size;

      ec = inflate (&strm, Z_NO_FLUSH);
      rv.append (buf, chunk_size - strm.avail_out);
    }
  while (Z_OK == ec);

  std::string message (zlib_message_(strm, ec));
  uInt trailing = strm.avail_in;
  inflateEnd (&strm);

  if (Z_STREAM_END != ec || 4 > trailing)
    {
      if (Z_BUF_ERROR == ec || Z_STREAM_END == ec)
        message = "compressed stream is truncated";
      BOOST_THROW_EXCEPTION (corruption_error (message));
    }

  const octet *p = data.data () + data.size () - trailing;
  uLong expected = 0;
  for (int i = 0; i < 4; ++i)
    expected = (expected << 8) | traits::to_int_type (p[i]);

  uLong actual = adler32 (0L, Z_NULL, 0);
  actual = adler32 (actual, reinterpret_cast< const Bytef * > (rv.data ()),
                    rv.size ());
  if (expected != actual)
    log::error ("zlib: checksum mismatch, %1% octets may be damaged")
      % rv.size ();

  trailing -= 4;
  if (trailing)
    log::debug ("ignoring %1% octets after compressed stream") % trailing;

  return rv;
}

}       // namespace kami
