//  digest.cpp -- SHA-256 message digests
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

#include <cctype>
#include <stdexcept>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <boost/throw_exception.hpp>

#include "kami/digest.hpp"

namespace kami {

namespace {

std::runtime_error
openssl_error_(const std::string& what)
{
  char buf[256] = "unknown error";
  unsigned long ec = ERR_get_error ();
  if (ec) ERR_error_string_n (ec, buf, sizeof (buf));
  return std::runtime_error (what + ": " + buf);
}

}       // namespace

sha256::sha256 ()
  : ctx_(EVP_MD_CTX_new ())
{
  if (!ctx_)
    BOOST_THROW_EXCEPTION (openssl_error_("EVP_MD_CTX_new"));
  init_();
}

sha256::~sha256 ()
{
  EVP_MD_CTX_free (ctx_);
}

sha256&
sha256::update (const octet *data, streamsize n)
{
  if (1 != EVP_DigestUpdate (ctx_, data, n))
    BOOST_THROW_EXCEPTION (openssl_error_("EVP_DigestUpdate"));
  return *this;
}

sha256&
sha256::update (const octets& data)
{
  return update (data.data (), data.size ());
}

octets
sha256::digest ()
{
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int  len = 0;

  if (1 != EVP_DigestFinal_ex (ctx_, md, &len))
    BOOST_THROW_EXCEPTION (openssl_error_("EVP_DigestFinal_ex"));

  init_();
  return octets (reinterpret_cast< const octet * > (md), len);
}

std::string
sha256::hex (const octets& data)
{
  sha256 md;
  return hex_encode (md.update (data).digest ());
}

void
sha256::init_()
{
  if (1 != EVP_DigestInit_ex (ctx_, EVP_sha256 (), NULL))
    BOOST_THROW_EXCEPTION (openssl_error_("EVP_DigestInit_ex"));
}

std::string
hex_encode (const octets& data)
{
  static const char digits[] = "0123456789abcdef";

  std::string rv;
  rv.reserve (2 * data.size ());
  for (octets::size_type i = 0; i < data.size (); ++i)
    {
      int c = traits::to_int_type (data[i]);
      rv += digits[c >> 4];
      rv += digits[c & 0x0f];
    }
  return rv;
}

bool
is_hex_digest (const std::string& s)
{
  if (sha256::hex_size != s.size ()) return false;

  for (std::string::size_type i = 0; i < s.size (); ++i)
    if (!isxdigit (static_cast< unsigned char > (s[i]))) return false;

  return true;
}

}       // namespace kami
