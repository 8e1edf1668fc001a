//  digest.hpp -- SHA-256 message digests
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

#ifndef kami_digest_hpp_
#define kami_digest_hpp_

#include <string>

#include <boost/noncopyable.hpp>

#include "octet.hpp"

struct evp_md_ctx_st;

namespace kami {

//! Incremental SHA-256 computation
class sha256
  : boost::noncopyable
{
public:
  enum {
    size = 32,                  //!< digest length in octets
    hex_size = 2 * size,        //!< digest length in hex digits
  };

  sha256 ();
  ~sha256 ();

  sha256& update (const octet *data, streamsize n);
  sha256& update (const octets& data);

  //! Finishes the computation and returns the raw digest
  /*! The object is reset and can be reused afterwards.
   */
  octets digest ();

  //! Convenience function returning the lower case hex digest
  static std::string hex (const octets& data);

private:
  evp_md_ctx_st *ctx_;

  void init_();
};

//! Lower case hexadecimal representation of \a data
std::string hex_encode (const octets& data);

//! Tells whether \a s is a well-formed SHA-256 hex digest
bool is_hex_digest (const std::string& s);

}       // namespace kami

#endif  /* kami_digest_hpp_ */
