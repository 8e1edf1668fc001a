//  symbol-strategy.hpp -- backups as sets of framed symbols
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

#ifndef kami_symbol_strategy_hpp_
#define kami_symbol_strategy_hpp_

#include <string>
#include <vector>

#include "strategy.hpp"
#include "symbol-codec.hpp"
#include "unit-bag.hpp"

namespace kami {

//! Spreads a file over many small, self-describing symbols
/*! The compressed file is base64 encoded and cut into chunks.  Each
 *  chunk travels in its own part frame.  A single metadata frame
 *  carries file name, unit count, size and digest.  Symbols can be
 *  captured in any order and assembly only needs all of them once.
 */
class symbol_strategy
  : public strategy
{
public:
  enum {
    default_chunk_size = 800,
  };

  symbol_strategy (symbol_codec::ptr codec,
                   std::string::size_type chunk_size = default_chunk_size,
                   symbol_codec::tolerance level = symbol_codec::quartile,
                   unsigned jobs = 1);

  //! Payload texts for \a data, metadata first, then parts 1 to N
  /*! Empty \a data results in a metadata frame only.
   */
  std::vector< std::string >
  frames (const octets& data, const std::string& name) const;

  //! Reconstructs a file from payload texts in arbitrary order
  /*! Texts that are not frames are dropped.
   *
   *  \throw metadata_absent, incomplete_backup, corruption_error
   */
  restoration assemble (const std::vector< std::string >& payloads) const;
  restoration assemble (const unit_bag& bag) const;

  unit_set encode (const octets& data, const std::string& name);
  restoration decode (const std::vector< image >& pages);

  //! Number of pages scanned concurrently
  void jobs (unsigned n);

private:
  symbol_codec::ptr codec_;
  std::string::size_type chunk_size_;
  symbol_codec::tolerance level_;
  unsigned jobs_;

  void scan_(const image& page, unit_bag& bag) const;
};

}       // namespace kami

#endif  /* kami_symbol_strategy_hpp_ */
