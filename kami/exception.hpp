//  exception.hpp -- error conditions raised by the codec
//  Copyright (C) 2012, 2013  SEIKO EPSON CORPORATION
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

#ifndef kami_exception_hpp_
#define kami_exception_hpp_

#include <exception>
#include <set>
#include <stdexcept>
#include <string>

namespace kami {

using std::exception_ptr;
using std::current_exception;
using std::rethrow_exception;

//! Compressed data or its text encoding cannot be read back
class corruption_error
  : public std::runtime_error
{
public:
  explicit corruption_error (const std::string& message);
};

//! Not all of a backup's units were recovered
/*! No partial reconstruction is attempted.  The missing unit indices
 *  are available for reporting so a user can rescan just those.
 */
class incomplete_backup
  : public std::runtime_error
{
public:
  typedef std::set< unsigned > index_set;

  explicit incomplete_backup (const index_set& missing);
  ~incomplete_backup () throw ();

  const index_set& missing () const;

private:
  index_set missing_;
};

//! The raster header marker could not be located
class header_not_found
  : public std::runtime_error
{
public:
  header_not_found ();
};

//! None of the decoded symbols carried backup metadata
class metadata_absent
  : public std::runtime_error
{
public:
  metadata_absent ();
};

//! Recovered data does not match the recorded digest
/*! This is a warning under the default policy and only thrown when
 *  strict verification has been requested.
 */
class digest_mismatch
  : public std::runtime_error
{
public:
  digest_mismatch (const std::string& expected, const std::string& actual);
  ~digest_mismatch () throw ();

  const std::string& expected () const;
  const std::string& actual () const;

private:
  std::string expected_;
  std::string actual_;
};

}       // namespace kami

#endif  /* kami_exception_hpp_ */
