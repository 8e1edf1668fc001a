//  file.hpp -- file based devices
//  Copyright (C) 2012, 2013, 2015  SEIKO EPSON CORPORATION
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

#ifndef kami_file_hpp_
#define kami_file_hpp_

#include <fstream>
#include <string>

#include "device.hpp"

namespace kami {

//!  Create path names following a simple pattern
/*!  Page images are numbered from one.
 */
class path_generator
{
public:
  //!  Default constructor
  /*!  A default path_generator evaluates to \c false in a Boolean
   *   context.  Its operator() member function should never be used.
   */
  path_generator ();

  //!  Creates a \c %i formatter \a pattern based instance
  /*!  The formatter may be a simple \c %i or contain a field width,
   *   similar to the printf() version.  Fields are always zero filled.
   *
   *   If \a pattern does not contain a \c %i formatter, a default
   *   constructed instance will be created.
   */
  explicit path_generator (const std::string& pattern);

  operator bool () const;

  std::string operator() ();

  //! Tells whether \a pattern contains a \c %i formatter
  static bool is_pattern (const std::string& pattern);

private:
  std::string parent_;
  std::string prefix_;
  std::string suffix_;
  int         width_;
  unsigned    offset_;
  bool        valid_;
};

//!  Load an image data sequence from file(s)
class file_idevice
  : public idevice
{
public:
  //!  Creates a device that loads a single file
  explicit file_idevice (const std::string& filename);

  //!  Creates a device that loads data from multiple files
  /*!  Path names are provided by a \a generator.  The first path name
   *   for which no file exists ends the image data sequence.
   */
  explicit file_idevice (const path_generator& generator);

  ~file_idevice ();

protected:
  bool is_consecutive () const;
  bool obtain_media ();
  bool set_up_image ();
  void finish_image ();
  streamsize sgetn (octet *data, streamsize n);

private:
  std::string    filename_;
  path_generator generator_;
  std::basic_filebuf< octet > file_;
  bool used_;
};

//!  Save an image data sequence to one or more files
class file_odevice
  : public odevice
{
public:
  //!  Creates a device that saves all image data in a single file
  /*!  \note  The file will not be opened until the sequence begins.
   */
  explicit file_odevice (const std::string& filename);

  //!  Creates a device that saves images in separate files
  /*!  Path names are provided by a \a generator.
   *   \note  Files are not opened until the start of an image.
   */
  explicit file_odevice (const path_generator& generator);

  ~file_odevice ();

  streamsize write (const octet *data, streamsize n);

protected:
  void open ();
  void close ();

  void bos (const context& ctx);
  void boi (const context& ctx);
  void eoi (const context& ctx);
  void eos (const context& ctx);
  void eof (const context& ctx);

  std::string    filename_;
  path_generator generator_;

  int fd_;
  size_t count_;
};

}       // namespace kami

#endif  /* kami_file_hpp_ */
