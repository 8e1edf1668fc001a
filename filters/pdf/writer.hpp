//  writer.hpp -- PDF file structure writer
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

#ifndef filters_pdf_writer_hpp_
#define filters_pdf_writer_hpp_

#include <map>
#include <sstream>
#include <string>

#include "kami/iobase.hpp"

#include "dictionary.hpp"
#include "object.hpp"
#include "primitive.hpp"

namespace kami {
namespace _flt_ {
namespace _pdf_ {

//! Lays out PDF objects in the basic PDF file structure
/*! Output is collected in an internal buffer and handed to an output
 *  whenever write(output::ptr&) is called.
 *
 *  The writer is either in object mode, the default, or in stream
 *  mode.  Stream mode is entered with begin_stream() and is left with
 *  end_stream().  In between, only stream content can be written.
 *  Calling a function in the wrong mode throws a std::logic_error.
 */
class writer
{
public:
  writer ();

  //! Flushes everything written so far to \a output
  streamsize write (output::ptr& output);

  //! Writes \a obj as an indirect object
  void write (object& obj);

  //! Starts a stream object described by \a dict
  /*! The stream's \c Length is added to \a dict as a reference to an
   *  indirect object that is written by end_stream().
   */
  void begin_stream (dictionary& dict);

  void write (const octet *data, streamsize n);
  void write (const std::string& s);

  void end_stream ();

  //! Writes the file header
  void header ();

  //! Writes the cross-reference table and the file trailer
  /*! All objects written so far are included.  The \c Size entry of
   *  \a trailer_dict is set.
   */
  void trailer (dictionary& trailer_dict);

private:
  enum mode_type {
    object_mode,
    stream_mode,
  };

  std::ostringstream buffer_;
  std::map< std::size_t, std::size_t > xref_;

  std::size_t octets_seen_;
  std::size_t stream_start_;
  primitive   stream_len_;
  mode_type   mode_;

  void require_(mode_type mode, const char *what) const;
  void append_(const std::string& s);
};

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace kami

#endif  /* filters_pdf_writer_hpp_ */
