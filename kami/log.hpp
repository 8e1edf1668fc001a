//  log.hpp -- prioritised, formatted log messages
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

#ifndef kami_log_hpp_
#define kami_log_hpp_

#include <iosfwd>
#include <sstream>
#include <string>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/optional.hpp>

#include "format.hpp"
#include "thread.hpp"

namespace kami {

class log
{
public:
  typedef enum {
    FATAL,                      //!<  famous last words
    ALERT,                      //!<  outside intervention required
    ERROR,                      //!<  something went wrong
    BRIEF,                      //!<  short informational notes
    TRACE,                      //!<  more chattery feedback
    DEBUG                       //!<  the gory details
  } priority;

  //!  The priority at and above which messages are logged
  static priority threshold;

  //!  Where log messages end up, \c std::clog unless redirected
  static std::ostream *os_;

  inline static bool make_noise (priority level)
  {
    return threshold >= level;
  }

  //!  Formatted, self-outputting log messages
  /*!  Modeled after boost::format.  Messages below the log::threshold
   *   are never formatted, so feeding them arguments is cheap.  Any
   *   arguments that were not provided by the time a message goes out
   *   of scope show up as their \c %N% placeholders.
   */
  class message
  {
    boost::optional< boost::posix_time::ptime > timestamp_;
    boost::optional< thread::id >               thread_id_;
    boost::optional< format >                   fmt_;
    int arg_;
    int cnt_;

  public:
    message (priority level, const std::string& fmt)
      : arg_(0), cnt_(0)
    {
      if (make_noise (level))
        {
          timestamp_ = boost::posix_time::microsec_clock::local_time ();
          thread_id_ = this_thread::get_id ();
          fmt_ = format (fmt);
          cnt_ = fmt_->expected_args ();
        }
    }

    ~message ()
    {
      if (!fmt_) return;

      while (arg_ < cnt_)
        {
          std::ostringstream os;
          os << "%" << ++arg_ << "%";
          *fmt_ % os.str ();
        }
      *os_ << str ();
      os_->flush ();
    }

    //!  Feeds the argument \a t to a message
    template< typename T > message& operator% (const T& t)
    {
      if (fmt_)
        {
          *fmt_ % t;
          ++arg_;
        }
      return *this;
    }

    std::string str () const
    {
      if (!fmt_) return std::string ();

      std::ostringstream os;
      os << *timestamp_ << "[" << *thread_id_ << "]: " << *fmt_
         << std::endl;
      return os.str ();
    }
  };

  //!  Prioritised named constructors
  /*!  These allow for concise code such as
   *
   *     \code
   *     log::error ("cannot open %1%") % filename;
   *     \endcode
   */
#define expand_named_ctor(ctor,level)                   \
  inline static message                                 \
  ctor (const std::string& fmt)                         \
  { return message (level, fmt); }                      \
  /**/

  expand_named_ctor (fatal, FATAL);
  expand_named_ctor (alert, ALERT);
  expand_named_ctor (error, ERROR);
  expand_named_ctor (brief, BRIEF);
  expand_named_ctor (trace, TRACE);
  expand_named_ctor (debug, DEBUG);

#undef expand_named_ctor
};

//!  Reads a priority by name (\c error, \c debug, ...) or number
std::istream& operator>> (std::istream& is, log::priority& level);
std::ostream& operator<< (std::ostream& os, const log::priority& level);

}       // namespace kami

#endif  /* kami_log_hpp_ */
