//  symbol-strategy.cpp -- backups as sets of framed symbols
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
#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "kami/base64.hpp"
#include "kami/exception.hpp"
#include "kami/log.hpp"
#include "kami/mutex.hpp"
#include "kami/symbol-strategy.hpp"
#include "kami/thread.hpp"

namespace kami {

symbol_strategy::symbol_strategy (symbol_codec::ptr codec,
                                  std::string::size_type chunk_size,
                                  symbol_codec::tolerance level,
                                  unsigned jobs)
  : codec_(codec)
  , chunk_size_(chunk_size)
  , level_(level)
  , jobs_(std::max (1u, jobs))
{
  if (0 == chunk_size_)
    BOOST_THROW_EXCEPTION
      (std::invalid_argument ("chunk size must be at least 1"));
}

void
symbol_strategy::jobs (unsigned n)
{
  jobs_ = std::max (1u, n);
}

std::vector< std::string >
symbol_strategy::frames (const octets& data, const std::string& name) const
{
  descriptor info (descriptor::of (data, name));

  std::string text;
  if (!data.empty ())
    text = base64_encode (compressor_.compress (data));

  const std::string::size_type parts
    = text.size () / chunk_size_ + (text.size () % chunk_size_ ? 1 : 0);
  const unsigned total = parts + 1;

  std::vector< std::string > rv;
  rv.reserve (total);
  rv.push_back (frame::metadata (info, total).str ());
  for (std::string::size_type i = 0; i < parts; ++i)
    {
      rv.push_back (frame::part (name, total, i + 1,
                                 text.substr (i * chunk_size_, chunk_size_))
                    .str ());
    }

  log::brief ("%1%: %2% octets in %3% units") % name % data.size () % total;
  return rv;
}

restoration
symbol_strategy::assemble (const std::vector< std::string >& payloads) const
{
  unit_bag bag;

  std::vector< std::string >::const_iterator it;
  for (it = payloads.begin (); payloads.end () != it; ++it)
    {
      boost::optional< frame > f (frame::parse (*it));
      if (f) bag.insert (*f);
    }
  return assemble (bag);
}

restoration
symbol_strategy::assemble (const unit_bag& bag) const
{
  boost::optional< frame > meta (bag.metadata ());
  if (!meta)
    BOOST_THROW_EXCEPTION (metadata_absent ());

  restoration rv;
  rv.info = meta->info ();

  if (1 < meta->total)
    {
      rv.data = compressor_.decompress (base64_decode (bag.assemble ()));
    }

  if (rv.data.size () != rv.info.size)
    log::alert ("%1%: expected %2% octets, recovered %3%")
      % rv.info.name % rv.info.size % rv.data.size ();

  verify (rv, rv.info.digest);
  return rv;
}

unit_set
symbol_strategy::encode (const octets& data, const std::string& name)
{
  std::vector< std::string > payloads (frames (data, name));

  unit_set rv;
  rv.info   = descriptor::of (data, name);
  rv.layout = unit_set::grid;
  rv.units.reserve (payloads.size ());

  for (std::vector< std::string >::size_type i = 0;
       i < payloads.size (); ++i)
    {
      rv.units.push_back (codec_->render (payloads[i], level_));
      signal_update_(i + 1, payloads.size ());
    }
  return rv;
}

restoration
symbol_strategy::decode (const std::vector< image >& pages)
{
  unit_bag bag;
  const streamsize total = pages.size ();
  const unsigned jobs = std::min< unsigned > (jobs_, pages.size ());

  if (1 >= jobs)
    {
      for (streamsize i = 0; i < total; ++i)
        {
          scan_(pages[i], bag);
          signal_update_(i + 1, total);
        }
      return assemble (bag);
    }

  mutex progress_mutex;
  streamsize done = 0;
  std::vector< exception_ptr > errors (jobs);
  std::vector< thread > workers;

  for (unsigned k = 0; k < jobs; ++k)
    {
      workers.push_back
        (thread ([&, k] ()
          {
            try
              {
                for (streamsize i = k; i < total; i += jobs)
                  {
                    scan_(pages[i], bag);

                    lock_guard< mutex > lock (progress_mutex);
                    signal_update_(++done, total);
                  }
              }
            catch (const std::exception&)
              {
                errors[k] = current_exception ();
              }
          }));
    }

  for (unsigned k = 0; k < jobs; ++k)
    workers[k].join ();

  for (unsigned k = 0; k < jobs; ++k)
    if (errors[k]) rethrow_exception (errors[k]);

  return assemble (bag);
}

void
symbol_strategy::scan_(const image& page, unit_bag& bag) const
{
  std::vector< std::string > payloads (codec_->scan (page));
  unsigned accepted = 0;

  std::vector< std::string >::const_iterator it;
  for (it = payloads.begin (); payloads.end () != it; ++it)
    {
      boost::optional< frame > f (frame::parse (*it));
      if (f)
        {
          bag.insert (*f);
          ++accepted;
        }
    }
  log::trace ("page: %1% symbols, %2% frames")
    % payloads.size () % accepted;
}

}       // namespace kami
