//  unit-bag.cpp -- unordered collection of recovered units
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

#include <boost/throw_exception.hpp>

#include "kami/log.hpp"
#include "kami/unit-bag.hpp"

namespace kami {

void
unit_bag::insert (const frame& f)
{
  lock_guard< mutex > lock (mutex_);

  if (frame::META == f.kind)
    {
      if (meta_ && meta_->str () != f.str ())
        log::brief ("replacing metadata for %1%") % meta_->name;
      meta_ = f;
    }
  else
    {
      if (parts_.count (f.index))
        log::debug ("part %1% seen again") % f.index;
      parts_[f.index] = f.chunk;
    }
}

boost::optional< frame >
unit_bag::metadata () const
{
  lock_guard< mutex > lock (mutex_);
  return meta_;
}

std::size_t
unit_bag::size () const
{
  lock_guard< mutex > lock (mutex_);
  return parts_.size ();
}

unit_bag::index_set
unit_bag::missing () const
{
  lock_guard< mutex > lock (mutex_);
  return missing_();
}

std::string
unit_bag::assemble () const
{
  lock_guard< mutex > lock (mutex_);

  index_set gaps (missing_());
  if (!gaps.empty ())
    BOOST_THROW_EXCEPTION (incomplete_backup (gaps));

  std::string rv;
  for (unsigned i = 1; i < meta_->total; ++i)
    rv += parts_.find (i)->second;

  return rv;
}

unit_bag::index_set
unit_bag::missing_() const
{
  if (!meta_)
    BOOST_THROW_EXCEPTION (metadata_absent ());

  index_set rv;
  for (unsigned i = 1; i < meta_->total; ++i)
    if (!parts_.count (i)) rv.insert (i);

  return rv;
}

}       // namespace kami
