//  strategy.cpp -- paper backup strategy interface
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

#include "kami/digest.hpp"
#include "kami/exception.hpp"
#include "kami/log.hpp"
#include "kami/strategy.hpp"

namespace kami {

unit_set::unit_set ()
  : layout (grid)
{}

std::string
unit_set::caption () const
{
  return info.caption (units.size (),
                       grid == layout ? "QR codes" : "pages");
}

bool
restoration::verified () const
{
  return warnings.empty ();
}

strategy::strategy ()
  : strict_(false)
{}

strategy::~strategy ()
{}

connection
strategy::connect_update (const update_signal_type::slot_type& slot) const
{
  return signal_update_.connect (slot);
}

void
strategy::strict (bool flag)
{
  strict_ = flag;
}

bool
strategy::strict () const
{
  return strict_;
}

void
strategy::verify (restoration& r, const std::string& expected) const
{
  std::string actual (sha256::hex (r.data));

  if (expected == actual)
    {
      log::brief ("SHA-256 verified: %1%") % actual;
      return;
    }

  digest_mismatch e (expected, actual);
  if (strict_) BOOST_THROW_EXCEPTION (e);

  log::alert (e.what ());
  r.warnings.push_back (e.what ());
}

}       // namespace kami
