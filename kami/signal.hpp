//  signal.hpp -- wrap the most commonly used Boost.Signals2 API
//  Copyright (C) 2012  SEIKO EPSON CORPORATION
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

#ifndef kami_signal_hpp_
#define kami_signal_hpp_

#include <boost/signals2/connection.hpp>
#include <boost/signals2/signal.hpp>

namespace kami {

using boost::signals2::connection;
using boost::signals2::scoped_connection;
using boost::signals2::signal;

}       // namespace kami

#endif  /* kami_signal_hpp_ */
