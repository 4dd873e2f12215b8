/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */
/*
 * Copyright (c) 2017-2026, Regents of the University of California.
 *
 * This file is part of revokr, an offline certificate revocation list tool.
 *
 * revokr is free software: you can redistribute it and/or modify it under the terms
 * of the GNU General Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * revokr is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
 * PARTICULAR PURPOSE.  See the GNU General Public License for more details.
 *
 * You should have received copies of the GNU General Public License along with
 * revokr, e.g., in COPYING.md file.  If not, see <http://www.gnu.org/licenses/>.
 *
 * See AUTHORS.md for complete list of revokr authors and contributors.
 */

#include "detail/revokr-common.hpp"

#include <ndn-cxx/util/backports.hpp>

namespace revokr {

std::ostream&
operator<<(std::ostream& os, OutputFormat format)
{
  switch (format) {
    case OutputFormat::DER: return os << "DER";
    case OutputFormat::PEM: return os << "PEM";
  }
  return os << "<Unknown Output Format " << ndn::to_underlying(format) << ">";
}

std::ostream&
operator<<(std::ostream& os, BuildMode mode)
{
  switch (mode) {
    case BuildMode::SIGNED: return os << "Signed";
    case BuildMode::TO_BE_SIGNED: return os << "To-Be-Signed";
  }
  return os << "<Unknown Build Mode " << ndn::to_underlying(mode) << ">";
}

} // namespace revokr
