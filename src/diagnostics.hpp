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

#ifndef REVOKR_DIAGNOSTICS_HPP
#define REVOKR_DIAGNOSTICS_HPP

#include "detail/revokr-common.hpp"

namespace revokr {

/**
 * @brief A recoverable problem with a single input item.
 */
struct Warning
{
  /**
   * @brief Where the item came from, e.g., the path of a serials file or extension CRL.
   */
  std::string origin;
  std::string message;
};

std::ostream&
operator<<(std::ostream& os, const Warning& warning);

/**
 * @brief Sink for per-item warnings raised while processing inputs.
 *
 * A Diagnostics instance is handed to every component call that may skip an item.
 * Warnings are kept in order of arrival and forwarded to the revokr.diagnostics logger.
 */
class Diagnostics : boost::noncopyable
{
public:
  void
  warn(const std::string& origin, const std::string& message);

  const std::vector<Warning>&
  getWarnings() const
  {
    return m_warnings;
  }

  bool
  empty() const
  {
    return m_warnings.empty();
  }

private:
  std::vector<Warning> m_warnings;
};

} // namespace revokr

#endif // REVOKR_DIAGNOSTICS_HPP
