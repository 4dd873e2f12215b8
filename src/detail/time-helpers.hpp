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

#ifndef REVOKR_DETAIL_TIME_HELPERS_HPP
#define REVOKR_DETAIL_TIME_HELPERS_HPP

#include "detail/openssl-helpers.hpp"

namespace revokr::detail {

class TimeFormatError : public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

/**
 * @brief Parse a user supplied timestamp.
 *
 * The accepted layouts are tried in order and the first one that fits wins:
 *  - RFC 3339 with offset, e.g., "2006-01-02T15:04:05Z" or "2006-01-02T15:04:05.5+07:00"
 *  - "2006-01-02 15:04:05"
 *  - "2006-01-02 15:04"
 *  - "2006-01-02"
 * Layouts without an offset are interpreted as UTC. Sub-second precision is dropped.
 *
 * @throw TimeFormatError none of the layouts fits @p str
 */
time::system_clock::time_point
parseTime(const std::string& str);

time::system_clock::time_point
asn1TimeToTimePoint(const ASN1_TIME* asn1Time);

/**
 * @brief Encode @p tp as UTCTime for years 1950 through 2049, GeneralizedTime otherwise.
 */
OpenSslPtr<ASN1_TIME>
timePointToAsn1Time(const time::system_clock::time_point& tp);

} // namespace revokr::detail

#endif // REVOKR_DETAIL_TIME_HELPERS_HPP
