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

#include "detail/time-helpers.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>

#include <cctype>

namespace revokr::detail {

NDN_LOG_INIT(revokr.time);

using UnixSeconds = std::optional<int64_t>;

// 'D' in the shape stands for any decimal digit, every other character must match literally
static bool
matchesShape(std::string_view str, std::string_view shape)
{
  if (str.size() != shape.size()) {
    return false;
  }
  for (size_t i = 0; i < shape.size(); i++) {
    if (shape[i] == 'D' ? !std::isdigit(static_cast<unsigned char>(str[i])) : str[i] != shape[i]) {
      return false;
    }
  }
  return true;
}

static int
readNumber(std::string_view str, size_t pos, size_t len)
{
  return std::stoi(std::string(str.substr(pos, len)));
}

// @param normalized "YYYY-MM-DD HH:MM:SS", already shape checked
static UnixSeconds
toUnixSeconds(const std::string& normalized)
{
  if (readNumber(normalized, 11, 2) > 23 || readNumber(normalized, 14, 2) > 59 ||
      readNumber(normalized, 17, 2) > 59) {
    return std::nullopt;
  }

  namespace bpt = boost::posix_time;
  static const bpt::ptime unixEpoch(boost::gregorian::date(1970, 1, 1));
  try {
    auto ptime = bpt::time_from_string(normalized);
    if (ptime.is_special()) {
      return std::nullopt;
    }
    return (ptime - unixEpoch).total_seconds();
  }
  catch (const std::exception& e) {
    // out of range day or month
    NDN_LOG_TRACE("Rejecting " << normalized << ": " << e.what());
    return std::nullopt;
  }
}

static UnixSeconds
parseRfc3339(const std::string& str)
{
  constexpr std::string_view base = "DDDD-DD-DDTDD:DD:DD";
  if (str.size() <= base.size() || !matchesShape(std::string_view(str).substr(0, base.size()), base)) {
    return std::nullopt;
  }

  size_t pos = base.size();
  if (str[pos] == '.') {
    auto fractionStart = ++pos;
    while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
      pos++;
    }
    if (pos == fractionStart) {
      return std::nullopt;
    }
  }

  int64_t offset = 0;
  std::string_view zone = std::string_view(str).substr(pos);
  if (zone == "Z" || zone == "z") {
    offset = 0;
  }
  else if (matchesShape(zone, "+DD:DD") || matchesShape(zone, "-DD:DD")) {
    int hours = readNumber(zone, 1, 2);
    int minutes = readNumber(zone, 4, 2);
    if (hours > 23 || minutes > 59) {
      return std::nullopt;
    }
    offset = (zone[0] == '-' ? -1 : 1) * (hours * 3600 + minutes * 60);
  }
  else {
    return std::nullopt;
  }

  auto seconds = toUnixSeconds(str.substr(0, 10) + " " + str.substr(11, 8));
  if (!seconds) {
    return std::nullopt;
  }
  return *seconds - offset;
}

static UnixSeconds
parseDateTime(const std::string& str)
{
  if (!matchesShape(str, "DDDD-DD-DD DD:DD:DD")) {
    return std::nullopt;
  }
  return toUnixSeconds(str);
}

static UnixSeconds
parseDateHourMinute(const std::string& str)
{
  if (!matchesShape(str, "DDDD-DD-DD DD:DD")) {
    return std::nullopt;
  }
  return toUnixSeconds(str + ":00");
}

static UnixSeconds
parseDate(const std::string& str)
{
  if (!matchesShape(str, "DDDD-DD-DD")) {
    return std::nullopt;
  }
  return toUnixSeconds(str + " 00:00:00");
}

using LayoutParser = UnixSeconds (*)(const std::string&);

// order matters, the first layout that fits wins
const LayoutParser TIME_LAYOUTS[] = {
  &parseRfc3339,
  &parseDateTime,
  &parseDateHourMinute,
  &parseDate,
};

time::system_clock::time_point
parseTime(const std::string& str)
{
  for (auto layout : TIME_LAYOUTS) {
    auto seconds = layout(str);
    if (seconds) {
      return time::system_clock::from_time_t(static_cast<std::time_t>(*seconds));
    }
  }
  NDN_THROW(TimeFormatError("Unable to parse time: " + str));
}

time::system_clock::time_point
asn1TimeToTimePoint(const ASN1_TIME* asn1Time)
{
  OpenSslPtr<ASN1_TIME> epoch(ASN1_TIME_set(nullptr, 0));
  int days = 0;
  int seconds = 0;
  if (epoch == nullptr || ASN1_TIME_diff(&days, &seconds, epoch.get(), asn1Time) != 1) {
    NDN_THROW(OpenSslError("Invalid ASN.1 time"));
  }
  auto unixSeconds = static_cast<int64_t>(days) * 86400 + seconds;
  return time::system_clock::from_time_t(static_cast<std::time_t>(unixSeconds));
}

OpenSslPtr<ASN1_TIME>
timePointToAsn1Time(const time::system_clock::time_point& tp)
{
  OpenSslPtr<ASN1_TIME> asn1Time(ASN1_TIME_set(nullptr, time::system_clock::to_time_t(tp)));
  if (asn1Time == nullptr) {
    NDN_THROW(OpenSslError("Cannot encode time " + time::toIsoString(tp)));
  }
  return asn1Time;
}

} // namespace revokr::detail
