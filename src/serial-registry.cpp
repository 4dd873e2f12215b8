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

#include "serial-registry.hpp"
#include "detail/pem-io.hpp"

#include <algorithm>
#include <cctype>

namespace revokr {

NDN_LOG_INIT(revokr.serials);

std::optional<SerialNumber>
SerialNumber::fromString(std::string_view str)
{
  auto hex = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(std::string(str)));
  if (boost::algorithm::starts_with(hex, "0x")) {
    hex.erase(0, 2);
  }
  if (hex.empty() || !std::all_of(hex.begin(), hex.end(),
                                  [] (unsigned char c) { return std::isxdigit(c) != 0; })) {
    return std::nullopt;
  }

  auto firstNonZero = hex.find_first_not_of('0');
  if (firstNonZero == std::string::npos) {
    return SerialNumber("0");
  }
  return SerialNumber(hex.substr(firstNonZero));
}

SerialNumber
SerialNumber::fromAsn1(const ASN1_INTEGER* value)
{
  return SerialNumber(detail::asn1IntegerToHex(value));
}

detail::OpenSslPtr<ASN1_INTEGER>
SerialNumber::toAsn1() const
{
  BIGNUM* raw = nullptr;
  if (BN_hex2bn(&raw, m_hex.data()) == 0) {
    NDN_THROW(detail::OpenSslError("Cannot convert serial number " + m_hex));
  }
  detail::BignumPtr bn(raw);
  detail::OpenSslPtr<ASN1_INTEGER> integer(BN_to_ASN1_INTEGER(bn.get(), nullptr));
  if (integer == nullptr) {
    NDN_THROW(detail::OpenSslError("Cannot convert serial number " + m_hex));
  }
  return integer;
}

std::ostream&
operator<<(std::ostream& os, const SerialNumber& serial)
{
  return os << serial.toHex();
}

DedupPolicy::DedupPolicy(const std::vector<SerialNumber>& blocked)
  : m_seen(blocked.begin(), blocked.end())
{
}

void
DedupPolicy::block(const SerialNumber& serial)
{
  m_seen.insert(serial);
}

bool
DedupPolicy::consider(const SerialNumber& serial)
{
  return m_seen.insert(serial).second;
}

namespace serials {

std::vector<SerialNumber>
parse(const std::vector<std::string>& lines, Diagnostics& diag, const std::string& origin)
{
  std::vector<SerialNumber> result;
  DedupPolicy policy;
  size_t lineNo = 0;
  for (const auto& line : lines) {
    lineNo++;
    auto trimmed = boost::algorithm::trim_copy(line);
    if (trimmed.empty()) {
      continue;
    }

    auto serial = SerialNumber::fromString(trimmed);
    if (!serial) {
      diag.warn(origin, "line " + std::to_string(lineNo) + ": invalid serial number format \"" +
                boost::algorithm::to_lower_copy(trimmed) + "\", skipping");
      continue;
    }
    if (policy.consider(*serial)) {
      result.push_back(*serial);
    }
    else {
      NDN_LOG_TRACE(origin << ": duplicate serial " << *serial << " on line " << lineNo);
    }
  }
  return result;
}

std::vector<SerialNumber>
loadFile(const std::string& path, Diagnostics& diag)
{
  if (path.empty()) {
    return {};
  }

  auto data = io::readFile(path);
  std::string content(data.begin(), data.end());
  std::vector<std::string> lines;
  boost::algorithm::split(lines, content, boost::algorithm::is_any_of("\n"));
  auto result = parse(lines, diag, path);
  NDN_LOG_DEBUG("Loaded " << result.size() << " serial number(s) from " << path);
  return result;
}

} // namespace serials
} // namespace revokr
