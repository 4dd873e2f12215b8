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

#ifndef REVOKR_SERIAL_REGISTRY_HPP
#define REVOKR_SERIAL_REGISTRY_HPP

#include "diagnostics.hpp"
#include "detail/openssl-helpers.hpp"

#include <set>

namespace revokr {

/**
 * @brief Certificate serial number in canonical form.
 *
 * The canonical form is lowercase hexadecimal without a 0x prefix and without leading
 * zeros ("0" for zero). Two serial numbers are equal iff their canonical forms are equal.
 */
class SerialNumber
{
public:
  /**
   * @brief Parse user input: surrounding whitespace, letter case and a 0x prefix are ignored.
   * @return nullopt if @p str is not a non-negative hexadecimal number
   */
  static std::optional<SerialNumber>
  fromString(std::string_view str);

  /**
   * @brief Convert the serial number of a certificate or revocation entry.
   */
  static SerialNumber
  fromAsn1(const ASN1_INTEGER* value);

  const std::string&
  toHex() const
  {
    return m_hex;
  }

  /**
   * @brief Encode as ASN.1 INTEGER.
   * @throw detail::OpenSslError the value cannot be encoded
   */
  detail::OpenSslPtr<ASN1_INTEGER>
  toAsn1() const;

  friend bool
  operator==(const SerialNumber& lhs, const SerialNumber& rhs)
  {
    return lhs.m_hex == rhs.m_hex;
  }

  friend bool
  operator!=(const SerialNumber& lhs, const SerialNumber& rhs)
  {
    return lhs.m_hex != rhs.m_hex;
  }

  friend bool
  operator<(const SerialNumber& lhs, const SerialNumber& rhs)
  {
    return lhs.m_hex < rhs.m_hex;
  }

private:
  explicit
  SerialNumber(std::string hex)
    : m_hex(std::move(hex))
  {
  }

private:
  std::string m_hex;
};

std::ostream&
operator<<(std::ostream& os, const SerialNumber& serial);

/**
 * @brief Decides which serial numbers may still enter a revocation list.
 *
 * A serial is accepted the first time consider() sees it; blocked serials are never
 * accepted. The same policy type drives both extraction of prior entries and the
 * merge of newly revoked serials.
 */
class DedupPolicy
{
public:
  DedupPolicy() = default;

  /**
   * @brief Create a policy that never accepts any of @p blocked.
   */
  explicit
  DedupPolicy(const std::vector<SerialNumber>& blocked);

  /**
   * @brief Mark @p serial as seen without accepting it.
   */
  void
  block(const SerialNumber& serial);

  /**
   * @return true if @p serial has not been seen before; it is marked as seen in that case
   */
  bool
  consider(const SerialNumber& serial);

  bool
  isSeen(const SerialNumber& serial) const
  {
    return m_seen.count(serial) > 0;
  }

private:
  std::set<SerialNumber> m_seen;
};

namespace serials {

/**
 * @brief Parse serial numbers, one per line.
 *
 * Empty lines are skipped. Lines that are not hexadecimal are reported to @p diag and
 * skipped. The result keeps first-seen order and contains no duplicates.
 *
 * @param origin name of the input reported along with warnings
 */
std::vector<SerialNumber>
parse(const std::vector<std::string>& lines, Diagnostics& diag, const std::string& origin = "input");

/**
 * @brief Read and parse a newline delimited serials file.
 *
 * An empty @p path yields an empty list.
 *
 * @throw io::Error the file cannot be read
 */
std::vector<SerialNumber>
loadFile(const std::string& path, Diagnostics& diag);

} // namespace serials
} // namespace revokr

#endif // REVOKR_SERIAL_REGISTRY_HPP
