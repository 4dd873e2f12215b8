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


#ifndef REVOKR_ENTRY_EXTRACTOR_HPP
#define REVOKR_ENTRY_EXTRACTOR_HPP

#include "serial-registry.hpp"

namespace revokr {

/**
 * @brief One revoked certificate in a revocation list.
 */
struct RevocationEntry
{
  SerialNumber serial;
  time::system_clock::time_point revocationTime;
  /**
   * @brief CRLReason code copied from a prior list, never interpreted.
   */
  std::optional<long> reasonCode;
};

namespace extractor {

struct ExtractionResult
{
  /**
   * @brief Highest CRL number among the parsed lists, nullopt if none carried one.
   */
  std::optional<CrlNumber> highestNumber;
  /**
   * @brief Accepted entries, in source order and then entry order.
   */
  std::vector<RevocationEntry> entries;
};

/**
 * @brief Fold the entries and CRL number of @p crl into @p result.
 *
 * Entries whose serial @p policy does not accept are dropped.
 */
void
collect(const X509_CRL* crl, DedupPolicy& policy, ExtractionResult& result);

/**
 * @brief Recover revocation entries and the highest CRL number from prior lists.
 *
 * Each source is a PEM or DER file. A source that cannot be read or parsed is
 * reported to @p diag and skipped. The first occurrence of a serial wins, and no
 * serial in @p ignore ever appears in the result.
 */
ExtractionResult
extract(const std::vector<SerialNumber>& ignore, const std::vector<std::string>& sources,
        Diagnostics& diag);

} // namespace extractor
} // namespace revokr

#endif // REVOKR_ENTRY_EXTRACTOR_HPP
