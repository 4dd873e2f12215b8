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


#ifndef REVOKR_CRL_BUILDER_HPP
#define REVOKR_CRL_BUILDER_HPP

#include "entry-extractor.hpp"
#include "signature-algorithm.hpp"

namespace revokr {

/**
 * @brief Everything needed to produce one revocation list.
 */
struct BuildRequest
{
  BuildMode mode = BuildMode::SIGNED;
  X509* issuer = nullptr;
  /**
   * @brief Issuer private key, required in SIGNED mode and forbidden in TO_BE_SIGNED mode.
   */
  EVP_PKEY* signer = nullptr;
  /**
   * @brief Newly revoked serials.
   */
  std::vector<SerialNumber> includes;
  /**
   * @brief Serials that must not be added.
   */
  std::vector<SerialNumber> ignores;
  /**
   * @brief Entries recovered from prior lists.
   */
  std::vector<RevocationEntry> entries;
  std::optional<CrlNumber> resolvedNumber;
  /**
   * @brief User supplied decimal CRL number, empty if none.
   */
  std::string explicitNumber;
  std::optional<time::system_clock::time_point> thisUpdate;
  std::optional<time::system_clock::time_point> nextUpdate;
};

struct BuildResult
{
  /**
   * @brief Signed CRL in SIGNED mode, the tbsCertList in TO_BE_SIGNED mode.
   */
  Buffer der;
  /**
   * @brief Digest of the tbsCertList, empty in SIGNED mode.
   */
  Buffer digest;
  CrlNumber number;
  size_t nEntries = 0;
};

/**
 * @brief Builds a v2 X.509 revocation list.
 *
 * All preconditions are checked by the constructor, so nothing is signed for an
 * invalid request.
 */
class CrlBuilder : boost::noncopyable
{
public:
  class Error : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  /**
   * @throw Error the request violates a precondition
   */
  explicit
  CrlBuilder(BuildRequest request);

  BuildResult
  build() const;

  time::system_clock::time_point
  getThisUpdate() const
  {
    return m_thisUpdate;
  }

  time::system_clock::time_point
  getNextUpdate() const
  {
    return m_nextUpdate;
  }

  const CrlNumber&
  getNumber() const
  {
    return m_number;
  }

  /**
   * @brief Entries of the new list, prior entries first.
   */
  const std::vector<RevocationEntry>&
  getEntries() const
  {
    return m_entries;
  }

  /**
   * @brief Number of the new list: the explicit number if given, otherwise one more
   *        than @p resolved, otherwise 1.
   * @throw Error @p explicitNumber is not a non-negative decimal integer, or the
   *              resulting number is negative or longer than 20 octets
   */
  static CrlNumber
  resolveNumber(const std::optional<CrlNumber>& resolved, const std::string& explicitNumber);

  /**
   * @brief Append newly revoked serials to the prior entries.
   *
   * An include is added, with @p revocationTime, unless it is already among
   * @p entries, is ignored, or repeats an earlier include.
   */
  static std::vector<RevocationEntry>
  mergeEntries(const std::vector<RevocationEntry>& entries,
               const std::vector<SerialNumber>& ignores,
               const std::vector<SerialNumber>& includes,
               time::system_clock::time_point revocationTime);

REVOKR_PUBLIC_WITH_TESTS_ELSE_PRIVATE:
  detail::X509CrlPtr
  makeCrl(EVP_PKEY* key, const EVP_MD* md) const;

private:
  BuildRequest m_request;
  PublicKey m_issuerKey;
  // nullptr when the issuer signs with pure Ed25519
  const SignatureAlgorithm* m_algorithm = nullptr;
  CrlNumber m_number;
  time::system_clock::time_point m_thisUpdate;
  time::system_clock::time_point m_nextUpdate;
  std::vector<RevocationEntry> m_entries;
};

} // namespace revokr

#endif // REVOKR_CRL_BUILDER_HPP
