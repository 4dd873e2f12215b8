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


#ifndef REVOKR_SIGNATURE_ALGORITHM_HPP
#define REVOKR_SIGNATURE_ALGORITHM_HPP

#include "public-key.hpp"

namespace revokr {

/**
 * @brief One row of the fixed signature algorithm table used for split signing.
 */
struct SignatureAlgorithm
{
  int nid;
  const char* name;
  const char* oid;
  /**
   * @brief true if the AlgorithmIdentifier carries an explicit NULL parameter (RSA),
   *        false if parameters are absent (ECDSA).
   */
  bool hasNullParameters;
  const EVP_MD* (*digest)();
  /**
   * @brief Index of the matching alternative in PublicKey.
   */
  size_t keyIndex;
};

class UnsupportedAlgorithmError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Look up the table row for a signature algorithm NID.
 * @throw UnsupportedAlgorithmError the algorithm is not in the table
 */
const SignatureAlgorithm&
findSignatureAlgorithm(int nid);

/**
 * @brief Look up the table row for the signature algorithm declared by @p issuer.
 * @throw UnsupportedAlgorithmError the algorithm is not in the table
 */
const SignatureAlgorithm&
getIssuerSignatureAlgorithm(const X509* issuer);

/**
 * @brief Check that @p key belongs to the key family signing with @p algo.
 * @throw UnsupportedAlgorithmError the families differ
 */
void
checkKeyFamily(const SignatureAlgorithm& algo, const PublicKey& key);

/**
 * @brief DER encoding of the AlgorithmIdentifier for @p algo.
 */
Buffer
encodeAlgorithmIdentifier(const SignatureAlgorithm& algo);

/**
 * @brief Hash @p data with the digest of @p algo.
 */
Buffer
computeDigest(const SignatureAlgorithm& algo, const Buffer& data);

} // namespace revokr

#endif // REVOKR_SIGNATURE_ALGORITHM_HPP
