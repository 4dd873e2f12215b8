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

#ifndef REVOKR_PUBLIC_KEY_HPP
#define REVOKR_PUBLIC_KEY_HPP

#include "detail/openssl-helpers.hpp"

#include <variant>

namespace revokr {

enum class EcCurve {
  P256,
  P384,
  P521
};

std::ostream&
operator<<(std::ostream& os, EcCurve curve);

struct RsaPublicKey
{
  Buffer modulus;
  Buffer exponent;
  int bits = 0;
};

struct EcPublicKey
{
  EcCurve curve = EcCurve::P256;
  Buffer x;
  Buffer y;
};

struct Ed25519PublicKey
{
  Buffer raw;
};

/**
 * @brief The public key types an issuer may hold.
 *
 * Each alternative carries the fields that identify the key, so two keys match iff
 * those fields are equal.
 */
using PublicKey = std::variant<RsaPublicKey, EcPublicKey, Ed25519PublicKey>;

/**
 * @brief Human readable key type, e.g., "RSA-2048" or "ECDSA P-384".
 */
std::string
describeKeyType(const PublicKey& key);

class KeyError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Extract the identifying public fields of @p key.
 *
 * Works for both public keys and private keys.
 *
 * @throw KeyError the key type or curve is not supported
 */
PublicKey
extractPublicKey(EVP_PKEY* key);

/**
 * @brief Check that @p signerKey is the public half of the key certified by @p certKey.
 *
 * RSA keys are compared by modulus and exponent, ECDSA keys by curve and point,
 * Ed25519 keys by their raw bytes.
 *
 * @throw KeyError the keys are of different types or do not match
 */
void
verifyKeyMatch(const PublicKey& certKey, const PublicKey& signerKey);

/**
 * @brief Generate a fresh key pair of the same type and size as @p like.
 *
 * The result is never persisted; it only gives the CRL encoder a key to sign with.
 */
detail::EvpPkeyPtr
generateThrowawayKey(const PublicKey& like);

} // namespace revokr

#endif // REVOKR_PUBLIC_KEY_HPP
