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


#include "signature-algorithm.hpp"

#include <openssl/obj_mac.h>
#include <openssl/objects.h>

#include <type_traits>

namespace revokr {

NDN_LOG_INIT(revokr.sigalg);

constexpr size_t RSA_KEY = 0;
constexpr size_t EC_KEY = 1;
static_assert(std::is_same_v<std::variant_alternative_t<RSA_KEY, PublicKey>, RsaPublicKey>);
static_assert(std::is_same_v<std::variant_alternative_t<EC_KEY, PublicKey>, EcPublicKey>);

const SignatureAlgorithm SIGNATURE_ALGORITHMS[] = {
  {NID_sha256WithRSAEncryption, "sha256WithRSAEncryption", "1.2.840.113549.1.1.11", true, &EVP_sha256, RSA_KEY},
  {NID_sha384WithRSAEncryption, "sha384WithRSAEncryption", "1.2.840.113549.1.1.12", true, &EVP_sha384, RSA_KEY},
  {NID_sha512WithRSAEncryption, "sha512WithRSAEncryption", "1.2.840.113549.1.1.13", true, &EVP_sha512, RSA_KEY},
  {NID_ecdsa_with_SHA256, "ecdsa-with-SHA256", "1.2.840.10045.4.3.2", false, &EVP_sha256, EC_KEY},
  {NID_ecdsa_with_SHA384, "ecdsa-with-SHA384", "1.2.840.10045.4.3.3", false, &EVP_sha384, EC_KEY},
  {NID_ecdsa_with_SHA512, "ecdsa-with-SHA512", "1.2.840.10045.4.3.4", false, &EVP_sha512, EC_KEY},
};

const SignatureAlgorithm&
findSignatureAlgorithm(int nid)
{
  for (const auto& algo : SIGNATURE_ALGORITHMS) {
    if (algo.nid == nid) {
      return algo;
    }
  }
  const char* name = nid == NID_undef ? nullptr : OBJ_nid2ln(nid);
  NDN_THROW(UnsupportedAlgorithmError("Unsupported signature algorithm "s +
                                      (name == nullptr ? std::to_string(nid) : name)));
}

const SignatureAlgorithm&
getIssuerSignatureAlgorithm(const X509* issuer)
{
  const auto& algo = findSignatureAlgorithm(X509_get_signature_nid(issuer));
  NDN_LOG_DEBUG("Issuer signature algorithm is " << algo.name << " (" << algo.oid << ")");
  return algo;
}

void
checkKeyFamily(const SignatureAlgorithm& algo, const PublicKey& key)
{
  if (key.index() != algo.keyIndex) {
    NDN_THROW(UnsupportedAlgorithmError("Signature algorithm "s + algo.name +
                                        " cannot be used with " + describeKeyType(key) + " key"));
  }
}

Buffer
encodeAlgorithmIdentifier(const SignatureAlgorithm& algo)
{
  detail::OpenSslPtr<X509_ALGOR> algor(X509_ALGOR_new());
  if (algor == nullptr ||
      X509_ALGOR_set0(algor.get(), OBJ_nid2obj(algo.nid),
                      algo.hasNullParameters ? V_ASN1_NULL : V_ASN1_UNDEF, nullptr) != 1) {
    NDN_THROW(detail::OpenSslError("Cannot create AlgorithmIdentifier for "s + algo.name));
  }
  return detail::encodeDer<X509_ALGOR>(algor.get(), &i2d_X509_ALGOR, "AlgorithmIdentifier");
}

Buffer
computeDigest(const SignatureAlgorithm& algo, const Buffer& data)
{
  const EVP_MD* md = algo.digest();
  Buffer out(static_cast<size_t>(EVP_MD_get_size(md)));
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, md, nullptr) != 1) {
    NDN_THROW(detail::OpenSslError("Cannot compute digest"));
  }
  out.resize(len);
  return out;
}

} // namespace revokr
