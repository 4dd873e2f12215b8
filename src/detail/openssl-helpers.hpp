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

#ifndef REVOKR_DETAIL_OPENSSL_HELPERS_HPP
#define REVOKR_DETAIL_OPENSSL_HELPERS_HPP

#include "detail/revokr-common.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace revokr::detail {

/**
 * @brief Releases OpenSSL objects owned by std::unique_ptr.
 *
 * ASN1_INTEGER, ASN1_TIME and ASN1_OCTET_STRING are all ASN1_STRING, so a single
 * overload covers them.
 */
struct OpenSslDeleter
{
  void operator()(X509* p) const noexcept { X509_free(p); }
  void operator()(X509_CRL* p) const noexcept { X509_CRL_free(p); }
  void operator()(X509_REVOKED* p) const noexcept { X509_REVOKED_free(p); }
  void operator()(X509_ALGOR* p) const noexcept { X509_ALGOR_free(p); }
  void operator()(X509_SIG* p) const noexcept { X509_SIG_free(p); }
  void operator()(PKCS8_PRIV_KEY_INFO* p) const noexcept { PKCS8_PRIV_KEY_INFO_free(p); }
  void operator()(AUTHORITY_KEYID* p) const noexcept { AUTHORITY_KEYID_free(p); }
  void operator()(ASN1_STRING* p) const noexcept { ASN1_STRING_free(p); }
  void operator()(EVP_PKEY* p) const noexcept { EVP_PKEY_free(p); }
  void operator()(EVP_PKEY_CTX* p) const noexcept { EVP_PKEY_CTX_free(p); }
  void operator()(EVP_MD_CTX* p) const noexcept { EVP_MD_CTX_free(p); }
  void operator()(BIGNUM* p) const noexcept { BN_free(p); }
  void operator()(BIO* p) const noexcept { BIO_free_all(p); }
};

template<typename T>
using OpenSslPtr = std::unique_ptr<T, OpenSslDeleter>;

using X509Ptr = OpenSslPtr<X509>;
using X509CrlPtr = OpenSslPtr<X509_CRL>;
using X509RevokedPtr = OpenSslPtr<X509_REVOKED>;
using EvpPkeyPtr = OpenSslPtr<EVP_PKEY>;
using BignumPtr = OpenSslPtr<BIGNUM>;

/**
 * @brief Error raised when an OpenSSL call fails.
 *
 * The message carries the caller's context followed by the drained OpenSSL error queue.
 */
class OpenSslError : public std::runtime_error
{
public:
  explicit
  OpenSslError(const std::string& what);
};

/**
 * @brief Drain the OpenSSL error queue of the calling thread into a single line.
 */
std::string
drainOpenSslErrors();

/**
 * @brief DER-encode an OpenSSL object using its i2d function.
 * @throw OpenSslError the object cannot be encoded
 */
template<typename T>
Buffer
encodeDer(const T* object, int (*i2d)(const T*, unsigned char**), const char* what)
{
  int len = i2d(object, nullptr);
  if (len <= 0) {
    NDN_THROW(OpenSslError("Cannot encode "s + what));
  }
  Buffer out(static_cast<size_t>(len));
  auto p = out.data();
  if (i2d(object, &p) != len) {
    NDN_THROW(OpenSslError("Cannot encode "s + what));
  }
  return out;
}

/**
 * @brief Hexadecimal rendering of an ASN.1 INTEGER, lowercase with no leading zeros.
 */
std::string
asn1IntegerToHex(const ASN1_INTEGER* value);

/**
 * @brief Convert an ASN.1 INTEGER into a CRL number.
 * @throw OpenSslError the integer cannot be converted
 */
CrlNumber
asn1IntegerToNumber(const ASN1_INTEGER* value);

/**
 * @brief Convert a non-negative CRL number into an ASN.1 INTEGER.
 */
OpenSslPtr<ASN1_INTEGER>
numberToAsn1Integer(const CrlNumber& number);

} // namespace revokr::detail

#endif // REVOKR_DETAIL_OPENSSL_HELPERS_HPP
