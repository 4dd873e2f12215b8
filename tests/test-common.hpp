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


#ifndef REVOKR_TESTS_TEST_COMMON_HPP
#define REVOKR_TESTS_TEST_COMMON_HPP

#include "detail/openssl-helpers.hpp"
#include "detail/pem-io.hpp"

#include "tests/boost-test.hpp"

#include <openssl/pem.h>
#include <openssl/x509v3.h>

#include <ctime>
#include <filesystem>
#include <fstream>

namespace revokr::tests {

constexpr std::time_t NOT_BEFORE = 1704067200; // 2024-01-01T00:00:00Z
constexpr std::time_t NOT_AFTER = 1735689600;  // 2025-01-01T00:00:00Z

inline time::system_clock::time_point
fromUnix(std::time_t t)
{
  return time::system_clock::from_time_t(t);
}

inline std::string
toString(const Buffer& buffer)
{
  return std::string(buffer.begin(), buffer.end());
}

inline Buffer
toBuffer(const std::string& str)
{
  return Buffer(str.data(), str.size());
}

/**
 * @brief A revoked certificate placed into a hand-made revocation list.
 */
struct TestEntry
{
  std::string serial;
  std::time_t revoked = NOT_BEFORE;
  std::optional<long> reason = std::nullopt;
};

struct IssuerOptions
{
  std::string keyUsage = "critical,keyCertSign,cRLSign";
  bool withSubjectKeyId = true;
};

/**
 * @brief Creates issuer keys, certificates and prior revocation lists with plain OpenSSL,
 *        and a private scratch directory to write them to.
 */
class IssuerFixture
{
public:
  IssuerFixture()
    : m_dir(std::filesystem::path(UNIT_TESTS_TMPDIR) / ("fixture-" + std::to_string(++s_counter)))
  {
    std::filesystem::create_directories(m_dir);
  }

  static detail::EvpPkeyPtr
  makeRsaKey(size_t bits = 2048)
  {
    return checked(EVP_PKEY_Q_keygen(nullptr, nullptr, "RSA", bits), "RSA key");
  }

  static detail::EvpPkeyPtr
  makeEcKey(const char* curve = "P-256")
  {
    return checked(EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", curve), "EC key");
  }

  static detail::EvpPkeyPtr
  makeEd25519Key()
  {
    return checked(EVP_PKEY_Q_keygen(nullptr, nullptr, "ED25519"), "Ed25519 key");
  }

  /**
   * @brief Self-signed CA certificate valid from NOT_BEFORE to NOT_AFTER.
   * @param md nullptr for Ed25519
   */
  static detail::X509Ptr
  makeIssuer(EVP_PKEY* key, const EVP_MD* md, const IssuerOptions& options = {})
  {
    detail::X509Ptr cert(X509_new());
    if (cert == nullptr || X509_set_version(cert.get(), X509_VERSION_3) != 1 ||
        ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1) != 1) {
      NDN_THROW(std::runtime_error("Cannot create test certificate"));
    }

    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>("revokr"), -1, -1, 0);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>("revokr test CA"), -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);
    ASN1_TIME_set(X509_getm_notBefore(cert.get()), NOT_BEFORE);
    ASN1_TIME_set(X509_getm_notAfter(cert.get()), NOT_AFTER);
    X509_set_pubkey(cert.get(), key);

    addExtension(cert.get(), NID_basic_constraints, "critical,CA:TRUE");
    if (!options.keyUsage.empty()) {
      addExtension(cert.get(), NID_key_usage, options.keyUsage);
    }
    if (options.withSubjectKeyId) {
      addExtension(cert.get(), NID_subject_key_identifier, "hash");
    }

    if (X509_sign(cert.get(), key, md) <= 0) {
      NDN_THROW(detail::OpenSslError("Cannot sign test certificate"));
    }
    return cert;
  }

  /**
   * @brief Revocation list made without revokr.
   * @param number CRL number extension, omitted if nullopt
   */
  static Buffer
  makeCrl(X509* issuer, EVP_PKEY* key, std::optional<long> number, const std::vector<TestEntry>& entries)
  {
    detail::X509CrlPtr crl(X509_CRL_new());
    X509_CRL_set_version(crl.get(), X509_CRL_VERSION_2);
    X509_CRL_set_issuer_name(crl.get(), X509_get_subject_name(issuer));
    detail::OpenSslPtr<ASN1_TIME> thisUpdate(ASN1_TIME_set(nullptr, NOT_BEFORE));
    detail::OpenSslPtr<ASN1_TIME> nextUpdate(ASN1_TIME_set(nullptr, NOT_AFTER));
    X509_CRL_set1_lastUpdate(crl.get(), thisUpdate.get());
    X509_CRL_set1_nextUpdate(crl.get(), nextUpdate.get());

    if (number) {
      detail::OpenSslPtr<ASN1_INTEGER> value(ASN1_INTEGER_new());
      ASN1_INTEGER_set(value.get(), *number);
      X509_CRL_add1_ext_i2d(crl.get(), NID_crl_number, value.get(), 0, X509V3_ADD_DEFAULT);
    }

    for (const auto& entry : entries) {
      X509_REVOKED* revoked = X509_REVOKED_new();
      BIGNUM* bn = nullptr;
      BN_hex2bn(&bn, entry.serial.data());
      detail::BignumPtr serialBn(bn);
      detail::OpenSslPtr<ASN1_INTEGER> serial(BN_to_ASN1_INTEGER(serialBn.get(), nullptr));
      detail::OpenSslPtr<ASN1_TIME> date(ASN1_TIME_set(nullptr, entry.revoked));
      X509_REVOKED_set_serialNumber(revoked, serial.get());
      X509_REVOKED_set_revocationDate(revoked, date.get());
      if (entry.reason) {
        detail::OpenSslPtr<ASN1_ENUMERATED> reason(ASN1_ENUMERATED_new());
        ASN1_ENUMERATED_set(reason.get(), *entry.reason);
        X509_REVOKED_add1_ext_i2d(revoked, NID_crl_reason, reason.get(), 0, X509V3_ADD_DEFAULT);
      }
      X509_CRL_add0_revoked(crl.get(), revoked);
    }

    if (X509_CRL_sign(crl.get(), key, EVP_sha256()) <= 0) {
      NDN_THROW(detail::OpenSslError("Cannot sign test CRL"));
    }
    return detail::encodeDer<X509_CRL>(crl.get(), &i2d_X509_CRL, "test CRL");
  }

  static detail::X509CrlPtr
  parseCrl(const Buffer& der)
  {
    const unsigned char* p = der.data();
    detail::X509CrlPtr crl(d2i_X509_CRL(nullptr, &p, static_cast<long>(der.size())));
    BOOST_REQUIRE(crl != nullptr);
    return crl;
  }

  /**
   * @brief Sign a precomputed digest, the way an offline signing device would.
   */
  static Buffer
  signDigest(EVP_PKEY* key, const EVP_MD* md, const Buffer& digest)
  {
    detail::OpenSslPtr<EVP_PKEY_CTX> ctx(EVP_PKEY_CTX_new(key, nullptr));
    size_t len = 0;
    if (ctx == nullptr || EVP_PKEY_sign_init(ctx.get()) != 1 ||
        EVP_PKEY_CTX_set_signature_md(ctx.get(), md) != 1 ||
        EVP_PKEY_sign(ctx.get(), nullptr, &len, digest.data(), digest.size()) != 1) {
      NDN_THROW(detail::OpenSslError("Cannot set up digest signing"));
    }
    Buffer sig(len);
    if (EVP_PKEY_sign(ctx.get(), sig.data(), &len, digest.data(), digest.size()) != 1) {
      NDN_THROW(detail::OpenSslError("Cannot sign digest"));
    }
    sig.resize(len);
    return sig;
  }

  /**
   * @brief tbsCertList of a signed revocation list, copied out of its DER encoding.
   */
  static Buffer
  extractTbs(const Buffer& crlDer)
  {
    const unsigned char* p = crlDer.data();
    long len = 0;
    int tag = 0;
    int xclass = 0;
    // step into the outer SEQUENCE, then measure the first element
    BOOST_REQUIRE_EQUAL(ASN1_get_object(&p, &len, &tag, &xclass, static_cast<long>(crlDer.size())) & 0x80, 0);
    const unsigned char* tbsStart = p;
    BOOST_REQUIRE_EQUAL(ASN1_get_object(&p, &len, &tag, &xclass, len) & 0x80, 0);
    return Buffer(tbsStart, static_cast<size_t>(p - tbsStart) + static_cast<size_t>(len));
  }

  std::string
  path(const std::string& name) const
  {
    return (m_dir / name).string();
  }

  std::string
  writeFile(const std::string& name, const std::string& content) const
  {
    std::ofstream os(path(name), std::ios::binary | std::ios::trunc);
    os << content;
    BOOST_REQUIRE(os);
    return path(name);
  }

  std::string
  writeFile(const std::string& name, const Buffer& content) const
  {
    return writeFile(name, toString(content));
  }

  std::string
  writeCertificate(const std::string& name, X509* cert, OutputFormat format = OutputFormat::PEM) const
  {
    auto der = detail::encodeDer<X509>(cert, &i2d_X509, "test certificate");
    if (format == OutputFormat::PEM) {
      return writeFile(name, io::encodePem("CERTIFICATE", der));
    }
    return writeFile(name, der);
  }

  /**
   * @brief PKCS#8 PEM ("PRIVATE KEY", or "ENCRYPTED PRIVATE KEY" with a password).
   */
  std::string
  writePkcs8Key(const std::string& name, EVP_PKEY* key,
                const std::optional<std::string>& password = std::nullopt) const
  {
    auto bio = openFile(name);
    int ok = password ?
      PEM_write_bio_PKCS8PrivateKey(bio.get(), key, EVP_aes_256_cbc(), password->data(),
                                    static_cast<int>(password->size()), nullptr, nullptr) :
      PEM_write_bio_PKCS8PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr);
    BOOST_REQUIRE_EQUAL(ok, 1);
    return path(name);
  }

  /**
   * @brief Traditional PEM ("RSA PRIVATE KEY", "EC PRIVATE KEY"), legacy encrypted with a password.
   */
  std::string
  writeLegacyKey(const std::string& name, EVP_PKEY* key,
                 const std::optional<std::string>& password = std::nullopt) const
  {
    auto bio = openFile(name);
    int ok = password ?
      PEM_write_bio_PrivateKey_traditional(bio.get(), key, EVP_aes_128_cbc(),
                                           reinterpret_cast<unsigned char*>(const_cast<char*>(password->data())),
                                           static_cast<int>(password->size()), nullptr, nullptr) :
      PEM_write_bio_PrivateKey_traditional(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr);
    BOOST_REQUIRE_EQUAL(ok, 1);
    return path(name);
  }

  /**
   * @brief Traditional DER (PKCS#1 for RSA, SEC1 for EC).
   */
  std::string
  writeDerKey(const std::string& name, EVP_PKEY* key) const
  {
    int len = i2d_PrivateKey(key, nullptr);
    BOOST_REQUIRE_GT(len, 0);
    Buffer der(static_cast<size_t>(len));
    auto p = der.data();
    i2d_PrivateKey(key, &p);
    return writeFile(name, der);
  }

private:
  static detail::EvpPkeyPtr
  checked(EVP_PKEY* key, const std::string& what)
  {
    if (key == nullptr) {
      NDN_THROW(detail::OpenSslError("Cannot generate test " + what));
    }
    return detail::EvpPkeyPtr(key);
  }

  static void
  addExtension(X509* cert, int nid, const std::string& value)
  {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value.data());
    if (ext == nullptr) {
      NDN_THROW(detail::OpenSslError("Cannot create extension " + value));
    }
    X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
  }

  detail::OpenSslPtr<BIO>
  openFile(const std::string& name) const
  {
    detail::OpenSslPtr<BIO> bio(BIO_new_file(path(name).data(), "wb"));
    BOOST_REQUIRE(bio != nullptr);
    return bio;
  }

private:
  static inline int s_counter = 0;
  std::filesystem::path m_dir;
};

} // namespace revokr::tests

#endif // REVOKR_TESTS_TEST_COMMON_HPP
