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


#include "crl-builder.hpp"
#include "detail/time-helpers.hpp"

#include <ndn-cxx/util/string-helper.hpp>

#include <openssl/obj_mac.h>

#include <algorithm>
#include <cctype>

namespace revokr {

NDN_LOG_INIT(revokr.builder);

CrlBuilder::CrlBuilder(BuildRequest request)
  : m_request(std::move(request))
{
  X509* issuer = m_request.issuer;
  if (issuer == nullptr) {
    NDN_THROW(Error("Issuer certificate is required"));
  }

  try {
    m_issuerKey = extractPublicKey(X509_get0_pubkey(issuer));
    if (m_request.mode == BuildMode::SIGNED) {
      if (m_request.signer == nullptr) {
        NDN_THROW(Error("A private key is required to sign the revocation list"));
      }
      verifyKeyMatch(m_issuerKey, extractPublicKey(m_request.signer));
    }
    else if (m_request.signer != nullptr) {
      NDN_THROW(Error("A private key must not be used when creating a to-be-signed revocation list"));
    }
  }
  catch (const KeyError& e) {
    NDN_THROW_NESTED(Error(e.what()));
  }

  int sigNid = X509_get_signature_nid(issuer);
  if (sigNid == NID_ED25519 && m_request.mode == BuildMode::SIGNED) {
    if (!std::holds_alternative<Ed25519PublicKey>(m_issuerKey)) {
      NDN_THROW(Error("Issuer declares Ed25519 signatures but holds a " + describeKeyType(m_issuerKey) + " key"));
    }
  }
  else {
    try {
      m_algorithm = &findSignatureAlgorithm(sigNid);
      checkKeyFamily(*m_algorithm, m_issuerKey);
    }
    catch (const UnsupportedAlgorithmError& e) {
      NDN_THROW_NESTED(Error(e.what()));
    }
  }

  if ((X509_get_extension_flags(issuer) & EXFLAG_KUSAGE) != 0 &&
      (X509_get_key_usage(issuer) & KU_CRL_SIGN) == 0) {
    NDN_THROW(Error("Issuer certificate key usage does not permit CRL signing"));
  }

  m_thisUpdate = m_request.thisUpdate ? *m_request.thisUpdate
                                      : detail::asn1TimeToTimePoint(X509_get0_notBefore(issuer));
  m_nextUpdate = m_request.nextUpdate ? *m_request.nextUpdate
                                      : detail::asn1TimeToTimePoint(X509_get0_notAfter(issuer));
  if (m_thisUpdate > m_nextUpdate) {
    NDN_THROW(Error("thisUpdate (" + time::toIsoString(m_thisUpdate) + ") is after nextUpdate (" +
                    time::toIsoString(m_nextUpdate) + ")"));
  }

  m_number = resolveNumber(m_request.resolvedNumber, m_request.explicitNumber);
  m_entries = mergeEntries(m_request.entries, m_request.ignores, m_request.includes, m_thisUpdate);
  NDN_LOG_DEBUG("Prepared revocation list #" << m_number << " with " << m_entries.size() << " entries, "
                << m_request.entries.size() << " of them carried over");
}

// a CRL number must fit in 20 DER octets
static const CrlNumber MAX_CRL_NUMBER = (CrlNumber(1) << 159) - 1;

CrlNumber
CrlBuilder::resolveNumber(const std::optional<CrlNumber>& resolved, const std::string& explicitNumber)
{
  CrlNumber number = 1;
  if (!explicitNumber.empty()) {
    auto str = boost::algorithm::trim_copy(explicitNumber);
    if (str.empty() || !std::all_of(str.begin(), str.end(),
                                    [] (unsigned char c) { return std::isdigit(c) != 0; })) {
      NDN_THROW(Error("Invalid CRL number \"" + explicitNumber +
                      "\", expecting a non-negative decimal integer"));
    }
    // no leading zeros, cpp_int would read them as octal
    auto firstNonZero = str.find_first_not_of('0');
    number = CrlNumber(firstNonZero == std::string::npos ? "0" : str.substr(firstNonZero));
  }
  else if (resolved) {
    number = *resolved + 1;
  }

  if (number < 0) {
    NDN_THROW(Error("CRL number " + number.str() + " is negative"));
  }
  if (number > MAX_CRL_NUMBER) {
    NDN_THROW(Error("CRL number " + number.str() + " exceeds 20 octets"));
  }
  return number;
}

std::vector<RevocationEntry>
CrlBuilder::mergeEntries(const std::vector<RevocationEntry>& entries,
                         const std::vector<SerialNumber>& ignores,
                         const std::vector<SerialNumber>& includes,
                         time::system_clock::time_point revocationTime)
{
  std::vector<RevocationEntry> merged = entries;
  DedupPolicy policy;
  for (const auto& entry : entries) {
    policy.block(entry.serial);
  }
  for (const auto& serial : ignores) {
    policy.block(serial);
  }
  for (const auto& serial : includes) {
    if (policy.consider(serial)) {
      merged.push_back({serial, revocationTime, std::nullopt});
    }
    else {
      NDN_LOG_TRACE("Not adding " << serial << ", already revoked or ignored");
    }
  }
  return merged;
}

static void
addRevokedEntry(X509_CRL* crl, const RevocationEntry& entry)
{
  detail::X509RevokedPtr revoked(X509_REVOKED_new());
  auto serial = entry.serial.toAsn1();
  auto date = detail::timePointToAsn1Time(entry.revocationTime);
  if (revoked == nullptr ||
      X509_REVOKED_set_serialNumber(revoked.get(), serial.get()) != 1 ||
      X509_REVOKED_set_revocationDate(revoked.get(), date.get()) != 1) {
    NDN_THROW(detail::OpenSslError("Cannot create entry for serial " + entry.serial.toHex()));
  }

  if (entry.reasonCode) {
    detail::OpenSslPtr<ASN1_ENUMERATED> reason(ASN1_ENUMERATED_new());
    if (reason == nullptr || ASN1_ENUMERATED_set(reason.get(), *entry.reasonCode) != 1 ||
        X509_REVOKED_add1_ext_i2d(revoked.get(), NID_crl_reason, reason.get(), 0, X509V3_ADD_DEFAULT) != 1) {
      NDN_THROW(detail::OpenSslError("Cannot set reason code for serial " + entry.serial.toHex()));
    }
  }

  if (X509_CRL_add0_revoked(crl, revoked.get()) != 1) {
    NDN_THROW(detail::OpenSslError("Cannot add entry for serial " + entry.serial.toHex()));
  }
  revoked.release();
}

detail::X509CrlPtr
CrlBuilder::makeCrl(EVP_PKEY* key, const EVP_MD* md) const
{
  X509* issuer = m_request.issuer;
  detail::X509CrlPtr crl(X509_CRL_new());
  if (crl == nullptr ||
      X509_CRL_set_version(crl.get(), X509_CRL_VERSION_2) != 1 ||
      X509_CRL_set_issuer_name(crl.get(), X509_get_subject_name(issuer)) != 1) {
    NDN_THROW(detail::OpenSslError("Cannot initialize revocation list"));
  }

  auto thisUpdate = detail::timePointToAsn1Time(m_thisUpdate);
  auto nextUpdate = detail::timePointToAsn1Time(m_nextUpdate);
  if (X509_CRL_set1_lastUpdate(crl.get(), thisUpdate.get()) != 1 ||
      X509_CRL_set1_nextUpdate(crl.get(), nextUpdate.get()) != 1) {
    NDN_THROW(detail::OpenSslError("Cannot set revocation list validity"));
  }

  const ASN1_OCTET_STRING* ski = X509_get0_subject_key_id(issuer);
  if (ski != nullptr) {
    detail::OpenSslPtr<AUTHORITY_KEYID> akid(AUTHORITY_KEYID_new());
    if (akid == nullptr || (akid->keyid = ASN1_OCTET_STRING_dup(ski)) == nullptr ||
        X509_CRL_add1_ext_i2d(crl.get(), NID_authority_key_identifier, akid.get(), 0, X509V3_ADD_DEFAULT) != 1) {
      NDN_THROW(detail::OpenSslError("Cannot add authority key identifier"));
    }
  }
  else {
    NDN_LOG_DEBUG("Issuer has no subject key identifier, omitting authority key identifier");
  }

  auto number = detail::numberToAsn1Integer(m_number);
  if (X509_CRL_add1_ext_i2d(crl.get(), NID_crl_number, number.get(), 0, X509V3_ADD_DEFAULT) != 1) {
    NDN_THROW(detail::OpenSslError("Cannot add CRL number"));
  }

  for (const auto& entry : m_entries) {
    addRevokedEntry(crl.get(), entry);
  }

  if (X509_CRL_sign(crl.get(), key, md) <= 0) {
    NDN_THROW(detail::OpenSslError("Cannot sign revocation list"));
  }
  return crl;
}

static Buffer
encodeTbs(X509_CRL* crl)
{
  int len = i2d_re_X509_CRL_tbs(crl, nullptr);
  if (len <= 0) {
    NDN_THROW(detail::OpenSslError("Cannot encode tbsCertList"));
  }
  Buffer tbs(static_cast<size_t>(len));
  auto p = tbs.data();
  if (i2d_re_X509_CRL_tbs(crl, &p) != len) {
    NDN_THROW(detail::OpenSslError("Cannot encode tbsCertList"));
  }
  return tbs;
}

BuildResult
CrlBuilder::build() const
{
  BuildResult result;
  result.number = m_number;
  result.nEntries = m_entries.size();
  const EVP_MD* md = m_algorithm == nullptr ? nullptr : m_algorithm->digest();

  if (m_request.mode == BuildMode::SIGNED) {
    auto crl = makeCrl(m_request.signer, md);
    result.der = detail::encodeDer<X509_CRL>(crl.get(), &i2d_X509_CRL, "revocation list");
    NDN_LOG_INFO("Signed revocation list #" << m_number << " with " << m_entries.size() << " entries");
  }
  else {
    // the placeholder signature of the throwaway key is discarded with the CRL object
    auto throwaway = generateThrowawayKey(m_issuerKey);
    auto crl = makeCrl(throwaway.get(), md);
    result.der = encodeTbs(crl.get());
    result.digest = computeDigest(*m_algorithm, result.der);
    NDN_LOG_INFO("Prepared to-be-signed revocation list #" << m_number << " with "
                 << m_entries.size() << " entries, digest " << ndn::toHex(result.digest, false));
  }
  return result;
}

} // namespace revokr
