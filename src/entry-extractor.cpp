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


#include "entry-extractor.hpp"
#include "detail/pem-io.hpp"
#include "detail/time-helpers.hpp"

#include <openssl/err.h>

#include <iterator>

namespace revokr::extractor {

NDN_LOG_INIT(revokr.extract);

static std::optional<long>
getReasonCode(const X509_REVOKED* revoked)
{
  int critical = 0;
  detail::OpenSslPtr<ASN1_ENUMERATED> reason(static_cast<ASN1_ENUMERATED*>(
    X509_REVOKED_get_ext_d2i(revoked, NID_crl_reason, &critical, nullptr)));
  if (reason == nullptr) {
    return std::nullopt;
  }
  return ASN1_ENUMERATED_get(reason.get());
}

void
collect(const X509_CRL* crl, DedupPolicy& policy, ExtractionResult& result)
{
  int critical = 0;
  detail::OpenSslPtr<ASN1_INTEGER> number(static_cast<ASN1_INTEGER*>(
    X509_CRL_get_ext_d2i(crl, NID_crl_number, &critical, nullptr)));
  if (number != nullptr) {
    auto value = detail::asn1IntegerToNumber(number.get());
    NDN_LOG_DEBUG("CRL number " << value);
    if (!result.highestNumber || *result.highestNumber < value) {
      result.highestNumber = value;
    }
  }

  STACK_OF(X509_REVOKED)* revoked = X509_CRL_get_REVOKED(const_cast<X509_CRL*>(crl));
  int nRevoked = revoked == nullptr ? 0 : sk_X509_REVOKED_num(revoked);
  for (int i = 0; i < nRevoked; i++) {
    const X509_REVOKED* item = sk_X509_REVOKED_value(revoked, i);
    auto serial = SerialNumber::fromAsn1(X509_REVOKED_get0_serialNumber(item));
    if (!policy.consider(serial)) {
      NDN_LOG_TRACE("Skipping ignored or duplicate serial " << serial);
      continue;
    }
    result.entries.push_back({serial,
                              detail::asn1TimeToTimePoint(X509_REVOKED_get0_revocationDate(item)),
                              getReasonCode(item)});
  }
}

static detail::X509CrlPtr
loadCrl(const std::string& path)
{
  auto block = io::loadPemOrRaw(path);
  if (block.bytes.empty()) {
    NDN_THROW(io::Error("Not a valid certificate revocation list"));
  }
  const unsigned char* p = block.bytes.data();
  detail::X509CrlPtr crl(d2i_X509_CRL(nullptr, &p, static_cast<long>(block.bytes.size())));
  if (crl == nullptr) {
    ERR_clear_error();
    NDN_THROW(io::Error("Not a valid certificate revocation list"));
  }
  return crl;
}

ExtractionResult
extract(const std::vector<SerialNumber>& ignore, const std::vector<std::string>& sources,
        Diagnostics& diag)
{
  ExtractionResult result;
  DedupPolicy policy(ignore);

  for (const auto& path : sources) {
    detail::X509CrlPtr crl;
    try {
      crl = loadCrl(path);
    }
    catch (const std::runtime_error& e) {
      diag.warn(path, "cannot load revocation list, skipping: "s + e.what());
      continue;
    }

    // a list is taken as a whole or not at all
    auto nextPolicy = policy;
    ExtractionResult found;
    try {
      collect(crl.get(), nextPolicy, found);
    }
    catch (const detail::OpenSslError& e) {
      diag.warn(path, "cannot read revocation list, skipping: "s + e.what());
      continue;
    }
    NDN_LOG_INFO("Extracted " << found.entries.size() << " entries from " << path);
    policy = std::move(nextPolicy);
    if (found.highestNumber && (!result.highestNumber || *result.highestNumber < *found.highestNumber)) {
      result.highestNumber = std::move(found.highestNumber);
    }
    result.entries.insert(result.entries.end(), std::make_move_iterator(found.entries.begin()),
                          std::make_move_iterator(found.entries.end()));
  }
  return result;
}

} // namespace revokr::extractor
