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


#include "crl-assembler.hpp"
#include "signature-algorithm.hpp"

#include <ndn-cxx/encoding/buffer-stream.hpp>
#include <ndn-cxx/security/transform/base64-decode.hpp>
#include <ndn-cxx/security/transform/buffer-source.hpp>
#include <ndn-cxx/security/transform/stream-sink.hpp>

#include <boost/assert.hpp>

#include <openssl/asn1.h>
#include <openssl/err.h>

#include <algorithm>
#include <cctype>
#include <cstring>

namespace revokr::assembler {

NDN_LOG_INIT(revokr.assemble);

static void
checkTbs(const Buffer& tbs)
{
  const unsigned char* p = tbs.data();
  long len = 0;
  int tag = 0;
  int xclass = 0;
  int ret = ASN1_get_object(&p, &len, &tag, &xclass, static_cast<long>(tbs.size()));
  if ((ret & 0x80) != 0) {
    ERR_clear_error();
    NDN_THROW(Error("To-be-signed data is not valid DER"));
  }
  if (tag != V_ASN1_SEQUENCE || xclass != V_ASN1_UNIVERSAL || (ret & V_ASN1_CONSTRUCTED) == 0) {
    NDN_THROW(Error("To-be-signed data is not a DER SEQUENCE"));
  }
  // 0x01 flags indefinite length, which DER forbids
  if ((ret & 0x01) != 0 ||
      static_cast<size_t>(p - tbs.data()) + static_cast<size_t>(len) != tbs.size()) {
    NDN_THROW(Error("To-be-signed data must be exactly one DER SEQUENCE"));
  }
}

Buffer
assemble(const X509* issuer, const Buffer& tbs, const Buffer& signature)
{
  if (issuer == nullptr) {
    NDN_THROW(Error("Issuer certificate is required"));
  }
  if (tbs.empty()) {
    NDN_THROW(Error("To-be-signed data is empty"));
  }
  if (signature.empty()) {
    NDN_THROW(Error("Signature is empty"));
  }
  checkTbs(tbs);

  const SignatureAlgorithm* algo = nullptr;
  try {
    algo = &getIssuerSignatureAlgorithm(issuer);
  }
  catch (const UnsupportedAlgorithmError& e) {
    NDN_THROW_NESTED(Error(e.what()));
  }
  auto algId = encodeAlgorithmIdentifier(*algo);

  // BIT STRING content starts with the number of unused bits
  int bitStringLen = static_cast<int>(signature.size()) + 1;
  int innerLen = static_cast<int>(tbs.size() + algId.size()) +
                 ASN1_object_size(0, bitStringLen, V_ASN1_BIT_STRING);
  int totalLen = ASN1_object_size(1, innerLen, V_ASN1_SEQUENCE);
  if (bitStringLen <= 0 || innerLen <= 0 || totalLen <= 0) {
    NDN_THROW(Error("Signed revocation list would be too large"));
  }

  Buffer crl(static_cast<size_t>(totalLen));
  unsigned char* p = crl.data();
  ASN1_put_object(&p, 1, innerLen, V_ASN1_SEQUENCE, V_ASN1_UNIVERSAL);
  p = std::copy(tbs.begin(), tbs.end(), p);
  p = std::copy(algId.begin(), algId.end(), p);
  ASN1_put_object(&p, 0, bitStringLen, V_ASN1_BIT_STRING, V_ASN1_UNIVERSAL);
  *p++ = 0;
  p = std::copy(signature.begin(), signature.end(), p);
  BOOST_ASSERT(p == crl.data() + crl.size());

  const unsigned char* check = crl.data();
  detail::X509CrlPtr parsed(d2i_X509_CRL(nullptr, &check, static_cast<long>(crl.size())));
  if (parsed == nullptr) {
    ERR_clear_error();
    NDN_THROW(Error("To-be-signed data is not a valid tbsCertList"));
  }

  NDN_LOG_INFO("Assembled revocation list (" << crl.size() << " bytes) with " << algo->name);
  return crl;
}

static bool
isBase64Text(const std::string& text)
{
  size_t nChars = 0;
  size_t nPadding = 0;
  for (unsigned char c : text) {
    if (std::isspace(c)) {
      continue;
    }
    if (c == '=') {
      nPadding++;
    }
    else if (nPadding > 0 || !(std::isalnum(c) || c == '+' || c == '/')) {
      return false;
    }
    nChars++;
  }
  return nChars > 0 && nChars % 4 == 0 && nPadding <= 2;
}

Buffer
decodeSignature(const io::PemBlock& block)
{
  std::string text(block.bytes.begin(), block.bytes.end());
  if (!isBase64Text(text)) {
    return block.bytes;
  }

  namespace t = ndn::security::transform;
  text.erase(std::remove_if(text.begin(), text.end(),
                            [] (unsigned char c) { return std::isspace(c) != 0; }),
             text.end());
  ndn::OBufferStream os;
  try {
    t::bufferSource(text) >> t::base64Decode(false) >> t::streamSink(os);
  }
  catch (const t::Error& e) {
    NDN_LOG_DEBUG("Signature looked like base64 but failed to decode, using it raw: " << e.what());
    return block.bytes;
  }
  NDN_LOG_DEBUG("Signature was base64 encoded");
  return *os.buf();
}

Buffer
loadSignature(const std::string& path)
{
  return decodeSignature(io::loadPemOrRaw(path));
}

Buffer
loadTbs(const std::string& path)
{
  auto block = io::loadPemOrRaw(path);
  if (block.isPem() && block.type != io::PEM_TYPE_CRL_TBS) {
    NDN_LOG_DEBUG("Accepting PEM label \"" << block.type << "\" for to-be-signed data in " << path);
  }
  return block.bytes;
}

} // namespace revokr::assembler
