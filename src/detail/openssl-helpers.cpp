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

#include "detail/openssl-helpers.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>

namespace revokr::detail {

OpenSslError::OpenSslError(const std::string& what)
  : std::runtime_error(what + drainOpenSslErrors())
{
}

std::string
drainOpenSslErrors()
{
  std::string result;
  unsigned long code = 0;
  while ((code = ERR_get_error()) != 0) {
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    result += " (";
    result += buf;
    result += ")";
  }
  return result;
}

static std::string
bignumToHex(const BIGNUM* bn)
{
  char* hex = BN_bn2hex(bn);
  if (hex == nullptr) {
    NDN_THROW(OpenSslError("Cannot render BIGNUM as hex"));
  }
  std::string str(hex);
  OPENSSL_free(hex);

  boost::algorithm::to_lower(str);
  bool isNegative = !str.empty() && str[0] == '-';
  auto digits = str.substr(isNegative ? 1 : 0);
  auto firstNonZero = digits.find_first_not_of('0');
  digits = firstNonZero == std::string::npos ? "0" : digits.substr(firstNonZero);
  return isNegative && digits != "0" ? "-" + digits : digits;
}

std::string
asn1IntegerToHex(const ASN1_INTEGER* value)
{
  BignumPtr bn(ASN1_INTEGER_to_BN(value, nullptr));
  if (bn == nullptr) {
    NDN_THROW(OpenSslError("Cannot convert ASN1_INTEGER to BIGNUM"));
  }
  return bignumToHex(bn.get());
}

CrlNumber
asn1IntegerToNumber(const ASN1_INTEGER* value)
{
  BignumPtr bn(ASN1_INTEGER_to_BN(value, nullptr));
  if (bn == nullptr) {
    NDN_THROW(OpenSslError("Cannot convert ASN1_INTEGER to BIGNUM"));
  }
  char* dec = BN_bn2dec(bn.get());
  if (dec == nullptr) {
    NDN_THROW(OpenSslError("Cannot render BIGNUM as decimal"));
  }
  CrlNumber number(dec);
  OPENSSL_free(dec);
  return number;
}

OpenSslPtr<ASN1_INTEGER>
numberToAsn1Integer(const CrlNumber& number)
{
  BIGNUM* raw = nullptr;
  if (BN_dec2bn(&raw, number.str().data()) == 0) {
    NDN_THROW(OpenSslError("Cannot convert CRL number " + number.str()));
  }
  BignumPtr bn(raw);
  OpenSslPtr<ASN1_INTEGER> integer(BN_to_ASN1_INTEGER(bn.get(), nullptr));
  if (integer == nullptr) {
    NDN_THROW(OpenSslError("Cannot convert CRL number " + number.str()));
  }
  return integer;
}

} // namespace revokr::detail
