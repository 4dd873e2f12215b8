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

#include "public-key.hpp"

#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <openssl/objects.h>
#include <openssl/rsa.h>

#include <type_traits>

namespace revokr {

NDN_LOG_INIT(revokr.keys);

std::ostream&
operator<<(std::ostream& os, EcCurve curve)
{
  switch (curve) {
    case EcCurve::P256: return os << "P-256";
    case EcCurve::P384: return os << "P-384";
    case EcCurve::P521: return os << "P-521";
  }
  return os << "<Unknown Curve>";
}

static int
getCurveNid(EcCurve curve)
{
  switch (curve) {
    case EcCurve::P256: return NID_X9_62_prime256v1;
    case EcCurve::P384: return NID_secp384r1;
    case EcCurve::P521: return NID_secp521r1;
  }
  NDN_THROW(KeyError("Unknown elliptic curve"));
}

std::string
describeKeyType(const PublicKey& key)
{
  return std::visit([] (const auto& k) -> std::string {
    using T = std::decay_t<decltype(k)>;
    if constexpr (std::is_same_v<T, RsaPublicKey>) {
      return "RSA-" + std::to_string(k.bits);
    }
    else if constexpr (std::is_same_v<T, EcPublicKey>) {
      std::ostringstream os;
      os << "ECDSA " << k.curve;
      return os.str();
    }
    else {
      static_assert(std::is_same_v<T, Ed25519PublicKey>);
      return "Ed25519";
    }
  }, key);
}

static Buffer
getBignumParam(EVP_PKEY* key, const char* name)
{
  BIGNUM* raw = nullptr;
  if (EVP_PKEY_get_bn_param(key, name, &raw) != 1) {
    NDN_THROW(detail::OpenSslError("Cannot read key parameter "s + name));
  }
  detail::BignumPtr bn(raw);
  Buffer out(static_cast<size_t>(BN_num_bytes(bn.get())));
  BN_bn2bin(bn.get(), out.data());
  return out;
}

static EcCurve
getCurve(EVP_PKEY* key)
{
  char groupName[80];
  size_t len = 0;
  if (EVP_PKEY_get_group_name(key, groupName, sizeof(groupName), &len) != 1) {
    NDN_THROW(detail::OpenSslError("Cannot read elliptic curve of the key"));
  }
  int nid = OBJ_sn2nid(groupName);
  if (nid == NID_undef) {
    nid = EC_curve_nist2nid(groupName);
  }
  switch (nid) {
    case NID_X9_62_prime256v1: return EcCurve::P256;
    case NID_secp384r1: return EcCurve::P384;
    case NID_secp521r1: return EcCurve::P521;
    default:
      NDN_THROW(KeyError("Unsupported elliptic curve "s + groupName));
  }
}

PublicKey
extractPublicKey(EVP_PKEY* key)
{
  if (key == nullptr) {
    NDN_THROW(KeyError("Key is missing"));
  }

  switch (EVP_PKEY_get_base_id(key)) {
    case EVP_PKEY_RSA: {
      RsaPublicKey rsa;
      rsa.modulus = getBignumParam(key, OSSL_PKEY_PARAM_RSA_N);
      rsa.exponent = getBignumParam(key, OSSL_PKEY_PARAM_RSA_E);
      rsa.bits = EVP_PKEY_get_bits(key);
      return rsa;
    }
    case EVP_PKEY_EC: {
      EcPublicKey ec;
      ec.curve = getCurve(key);
      ec.x = getBignumParam(key, OSSL_PKEY_PARAM_EC_PUB_X);
      ec.y = getBignumParam(key, OSSL_PKEY_PARAM_EC_PUB_Y);
      return ec;
    }
    case EVP_PKEY_ED25519: {
      Ed25519PublicKey ed;
      size_t len = 0;
      if (EVP_PKEY_get_raw_public_key(key, nullptr, &len) != 1) {
        NDN_THROW(detail::OpenSslError("Cannot read Ed25519 public key"));
      }
      ed.raw.resize(len);
      if (EVP_PKEY_get_raw_public_key(key, ed.raw.data(), &len) != 1) {
        NDN_THROW(detail::OpenSslError("Cannot read Ed25519 public key"));
      }
      return ed;
    }
    default:
      NDN_THROW(KeyError("Unsupported public key type "s + OBJ_nid2sn(EVP_PKEY_get_base_id(key))));
  }
}

void
verifyKeyMatch(const PublicKey& certKey, const PublicKey& signerKey)
{
  std::visit([&certKey] (const auto& signer) {
    using T = std::decay_t<decltype(signer)>;
    if constexpr (std::is_same_v<T, RsaPublicKey>) {
      auto cert = std::get_if<RsaPublicKey>(&certKey);
      if (cert == nullptr) {
        NDN_THROW(KeyError("Certificate public key is not RSA"));
      }
      if (cert->modulus != signer.modulus || cert->exponent != signer.exponent) {
        NDN_THROW(KeyError("RSA public key in certificate does not match private key"));
      }
    }
    else if constexpr (std::is_same_v<T, EcPublicKey>) {
      auto cert = std::get_if<EcPublicKey>(&certKey);
      if (cert == nullptr) {
        NDN_THROW(KeyError("Certificate public key is not ECDSA"));
      }
      if (cert->curve != signer.curve || cert->x != signer.x || cert->y != signer.y) {
        NDN_THROW(KeyError("ECDSA public key in certificate does not match private key"));
      }
    }
    else {
      static_assert(std::is_same_v<T, Ed25519PublicKey>);
      auto cert = std::get_if<Ed25519PublicKey>(&certKey);
      if (cert == nullptr) {
        NDN_THROW(KeyError("Certificate public key is not Ed25519"));
      }
      if (cert->raw != signer.raw) {
        NDN_THROW(KeyError("Ed25519 public key in certificate does not match private key"));
      }
    }
  }, signerKey);
}

static detail::EvpPkeyPtr
runKeygen(EVP_PKEY_CTX* ctx)
{
  EVP_PKEY* key = nullptr;
  if (EVP_PKEY_keygen(ctx, &key) != 1) {
    NDN_THROW(detail::OpenSslError("Cannot generate throwaway key"));
  }
  return detail::EvpPkeyPtr(key);
}

detail::EvpPkeyPtr
generateThrowawayKey(const PublicKey& like)
{
  NDN_LOG_DEBUG("Generating throwaway " << describeKeyType(like) << " key");
  return std::visit([] (const auto& k) {
    using T = std::decay_t<decltype(k)>;
    detail::OpenSslPtr<EVP_PKEY_CTX> ctx;
    if constexpr (std::is_same_v<T, RsaPublicKey>) {
      // round up to whole bytes of modulus
      int bits = (k.bits + 7) / 8 * 8;
      ctx.reset(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
      if (ctx == nullptr || EVP_PKEY_keygen_init(ctx.get()) != 1 ||
          EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) != 1) {
        NDN_THROW(detail::OpenSslError("Cannot set up RSA key generation"));
      }
    }
    else if constexpr (std::is_same_v<T, EcPublicKey>) {
      ctx.reset(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
      if (ctx == nullptr || EVP_PKEY_keygen_init(ctx.get()) != 1 ||
          EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), getCurveNid(k.curve)) != 1) {
        NDN_THROW(detail::OpenSslError("Cannot set up EC key generation"));
      }
    }
    else {
      static_assert(std::is_same_v<T, Ed25519PublicKey>);
      ctx.reset(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
      if (ctx == nullptr || EVP_PKEY_keygen_init(ctx.get()) != 1) {
        NDN_THROW(detail::OpenSslError("Cannot set up Ed25519 key generation"));
      }
    }
    return runKeygen(ctx.get());
  }, like);
}

} // namespace revokr
