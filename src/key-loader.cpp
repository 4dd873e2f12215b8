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


#include "key-loader.hpp"

#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ui.h>

#include <cstring>

namespace revokr::keys {

NDN_LOG_INIT(revokr.keys);

detail::X509Ptr
decodeCertificate(const io::PemBlock& block, const std::string& origin)
{
  const unsigned char* p = block.bytes.data();
  detail::X509Ptr cert(d2i_X509(nullptr, &p, static_cast<long>(block.bytes.size())));
  if (cert == nullptr) {
    ERR_clear_error();
    NDN_THROW(Error("Unable to parse certificate " + origin));
  }
  return cert;
}

detail::X509Ptr
loadCertificate(const std::string& path)
{
  auto cert = decodeCertificate(io::loadPemOrRaw(path), path);
  NDN_LOG_DEBUG("Loaded issuer certificate from " << path);
  return cert;
}

static int
passwordCallback(char* buf, int size, int, void* userdata)
{
  const auto& password = *static_cast<const std::string*>(userdata);
  if (size <= 0 || password.size() > static_cast<size_t>(size)) {
    return -1;
  }
  std::memcpy(buf, password.data(), password.size());
  return static_cast<int>(password.size());
}

static Buffer
decryptLegacyPem(const io::PemBlock& block, const std::string& password)
{
  EVP_CIPHER_INFO cipher;
  std::string headers = block.headers;
  if (PEM_get_EVP_CIPHER_INFO(headers.data(), &cipher) != 1) {
    NDN_THROW(detail::OpenSslError("Unsupported legacy PEM encryption header"));
  }

  Buffer data = block.bytes;
  long len = static_cast<long>(data.size());
  if (PEM_do_header(&cipher, data.data(), &len, &passwordCallback,
                    const_cast<std::string*>(&password)) != 1) {
    ERR_clear_error();
    NDN_THROW(Error("Cannot decrypt legacy PEM private key, the password may be wrong"));
  }
  data.resize(static_cast<size_t>(len));
  return data;
}

static detail::EvpPkeyPtr
parsePkcs8(const Buffer& der)
{
  const unsigned char* p = der.data();
  detail::OpenSslPtr<PKCS8_PRIV_KEY_INFO> info(d2i_PKCS8_PRIV_KEY_INFO(nullptr, &p,
                                                                       static_cast<long>(der.size())));
  if (info == nullptr) {
    ERR_clear_error();
    return nullptr;
  }
  detail::EvpPkeyPtr key(EVP_PKCS82PKEY(info.get()));
  if (key == nullptr) {
    NDN_THROW(detail::OpenSslError("Cannot decode PKCS#8 private key"));
  }
  NDN_LOG_TRACE("Private key is unencrypted PKCS#8");
  return key;
}

static detail::EvpPkeyPtr
parseEncryptedPkcs8(const Buffer& der, const std::optional<std::string>& password)
{
  const unsigned char* p = der.data();
  detail::OpenSslPtr<X509_SIG> sig(d2i_X509_SIG(nullptr, &p, static_cast<long>(der.size())));
  if (sig == nullptr) {
    ERR_clear_error();
    return nullptr;
  }
  if (!password) {
    NDN_THROW(Error("Private key is encrypted PKCS#8, but no password was given"));
  }

  detail::OpenSslPtr<PKCS8_PRIV_KEY_INFO> info(PKCS8_decrypt(sig.get(), password->data(),
                                                             static_cast<int>(password->size())));
  if (info == nullptr) {
    ERR_clear_error();
    NDN_THROW(Error("Cannot decrypt PKCS#8 private key, the password may be wrong"));
  }
  detail::EvpPkeyPtr key(EVP_PKCS82PKEY(info.get()));
  if (key == nullptr) {
    NDN_THROW(detail::OpenSslError("Cannot decode decrypted PKCS#8 private key"));
  }
  NDN_LOG_TRACE("Private key is encrypted PKCS#8");
  return key;
}

static detail::EvpPkeyPtr
parseTypedKey(int type, const Buffer& der)
{
  const unsigned char* p = der.data();
  detail::EvpPkeyPtr key(d2i_PrivateKey(type, nullptr, &p, static_cast<long>(der.size())));
  if (key == nullptr) {
    ERR_clear_error();
  }
  return key;
}

detail::EvpPkeyPtr
decodePrivateKey(const io::PemBlock& block, const std::optional<std::string>& password)
{
  Buffer der = block.bytes;
  if (block.headers.find("ENCRYPTED") != std::string::npos) {
    NDN_LOG_WARN("Private key uses legacy PEM encryption, which is insecure; "
                 "consider converting it to encrypted PKCS#8");
    if (!password) {
      NDN_THROW(Error("Private key is encrypted, but no password was given"));
    }
    der = decryptLegacyPem(block, *password);
  }

  if (auto key = parsePkcs8(der); key != nullptr) {
    return key;
  }
  if (auto key = parseEncryptedPkcs8(der, password); key != nullptr) {
    return key;
  }
  if (auto key = parseTypedKey(EVP_PKEY_RSA, der); key != nullptr) {
    NDN_LOG_TRACE("Private key is PKCS#1 RSA");
    return key;
  }
  if (auto key = parseTypedKey(EVP_PKEY_EC, der); key != nullptr) {
    NDN_LOG_TRACE("Private key is SEC1 EC");
    return key;
  }
  NDN_THROW(Error("Unable to parse private key: unsupported or corrupted format"));
}

detail::EvpPkeyPtr
loadPrivateKey(const std::string& path, const std::optional<std::string>& password)
{
  auto block = io::loadPemOrRaw(path);
  try {
    auto key = decodePrivateKey(block, password);
    NDN_LOG_DEBUG("Loaded private key from " << path);
    return key;
  }
  catch (const Error& e) {
    NDN_THROW_NESTED(Error(std::string(e.what()) + " (" + path + ")"));
  }
}

std::string
promptPassword(const std::string& prompt)
{
  char buf[1024];
  int res = EVP_read_pw_string(buf, sizeof(buf), prompt.data(), 0);
  if (res != 0) {
    OPENSSL_cleanse(buf, sizeof(buf));
    NDN_THROW(Error(res < 0 ? "Cannot read password from the terminal" : "Password entry aborted"));
  }
  std::string password(buf);
  OPENSSL_cleanse(buf, sizeof(buf));
  return password;
}

} // namespace revokr::keys
