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


#ifndef REVOKR_KEY_LOADER_HPP
#define REVOKR_KEY_LOADER_HPP

#include "detail/pem-io.hpp"
#include "detail/openssl-helpers.hpp"

namespace revokr::keys {

class Error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Decode one X.509 certificate from PEM or DER.
 * @param origin name of the input used in error messages
 * @throw Error the content is not a certificate
 */
detail::X509Ptr
decodeCertificate(const io::PemBlock& block, const std::string& origin);

/**
 * @brief Load the issuer certificate from @p path (PEM or DER).
 * @throw io::Error the file cannot be read
 * @throw Error the file does not hold a certificate
 */
detail::X509Ptr
loadCertificate(const std::string& path);

/**
 * @brief Decode a private key.
 *
 * Formats are tried in this order, first success wins:
 *  - legacy encrypted PEM (Proc-Type: 4,ENCRYPTED), decrypted first and then decoded
 *    by the rules below
 *  - unencrypted PKCS#8
 *  - encrypted PKCS#8
 *  - PKCS#1 RSA private key
 *  - SEC1 EC private key
 *
 * @param password required only for encrypted keys
 * @throw Error the key is encrypted and no password was given, the password is wrong,
 *              or no format matches
 */
detail::EvpPkeyPtr
decodePrivateKey(const io::PemBlock& block, const std::optional<std::string>& password);

/**
 * @brief Load the issuer private key from @p path.
 * @throw io::Error the file cannot be read
 * @throw Error see decodePrivateKey()
 */
detail::EvpPkeyPtr
loadPrivateKey(const std::string& path, const std::optional<std::string>& password);

/**
 * @brief Read a password from the terminal without echo.
 * @throw Error reading failed or was aborted
 */
std::string
promptPassword(const std::string& prompt);

} // namespace revokr::keys

#endif // REVOKR_KEY_LOADER_HPP
