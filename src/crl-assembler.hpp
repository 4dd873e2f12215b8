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


#ifndef REVOKR_CRL_ASSEMBLER_HPP
#define REVOKR_CRL_ASSEMBLER_HPP

#include "detail/pem-io.hpp"
#include "detail/openssl-helpers.hpp"

namespace revokr::assembler {

class Error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Put a to-be-signed revocation list and its detached signature together.
 *
 * The result is SEQUENCE { tbsCertList, signatureAlgorithm, signatureValue }, where
 * @p tbs is copied verbatim and the algorithm is the one declared by @p issuer.
 * No private key is involved and the signature is not verified.
 *
 * @throw Error @p tbs or @p signature is empty, @p tbs is not a single DER SEQUENCE,
 *              or the issuer signature algorithm is not supported
 */
Buffer
assemble(const X509* issuer, const Buffer& tbs, const Buffer& signature);

/**
 * @brief Signature bytes held in @p block.
 *
 * A payload that is valid standard base64 text is decoded, anything else is taken
 * as the raw signature.
 */
Buffer
decodeSignature(const io::PemBlock& block);

/**
 * @brief Load a signature file (raw, base64 or PEM).
 */
Buffer
loadSignature(const std::string& path);

/**
 * @brief Load a to-be-signed revocation list file (PEM with any label, or DER).
 */
Buffer
loadTbs(const std::string& path);

} // namespace revokr::assembler

#endif // REVOKR_CRL_ASSEMBLER_HPP
