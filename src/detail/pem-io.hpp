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

#ifndef REVOKR_DETAIL_PEM_IO_HPP
#define REVOKR_DETAIL_PEM_IO_HPP

#include "detail/revokr-common.hpp"

#include <iosfwd>
#include <stdexcept>

namespace revokr::io {

// PEM labels of the artifacts written by revokr
const std::string PEM_TYPE_CRL = "X509 CRL";
const std::string PEM_TYPE_CRL_TBS = "X509 CRL TBS";
const std::string PEM_TYPE_CRL_DIGEST = "X509 CRL DIGEST";

class Error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Content of a file that may or may not be PEM encoded.
 */
struct PemBlock
{
  /**
   * @brief PEM label, empty when the content was not PEM encoded.
   */
  std::string type;
  /**
   * @brief RFC 1421 headers (e.g., Proc-Type, DEK-Info), empty if none.
   */
  std::string headers;
  /**
   * @brief Decoded payload, or the raw file content if not PEM encoded.
   */
  Buffer bytes;

  bool
  isPem() const
  {
    return !type.empty();
  }
};

/**
 * @brief Read the whole file into memory.
 * @throw Error the file cannot be read
 */
Buffer
readFile(const std::string& path);

/**
 * @brief Decode the first PEM block of @p data, or return @p data verbatim if there is none.
 */
PemBlock
decodePemOrRaw(const Buffer& data);

/**
 * @brief Read @p path and decode it with decodePemOrRaw().
 * @throw Error the file cannot be read
 */
PemBlock
loadPemOrRaw(const std::string& path);

/**
 * @brief Wrap @p der into a PEM block labeled @p type.
 */
std::string
encodePem(const std::string& type, const Buffer& der);

/**
 * @brief Write an artifact according to the output destination policy.
 *
 * PEM output without a path is printed to @p stdOut. DER output requires a path since
 * binary data is never written to the terminal.
 *
 * @throw Error DER output requested without a path, or the file cannot be written
 */
void
writeArtifact(const std::string& path, const Buffer& der, OutputFormat format,
              const std::string& pemType, std::ostream& stdOut);

} // namespace revokr::io

#endif // REVOKR_DETAIL_PEM_IO_HPP
