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


#ifndef REVOKR_TOOL_CONFIG_HPP
#define REVOKR_TOOL_CONFIG_HPP

#include "detail/revokr-common.hpp"

namespace revokr {

/**
 * @brief Defaults for the revokr command line, read from a JSON file.
 *
 * The format of the configuration in JSON
 * {
 *   "issuer-certificate": "ca.crt",
 *   "issuer-key": "ca.key",
 *   "pem": true,
 *   "serials": "revoked.txt",
 *   "ignore": "reinstated.txt",
 *   "extend": ["previous.crl"],
 *   "out": "ca.crl"
 * }
 *
 * Every key is optional. Relative paths are kept as written.
 */
class ToolConfig
{
public:
  /**
   * @brief Load the configuration from the file.
   * @throw std::runtime_error when the file cannot be correctly parsed
   */
  void
  load(const std::string& fileName);

  /**
   * @brief Load the configuration from a parsed JSON section.
   * @throw std::runtime_error when a value has the wrong type
   */
  void
  load(const JsonSection& configJson);

public:
  std::string issuerCertificate;
  std::string issuerKey;
  std::optional<bool> pem;
  std::string serials;
  std::string ignore;
  std::vector<std::string> extend;
  std::string out;
};

} // namespace revokr

#endif // REVOKR_TOOL_CONFIG_HPP
