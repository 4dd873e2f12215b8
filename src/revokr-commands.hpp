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


#ifndef REVOKR_REVOKR_COMMANDS_HPP
#define REVOKR_REVOKR_COMMANDS_HPP

#include "crl-builder.hpp"
#include "diagnostics.hpp"

#include <iosfwd>

namespace revokr {

/**
 * @brief Inputs of the create command.
 */
struct CreateOptions
{
  std::string issuerCertificate;
  std::string issuerKey;
  std::optional<std::string> password;
  bool promptPassword = false;
  std::vector<std::string> extend;
  std::string serials;
  std::string ignore;
  std::string number;
  std::string thisUpdate;
  std::string nextUpdate;
  bool toBeSigned = false;
  std::string digest;
  std::string out;
  OutputFormat format = OutputFormat::DER;
};

/**
 * @brief Inputs of the assemble command.
 */
struct AssembleOptions
{
  std::string issuerCertificate;
  std::string toBeSigned;
  std::string signature;
  std::string out;
  OutputFormat format = OutputFormat::DER;
};

/**
 * @brief Thrown when options are missing or contradict each other.
 */
class UsageError : public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

/**
 * @throw UsageError
 */
void
checkCreateOptions(const CreateOptions& options);

/**
 * @throw UsageError
 */
void
checkAssembleOptions(const AssembleOptions& options);

/**
 * @brief Create a signed or to-be-signed revocation list and write it out.
 *
 * Per-item problems (malformed serials, unreadable prior lists) are reported to
 * @p diag. PEM output without a path goes to @p stdOut.
 *
 * @throw UsageError the options are invalid
 * @throw std::runtime_error any other fatal problem; nothing has been written then
 */
BuildResult
createCrl(const CreateOptions& options, Diagnostics& diag, std::ostream& stdOut);

/**
 * @brief Assemble a signed revocation list from a to-be-signed list and a signature.
 *
 * @throw UsageError the options are invalid
 * @throw std::runtime_error any other fatal problem
 */
Buffer
assembleCrl(const AssembleOptions& options, std::ostream& stdOut);

} // namespace revokr

#endif // REVOKR_REVOKR_COMMANDS_HPP
