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


#include "revokr-commands.hpp"
#include "crl-assembler.hpp"
#include "key-loader.hpp"
#include "detail/pem-io.hpp"
#include "detail/time-helpers.hpp"

namespace revokr {

NDN_LOG_INIT(revokr.commands);

void
checkCreateOptions(const CreateOptions& options)
{
  if (options.toBeSigned && options.digest.empty()) {
    NDN_THROW(UsageError("Target digest path must be specified with --digest when creating a to-be-signed CRL"));
  }
  if (options.toBeSigned && !options.issuerKey.empty()) {
    NDN_THROW(UsageError("Issuer private key must not be specified when creating a to-be-signed CRL"));
  }
  if (options.toBeSigned && (options.password || options.promptPassword)) {
    NDN_THROW(UsageError("Password must not be specified when creating a to-be-signed CRL"));
  }
  if (options.issuerCertificate.empty()) {
    NDN_THROW(UsageError("Issuer certificate path must be specified with --crt"));
  }
  if (!options.toBeSigned && options.issuerKey.empty()) {
    NDN_THROW(UsageError("Issuer private key path must be specified with --key"));
  }
}

void
checkAssembleOptions(const AssembleOptions& options)
{
  if (options.toBeSigned.empty()) {
    NDN_THROW(UsageError("To-be-signed CRL path must be specified with --to-be-signed"));
  }
  if (options.signature.empty()) {
    NDN_THROW(UsageError("Signature path must be specified with --signature"));
  }
  if (options.issuerCertificate.empty()) {
    NDN_THROW(UsageError("Issuer certificate path must be specified with --crt"));
  }
}

static void
checkOutputDestination(const std::string& out, OutputFormat format)
{
  if (out.empty() && format == OutputFormat::DER) {
    NDN_THROW(io::Error("Output path must be specified with --out unless --pem is used"));
  }
}

static std::optional<time::system_clock::time_point>
parseOptionalTime(const std::string& str, const std::string& what)
{
  if (str.empty()) {
    return std::nullopt;
  }
  try {
    return detail::parseTime(str);
  }
  catch (const detail::TimeFormatError& e) {
    NDN_THROW_NESTED(std::runtime_error("Failed to parse " + what + " time: " + e.what()));
  }
}

BuildResult
createCrl(const CreateOptions& options, Diagnostics& diag, std::ostream& stdOut)
{
  checkCreateOptions(options);
  checkOutputDestination(options.out, options.format);
  if (!options.toBeSigned && !options.digest.empty()) {
    NDN_LOG_WARN("--digest is only used with --to-be-signed, ignoring " << options.digest);
  }

  auto includes = serials::loadFile(options.serials, diag);
  auto ignores = serials::loadFile(options.ignore, diag);
  auto issuer = keys::loadCertificate(options.issuerCertificate);

  detail::EvpPkeyPtr signer;
  if (!options.toBeSigned) {
    auto password = options.password;
    if (options.promptPassword) {
      password = keys::promptPassword("Enter the private key password: ");
    }
    signer = keys::loadPrivateKey(options.issuerKey, password);
  }

  BuildRequest request;
  request.mode = options.toBeSigned ? BuildMode::TO_BE_SIGNED : BuildMode::SIGNED;
  NDN_LOG_DEBUG("Creating " << request.mode << " revocation list in " << options.format << " format");
  request.issuer = issuer.get();
  request.signer = signer.get();
  request.thisUpdate = parseOptionalTime(options.thisUpdate, "this-update");
  request.nextUpdate = parseOptionalTime(options.nextUpdate, "next-update");

  auto extracted = extractor::extract(ignores, options.extend, diag);
  request.entries = std::move(extracted.entries);
  request.resolvedNumber = extracted.highestNumber;
  request.explicitNumber = options.number;
  request.includes = std::move(includes);
  request.ignores = std::move(ignores);

  CrlBuilder builder(std::move(request));
  auto result = builder.build();

  if (options.toBeSigned) {
    io::writeArtifact(options.out, result.der, options.format, io::PEM_TYPE_CRL_TBS, stdOut);
    io::writeArtifact(options.digest, result.digest, options.format, io::PEM_TYPE_CRL_DIGEST, stdOut);
  }
  else {
    io::writeArtifact(options.out, result.der, options.format, io::PEM_TYPE_CRL, stdOut);
  }
  return result;
}

Buffer
assembleCrl(const AssembleOptions& options, std::ostream& stdOut)
{
  checkAssembleOptions(options);
  checkOutputDestination(options.out, options.format);

  auto tbs = assembler::loadTbs(options.toBeSigned);
  auto signature = assembler::loadSignature(options.signature);
  auto issuer = keys::loadCertificate(options.issuerCertificate);

  auto crl = assembler::assemble(issuer.get(), tbs, signature);
  NDN_LOG_DEBUG("Writing assembled revocation list in " << options.format << " format");
  io::writeArtifact(options.out, crl, options.format, io::PEM_TYPE_CRL, stdOut);
  return crl;
}

} // namespace revokr
