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

#include "detail/pem-io.hpp"
#include "detail/openssl-helpers.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/pem.h>

#include <fstream>
#include <iterator>
#include <ostream>

namespace revokr::io {

NDN_LOG_INIT(revokr.io);

Buffer
readFile(const std::string& path)
{
  std::ifstream is(path, std::ios::binary);
  if (!is) {
    NDN_THROW(Error("Cannot open " + path));
  }
  Buffer data((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
  if (is.bad()) {
    NDN_THROW(Error("Cannot read " + path));
  }
  NDN_LOG_TRACE("Read " << data.size() << " bytes from " << path);
  return data;
}

PemBlock
decodePemOrRaw(const Buffer& data)
{
  PemBlock block;
  if (data.empty()) {
    return block;
  }

  detail::OpenSslPtr<BIO> bio(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())));
  if (bio == nullptr) {
    NDN_THROW(detail::OpenSslError("Cannot create memory BIO"));
  }

  char* name = nullptr;
  char* header = nullptr;
  unsigned char* payload = nullptr;
  long len = 0;
  if (PEM_read_bio(bio.get(), &name, &header, &payload, &len) == 1) {
    block.type = name;
    block.headers = header;
    block.bytes.assign(payload, payload + len);
    OPENSSL_free(name);
    OPENSSL_free(header);
    OPENSSL_free(payload);
    return block;
  }

  // not PEM, the queue only holds "no start line"
  ERR_clear_error();
  block.bytes = data;
  return block;
}

PemBlock
loadPemOrRaw(const std::string& path)
{
  auto block = decodePemOrRaw(readFile(path));
  if (block.isPem()) {
    NDN_LOG_DEBUG("Decoded PEM block \"" << block.type << "\" from " << path);
  }
  return block;
}

std::string
encodePem(const std::string& type, const Buffer& der)
{
  detail::OpenSslPtr<BIO> bio(BIO_new(BIO_s_mem()));
  if (bio == nullptr ||
      PEM_write_bio(bio.get(), type.data(), "", der.data(), static_cast<long>(der.size())) <= 0) {
    NDN_THROW(detail::OpenSslError("Cannot PEM-encode " + type));
  }
  char* mem = nullptr;
  long memLen = BIO_get_mem_data(bio.get(), &mem);
  return std::string(mem, static_cast<size_t>(memLen));
}

void
writeArtifact(const std::string& path, const Buffer& der, OutputFormat format,
              const std::string& pemType, std::ostream& stdOut)
{
  std::string out;
  if (format == OutputFormat::PEM) {
    out = encodePem(pemType, der);
  }
  else {
    out.assign(der.begin(), der.end());
  }

  if (path.empty()) {
    if (format != OutputFormat::PEM) {
      NDN_THROW(Error("Output path must be specified when writing " + pemType + " in DER format"));
    }
    stdOut << out;
    stdOut.flush();
    return;
  }

  std::ofstream os(path, std::ios::binary | std::ios::trunc);
  if (!os) {
    NDN_THROW(Error("Cannot open " + path + " for writing"));
  }
  os.write(out.data(), static_cast<std::streamsize>(out.size()));
  os.close();
  if (!os) {
    NDN_THROW(Error("Failed to write " + path));
  }
  NDN_LOG_DEBUG("Wrote " << format << " " << pemType << " (" << out.size() << " bytes) to " << path);
}

} // namespace revokr::io
