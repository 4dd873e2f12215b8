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
#include "public-key.hpp"

#include "tests/test-common.hpp"

namespace revokr::tests {

class KeyLoaderFixture : public IssuerFixture
{
protected:
  static void
  checkSameKey(EVP_PKEY* loaded, EVP_PKEY* expected)
  {
    BOOST_REQUIRE(loaded != nullptr);
    BOOST_CHECK_NO_THROW(verifyKeyMatch(extractPublicKey(expected), extractPublicKey(loaded)));
  }

protected:
  detail::EvpPkeyPtr rsa = makeRsaKey();
  detail::EvpPkeyPtr ec = makeEcKey("P-256");
};

BOOST_FIXTURE_TEST_SUITE(TestKeyLoader, KeyLoaderFixture)

BOOST_AUTO_TEST_CASE(Certificate)
{
  auto cert = makeIssuer(rsa.get(), EVP_sha256());
  auto pemPath = writeCertificate("ca.pem", cert.get(), OutputFormat::PEM);
  auto derPath = writeCertificate("ca.der", cert.get(), OutputFormat::DER);

  auto fromPem = keys::loadCertificate(pemPath);
  auto fromDer = keys::loadCertificate(derPath);
  BOOST_CHECK_EQUAL(X509_cmp(fromPem.get(), cert.get()), 0);
  BOOST_CHECK_EQUAL(X509_cmp(fromDer.get(), cert.get()), 0);

  BOOST_CHECK_THROW(keys::loadCertificate(writeFile("garbage.pem", "hello")), keys::Error);
  BOOST_CHECK_THROW(keys::loadCertificate(path("missing.pem")), io::Error);
}

BOOST_AUTO_TEST_CASE(Pkcs8)
{
  checkSameKey(keys::loadPrivateKey(writePkcs8Key("rsa.p8", rsa.get()), std::nullopt).get(), rsa.get());
  checkSameKey(keys::loadPrivateKey(writePkcs8Key("ec.p8", ec.get()), std::nullopt).get(), ec.get());

  // a password given for an unencrypted key is not used
  checkSameKey(keys::loadPrivateKey(path("ec.p8"), "unused"s).get(), ec.get());

  auto ed = makeEd25519Key();
  checkSameKey(keys::loadPrivateKey(writePkcs8Key("ed.p8", ed.get()), std::nullopt).get(), ed.get());
}

BOOST_AUTO_TEST_CASE(EncryptedPkcs8)
{
  auto file = writePkcs8Key("rsa-enc.p8", rsa.get(), "s3cret"s);
  BOOST_CHECK_EQUAL(io::loadPemOrRaw(file).type, "ENCRYPTED PRIVATE KEY");

  checkSameKey(keys::loadPrivateKey(file, "s3cret"s).get(), rsa.get());
  BOOST_CHECK_THROW(keys::loadPrivateKey(file, std::nullopt), keys::Error);
  BOOST_CHECK_THROW(keys::loadPrivateKey(file, "wrong"s), keys::Error);
}

BOOST_AUTO_TEST_CASE(Traditional)
{
  auto rsaFile = writeLegacyKey("rsa.pem", rsa.get());
  BOOST_CHECK_EQUAL(io::loadPemOrRaw(rsaFile).type, "RSA PRIVATE KEY");
  checkSameKey(keys::loadPrivateKey(rsaFile, std::nullopt).get(), rsa.get());

  auto ecFile = writeLegacyKey("ec.pem", ec.get());
  BOOST_CHECK_EQUAL(io::loadPemOrRaw(ecFile).type, "EC PRIVATE KEY");
  checkSameKey(keys::loadPrivateKey(ecFile, std::nullopt).get(), ec.get());

  checkSameKey(keys::loadPrivateKey(writeDerKey("rsa.der", rsa.get()), std::nullopt).get(), rsa.get());
  checkSameKey(keys::loadPrivateKey(writeDerKey("ec.der", ec.get()), std::nullopt).get(), ec.get());
}

BOOST_AUTO_TEST_CASE(LegacyEncryptedPem)
{
  for (auto* key : {rsa.get(), ec.get()}) {
    auto file = writeLegacyKey("legacy.pem", key, "s3cret"s);
    BOOST_CHECK_NE(io::loadPemOrRaw(file).headers.find("Proc-Type: 4,ENCRYPTED"), std::string::npos);

    checkSameKey(keys::loadPrivateKey(file, "s3cret"s).get(), key);
    BOOST_CHECK_THROW(keys::loadPrivateKey(file, std::nullopt), keys::Error);
    BOOST_CHECK_THROW(keys::loadPrivateKey(file, "wrong"s), keys::Error);
  }
}

BOOST_AUTO_TEST_CASE(Unparsable)
{
  BOOST_CHECK_THROW(keys::loadPrivateKey(writeFile("junk.key", "definitely not a key"), std::nullopt),
                    keys::Error);
  auto cert = makeIssuer(rsa.get(), EVP_sha256());
  BOOST_CHECK_THROW(keys::loadPrivateKey(writeCertificate("cert-as-key.pem", cert.get()), std::nullopt),
                    keys::Error);
  BOOST_CHECK_THROW(keys::loadPrivateKey(path("missing.key"), std::nullopt), io::Error);
}

BOOST_AUTO_TEST_SUITE_END() // TestKeyLoader

} // namespace revokr::tests
