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


#include "tool-config.hpp"

#include "tests/test-common.hpp"

#include <boost/property_tree/json_parser.hpp>

#include <sstream>

namespace revokr::tests {

BOOST_FIXTURE_TEST_SUITE(TestToolConfig, IssuerFixture)

BOOST_AUTO_TEST_CASE(ReadConfigFile)
{
  auto file = writeFile("revokr.conf", R"({
    "issuer-certificate": "ca.crt",
    "issuer-key": "/etc/revokr/ca.key",
    "pem": true,
    "serials": "revoked.txt",
    "extend": ["2024-01.crl", "2024-02.crl"],
    "out": "ca.crl"
  })");

  ToolConfig config;
  config.load(file);
  BOOST_CHECK_EQUAL(config.issuerCertificate, "ca.crt");
  BOOST_CHECK_EQUAL(config.issuerKey, "/etc/revokr/ca.key");
  BOOST_REQUIRE(config.pem);
  BOOST_CHECK_EQUAL(*config.pem, true);
  BOOST_CHECK_EQUAL(config.serials, "revoked.txt");
  BOOST_CHECK_EQUAL(config.ignore, "");
  BOOST_REQUIRE_EQUAL(config.extend.size(), 2);
  BOOST_CHECK_EQUAL(config.extend[0], "2024-01.crl");
  BOOST_CHECK_EQUAL(config.extend[1], "2024-02.crl");
  BOOST_CHECK_EQUAL(config.out, "ca.crl");
}

BOOST_AUTO_TEST_CASE(Defaults)
{
  ToolConfig config;
  config.load(writeFile("revokr.conf", R"({"ignore": "reinstated.txt"})"));
  BOOST_CHECK_EQUAL(config.ignore, "reinstated.txt");
  BOOST_CHECK(config.issuerCertificate.empty());
  BOOST_CHECK(!config.pem);
  BOOST_CHECK(config.extend.empty());
}

BOOST_AUTO_TEST_CASE(ExtendAsString)
{
  std::istringstream is(R"({"extend": "previous.crl", "pem": "false"})");
  JsonSection json;
  boost::property_tree::read_json(is, json);

  ToolConfig config;
  config.load(json);
  BOOST_REQUIRE_EQUAL(config.extend.size(), 1);
  BOOST_CHECK_EQUAL(config.extend[0], "previous.crl");
  BOOST_REQUIRE(config.pem);
  BOOST_CHECK_EQUAL(*config.pem, false);
}

BOOST_AUTO_TEST_CASE(InvalidConfig)
{
  ToolConfig config;
  BOOST_CHECK_THROW(config.load(path("nonexistent.conf")), std::runtime_error);
  BOOST_CHECK_THROW(config.load(writeFile("broken.conf", "{\"out\": ")), std::runtime_error);
  BOOST_CHECK_THROW(config.load(writeFile("empty.conf", "{}")), std::runtime_error);
  BOOST_CHECK_THROW(config.load(writeFile("pem.conf", R"({"pem": "yes"})")), std::runtime_error);
  BOOST_CHECK_THROW(config.load(writeFile("extend.conf", R"({"extend": {"first": "a.crl"}})")),
                    std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END() // TestToolConfig

} // namespace revokr::tests
