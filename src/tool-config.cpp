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

#include <boost/property_tree/json_parser.hpp>

namespace revokr {

NDN_LOG_INIT(revokr.config);

const std::string CONFIG_ISSUER_CERTIFICATE = "issuer-certificate";
const std::string CONFIG_ISSUER_KEY = "issuer-key";
const std::string CONFIG_PEM = "pem";
const std::string CONFIG_SERIALS = "serials";
const std::string CONFIG_IGNORE = "ignore";
const std::string CONFIG_EXTEND = "extend";
const std::string CONFIG_OUT = "out";

void
ToolConfig::load(const std::string& fileName)
{
  JsonSection configJson;
  try {
    boost::property_tree::read_json(fileName, configJson);
  }
  catch (const std::exception& error) {
    NDN_THROW(std::runtime_error("Failed to parse configuration file " + fileName + ", " + error.what()));
  }

  if (configJson.begin() == configJson.end()) {
    NDN_THROW(std::runtime_error("No JSON configuration found in file: " + fileName));
  }
  load(configJson);
  NDN_LOG_DEBUG("Loaded configuration from " << fileName);
}

void
ToolConfig::load(const JsonSection& configJson)
{
  issuerCertificate = configJson.get(CONFIG_ISSUER_CERTIFICATE, "");
  issuerKey = configJson.get(CONFIG_ISSUER_KEY, "");
  serials = configJson.get(CONFIG_SERIALS, "");
  ignore = configJson.get(CONFIG_IGNORE, "");
  out = configJson.get(CONFIG_OUT, "");

  pem.reset();
  auto pemValue = configJson.get_optional<std::string>(CONFIG_PEM);
  if (pemValue) {
    if (*pemValue == "true") {
      pem = true;
    }
    else if (*pemValue == "false") {
      pem = false;
    }
    else {
      NDN_THROW(std::runtime_error("\"" + CONFIG_PEM + "\" must be true or false, got \"" + *pemValue + "\""));
    }
  }

  extend.clear();
  auto extendItems = configJson.get_child_optional(CONFIG_EXTEND);
  if (extendItems) {
    if (!extendItems->data().empty()) {
      // a plain string instead of an array
      extend.push_back(extendItems->data());
    }
    for (const auto& item : *extendItems) {
      if (!item.first.empty() || !item.second.empty()) {
        NDN_THROW(std::runtime_error("\"" + CONFIG_EXTEND + "\" must be an array of paths"));
      }
      extend.push_back(item.second.data());
    }
  }
}

} // namespace revokr
