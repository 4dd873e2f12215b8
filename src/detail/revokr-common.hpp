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

#ifndef REVOKR_DETAIL_REVOKR_COMMON_HPP
#define REVOKR_DETAIL_REVOKR_COMMON_HPP

#include "detail/revokr-config.hpp"

#ifdef REVOKR_HAVE_TESTS
#define REVOKR_VIRTUAL_WITH_TESTS virtual
#define REVOKR_PUBLIC_WITH_TESTS_ELSE_PROTECTED public
#define REVOKR_PUBLIC_WITH_TESTS_ELSE_PRIVATE public
#define REVOKR_PROTECTED_WITH_TESTS_ELSE_PRIVATE protected
#else
#define REVOKR_VIRTUAL_WITH_TESTS
#define REVOKR_PUBLIC_WITH_TESTS_ELSE_PROTECTED protected
#define REVOKR_PUBLIC_WITH_TESTS_ELSE_PRIVATE private
#define REVOKR_PROTECTED_WITH_TESTS_ELSE_PRIVATE private
#endif

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <ndn-cxx/encoding/buffer.hpp>
#include <ndn-cxx/util/exception.hpp>
#include <ndn-cxx/util/logger.hpp>
#include <ndn-cxx/util/time.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <boost/noncopyable.hpp>
#include <boost/property_tree/ptree.hpp>

namespace revokr {

using ndn::Buffer;

namespace time = ndn::time;
using namespace std::string_literals;

using JsonSection = boost::property_tree::ptree;

/**
 * @brief Arbitrary precision CRL number.
 */
using CrlNumber = boost::multiprecision::cpp_int;

// Output container for every artifact the tool writes
enum class OutputFormat {
  DER,
  PEM
};

std::ostream&
operator<<(std::ostream& os, OutputFormat format);

// How the revocation list leaves the builder
enum class BuildMode {
  SIGNED,
  TO_BE_SIGNED
};

std::ostream&
operator<<(std::ostream& os, BuildMode mode);

} // namespace revokr

#endif // REVOKR_DETAIL_REVOKR_COMMON_HPP
