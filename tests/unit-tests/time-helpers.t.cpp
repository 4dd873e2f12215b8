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


#include "detail/time-helpers.hpp"

#include "tests/test-common.hpp"

namespace revokr::tests {

using detail::parseTime;

BOOST_AUTO_TEST_SUITE(Detail)
BOOST_AUTO_TEST_SUITE(TestTimeHelpers)

BOOST_AUTO_TEST_CASE(Layouts)
{
  const auto expected = fromUnix(1709296200); // 2024-03-01T12:30:00Z

  BOOST_CHECK(parseTime("2024-03-01T12:30:00Z") == expected);
  BOOST_CHECK(parseTime("2024-03-01T14:30:00+02:00") == expected);
  BOOST_CHECK(parseTime("2024-03-01T07:00:00-05:30") == expected);
  BOOST_CHECK(parseTime("2024-03-01T12:30:00.987654Z") == expected);
  BOOST_CHECK(parseTime("2024-03-01 12:30:00") == expected);
  BOOST_CHECK(parseTime("2024-03-01 12:30") == expected);
  BOOST_CHECK(parseTime("2024-03-01") == fromUnix(1709251200));
}

BOOST_AUTO_TEST_CASE(Invalid)
{
  BOOST_CHECK_THROW(parseTime(""), detail::TimeFormatError);
  BOOST_CHECK_THROW(parseTime("yesterday"), detail::TimeFormatError);
  BOOST_CHECK_THROW(parseTime("2024-03-01T12:30:00"), detail::TimeFormatError);
  BOOST_CHECK_THROW(parseTime("2024-03-01T12:30Z"), detail::TimeFormatError);
  BOOST_CHECK_THROW(parseTime("2024-13-01"), detail::TimeFormatError);
  BOOST_CHECK_THROW(parseTime("2024-02-30"), detail::TimeFormatError);
  BOOST_CHECK_THROW(parseTime("2024-03-01 24:00"), detail::TimeFormatError);
  BOOST_CHECK_THROW(parseTime("2024-3-1"), detail::TimeFormatError);
  BOOST_CHECK_THROW(parseTime(" 2024-03-01"), detail::TimeFormatError);

  try {
    parseTime("soon");
    BOOST_ERROR("exception expected");
  }
  catch (const detail::TimeFormatError& e) {
    BOOST_CHECK_EQUAL(e.what(), std::string("Unable to parse time: soon"));
  }
}

BOOST_AUTO_TEST_CASE(Asn1Time)
{
  for (std::time_t t : {std::time_t(0), NOT_BEFORE, NOT_AFTER, std::time_t(2556143999)}) {
    auto asn1 = detail::timePointToAsn1Time(fromUnix(t));
    BOOST_CHECK(detail::asn1TimeToTimePoint(asn1.get()) == fromUnix(t));
  }
}

BOOST_AUTO_TEST_SUITE_END() // TestTimeHelpers
BOOST_AUTO_TEST_SUITE_END() // Detail

} // namespace revokr::tests
