/*
   Copyright 2024 The B58 Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include <optional>
#include <vector>

#include <catch2/catch.hpp>

#include <core/encoding/hex.hpp>

namespace b58::enc::hex {
namespace {
    struct TestCaseDecodeHex {
        std::string hexstring;
        std::optional<enc::Error> expected;
        Bytes bytes;
    };

    const std::vector<TestCaseDecodeHex> TestCasesDecodeHex{
        {"", std::nullopt, {}},
        {"0x", std::nullopt, {}},
        {"0xg", enc::Error::kIllegalHexDigit, {}},
        {"0x0z", enc::Error::kIllegalHexDigit, {}},
        {"0", std::nullopt, {0x0}},
        {"0x0", std::nullopt, {0x0}},
        {"0xa", std::nullopt, {0x0a}},
        {"0XA", std::nullopt, {0x0a}},
        {"0xa1f", std::nullopt, {0x0a, 0x1f}},
        {"0x0a1f", std::nullopt, {0x0a, 0x1f}},
        {"DeadBeef", std::nullopt, {0xde, 0xad, 0xbe, 0xef}},
        {"111111111111111111111111",
         std::nullopt,
         {0x11, 0x11, 0x11, 0x11, 0x11, 0x11, 0x11, 0x11, 0x11, 0x11, 0x11, 0x11}}};
}  // namespace

TEST_CASE("Decoding Hex", "[encoding][hex]") {
    CHECK_FALSE(decode_digit('0').has_error());
    CHECK_FALSE(decode_digit('1').has_error());
    CHECK_FALSE(decode_digit('5').has_error());
    CHECK_FALSE(decode_digit('a').has_error());
    CHECK_FALSE(decode_digit('d').has_error());
    CHECK_FALSE(decode_digit('f').has_error());
    CHECK_FALSE(decode_digit('g'));
    CHECK(decode_digit('F').value() == 15U);
    CHECK(decode_digit('9').value() == 9U);

    for (const auto& test : TestCasesDecodeHex) {
        INFO("Decoding [" << test.hexstring << "]");
        const auto parsed_bytes{decode(test.hexstring)};
        if (test.expected.has_value()) {
            REQUIRE(parsed_bytes.has_error());
            REQUIRE(parsed_bytes.error().value() == static_cast<int>(test.expected.value()));
        } else {
            REQUIRE_FALSE(parsed_bytes.has_error());
            REQUIRE(parsed_bytes.value() == test.bytes);
        }
    }
}

TEST_CASE("Encoding Hex", "[encoding][hex]") {
    CHECK(encode(Bytes{}).empty());
    CHECK(encode(Bytes{}, true) == "0x");
    CHECK(encode(Bytes{0x00}) == "00");
    CHECK(encode(Bytes{0x0a}, true) == "0x0a");
    CHECK(encode(Bytes{0xde, 0xad, 0xbe, 0xef}) == "deadbeef");
    CHECK(encode(Bytes{0x00, 0x00, 0xff}, true) == "0x0000ff");

    CHECK(has_prefix("0x"));
    CHECK(has_prefix("0X12"));
    CHECK_FALSE(has_prefix("0"));
    CHECK_FALSE(has_prefix("x0"));

    const Bytes data{0x00, 0x01, 0x7f, 0x80, 0xfe, 0xff};
    const auto decoded{decode(encode(data, true))};
    REQUIRE(decoded);
    CHECK(decoded.value() == data);
}
}  // namespace b58::enc::hex
