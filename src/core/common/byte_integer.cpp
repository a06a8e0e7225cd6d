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

#include "byte_integer.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>

#include <core/common/assert.hpp>

namespace b58 {

ByteInteger::ByteInteger(ByteView big_endian) {
    const auto first_significant{std::ranges::find_if(big_endian, [](uint8_t byte) { return byte not_eq 0; })};
    bytes_.assign(std::make_reverse_iterator(big_endian.end()), std::make_reverse_iterator(first_significant));
}

uint32_t ByteInteger::divide(uint32_t divisor) noexcept {
    ASSERT_PRE(divisor >= 2U and divisor <= kMaxRadix);
    uint32_t remainder{0};
    for (auto& byte : bytes_ | std::views::reverse) {
        const uint32_t current{(remainder << 8U) | byte};
        byte = static_cast<uint8_t>(current / divisor);
        remainder = current % divisor;
    }
    trim();
    return remainder;
}

void ByteInteger::multiply(uint32_t multiplier) {
    ASSERT_PRE(multiplier >= 1U and multiplier <= kMaxRadix);
    uint32_t carry{0};
    for (auto& byte : bytes_) {
        const uint32_t current{static_cast<uint32_t>(byte) * multiplier + carry};
        byte = static_cast<uint8_t>(current & 0xffU);
        carry = current >> 8U;
    }
    while (carry not_eq 0U) {
        bytes_.push_back(static_cast<uint8_t>(carry & 0xffU));
        carry >>= 8U;
    }
}

void ByteInteger::add(uint32_t addend) {
    ASSERT_PRE(addend < kMaxRadix);
    uint32_t carry{addend};
    for (auto& byte : bytes_) {
        if (carry == 0U) break;
        const uint32_t current{static_cast<uint32_t>(byte) + carry};
        byte = static_cast<uint8_t>(current & 0xffU);
        carry = current >> 8U;
    }
    while (carry not_eq 0U) {
        bytes_.push_back(static_cast<uint8_t>(carry & 0xffU));
        carry >>= 8U;
    }
}

Bytes ByteInteger::to_big_endian() const {
    if (bytes_.empty()) return Bytes(1, 0x00);
    return Bytes(bytes_.rbegin(), bytes_.rend());
}

void ByteInteger::trim() noexcept {
    while (not bytes_.empty() and bytes_.back() == 0x00) {
        bytes_.pop_back();
    }
}

}  // namespace b58
