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

#include "utf8.hpp"

#include <cstdint>

namespace b58::enc::utf8 {

namespace {

    //! \brief Returns the length of the sequence introduced by lead byte (0 for invalid lead bytes)
    size_t sequence_length(uint8_t lead) noexcept {
        if (lead < 0x80U) return 1;
        if (lead < 0xc2U) return 0;  // Continuation bytes or overlong 2 bytes sequences
        if (lead < 0xe0U) return 2;
        if (lead < 0xf0U) return 3;
        if (lead < 0xf5U) return 4;
        return 0;
    }

    bool is_continuation(uint8_t byte) noexcept { return (byte & 0xc0U) == 0x80U; }

    //! \brief Decodes one well-formed sequence at offset or returns length 0
    std::pair<char32_t, size_t> try_decode(std::string_view input, size_t offset) noexcept {
        const auto lead{static_cast<uint8_t>(input[offset])};
        const size_t length{sequence_length(lead)};
        if (length == 0 or input.size() - offset < length) return {0, 0};
        if (length == 1) return {lead, 1};

        char32_t code_point{static_cast<char32_t>(lead & (0x7fU >> length))};
        for (size_t i{1}; i < length; ++i) {
            const auto byte{static_cast<uint8_t>(input[offset + i])};
            if (not is_continuation(byte)) return {0, 0};
            code_point = (code_point << 6U) | (byte & 0x3fU);
        }

        // Overlong encodings, surrogates and out of range values
        if ((length == 3 and code_point < 0x800U) or (length == 4 and code_point < 0x10000U) or
            (code_point >= 0xd800U and code_point <= 0xdfffU) or code_point > 0x10ffffU) {
            return {0, 0};
        }
        return {code_point, length};
    }

}  // namespace

bool is_valid(std::string_view input) noexcept {
    size_t offset{0};
    while (offset < input.size()) {
        const auto length{try_decode(input, offset).second};
        if (length == 0) return false;
        offset += length;
    }
    return true;
}

std::pair<char32_t, size_t> decode_code_point(std::string_view input, size_t offset) noexcept {
    if (offset >= input.size()) return {0, 0};
    if (const auto decoded{try_decode(input, offset)}; decoded.second not_eq 0) {
        return decoded;
    }
    return {static_cast<uint8_t>(input[offset]), 1};
}

bool is_white_space(char32_t code_point) noexcept {
    switch (code_point) {
        case 0x09U:  // Tab, line feed, vertical tab, form feed, carriage return
        case 0x0aU:
        case 0x0bU:
        case 0x0cU:
        case 0x0dU:
        case 0x20U:
        case 0x85U:
        case 0xa0U:
        case 0x1680U:
        case 0x2028U:
        case 0x2029U:
        case 0x202fU:
        case 0x205fU:
        case 0x3000U:
            return true;
        default:
            return code_point >= 0x2000U and code_point <= 0x200aU;
    }
}

std::string_view trim(std::string_view input) noexcept {
    while (not input.empty()) {
        const auto [code_point, length]{try_decode(input, 0)};
        if (length == 0 or not is_white_space(code_point)) break;
        input.remove_prefix(length);
    }
    while (not input.empty()) {
        // Step back to the lead byte of the last sequence
        size_t start{input.size() - 1};
        while (start > 0 and input.size() - start < 4 and is_continuation(static_cast<uint8_t>(input[start]))) {
            --start;
        }
        const auto [code_point, length]{try_decode(input, start)};
        if (length not_eq input.size() - start or not is_white_space(code_point)) break;
        input.remove_suffix(length);
    }
    return input;
}

std::string encode(char32_t code_point) {
    std::string ret;
    if (code_point < 0x80U) {
        ret.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
        ret.push_back(static_cast<char>(0xc0U | (code_point >> 6U)));
        ret.push_back(static_cast<char>(0x80U | (code_point & 0x3fU)));
    } else if (code_point < 0x10000U) {
        ret.push_back(static_cast<char>(0xe0U | (code_point >> 12U)));
        ret.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3fU)));
        ret.push_back(static_cast<char>(0x80U | (code_point & 0x3fU)));
    } else {
        ret.push_back(static_cast<char>(0xf0U | (code_point >> 18U)));
        ret.push_back(static_cast<char>(0x80U | ((code_point >> 12U) & 0x3fU)));
        ret.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3fU)));
        ret.push_back(static_cast<char>(0x80U | (code_point & 0x3fU)));
    }
    return ret;
}

}  // namespace b58::enc::utf8
