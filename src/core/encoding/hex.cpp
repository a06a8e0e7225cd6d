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

#include "hex.hpp"

namespace b58::enc::hex {

std::string encode(ByteView bytes, bool with_prefix) noexcept {
    static const char* kHexDigits{"0123456789abcdef"};
    std::string out(bytes.length() * 2 + (with_prefix ? 2 : 0), '\0');
    char* dest{&out[0]};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    for (const auto& byte : bytes) {
        *dest++ = kHexDigits[byte >> 4];
        *dest++ = kHexDigits[byte & 0x0f];
    }
    return out;
}

outcome::result<unsigned> decode_digit(char input) noexcept {
    switch (input) {
        case '0':
        case '1':
        case '2':
        case '3':
        case '4':
        case '5':
        case '6':
        case '7':
        case '8':
        case '9':
            return static_cast<unsigned>(input - '0');
        case 'a':
        case 'b':
        case 'c':
        case 'd':
        case 'e':
        case 'f':
            return static_cast<unsigned>(input - 'a' + 10);
        case 'A':
        case 'B':
        case 'C':
        case 'D':
        case 'E':
        case 'F':
            return static_cast<unsigned>(input - 'A' + 10);
        default:
            return Error::kIllegalHexDigit;
    }
}

outcome::result<Bytes> decode(std::string_view source) noexcept {
    // Omit the optional 0x prefix
    if (has_prefix(source)) source.remove_prefix(2);
    if (source.empty()) return Bytes{};

    const size_t pos(source.length() & 1);  // "[0x]1" is legit and has to be treated as "[0x]01"
    Bytes out((source.length() + pos) / 2, '\0');
    auto dst{out.begin()};
    auto src{source.begin()};

    if (pos not_eq 0U) {
        const auto low{decode_digit(*src++)};
        if (not low) return low.error();
        *dst++ = static_cast<uint8_t>(low.value());
    }
    for (; src not_eq source.end(); src += 2) {
        const auto high{decode_digit(*src)};
        if (not high) return high.error();
        const auto low{decode_digit(*(src + 1))};
        if (not low) return low.error();
        *dst++ = static_cast<uint8_t>((high.value() << 4) | low.value());
    }
    return out;
}

}  // namespace b58::enc::hex
