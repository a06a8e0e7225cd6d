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

#include "base58.hpp"

#include <algorithm>
#include <iterator>

#include <core/common/byte_integer.hpp>
#include <core/common/cast.hpp>
#include <core/encoding/utf8.hpp>

namespace b58::enc::base58 {

/*
 * A note about the implementation
 * The significant part of the input (i.e. without leading zeroes) is treated as a big endian unsigned integer.
 * Encoding repeatedly divides it by 58 collecting the remainders (least significant digit first) while
 * decoding accumulates value = value * 58 + digit for each symbol.
 * Leading zeroes carry no value hence they're counted apart and restored as zero symbols (or zero bytes).
 */

std::string encode(ByteView input, Alphabet alphabet) {
    if (input.empty()) return std::string{};
    const auto& table{get_alphabet_table(alphabet)};

    const auto first_significant{std::ranges::find_if(input, [](uint8_t byte) { return byte not_eq 0x00; })};
    const auto leading_zeroes{static_cast<size_t>(std::distance(input.begin(), first_significant))};
    std::string encoded(leading_zeroes, table.zero_symbol());
    if (leading_zeroes == input.size()) return encoded;

    input.remove_prefix(leading_zeroes);
    ByteInteger value{input};
    std::string digits{};
    digits.reserve(input.size() * 138 / 100 + 1);  // 138% is the max ratio between input and output size
    while (not value.is_zero()) {
        digits.push_back(table.symbol(value.divide(AlphabetTable::kRadix)));
    }

    encoded.append(digits.rbegin(), digits.rend());
    return encoded;
}

std::string encode(std::string_view input, Alphabet alphabet) {
    return encode(string_view_to_byte_view(input), alphabet);
}

outcome::result<Bytes, DecodingError> decode(std::string_view input, Alphabet alphabet) {
    if (input.empty()) return Bytes{};
    const auto& table{get_alphabet_table(alphabet)};

    const auto leading_zeroes{input.find_first_not_of(table.zero_symbol())};
    if (leading_zeroes == std::string_view::npos) return Bytes(input.size(), 0x00);

    ByteInteger value{};
    value.reserve((input.size() - leading_zeroes) * 733 / 1000 + 1);  // 73.3% is the max ratio the other way round
    for (auto position{leading_zeroes}; position < input.size(); ++position) {
        const auto digit{table.digit(static_cast<uint8_t>(input[position]))};
        if (digit == AlphabetTable::kInvalidDigit) [[unlikely]] {
            const auto [symbol, length]{utf8::decode_code_point(input, position)};
            return DecodingError{Error::kIllegalBase58Digit, symbol, position,
                                 /*well_formed=*/symbol < 0x80U or length > 1};
        }
        value.multiply(AlphabetTable::kRadix);
        value.add(digit);
    }

    Bytes decoded(leading_zeroes, 0x00);
    decoded.append(value.to_big_endian());
    return decoded;
}

}  // namespace b58::enc::base58
