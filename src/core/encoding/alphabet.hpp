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

#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <core/common/base.hpp>

namespace b58::enc {

//! \brief The closed set of supported base58 alphabets
enum class Alphabet {
    kBitcoin,  // 123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz
    kRipple,   // rpshnaf39wBUDNEGHJKLM4PQRST7VWXYZ2bcdeCg65jkm8oFqi1tuvAxyz
    kFlickr,   // 123456789abcdefghijkmnopqrstuvwxyzABCDEFGHJKLMNPQRSTUVWXYZ
};

//! \brief The alphabet used when none is specified
inline constexpr Alphabet kDefaultAlphabet{Alphabet::kBitcoin};

//! \brief An ordered set of 58 symbols along with its inverse lookup table
class AlphabetTable {
  public:
    static constexpr size_t kRadix{58};
    static constexpr uint8_t kInvalidDigit{0xff};  // Marks codes not belonging to the alphabet
    using DecodeTable = std::array<uint8_t, 256>;

    constexpr explicit AlphabetTable(std::string_view symbols) noexcept : symbols_{symbols} {
        decode_table_.fill(kInvalidDigit);
        for (size_t i{0}; i < symbols_.size(); ++i) {
            decode_table_[static_cast<uint8_t>(symbols_[i])] = static_cast<uint8_t>(i);
        }
    }

    //! \brief The ordered sequence of symbols
    [[nodiscard]] constexpr std::string_view symbols() const noexcept { return symbols_; }

    //! \brief The symbol at index 0 which represents leading zero bytes
    [[nodiscard]] constexpr char zero_symbol() const noexcept { return symbols_.front(); }

    //! \brief Returns the symbol for a digit in range [0, kRadix)
    [[nodiscard]] constexpr char symbol(size_t digit) const noexcept { return symbols_[digit]; }

    //! \brief Returns the digit value of an input code or kInvalidDigit
    [[nodiscard]] constexpr uint8_t digit(uint8_t code) const noexcept { return decode_table_[code]; }

    //! \brief Whether the input code is a symbol of this alphabet
    [[nodiscard]] constexpr bool contains(uint8_t code) const noexcept { return digit(code) not_eq kInvalidDigit; }

    [[nodiscard]] constexpr const DecodeTable& decode_table() const noexcept { return decode_table_; }

  private:
    std::string_view symbols_;
    DecodeTable decode_table_{};
};

//! \brief Returns the immutable table of the requested alphabet
[[nodiscard]] const AlphabetTable& get_alphabet_table(Alphabet alphabet) noexcept;

//! \brief Returns the canonical (lowercase) name of an alphabet
[[nodiscard]] std::string to_string(Alphabet alphabet);

//! \brief Returns the alphabet matching a name or one of its aliases (case insensitive)
[[nodiscard]] std::optional<Alphabet> parse_alphabet(std::string_view name);

//! \brief Returns the map of all accepted names and aliases
[[nodiscard]] const std::map<std::string, Alphabet, std::less<>>& get_alphabet_names_map();

}  // namespace b58::enc
