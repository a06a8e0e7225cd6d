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

#include "alphabet.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <magic_enum.hpp>

#include <core/common/assert.hpp>

namespace b58::enc {

namespace {

    //! \brief Whether symbols are exactly kRadix printable and pairwise distinct ascii chars
    constexpr bool is_well_formed(std::string_view symbols) {
        if (symbols.size() not_eq AlphabetTable::kRadix) return false;
        for (size_t i{0}; i < symbols.size(); ++i) {
            if (symbols[i] < '!' or symbols[i] > '~') return false;
            if (symbols.find(symbols[i], i + 1) not_eq std::string_view::npos) return false;
        }
        return true;
    }

    // All alphanumeric characters except for "0", "I", "O", and "l"
    constexpr std::string_view kBitcoinSymbols{"123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"};
    constexpr std::string_view kRippleSymbols{"rpshnaf39wBUDNEGHJKLM4PQRST7VWXYZ2bcdeCg65jkm8oFqi1tuvAxyz"};
    constexpr std::string_view kFlickrSymbols{"123456789abcdefghijkmnopqrstuvwxyzABCDEFGHJKLMNPQRSTUVWXYZ"};

    static_assert(is_well_formed(kBitcoinSymbols));
    static_assert(is_well_formed(kRippleSymbols));
    static_assert(is_well_formed(kFlickrSymbols));

    constexpr AlphabetTable kBitcoinTable{kBitcoinSymbols};
    constexpr AlphabetTable kRippleTable{kRippleSymbols};
    constexpr AlphabetTable kFlickrTable{kFlickrSymbols};

    // Short names accepted along with the canonical ones
    constexpr std::array<std::pair<std::string_view, Alphabet>, 2> kAliases{{
        {"btc", Alphabet::kBitcoin},
        {"xrp", Alphabet::kRipple},
    }};

}  // namespace

const AlphabetTable& get_alphabet_table(Alphabet alphabet) noexcept {
    switch (alphabet) {
        using enum Alphabet;
        case kBitcoin:
            return kBitcoinTable;
        case kRipple:
            return kRippleTable;
        case kFlickr:
            return kFlickrTable;
    }
    abort_on_broken_invariant("alphabet is not a valid enumerator", std::source_location::current());
}

std::string to_string(Alphabet alphabet) {
    std::string ret{magic_enum::enum_name(alphabet)};
    ret.erase(0, 1);  // Remove the constant `k` prefix
    boost::algorithm::to_lower(ret);
    return ret;
}

std::optional<Alphabet> parse_alphabet(std::string_view name) {
    const auto& names{get_alphabet_names_map()};
    const auto item{names.find(boost::algorithm::to_lower_copy(std::string(name)))};
    if (item == names.end()) return std::nullopt;
    return item->second;
}

const std::map<std::string, Alphabet, std::less<>>& get_alphabet_names_map() {
    static const auto names{[] {
        std::map<std::string, Alphabet, std::less<>> ret;
        for (const auto enumerator : magic_enum::enum_values<Alphabet>()) {
            ret.try_emplace(to_string(enumerator), enumerator);
        }
        for (const auto& [alias, enumerator] : kAliases) {
            ret.try_emplace(std::string(alias), enumerator);
        }
        return ret;
    }()};
    return names;
}

}  // namespace b58::enc
