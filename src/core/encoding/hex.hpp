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

#include <string_view>

#include <core/common/base.hpp>
#include <core/encoding/errors.hpp>

namespace b58::enc::hex {

//! \brief Whether text starts with a "0x" or "0X" prefix
inline bool has_prefix(std::string_view text) noexcept {
    return text.size() > 1 and text[0] == '0' and (text[1] | 0x20) == 'x';
}

//! \brief Renders bytes as lowercase hexadecimal digits, two per byte
[[nodiscard]] std::string encode(ByteView bytes, bool with_prefix = false) noexcept;

//! \brief Parses hexadecimal text (optionally "0x" prefixed) into bytes
//! \remarks An odd number of digits is read as if padded with a leading zero
[[nodiscard]] outcome::result<Bytes> decode(std::string_view text) noexcept;

//! \brief Returns the value of a single hexadecimal digit or Error::kIllegalHexDigit
[[nodiscard]] outcome::result<unsigned> decode_digit(char digit) noexcept;

}  // namespace b58::enc::hex
