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

#include <string>
#include <string_view>
#include <utility>

namespace b58::enc::utf8 {

//! \brief Whether the input is a well-formed UTF-8 sequence
//! \remarks Overlong encodings, surrogates and code points beyond U+10FFFF are rejected
[[nodiscard]] bool is_valid(std::string_view input) noexcept;

//! \brief Decodes the code point starting at the given byte offset
//! \return The code point and the number of bytes it spans
//! \remarks If the sequence at offset is not well-formed the raw byte value is returned with a length of 1
[[nodiscard]] std::pair<char32_t, size_t> decode_code_point(std::string_view input, size_t offset) noexcept;

//! \brief Whether the code point has the Unicode White_Space property
[[nodiscard]] bool is_white_space(char32_t code_point) noexcept;

//! \brief Returns input without leading and trailing White_Space code points
//! \remarks Malformed sequences are never trimmed
[[nodiscard]] std::string_view trim(std::string_view input) noexcept;

//! \brief Returns the UTF-8 representation of a code point
[[nodiscard]] std::string encode(char32_t code_point);

}  // namespace b58::enc::utf8
