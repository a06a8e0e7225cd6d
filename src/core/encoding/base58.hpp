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

#include <core/common/base.hpp>
#include <core/encoding/alphabet.hpp>
#include <core/encoding/errors.hpp>

namespace b58::enc::base58 {

//! \brief Returns a string of ascii chars with the base58 representation of input
//! \remark If provided an empty input the return string is empty as well
//! \remark Each leading zero byte is represented by one zero symbol of the alphabet
[[nodiscard]] std::string encode(ByteView input, Alphabet alphabet = kDefaultAlphabet);

//! \brief Returns a string of ascii chars with the base58 representation of the bytes of a text input
[[nodiscard]] std::string encode(std::string_view input, Alphabet alphabet = kDefaultAlphabet);

//! \brief Returns a string of bytes with the decoded base58 payload
//! \remark If provided an empty input the returned bytes are empty as well
//! \remark Decoding stops at the first symbol not belonging to the alphabet : the failure carries that symbol
[[nodiscard]] outcome::result<Bytes, DecodingError> decode(std::string_view input,
                                                           Alphabet alphabet = kDefaultAlphabet);

}  // namespace b58::enc::base58
