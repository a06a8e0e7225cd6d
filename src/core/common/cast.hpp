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

namespace b58 {

//! \brief Reinterprets a pointer to bytes as a pointer to chars (and back)
inline const char* byte_ptr_cast(const uint8_t* ptr) { return reinterpret_cast<const char*>(ptr); }
inline const uint8_t* byte_ptr_cast(const char* ptr) { return reinterpret_cast<const uint8_t*>(ptr); }

//! \brief Views the characters of a text as raw bytes
inline ByteView string_view_to_byte_view(std::string_view text) { return {byte_ptr_cast(text.data()), text.length()}; }

//! \brief Views raw bytes as characters
inline std::string_view byte_view_to_string_view(ByteView bytes) {
    return {byte_ptr_cast(bytes.data()), bytes.length()};
}

}  // namespace b58
