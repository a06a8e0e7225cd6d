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

// clang-format off
#include <core/common/preprocessor.hpp>  // Must be first
// clang-format on

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <b58/buildinfo.h>

#include <core/common/outcome.hpp>

namespace b58 {

//! \brief Integral types usable as arithmetic values (bool excluded)
template <class T>
concept Integral = std::integral<T> and not std::same_as<T, bool>;

//! \brief Returns the build information generated at configure time
const buildinfo* get_buildinfo() noexcept;

//! \brief Returns a one line description of the build (e.g. "b58 0.1.0 (Linux-x86_64 Release GNU-12.2.0)")
std::string get_buildinfo_string() noexcept;

//! \brief An owning sequence of bytes
using Bytes = std::basic_string<uint8_t>;

//! \brief A non-owning view over a sequence of bytes
class ByteView : public std::basic_string_view<uint8_t> {
  public:
    using std::basic_string_view<uint8_t>::basic_string_view;

    constexpr ByteView() noexcept = default;

    constexpr ByteView(std::basic_string_view<uint8_t> other) noexcept : basic_string_view{other} {}
    constexpr ByteView(const Bytes& bytes) noexcept : basic_string_view{bytes.data(), bytes.size()} {}

    template <size_t N>
    constexpr ByteView(const std::array<uint8_t, N>& array) noexcept : basic_string_view{array.data(), N} {}
};

}  // namespace b58
