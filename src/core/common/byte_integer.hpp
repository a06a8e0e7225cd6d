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

namespace b58 {

//! \brief An arbitrary precision unsigned integer backed by a sequence of bytes
//! \remarks Bytes are stored least significant first so carries moving towards the most significant end
//! only ever append at the back of the buffer. Big endian representation is used at the boundaries only.
//! A zero value holds no bytes at all.
class ByteInteger {
  public:
    //! \brief The largest radix accepted by divide and multiply
    static constexpr uint32_t kMaxRadix{256};

    ByteInteger() = default;

    //! \brief Builds the integer from a big endian sequence of bytes (leading zeroes are allowed)
    explicit ByteInteger(ByteView big_endian);

    //! \brief Whether the value is zero
    [[nodiscard]] bool is_zero() const noexcept { return bytes_.empty(); }

    //! \brief Number of significant bytes
    [[nodiscard]] size_t size() const noexcept { return bytes_.size(); }

    //! \brief Pre-allocates storage for the given number of bytes
    void reserve(size_t size) { bytes_.reserve(size); }

    //! \brief Divides the value by divisor in place using long division from the most significant byte
    //! \return The remainder of the division
    //! \remarks divisor must lay in range [2, kMaxRadix]
    uint32_t divide(uint32_t divisor) noexcept;

    //! \brief Multiplies the value by multiplier in place growing the buffer as needed
    //! \remarks multiplier must lay in range [1, kMaxRadix]
    void multiply(uint32_t multiplier);

    //! \brief Adds a single digit to the value in place
    //! \remarks addend must be lower than kMaxRadix
    void add(uint32_t addend);

    //! \brief Returns the canonical big endian representation of the value
    //! \remarks Zero is represented by a single zero byte
    [[nodiscard]] Bytes to_big_endian() const;

  private:
    //! \brief Drops zero bytes at the most significant end
    void trim() noexcept;

    Bytes bytes_{};  // Least significant byte first
};

}  // namespace b58
