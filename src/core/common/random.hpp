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
#include <limits>
#include <random>

#include <core/common/base.hpp>

namespace b58 {

//! \brief Returns a uniformly distributed value of type T in range [min, max]
template <Integral T>
T randomize(const T min = std::numeric_limits<T>::min(), const T max = std::numeric_limits<T>::max()) {
    B58_THREAD_LOCAL std::mt19937_64 engine{std::random_device{}()};
    return std::uniform_int_distribution<T>{min, max}(engine);
}

//! \brief Returns a sequence of random bytes of the requested size
Bytes get_random_bytes(size_t size) noexcept;

}  // namespace b58
