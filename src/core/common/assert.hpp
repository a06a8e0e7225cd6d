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
#include <source_location>
#include <string_view>

namespace b58 {
//! \brief Reports a broken invariant on std::cerr and terminates the process
[[noreturn]] void abort_on_broken_invariant(std::string_view expression, const std::source_location& location);
}  // namespace b58

//! \brief Checks an invariant regardless of NDEBUG and terminates the process when it does not hold
#define ASSERT(expr)          \
    if ((expr)) [[likely]]    \
        static_cast<void>(0); \
    else                      \
        ::b58::abort_on_broken_invariant(#expr, std::source_location::current())

//! \brief ASSERT applied to the arguments of a function
#define ASSERT_PRE(expr) ASSERT(expr)
