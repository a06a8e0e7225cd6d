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

// Target must be a 64 bit architecture
#if defined(_MSC_VER)
#if !defined(_M_X64) && !defined(_M_ARM64)
#error "Only 64 bit target architecture is supported"
#endif
#elif defined(__GNUC__) || defined(__clang__)
#if !defined(__x86_64__) && !defined(__aarch64__)
#error "Only 64 bit target architecture is supported"
#endif
#else
#error "Cannot detect compiler or compiler is not supported"
#endif

// Random engines are kept per thread where threads are available
#if defined(__wasm__)
#define B58_THREAD_LOCAL
#else
#define B58_THREAD_LOCAL thread_local
#endif
