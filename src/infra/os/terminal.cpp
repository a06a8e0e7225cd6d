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

#if defined(_WIN32)
#include <fcntl.h>
#include <io.h>
#include <windows.h>
#if !defined(ENABLE_VIRTUAL_TERMINAL_PROCESSING)
#define ENABLE_VIRTUAL_TERMINAL_PROCESSING 0x0004
#endif
#else
#include <unistd.h>
#endif

#include <cstdio>
#include <cstdlib>
#include <string_view>

#include "terminal.hpp"

namespace b58 {

bool init_terminal() {
#if defined(_WIN32)
    // Log lines go to std::cerr hence the error handle is the one to configure
    SetConsoleOutputCP(CP_UTF8);
    HANDLE handle{GetStdHandle(STD_ERROR_HANDLE)};
    if (handle == INVALID_HANDLE_VALUE) return false;
    DWORD mode{0};
    if (GetConsoleMode(handle, &mode) == 0) return false;  // Redirected
    return SetConsoleMode(handle, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING) not_eq 0;
#else
    if (isatty(fileno(stderr)) == 0) return false;
    const char* term{std::getenv("TERM")};
    return term not_eq nullptr and std::string_view(term) not_eq "dumb";
#endif
}

bool init_binary_stdio() {
#if defined(_WIN32)
    // Text mode stops reading at 0x1a and translates line endings
    return _setmode(_fileno(stdin), _O_BINARY) not_eq -1 and _setmode(_fileno(stdout), _O_BINARY) not_eq -1;
#else
    return true;
#endif
}

}  // namespace b58
