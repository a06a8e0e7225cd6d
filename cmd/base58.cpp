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

#include <iostream>

#include <infra/os/terminal.hpp>

#include "common.hpp"

int main(int argc, char* argv[]) {
    if (not b58::init_binary_stdio()) {
        std::cerr << "Could not switch standard streams to binary mode" << std::endl;
        return 1;
    }
    return b58::cmd::run(argc, argv, std::cin, std::cout);
}
