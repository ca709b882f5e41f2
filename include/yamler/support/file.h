// Copyright 2024 Robert A. Dunnagan
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <yamler/support/exception.h>
#include <yamler/support/types.h>

namespace yamler {

inline
String read_file(const std::filesystem::path& fpath) {
    std::ifstream f_in{fpath, std::ios::in | std::ios::binary};
    if (!f_in.is_open()) throw IOError(fpath.string(), strerror(errno));
    StringStream ss;
    ss << f_in.rdbuf();
    if (f_in.bad()) throw IOError(fpath.string(), strerror(errno));
    return ss.str();
}

inline
void write_file(const std::filesystem::path& fpath, const StringView& content) {
    std::ofstream f_out{fpath, std::ios::out | std::ios::binary | std::ios::trunc};
    if (!f_out.is_open()) throw IOError(fpath.string(), strerror(errno));
    f_out.write(content.data(), (std::streamsize)content.size());
    if (f_out.bad()) throw IOError(fpath.string(), strerror(errno));
    if (f_out.fail()) throw IOError(fpath.string(), "ostream::fail()");
}

} // namespace yamler
