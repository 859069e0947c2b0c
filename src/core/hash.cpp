/*
 * Copyright 2026 Harbor Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */


// Harbor Hashing - Implementation

#include "hash.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace harbor::core {

Md5Digest md5(std::string_view data) {
    Md5Digest digest{};
    unsigned int length = 0;

    if (EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_md5(), nullptr) != 1 ||
        length != digest.size()) {
        throw std::runtime_error("EVP_Digest(MD5) failed");
    }
    return digest;
}

std::string md5_hex(std::string_view data) {
    static constexpr char kHex[] = "0123456789abcdef";

    Md5Digest digest = md5(data);
    std::string out;
    out.reserve(digest.size() * 2);
    for (uint8_t byte : digest) {
        out += kHex[byte >> 4];
        out += kHex[byte & 0x0F];
    }
    return out;
}

uint32_t md5_point(const Md5Digest& digest, size_t index) noexcept {
    size_t base = (index % 4) * 4;
    return static_cast<uint32_t>(digest[base]) | (static_cast<uint32_t>(digest[base + 1]) << 8) |
           (static_cast<uint32_t>(digest[base + 2]) << 16) |
           (static_cast<uint32_t>(digest[base + 3]) << 24);
}

}  // namespace harbor::core
