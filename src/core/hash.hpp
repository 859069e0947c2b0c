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


// Harbor Hashing - Header
// Stable hashes for cache keys and load-balancer rings

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace harbor::core {

using Md5Digest = std::array<uint8_t, 16>;

/// MD5 digest via OpenSSL EVP. Used only for key distribution, never for security.
[[nodiscard]] Md5Digest md5(std::string_view data);

/// Lowercase hex encoding of an MD5 digest (32 chars)
[[nodiscard]] std::string md5_hex(std::string_view data);

/// First four digest bytes as a little-endian 32-bit ring point
[[nodiscard]] uint32_t md5_point(const Md5Digest& digest, size_t index = 0) noexcept;

/// FNV-1a 64-bit, stable across runs and platforms
[[nodiscard]] constexpr uint64_t fnv1a_64(std::string_view data) noexcept {
    uint64_t hash = 14695981039346656037ULL;
    for (char c : data) {
        hash ^= static_cast<uint8_t>(c);
        hash *= 1099511628211ULL;
    }
    return hash;
}

}  // namespace harbor::core
