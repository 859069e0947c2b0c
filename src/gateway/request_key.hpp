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


// Harbor Request Key - Header
// Extracts the per-request key used by rate limiting and hash balancing

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "../http/http.hpp"

namespace harbor::gateway {

/// Key source: "client_ip", "header:<Name>" or "cookie:<Name>"
class RequestKeyExtractor {
public:
    enum class Source : uint8_t { ClientIp, Header, Cookie };

    RequestKeyExtractor() = default;

    /// Parse a key description; nullopt if malformed
    [[nodiscard]] static std::optional<RequestKeyExtractor> parse(std::string_view spec);

    /// Key for this request; empty when the header or cookie is absent
    [[nodiscard]] std::string_view extract(const http::Request& request) const noexcept;

    [[nodiscard]] Source source() const noexcept { return source_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// Canonical text form, as accepted by parse()
    [[nodiscard]] std::string describe() const;

private:
    Source source_ = Source::ClientIp;
    std::string name_;
};

}  // namespace harbor::gateway
