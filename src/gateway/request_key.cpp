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


// Harbor Request Key - Implementation

#include "request_key.hpp"

#include <fmt/format.h>

namespace harbor::gateway {

std::optional<RequestKeyExtractor> RequestKeyExtractor::parse(std::string_view spec) {
    RequestKeyExtractor extractor;
    if (spec == "client_ip" || spec == "remote_addr") {
        extractor.source_ = Source::ClientIp;
        return extractor;
    }

    size_t colon = spec.find(':');
    if (colon == std::string_view::npos || colon + 1 >= spec.size()) {
        return std::nullopt;
    }
    std::string_view kind = spec.substr(0, colon);
    std::string_view name = spec.substr(colon + 1);

    if (kind == "header") {
        extractor.source_ = Source::Header;
    } else if (kind == "cookie") {
        extractor.source_ = Source::Cookie;
    } else {
        return std::nullopt;
    }
    extractor.name_ = std::string(name);
    return extractor;
}

std::string_view RequestKeyExtractor::extract(const http::Request& request) const noexcept {
    switch (source_) {
        case Source::ClientIp:
            return request.client_ip;
        case Source::Header:
            return request.get_header(name_);
        case Source::Cookie:
            return request.get_cookie(name_);
    }
    return {};
}

std::string RequestKeyExtractor::describe() const {
    switch (source_) {
        case Source::ClientIp:
            return "client_ip";
        case Source::Header:
            return fmt::format("header:{}", name_);
        case Source::Cookie:
            return fmt::format("cookie:{}", name_);
    }
    return "client_ip";
}

}  // namespace harbor::gateway
