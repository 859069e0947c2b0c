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


// Harbor Cancellation - Header
// Shared cancellation flag checked at every blocking I/O slice

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <utility>

namespace harbor::core {

/// Cancellation token shared between the owner of a request and the code
/// blocked on its behalf. A default-constructed token is never cancelled.
///
/// An optional probe is evaluated on each check; Listener installs one that
/// polls the client socket for a hang-up so that a disconnect aborts the
/// in-flight upstream attempt.
class CancellationToken {
public:
    CancellationToken() = default;

    /// Create a token that can be cancelled through cancel()
    [[nodiscard]] static CancellationToken create() {
        CancellationToken token;
        token.state_ = std::make_shared<State>();
        return token;
    }

    /// Install a probe; returning true marks the token cancelled
    void set_probe(std::function<bool()> probe) {
        if (!state_) {
            state_ = std::make_shared<State>();
        }
        state_->probe = std::move(probe);
    }

    void cancel() noexcept {
        if (state_) {
            state_->cancelled.store(true, std::memory_order_release);
        }
    }

    [[nodiscard]] bool is_cancelled() const {
        if (!state_) {
            return false;
        }
        if (state_->cancelled.load(std::memory_order_acquire)) {
            return true;
        }
        if (state_->probe && state_->probe()) {
            state_->cancelled.store(true, std::memory_order_release);
            return true;
        }
        return false;
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::function<bool()> probe;
    };

    std::shared_ptr<State> state_;
};

}  // namespace harbor::core
