#pragma once
// ============================================================================
// AEGIS TRADE CORE - Guard Pipeline
// ============================================================================
// Ordered list of named admission predicates. Evaluation stops at the first
// failing guard; later guards never run.
// ============================================================================

#include "aegis/utils/logger.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace aegis::execution {

/// Why a guard refused admission; index is 1-based in pipeline order
struct GuardRejection {
    size_t index = 0;
    std::string guard;
    std::string reason;
};

template <typename Context>
struct Guard {
    std::string name;
    /// Returns the rejection reason, or nullopt to admit
    std::function<std::optional<std::string>(const Context&)> check;
};

template <typename Context>
class GuardPipeline {
public:
    GuardPipeline() = default;
    explicit GuardPipeline(std::vector<Guard<Context>> guards) : guards_(std::move(guards)) {}

    void add(Guard<Context> guard) { guards_.push_back(std::move(guard)); }

    [[nodiscard]] std::optional<GuardRejection> run(const Context& context) const {
        for (size_t i = 0; i < guards_.size(); ++i) {
            const auto& guard = guards_[i];
            if (auto reason = guard.check(context)) {
                return GuardRejection{i + 1, guard.name, std::move(*reason)};
            }
            LOG_TRACE("Guard {} ({}) passed", i + 1, guard.name);
        }
        return std::nullopt;
    }

    [[nodiscard]] size_t size() const noexcept { return guards_.size(); }
    [[nodiscard]] const std::vector<Guard<Context>>& guards() const noexcept { return guards_; }

private:
    std::vector<Guard<Context>> guards_;
};

}  // namespace aegis::execution
