#pragma once

#include <algorithm>
#include <vector>

#include "app/IParseDiagnostics.hpp"

namespace phh::app {

// Keeps every reported diagnostic in memory (batch summaries, tests).
class CollectingDiagnostics final : public IParseDiagnostics {
public:
    void report(const Diagnostic& d) override {
        items_.push_back(d);
    }

    const std::vector<Diagnostic>& items() const noexcept {
        return items_;
    }

    std::size_t count(DiagnosticKind kind) const {
        return static_cast<std::size_t>(std::count_if(items_.begin(), items_.end(), [kind](const Diagnostic& d) {
            return d.kind == kind;
        }));
    }

    void clear() { items_.clear(); }

private:
    std::vector<Diagnostic> items_;
};

} // namespace phh::app
