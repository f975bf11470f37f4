#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "app/IParseDiagnostics.hpp"
#include "infra/stars/StarsHandHistory.hpp"

namespace phh::app {

struct BatchFailure {
    std::size_t                     index{0}; // position in the input list
    std::string                     handId;   // empty if the header never parsed
    phh::infra::stars::ParseError   error;
};

struct BatchResult {
    std::vector<phh::infra::stars::StarsHandHistory> hands; // parsed, in input order
    std::vector<BatchFailure>                        failures;

    std::size_t total() const noexcept { return hands.size() + failures.size(); }
};

struct HandBatchCallbacks {
    std::function<void(const phh::infra::stars::StarsHandHistory&)> onHandParsed;
    std::function<void(const BatchFailure&)>                        onHandFailed;
};

// Parses already-sliced hand texts one after another. A hand that fails is
// logged with its id and offending line and skipped; the batch always runs to
// the end. Diagnostics of every hand go to the sink given at construction
// (Qt logging when none).
class HandBatchParser {
public:
    explicit HandBatchParser(phh::infra::stars::ParserSettings settings = {},
                             IParseDiagnostics* diagnostics = nullptr);

    void setCallbacks(HandBatchCallbacks callbacks);

    // Stop after the header phase (stakes / date filtering).
    void setHeaderOnly(bool headerOnly) noexcept { headerOnly_ = headerOnly; }
    bool headerOnly() const noexcept { return headerOnly_; }

    BatchResult parseAll(const std::vector<std::string>& handTexts);

    // Parses one hand and appends it to `into`. Returns false if it failed.
    bool parseOne(std::string handText, std::size_t index, BatchResult& into);

private:
    phh::infra::stars::ParserSettings settings_;
    IParseDiagnostics*                diagnostics_;
    HandBatchCallbacks                callbacks_;
    bool                              headerOnly_{false};
};

} // namespace phh::app
