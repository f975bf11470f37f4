#pragma once

#include <optional>
#include <string>

#include <QString>

#include "domain/domain_model.hpp"

namespace phh::infra::stars {

enum class ClassifyStatus {
    Ok           = 0,
    Unrecognized = 1, // no rule matched; caller drops the line and reports it
    InvalidCards = 2  // "shows" line with a repeated card; fatal for the hand
};

struct ClassifyResult {
    ClassifyStatus                    status{ClassifyStatus::Unrecognized};
    std::optional<domain::PlayerAction> action;
    std::string                       error;
};

// Classifies one trimmed line of hand-body text.
//
// Rules are tried in a fixed priority order and the first rule whose pattern
// matches wins; the order matters because vocabulary overlaps ("collected"
// appears in dedicated win lines, "shows" in both show and chat lines).
// Stateless and safe to call from several threads.
ClassifyResult classifyActionLine(const QString& line);

} // namespace phh::infra::stars
