#pragma once

#include <string>

namespace phh::app {

enum class DiagnosticKind {
    UnrecognizedAction = 0, // body line matched no classifier rule; dropped
    MissingSection     = 1, // an expected line/section was absent; field left unset
    SkippedLine        = 2  // line recognised but unusable (e.g. seat outside the table)
};

inline std::string to_string(DiagnosticKind k) {
    switch (k) {
        case DiagnosticKind::UnrecognizedAction: return "UnrecognizedAction";
        case DiagnosticKind::MissingSection:     return "MissingSection";
        case DiagnosticKind::SkippedLine:        return "SkippedLine";
    }
    return "Unknown";
}

struct Diagnostic {
    DiagnosticKind kind{DiagnosticKind::UnrecognizedAction};
    std::string    handId;  // empty until the header is parsed
    std::string    text;    // offending source line, if any
    std::string    message;
};

// Port for non-fatal parse events. Passed into each parse call so that
// parallel parses never share a sink unless the caller wants them to.
// Implementations: infra::LoggingDiagnostics (Qt logging), app::CollectingDiagnostics.
class IParseDiagnostics {
public:
    virtual ~IParseDiagnostics() = default;

    virtual void report(const Diagnostic& d) = 0;
};

} // namespace phh::app
