#pragma once

#include "app/IParseDiagnostics.hpp"

namespace phh::infra {

// Forwards diagnostics to Qt logging. Stateless, so one instance may be
// shared by concurrent parses.
class LoggingDiagnostics final : public phh::app::IParseDiagnostics {
public:
    void report(const phh::app::Diagnostic& d) override;

    // Process-wide default used when a parse call gets no sink.
    static LoggingDiagnostics& instance();
};

} // namespace phh::infra
