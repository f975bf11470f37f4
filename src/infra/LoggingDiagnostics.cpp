#include "infra/LoggingDiagnostics.hpp"

#include <QDebug>
#include <QString>

namespace phh::infra {

using phh::app::DiagnosticKind;

void LoggingDiagnostics::report(const phh::app::Diagnostic& d) {
    const QString handId = d.handId.empty() ? QStringLiteral("?") : QString::fromStdString(d.handId);

    switch (d.kind) {
        case DiagnosticKind::UnrecognizedAction:
            qWarning() << "Hand" << handId << "- unknown action, skipped:" << QString::fromStdString(d.text);
            break;
        case DiagnosticKind::SkippedLine:
            qWarning() << "Hand" << handId << "-" << QString::fromStdString(d.message) << ":"
                       << QString::fromStdString(d.text);
            break;
        case DiagnosticKind::MissingSection:
            // Absent sections are routine (no flop, no showdown); keep them out of warnings.
            qDebug() << "Hand" << handId << "-" << QString::fromStdString(d.message);
            break;
    }
}

LoggingDiagnostics& LoggingDiagnostics::instance() {
    static LoggingDiagnostics sink;
    return sink;
}

} // namespace phh::infra
