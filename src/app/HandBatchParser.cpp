#include "app/HandBatchParser.hpp"

#include <utility>

#include <QDebug>
#include <QString>

namespace phh::app {

using phh::infra::stars::ParserSettings;
using phh::infra::stars::StarsHandHistory;

HandBatchParser::HandBatchParser(ParserSettings settings, IParseDiagnostics* diagnostics)
    : settings_(std::move(settings)), diagnostics_(diagnostics) {
}

void HandBatchParser::setCallbacks(HandBatchCallbacks callbacks) {
    callbacks_ = std::move(callbacks);
}

BatchResult HandBatchParser::parseAll(const std::vector<std::string>& handTexts) {
    BatchResult res;
    res.hands.reserve(handTexts.size());

    for (std::size_t i = 0; i < handTexts.size(); ++i) {
        parseOne(handTexts[i], i, res);
    }

    if (!res.failures.empty()) {
        qWarning() << "Parsed" << res.hands.size() << "of" << res.total() << "hands,"
                   << res.failures.size() << "skipped";
    }
    return res;
}

bool HandBatchParser::parseOne(std::string handText, std::size_t index, BatchResult& into) {
    StarsHandHistory hh(std::move(handText), settings_);

    const bool ok = headerOnly_ ? hh.parseHeader(diagnostics_) : hh.parse(diagnostics_);
    if (!ok) {
        BatchFailure f;
        f.index = index;
        if (hh.error()) {
            f.error = *hh.error();
            f.handId = f.error.handId;
        }

        qWarning() << "Skipping hand" << (f.handId.empty() ? QStringLiteral("?") : QString::fromStdString(f.handId))
                   << "at position" << static_cast<qulonglong>(index) << "-"
                   << QString::fromStdString(f.error.describe());

        if (callbacks_.onHandFailed) {
            callbacks_.onHandFailed(f);
        }
        into.failures.push_back(std::move(f));
        return false;
    }

    into.hands.push_back(std::move(hh));
    if (callbacks_.onHandParsed) {
        callbacks_.onHandParsed(into.hands.back());
    }
    return true;
}

} // namespace phh::app
