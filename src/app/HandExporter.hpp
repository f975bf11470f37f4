#pragma once

#include <vector>

#include <QJsonDocument>
#include <QJsonObject>

#include "domain/hand/Hand.hpp"
#include "infra/stars/StarsHandHistory.hpp"

namespace phh::app {

// JSON rendering of parsed hands. Amounts are written as decimal strings
// ("0.02") so nothing is lost to floating point; the timestamp is written both
// as UTC ISO-8601 and as Unix milliseconds.
class HandExporter final {
public:
    static QJsonObject headerToJson(const phh::domain::HandHeader& header);
    static QJsonObject handToJson(const phh::domain::Hand& hand);

    // Fully parsed hands export the whole record, header-only ones just "header".
    static QJsonDocument toJson(const std::vector<phh::infra::stars::StarsHandHistory>& hands);

private:
    HandExporter() = delete;
};

} // namespace phh::app
