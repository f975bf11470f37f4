#include "infra/ParserSettingsRepository.hpp"

#include <QByteArray>
#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QTimeZone>

namespace phh::infra {

using phh::infra::stars::ParserSettings;

ParserSettingsRepository::ParserSettingsRepository(std::string path)
    : path_(std::move(path)) {
}

ParserSettings ParserSettingsRepository::load() const {
    QFile file(QString::fromStdString(path_));
    if (!file.exists()) {
        qWarning() << "Parser settings not found, using defaults:" << QString::fromStdString(path_);
        return ParserSettings{};
    }

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Failed to open parser settings, using defaults:" << QString::fromStdString(path_);
        return ParserSettings{};
    }

    QJsonParseError parseErr{};
    const auto doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Invalid parser settings, using defaults:" << parseErr.errorString();
        return ParserSettings{};
    }

    const auto o = doc.object();
    ParserSettings s;

    if (o.contains(QStringLiteral("reference_time_zone"))) {
        const QString tzId = o.value(QStringLiteral("reference_time_zone")).toString();
        if (QTimeZone(tzId.toUtf8()).isValid()) {
            s.referenceTimeZone = tzId.toStdString();
        } else {
            qWarning() << "Unknown reference_time_zone in parser settings, keeping"
                       << QString::fromStdString(s.referenceTimeZone) << ":" << tzId;
        }
    }

    if (o.contains(QStringLiteral("freeroll_currency"))) {
        const QString code = o.value(QStringLiteral("freeroll_currency")).toString();
        if (const auto c = phh::domain::currencyFromCode(code.toStdString())) {
            s.freerollCurrency = *c;
        } else {
            qWarning() << "Unknown freeroll_currency in parser settings, keeping USD:" << code;
        }
    }

    s.reportUnrecognizedLines =
        o.value(QStringLiteral("report_unrecognized_lines")).toBool(s.reportUnrecognizedLines);

    return s;
}

bool ParserSettingsRepository::save(const ParserSettings& settings) const {
    QJsonObject root;
    root.insert(QStringLiteral("reference_time_zone"),       QString::fromStdString(settings.referenceTimeZone));
    root.insert(QStringLiteral("freeroll_currency"),         QString::fromStdString(phh::domain::to_string(settings.freerollCurrency)));
    root.insert(QStringLiteral("report_unrecognized_lines"), settings.reportUnrecognizedLines);

    QFile file(QString::fromStdString(path_));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "Failed to write parser settings:" << QString::fromStdString(path_);
        return false;
    }

    QJsonDocument doc(root);
    file.write(doc.toJson(QJsonDocument::Indented));
    file.close();
    return true;
}

} // namespace phh::infra
