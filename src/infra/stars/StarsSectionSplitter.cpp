#include "infra/stars/StarsSectionSplitter.hpp"

#include <QRegularExpression>

namespace phh::infra::stars {

namespace {

const QRegularExpression& markerRe() {
    static const QRegularExpression re(QStringLiteral(R"(^\*{3}\s*([^*]+?)\s*\*{3}\s*(.*)$)"));
    return re;
}

QString normaliseText(const std::string& rawText) {
    QString text = QString::fromUtf8(rawText.data(), static_cast<int>(rawText.size()));
    if (text.startsWith(QChar(0xFEFF))) {
        text.remove(0, 1);
    }
    text.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
    text.replace(QLatin1Char('\r'), QLatin1Char('\n'));
    return text;
}

} // namespace

const Section* SplitHand::find(SectionKind kind) const {
    for (const auto& s : sections) {
        if (s.kind == kind) return &s;
    }
    return nullptr;
}

SectionKind sectionKindForMarker(const QString& normalisedName) {
    const QString name = normalisedName.simplified().toUpper();
    if (name == QStringLiteral("HOLE CARDS")) return SectionKind::HoleCards;
    if (name == QStringLiteral("FLOP")) return SectionKind::Flop;
    if (name == QStringLiteral("TURN")) return SectionKind::Turn;
    if (name == QStringLiteral("RIVER")) return SectionKind::River;
    if (name == QStringLiteral("SHOW DOWN") || name == QStringLiteral("SHOWDOWN")) return SectionKind::ShowDown;
    if (name == QStringLiteral("SUMMARY")) return SectionKind::Summary;
    return SectionKind::Other;
}

SplitHand splitHandText(const std::string& rawText) {
    SplitHand out;

    Section current;
    bool bodyClosed = false;

    const QStringList rawLines = normaliseText(rawText).split(QLatin1Char('\n'));
    for (const QString& rawLine : rawLines) {
        const QString line = rawLine.trimmed();

        const auto m = markerRe().match(line);
        if (m.hasMatch()) {
            if (current.kind != SectionKind::Header || !current.lines.isEmpty()) {
                out.sections.push_back(current);
            }
            current = Section{};
            current.marker = m.captured(1).simplified().toUpper();
            current.kind = sectionKindForMarker(current.marker);
            current.boardText = m.captured(2).trimmed();
            bodyClosed = false;
            continue;
        }

        if (line.isEmpty()) {
            // Blank lines before any content (e.g. leading newlines) are skipped.
            if (!current.lines.isEmpty()) bodyClosed = true;
            continue;
        }

        if (bodyClosed) continue;
        current.lines.push_back(line);
    }

    if (current.kind != SectionKind::Header || !current.lines.isEmpty()) {
        out.sections.push_back(current);
    }
    return out;
}

} // namespace phh::infra::stars
