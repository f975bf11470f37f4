#pragma once

#include <string>

#include <QString>
#include <QStringList>
#include <QVector>

namespace phh::infra::stars {

enum class SectionKind {
    Header    = 0, // header line, table line, seats, blind posts
    HoleCards = 1,
    Flop      = 2,
    Turn      = 3,
    River     = 4,
    ShowDown  = 5,
    Summary   = 6,
    Other     = 7  // marker we do not interpret (e.g. "FIRST FLOP")
};

struct Section {
    SectionKind kind{SectionKind::Header};
    QString     marker;    // normalised marker name, empty for the header block
    QString     boardText; // text after the closing "***", e.g. "[6s 4d 3s] [8c]"
    QStringList lines;     // trimmed, non-empty body lines
};

struct SplitHand {
    QVector<Section> sections;

    // First section of the given kind, or nullptr if the marker never appeared.
    const Section* find(SectionKind kind) const;
};

// Splits one hand's text on "*** NAME ***" separator lines.
//
// Lines before the first marker form the Header section. A section body ends
// at its first blank line once it has content; anything after that blank line
// up to the next marker is ignored. Missing markers are not errors.
SplitHand splitHandText(const std::string& rawText);

// Marker name ("HOLE CARDS", "show down", "SHOWDOWN") to section kind.
SectionKind sectionKindForMarker(const QString& normalisedName);

} // namespace phh::infra::stars
