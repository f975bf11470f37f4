#pragma once

#include <string>

namespace phh::infra::stars {

// Errors that make a hand unusable. Everything else is a diagnostic.
enum class ParseErrorKind {
    HeaderFormat = 0, // header line matches none of the known sub-grammars
    TableFormat  = 1, // "Table '...' N-max Seat #B is the button" line missing or malformed
    InvalidCombo = 2  // hole / board / shown cards repeat a card or have the wrong count
};

inline std::string to_string(ParseErrorKind k) {
    switch (k) {
        case ParseErrorKind::HeaderFormat: return "HeaderFormatError";
        case ParseErrorKind::TableFormat:  return "TableFormatError";
        case ParseErrorKind::InvalidCombo: return "InvalidCombo";
    }
    return "Unknown";
}

struct ParseError {
    ParseErrorKind kind{ParseErrorKind::HeaderFormat};
    std::string    handId;        // empty if the header never parsed
    std::string    offendingText; // the source line that failed
    std::string    message;

    std::string describe() const {
        std::string s = to_string(kind);
        if (!handId.empty()) s += " in hand #" + handId;
        if (!message.empty()) s += ": " + message;
        if (!offendingText.empty()) s += " [" + offendingText + "]";
        return s;
    }
};

} // namespace phh::infra::stars
