#pragma once

#include <string>

#include "infra/stars/StarsParserSettings.hpp"

namespace phh::infra {

class ParserSettingsRepository {
public:
    explicit ParserSettingsRepository(std::string path);

    // Load parser settings from JSON file.
    // If the file is missing or invalid, returns defaults (America/New_York,
    // USD freerolls, report unknown lines) and logs a warning. A single bad
    // field falls back to its default without discarding the rest.
    phh::infra::stars::ParserSettings load() const;

    // Write settings back as indented JSON. Returns false if the file cannot be written.
    bool save(const phh::infra::stars::ParserSettings& settings) const;

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

} // namespace phh::infra
