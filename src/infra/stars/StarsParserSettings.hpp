#pragma once

#include <string>

#include "domain/domain_model.hpp"

namespace phh::infra::stars {

struct ParserSettings {
    // IANA id of the zone the bracketed "[... ET]" stamp is printed in.
    std::string referenceTimeZone{"America/New_York"};

    // Currency assumed for freeroll tournaments that print none.
    phh::domain::Currency freerollCurrency{phh::domain::Currency::USD};

    // When false, unknown body lines are still dropped but not reported.
    bool reportUnrecognizedLines{true};
};

} // namespace phh::infra::stars
