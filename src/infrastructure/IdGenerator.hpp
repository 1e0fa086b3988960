// IdGenerator Header
#pragma once
#include <string>

namespace findoc::infrastructure {

class IdGenerator {
public:
    /** @brief Random RFC 4122 version-4 identifier in canonical 8-4-4-4-12 form. */
    static std::string NewUuid();
};

} // namespace findoc::infrastructure
