#pragma once

#include <array>
#include <string>

#include <uuid/uuid.h>

namespace claimscan {

inline auto GenerateUuid() -> std::string {
    uuid_t binuuid;
    uuid_generate_random(binuuid);
    std::array<char, 37> text{};
    uuid_unparse_lower(binuuid, text.data());
    return {text.data()};
}

} // namespace claimscan
