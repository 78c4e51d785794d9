#pragma once

#include <string_view>

namespace peerpin::core {

class ApiRoute {
public:
    static constexpr std::string_view kHello = "/hello";
    static constexpr std::string_view kWhoami = "/whoami";
};

} // namespace peerpin::core
