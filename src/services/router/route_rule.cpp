/// @file route_rule.cpp
/// @brief Rule breaker lookup.

#include "agw/service/route_rule.hpp"

namespace agw::service {

const BreakerConfig* Rule::findBreakerConfig(std::string_view path) const {
    for (const auto& config : breakerConfigs) {
        if (config.path == path) {
            return &config;
        }
    }
    return nullptr;
}

}  // namespace agw::service
