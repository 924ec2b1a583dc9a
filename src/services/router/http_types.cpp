/// @file http_types.cpp
/// @brief Header helpers for upstream HTTP messages.

#include "agw/service/http_types.hpp"

#include <algorithm>
#include <cctype>

namespace agw::service {

std::string_view findHeader(const HeaderList& headers, std::string_view name) {
    auto equalsIgnoreCase = [](std::string_view a, std::string_view b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) ==
                          std::tolower(static_cast<unsigned char>(y));
               });
    };
    for (const auto& [key, value] : headers) {
        if (equalsIgnoreCase(key, name)) {
            return value;
        }
    }
    return {};
}

}  // namespace agw::service
