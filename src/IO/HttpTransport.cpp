#include "HttpTransport.h"

#include <cctype>

namespace AsyncFile::Core::IO {

namespace {
    bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    for (auto it = headers.rbegin(); it != headers.rend(); ++it) {
        if (equalsIgnoreCase(it->name, name)) {
            return it->value;
        }
    }
    return std::nullopt;
}

} // namespace AsyncFile::Core::IO
