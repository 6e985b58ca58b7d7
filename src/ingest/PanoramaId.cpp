#include "ingest/PanoramaId.hpp"
#include "util/encoding.hpp"
#include "util/timestamp.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>

namespace pv::ingest {

std::string makePanoramaId(const int64_t unixMillis, const std::string_view suffix) {
    return fmt::format("pano_{}_{}", unixMillis, suffix);
}

std::string generatePanoramaId() {
    return makePanoramaId(util::unixMillis(), util::random_b32(kPanoramaIdSuffixChars, util::Case::Lower));
}

bool isPanoramaId(const std::string_view id) {
    constexpr std::string_view prefix = "pano_";
    if (!id.starts_with(prefix)) return false;

    const auto rest = id.substr(prefix.size());
    const auto sep = rest.find('_');
    if (sep == std::string_view::npos || sep == 0) return false;

    const auto millis = rest.substr(0, sep);
    const auto suffix = rest.substr(sep + 1);
    if (suffix.size() != kPanoramaIdSuffixChars) return false;

    const auto isDigit = [](const char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
    const auto isSuffixChar = [](const char c) {
        return std::isdigit(static_cast<unsigned char>(c)) || (std::islower(static_cast<unsigned char>(c)) &&
               c != 'i' && c != 'l' && c != 'o' && c != 'u');
    };

    return std::ranges::all_of(millis, isDigit) && std::ranges::all_of(suffix, isSuffixChar);
}

}
