#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pv::ingest {

constexpr size_t kPanoramaIdSuffixChars = 7;

// pano_<unix millis>_<7 lower-case crockford chars>
std::string generatePanoramaId();
std::string makePanoramaId(int64_t unixMillis, std::string_view suffix);

[[nodiscard]] bool isPanoramaId(std::string_view id);

}
