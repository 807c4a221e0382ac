#pragma once

#include "core/Error.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace VW::Text {

struct FontQuery {
    std::string              family;
    std::vector<std::string> fallback_families;
    // Text the face should cover; an empty sample accepts any face.
    std::string sample_text;
};

struct ResolvedFontFile {
    std::filesystem::path path;
    std::string           family;
    unsigned int          index = 0;
    bool                  covers_sample = true;
};

// CJK families tried after the requested one, most specific first.
[[nodiscard]] auto default_fallback_families() -> std::vector<std::string> const&;

// Requested family, then the fallbacks, then "serif" and "sans-serif".
// Empty names are dropped; duplicates are removed ignoring case.
[[nodiscard]] auto build_family_candidates(std::string_view family,
                                           std::vector<std::string> const& fallbacks) -> std::vector<std::string>;

/**
 * resolve_font_file - maps a family name onto an installed font file.
 *
 * Each candidate is matched through fontconfig. A match for a named family
 * only counts when fontconfig returns that family, so substitutions do not
 * hide a missing font; generic names accept whatever fontconfig picks. The
 * first pass requires coverage of the sample text, the second takes the
 * first match. NotFound when no candidate matches.
 */
[[nodiscard]] auto resolve_font_file(FontQuery const& query) -> Expected<ResolvedFontFile>;

} // namespace VW::Text
