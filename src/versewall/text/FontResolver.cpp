#include <versewall/text/FontResolver.hpp>
#include <versewall/text/Utf8.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_set>

#include <fontconfig/fontconfig.h>

namespace VW::Text {
namespace {

auto to_lower_copy(std::string_view value) -> std::string {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

auto is_generic_family(std::string_view family) -> bool {
    static constexpr std::array<std::string_view, 6> generics{
            "serif", "sans-serif", "sans", "monospace", "system-ui", "cursive"};
    auto lowered = to_lower_copy(family);
    return std::find(generics.begin(), generics.end(), lowered) != generics.end();
}

struct PatternDeleter {
    void operator()(FcPattern* pattern) const {
        if (pattern != nullptr) {
            FcPatternDestroy(pattern);
        }
    }
};
using PatternPtr = std::unique_ptr<FcPattern, PatternDeleter>;

struct FontConfigState {
    std::mutex mutex;
    FcConfig*  config = nullptr;
};

// Loaded once and kept for the process lifetime.
auto font_config() -> FontConfigState& {
    static FontConfigState* state = [] {
        auto* created = new FontConfigState();
        created->config = FcInitLoadConfigAndFonts();
        if (created->config == nullptr) {
            vw_log("fontconfig could not load its configuration", "Font", "Warning");
        }
        return created;
    }();
    return *state;
}

struct Match {
    ResolvedFontFile file;
    bool             family_matches = false;
};

auto match_family(FcConfig* config, std::string const& family, std::u32string const& sample) -> std::optional<Match> {
    PatternPtr pattern{FcPatternCreate()};
    if (!pattern) {
        return std::nullopt;
    }
    FcPatternAddString(pattern.get(), FC_FAMILY, reinterpret_cast<FcChar8 const*>(family.c_str()));
    FcConfigSubstitute(config, pattern.get(), FcMatchPattern);
    FcDefaultSubstitute(pattern.get());

    FcResult result = FcResultNoMatch;
    PatternPtr matched{FcFontMatch(config, pattern.get(), &result)};
    if (!matched || result != FcResultMatch) {
        return std::nullopt;
    }

    FcChar8* file = nullptr;
    if (FcPatternGetString(matched.get(), FC_FILE, 0, &file) != FcResultMatch || file == nullptr) {
        return std::nullopt;
    }
    Match match;
    match.file.path = reinterpret_cast<char const*>(file);

    int index = 0;
    if (FcPatternGetInteger(matched.get(), FC_INDEX, 0, &index) == FcResultMatch && index > 0) {
        match.file.index = static_cast<unsigned int>(index);
    }

    auto wanted = to_lower_copy(family);
    match.family_matches = is_generic_family(family);
    FcChar8* name = nullptr;
    for (int n = 0; FcPatternGetString(matched.get(), FC_FAMILY, n, &name) == FcResultMatch; ++n) {
        std::string_view found{reinterpret_cast<char const*>(name)};
        if (n == 0) {
            match.file.family = std::string(found);
        }
        if (to_lower_copy(found) == wanted) {
            match.file.family = std::string(found);
            match.family_matches = true;
            break;
        }
    }

    FcCharSet* charset = nullptr;
    if (!sample.empty() && FcPatternGetCharSet(matched.get(), FC_CHARSET, 0, &charset) == FcResultMatch) {
        match.file.covers_sample = std::all_of(sample.begin(), sample.end(), [charset](char32_t cp) {
            return FcCharSetHasChar(charset, static_cast<FcChar32>(cp)) == FcTrue;
        });
    }
    return match;
}

auto sample_codepoints(std::string_view text) -> std::u32string {
    std::u32string sample;
    for (auto cp : decode_utf8(text)) {
        if (cp <= U' ' || cp == U'\u3000' || cp == U'\uFFFD') {
            continue;
        }
        if (sample.find(cp) == std::u32string::npos) {
            sample.push_back(cp);
        }
    }
    return sample;
}

} // namespace

auto default_fallback_families() -> std::vector<std::string> const& {
    static std::vector<std::string> const families{
            "Noto Serif CJK SC",
            "Noto Sans CJK SC",
            "Source Han Serif SC",
            "Source Han Sans SC",
            "WenQuanYi Zen Hei",
            "AR PL UKai CN",
    };
    return families;
}

auto build_family_candidates(std::string_view family,
                             std::vector<std::string> const& fallbacks) -> std::vector<std::string> {
    std::vector<std::string> candidates;
    candidates.emplace_back(family);
    candidates.insert(candidates.end(), fallbacks.begin(), fallbacks.end());
    candidates.emplace_back("serif");
    candidates.emplace_back("sans-serif");

    std::vector<std::string> unique;
    std::unordered_set<std::string> seen;
    unique.reserve(candidates.size());
    for (auto& entry : candidates) {
        if (entry.empty()) {
            continue;
        }
        if (seen.insert(to_lower_copy(entry)).second) {
            unique.emplace_back(std::move(entry));
        }
    }
    return unique;
}

auto resolve_font_file(FontQuery const& query) -> Expected<ResolvedFontFile> {
    auto candidates = build_family_candidates(query.family, query.fallback_families);
    auto sample = sample_codepoints(query.sample_text);

    auto& state = font_config();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.config == nullptr) {
        return std::unexpected(Error{Error::Code::NotSupported, "fontconfig is not available"});
    }

    std::vector<Match> matches;
    matches.reserve(candidates.size());
    for (auto const& candidate : candidates) {
        auto match = match_family(state.config, candidate, sample);
        if (!match || !match->family_matches) {
            continue;
        }
        if (match->file.covers_sample) {
            vw_log("Font family '" + query.family + "' resolved to " + match->file.path.string(), "Font");
            return match->file;
        }
        matches.push_back(std::move(*match));
    }
    if (!matches.empty()) {
        vw_log("No installed font covers the text; using " + matches.front().file.path.string(), "Font", "Warning");
        return matches.front().file;
    }
    return std::unexpected(Error{Error::Code::NotFound, "no installed font matches '" + query.family + "'"});
}

} // namespace VW::Text
