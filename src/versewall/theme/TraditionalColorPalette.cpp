#include <versewall/settings/EntropySource.hpp>
#include <versewall/theme/TraditionalColorPalette.hpp>

#include "core/FileIO.hpp"
#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <cctype>

namespace VW::Theme {
namespace {

using json = nlohmann::json;

auto make_entry(std::string name, std::string pinyin, std::string_view hex, bool light, bool dark) -> std::optional<TraditionalColor> {
    auto normalized = normalize_hex(hex);
    if (!normalized) {
        return std::nullopt;
    }
    auto color = Scene::parse_color(*normalized);
    if (!color) {
        return std::nullopt;
    }
    return TraditionalColor{
        .name = std::move(name),
        .pinyin = std::move(pinyin),
        .hex = std::move(*normalized),
        .color = *color,
        .light_suitable = light,
        .dark_suitable = dark,
    };
}

auto string_field(json const& object, char const* key) -> std::string {
    auto it = object.find(key);
    return it != object.end() && it->is_string() ? it->get<std::string>() : std::string{};
}

auto bool_field(json const& object, char const* key) -> bool {
    auto it = object.find(key);
    return it != object.end() && it->is_boolean() && it->get<bool>();
}

} // namespace

auto normalize_hex(std::string_view hex) -> std::optional<std::string> {
    while (!hex.empty() && std::isspace(static_cast<unsigned char>(hex.front()))) {
        hex.remove_prefix(1);
    }
    while (!hex.empty() && std::isspace(static_cast<unsigned char>(hex.back()))) {
        hex.remove_suffix(1);
    }
    if (!hex.empty() && hex.front() == '#') {
        hex.remove_prefix(1);
    }
    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    std::string out = "#";
    if (hex.size() == 3) {
        for (char c : hex) {
            out.push_back(c);
            out.push_back(c);
        }
        return out;
    }
    if (hex.size() == 6 || hex.size() == 8) {
        out.append(hex);
        return out;
    }
    return std::nullopt;
}

TraditionalColorPalette::TraditionalColorPalette(std::vector<TraditionalColor> entries)
    : entries_(std::move(entries)) {}

auto TraditionalColorPalette::builtin() -> TraditionalColorPalette {
    std::vector<TraditionalColor> entries;
    auto add = [&](char const* name, char const* pinyin, char const* hex, bool light, bool dark) {
        if (auto entry = make_entry(name, pinyin, hex, light, dark)) {
            entries.push_back(std::move(*entry));
        }
    };
    add("乳白", "rubai", "#f9f4dc", false, true);
    add("孔雀绿", "kongquelv", "#229453", true, true);
    add("胭脂红", "yanzhihong", "#f03f24", true, true);
    add("景泰蓝", "jingtailan", "#2775b6", true, false);
    return TraditionalColorPalette{std::move(entries)};
}

auto TraditionalColorPalette::from_json(std::string_view text) -> Expected<TraditionalColorPalette> {
    auto document = json::parse(text, nullptr, false);
    if (document.is_discarded() || !document.is_array()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "palette must be a JSON array"});
    }
    std::vector<TraditionalColor> entries;
    for (auto const& item : document) {
        if (!item.is_object()) {
            continue;
        }
        auto entry = make_entry(string_field(item, "name"),
                                string_field(item, "pinyin"),
                                string_field(item, "hex"),
                                bool_field(item, "lightSuitable"),
                                bool_field(item, "darkSuitable"));
        if (entry) {
            entries.push_back(std::move(*entry));
        }
    }
    if (entries.empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "palette has no usable colors"});
    }
    return TraditionalColorPalette{std::move(entries)};
}

auto TraditionalColorPalette::load(std::filesystem::path const& path) -> Expected<TraditionalColorPalette> {
    auto text = readTextFile(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    return from_json(*text);
}

auto TraditionalColorPalette::load_first(std::span<std::filesystem::path const> candidates) -> TraditionalColorPalette {
    for (auto const& path : candidates) {
        auto loaded = load(path);
        if (loaded) {
            vw_log("Palette loaded from " + path.string() + " (" + std::to_string(loaded->size()) + " colors)", "Settings");
            return std::move(*loaded);
        }
        if (loaded.error().code != Error::Code::NotFound) {
            vw_log("Palette " + path.string() + " ignored: " + describeError(loaded.error()), "Settings", "Warning");
        }
    }
    return builtin();
}

auto TraditionalColorPalette::find_by_rgb(Scene::Argb color) const -> TraditionalColor const* {
    for (auto const& entry : entries_) {
        if (entry.color.r == color.r && entry.color.g == color.g && entry.color.b == color.b) {
            return &entry;
        }
    }
    return nullptr;
}

auto TraditionalColorPalette::name_for(std::string_view color_text) const -> std::optional<std::string> {
    auto normalized = normalize_hex(color_text);
    if (!normalized) {
        return std::nullopt;
    }
    auto color = Scene::parse_color(*normalized);
    if (!color) {
        return std::nullopt;
    }
    auto const* entry = find_by_rgb(*color);
    if (entry == nullptr || entry->name.empty()) {
        return std::nullopt;
    }
    return entry->name;
}

auto TraditionalColorPalette::pick_random(bool dark_theme, Settings::EntropySource& entropy) const -> TraditionalColor const* {
    std::vector<TraditionalColor const*> pool;
    for (auto const& entry : entries_) {
        if (dark_theme ? entry.dark_suitable : entry.light_suitable) {
            pool.push_back(&entry);
        }
    }
    if (pool.empty()) {
        for (auto const& entry : entries_) {
            pool.push_back(&entry);
        }
    }
    if (pool.empty()) {
        return nullptr;
    }
    return pool[entropy.next_u32() % pool.size()];
}

} // namespace VW::Theme
