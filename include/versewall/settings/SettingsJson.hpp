#pragma once

#include "core/Error.hpp"

#include <versewall/settings/AppSettings.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace VW::Settings {

auto settings_to_json(AppSettings const& settings) -> nlohmann::json;

// Missing, mistyped or out-of-range fields keep their defaults. Enums accept
// their names or the numeric values older settings files stored.
auto settings_from_json(nlohmann::json const& document) -> AppSettings;

auto parse_settings(std::string_view text) -> Expected<AppSettings>;
auto serialize_settings(AppSettings const& settings) -> std::string;

} // namespace VW::Settings
