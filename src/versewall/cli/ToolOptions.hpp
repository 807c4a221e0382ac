#pragma once

#include <versewall/effects/EffectGenerator.hpp>

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>

namespace VW::Cli {

struct ToolOptions {
    std::string settings_file;
    std::string poem_file;
    std::string monitors_file;
    std::string output_dir;
    std::string install_command;
    std::string log_file;
    std::optional<std::int32_t>        seed;
    std::optional<Effects::EffectKind> effect;
    bool watch     = false;
    bool verbose   = false;
    bool silent    = false;
    bool show_help = false;
};

// nullopt when the arguments are invalid; the reason goes to error_logger.
auto parse_tool_options(int argc,
                        char const* const* argv,
                        std::function<void(std::string const&)> error_logger = {}) -> std::optional<ToolOptions>;

auto print_tool_usage(std::ostream& out) -> void;

} // namespace VW::Cli
