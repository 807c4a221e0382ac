#include "ToolOptions.hpp"

#include "CommandLine.hpp"

#include <ostream>

namespace VW::Cli {

auto parse_tool_options(int argc, char const* const* argv, std::function<void(std::string const&)> error_logger)
    -> std::optional<ToolOptions> {
    ToolOptions options;
    CommandLine cli;
    cli.set_program_name("versewall");
    if (error_logger) {
        cli.set_error_logger(error_logger);
    }

    cli.add_string("--settings", options.settings_file);
    cli.add_string("--poem", options.poem_file);
    cli.add_string("--monitors", options.monitors_file);
    cli.add_string("--output-dir", options.output_dir);
    cli.add_string("--install-command", options.install_command);
    cli.add_string("--log-file", options.log_file);
    cli.add_int("--seed", {.on_value = [&](int value) { options.seed = value; }});
    cli.add_value("--effect", {.on_value = [&](std::optional<std::string_view> token) -> CommandLine::ParseError {
        auto kind = token ? Effects::parse_effect_kind(*token) : std::nullopt;
        if (!kind) {
            return std::string("--effect expects wave, bubbles or blobs");
        }
        options.effect = *kind;
        return std::nullopt;
    }});
    cli.add_flag("--watch", {.on_set = [&] { options.watch = true; }});
    cli.add_flag("--verbose", {.on_set = [&] { options.verbose = true; }});
    cli.add_flag("--silent", {.on_set = [&] { options.silent = true; }});
    cli.add_flag("--help", {.on_set = [&] { options.show_help = true; }});
    cli.add_alias("-h", "--help");
    cli.add_alias("-v", "--verbose");

    if (!cli.parse(argc, argv)) {
        return std::nullopt;
    }
    return options;
}

auto print_tool_usage(std::ostream& out) -> void {
    out << "Usage: versewall [options]\n"
        << "Renders the poem wallpaper and installs it on every monitor.\n\n"
        << "  --settings <file>          settings.json (default: app data directory)\n"
        << "  --poem <file>              poem JSON used as the poem provider\n"
        << "  --monitors <file>          monitor layout JSON (default: one 1920x1080 monitor)\n"
        << "  --output-dir <dir>         where wallpaper images are written\n"
        << "  --install-command <cmd>    shell command run per image; {path}, {monitor} and {mode} are substituted\n"
        << "  --seed <n>                 background seed to persist before applying\n"
        << "  --effect <kind>            wave, bubbles or blobs\n"
        << "  --watch                    keep running and refresh on the configured interval\n"
        << "  --log-file <file>          append log lines to a file\n"
        << "  --silent                   no success or failure notices\n"
        << "  -v, --verbose              log every tag to stderr\n"
        << "  -h, --help                 show this help\n";
}

} // namespace VW::Cli
