#include <doctest/doctest.h>

#include "cli/CommandLine.hpp"
#include "cli/ToolOptions.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace VW;
using VW::Cli::CommandLine;

namespace {

auto parse(std::initializer_list<char const*> args, std::vector<std::string>* errors = nullptr) {
    std::vector<char const*> argv{"versewall"};
    argv.insert(argv.end(), args.begin(), args.end());
    return Cli::parse_tool_options(static_cast<int>(argv.size()), argv.data(), [errors](std::string const& message) {
        if (errors != nullptr) {
            errors->push_back(message);
        }
    });
}

} // namespace

TEST_SUITE("cli.commandline") {

TEST_CASE("values may be attached or separate") {
    CommandLine cli;
    std::string name;
    int width = 0;
    bool flag = false;
    cli.add_string("--name", name);
    cli.add_int("--width", {.on_value = [&](int value) { width = value; }});
    cli.add_flag("--flag", {.on_set = [&] { flag = true; }});

    std::vector<char const*> argv{"prog", "--name", "dawn", "--width=-40", "--flag"};
    CHECK(cli.parse(static_cast<int>(argv.size()), argv.data()));
    CHECK(name == "dawn");
    CHECK(width == -40);
    CHECK(flag);
    CHECK(cli.option_names() == std::vector<std::string>{"--name", "--width", "--flag"});
}

TEST_CASE("a missing value is an error") {
    CommandLine cli;
    std::vector<std::string> errors;
    cli.set_program_name("tester");
    cli.set_error_logger([&](std::string const& message) { errors.push_back(message); });
    std::string name;
    cli.add_string("--name", name);
    cli.add_flag("--flag", {});

    std::vector<char const*> argv{"prog", "--name", "--flag"};
    CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
    CHECK(cli.had_errors());
    REQUIRE(errors.size() == 1);
    CHECK(errors[0] == "tester: --name requires a value");
}

TEST_CASE("flags reject attached values and integers must be whole") {
    CommandLine cli;
    std::vector<std::string> errors;
    cli.set_error_logger([&](std::string const& message) { errors.push_back(message); });
    cli.add_flag("--flag", {});
    cli.add_int("--count", {.on_value = [](int) {}});

    std::vector<char const*> argv{"/usr/bin/prog", "--flag=1", "--count", "12abc"};
    CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
    REQUIRE(errors.size() == 2);
    CHECK(errors[0] == "prog: --flag does not accept a value");
    CHECK(errors[1] == "prog: --count expects an integer value");
}

TEST_CASE("unknown arguments go to the handler") {
    CommandLine cli;
    std::vector<std::string> seen;
    cli.set_unknown_argument_handler([&](std::string_view token) {
        seen.emplace_back(token);
        return true;
    });
    std::vector<char const*> argv{"prog", "positional", "--other=3"};
    CHECK(cli.parse(static_cast<int>(argv.size()), argv.data()));
    CHECK(seen == std::vector<std::string>{"positional", "--other=3"});
}

TEST_CASE("optional values leave the next option alone") {
    CommandLine cli;
    std::optional<std::string> captured;
    bool seen = false;
    CommandLine::ValueOption option{};
    option.value_optional = true;
    option.on_value = [&](std::optional<std::string_view> value) -> CommandLine::ParseError {
        seen = true;
        if (value) {
            captured = std::string(*value);
        }
        return std::nullopt;
    };
    cli.add_value("--capture", option);
    cli.add_flag("--flag", {});

    std::vector<char const*> argv{"prog", "--capture", "--flag"};
    CHECK(cli.parse(static_cast<int>(argv.size()), argv.data()));
    CHECK(seen);
    CHECK_FALSE(captured.has_value());
}

}

TEST_SUITE("cli.tool") {

TEST_CASE("defaults") {
    auto options = parse({});
    REQUIRE(options.has_value());
    CHECK(options->settings_file.empty());
    CHECK_FALSE(options->seed.has_value());
    CHECK_FALSE(options->effect.has_value());
    CHECK_FALSE(options->watch);
    CHECK_FALSE(options->silent);
}

TEST_CASE("every option is recognised") {
    auto options = parse({"--settings", "/tmp/s.json", "--poem=/tmp/p.json", "--monitors", "m.json",
                          "--output-dir", "out", "--install-command", "feh --bg-fill {path}",
                          "--log-file", "vw.log", "--seed", "-7", "--effect", "blobs",
                          "--watch", "-v", "--silent", "-h"});
    REQUIRE(options.has_value());
    CHECK(options->settings_file == "/tmp/s.json");
    CHECK(options->poem_file == "/tmp/p.json");
    CHECK(options->monitors_file == "m.json");
    CHECK(options->output_dir == "out");
    CHECK(options->install_command == "feh --bg-fill {path}");
    CHECK(options->log_file == "vw.log");
    CHECK(options->seed == -7);
    CHECK(options->effect == Effects::EffectKind::Blobs);
    CHECK(options->watch);
    CHECK(options->verbose);
    CHECK(options->silent);
    CHECK(options->show_help);
}

TEST_CASE("invalid effect and unknown options fail") {
    std::vector<std::string> errors;
    CHECK_FALSE(parse({"--effect", "sparkles"}, &errors).has_value());
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].find("wave, bubbles or blobs") != std::string::npos);

    errors.clear();
    CHECK_FALSE(parse({"--fullscreen"}, &errors).has_value());
    CHECK(errors.size() == 1);

    errors.clear();
    CHECK_FALSE(parse({"--seed", "many"}, &errors).has_value());
}

TEST_CASE("usage lists the options") {
    std::ostringstream out;
    Cli::print_tool_usage(out);
    auto text = out.str();
    CHECK(text.find("--install-command") != std::string::npos);
    CHECK(text.find("--watch") != std::string::npos);
}

}
