#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace VW::Cli {

/**
 * CommandLine - long-option parser for the versewall tool.
 *
 * Accepts "--name value", "--name=value" and bare flags. Only tokens that
 * start with "--" are treated as options when looking ahead for a value, so
 * negative numbers can be passed separately. Every problem is reported
 * through the error logger as "<program>: <message>" and parsing continues.
 */
class CommandLine {
public:
    using ParseError     = std::optional<std::string>;
    using ValueHandler   = std::function<ParseError(std::optional<std::string_view>)>;
    using UnknownHandler = std::function<bool(std::string_view)>;
    using ErrorLogger    = std::function<void(std::string const&)>;

    struct FlagOption {
        std::function<void()> on_set;
    };

    struct ValueOption {
        ValueHandler on_value;
        // When true a missing value reaches on_value as std::nullopt.
        bool value_optional = false;
    };

    struct IntOption {
        std::function<void(int)> on_value;
    };

    CommandLine();

    auto set_program_name(std::string_view name) -> void;
    // Returning false from the handler marks the parse as failed.
    auto set_unknown_argument_handler(UnknownHandler handler) -> void;
    auto set_error_logger(ErrorLogger logger) -> void;

    auto add_flag(std::string_view name, FlagOption option) -> void;
    auto add_value(std::string_view name, ValueOption option) -> void;
    auto add_string(std::string_view name, std::string& target) -> void;
    auto add_int(std::string_view name, IntOption option) -> void;
    auto add_alias(std::string_view alias, std::string_view target) -> void;

    [[nodiscard]] auto parse(int argc, char const* const* argv) -> bool;
    [[nodiscard]] auto had_errors() const -> bool { return failed_; }
    // Registration order, aliases excluded.
    [[nodiscard]] auto option_names() const -> std::vector<std::string>;

private:
    struct Option {
        std::string           name;
        bool                  takes_value    = false;
        bool                  value_optional = false;
        std::function<void()> on_flag;
        ValueHandler          on_value;
    };

    auto add_option(Option option) -> void;
    auto lookup(std::string_view name) -> Option*;
    auto report(std::string_view message) -> void;
    auto fail(std::string_view message) -> void;

    std::vector<Option>                          options_;
    std::unordered_map<std::string, std::size_t> index_;
    std::string                                  program_;
    UnknownHandler                               unknown_;
    ErrorLogger                                  logger_;
    bool                                         failed_ = false;
};

} // namespace VW::Cli
