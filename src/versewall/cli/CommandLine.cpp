#include "CommandLine.hpp"

#include <charconv>
#include <iostream>
#include <utility>

namespace VW::Cli {
namespace {

auto is_option_token(std::string_view token) -> bool {
    return token.size() > 1 && token.starts_with("--");
}

auto basename_of(std::string_view path) -> std::string_view {
    auto slash = path.find_last_of('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

struct SplitToken {
    std::string_view                name;
    std::optional<std::string_view> value;
};

auto split_token(std::string_view token) -> SplitToken {
    auto eq = token.find('=');
    if (eq == std::string_view::npos) {
        return {token, std::nullopt};
    }
    return {token.substr(0, eq), token.substr(eq + 1)};
}

} // namespace

CommandLine::CommandLine()
    : unknown_([this](std::string_view token) {
          report("unknown argument '" + std::string(token) + "'");
          return false;
      }) {}

auto CommandLine::set_program_name(std::string_view name) -> void {
    program_ = std::string(name);
}

auto CommandLine::set_unknown_argument_handler(UnknownHandler handler) -> void {
    unknown_ = std::move(handler);
}

auto CommandLine::set_error_logger(ErrorLogger logger) -> void {
    logger_ = std::move(logger);
}

auto CommandLine::add_flag(std::string_view name, FlagOption option) -> void {
    add_option(Option{.name = std::string(name), .on_flag = std::move(option.on_set)});
}

auto CommandLine::add_value(std::string_view name, ValueOption option) -> void {
    add_option(Option{.name           = std::string(name),
                      .takes_value    = true,
                      .value_optional = option.value_optional,
                      .on_value       = std::move(option.on_value)});
}

auto CommandLine::add_string(std::string_view name, std::string& target) -> void {
    add_value(name, {.on_value = [label = std::string(name), &target](std::optional<std::string_view> value) -> ParseError {
        if (!value || value->empty()) {
            return label + " requires a value";
        }
        target = std::string(*value);
        return std::nullopt;
    }});
}

auto CommandLine::add_int(std::string_view name, IntOption option) -> void {
    auto handler = [label = std::string(name), sink = std::move(option.on_value)](std::optional<std::string_view> value) -> ParseError {
        if (!value || value->empty()) {
            return label + " requires an integer value";
        }
        int  parsed = 0;
        auto last   = value->data() + value->size();
        auto [ptr, ec] = std::from_chars(value->data(), last, parsed);
        if (ec != std::errc{} || ptr != last) {
            return label + " expects an integer value";
        }
        if (sink) {
            sink(parsed);
        }
        return std::nullopt;
    };
    add_value(name, {.on_value = std::move(handler)});
}

auto CommandLine::add_alias(std::string_view alias, std::string_view target) -> void {
    auto found = index_.find(std::string(target));
    if (found == index_.end()) {
        fail("alias " + std::string(alias) + " names unknown option " + std::string(target));
        return;
    }
    index_.emplace(std::string(alias), found->second);
}

auto CommandLine::parse(int argc, char const* const* argv) -> bool {
    failed_ = false;
    if (program_.empty() && argc > 0 && argv[0] != nullptr) {
        program_ = std::string(basename_of(argv[0]));
    }

    int i = 1;
    while (i < argc) {
        std::string_view token{argv[i++]};
        auto [name, value] = split_token(token);

        auto* option = lookup(name);
        if (option == nullptr) {
            if (unknown_ && !unknown_(token)) {
                failed_ = true;
            }
            continue;
        }

        if (!option->takes_value) {
            if (value) {
                fail(option->name + " does not accept a value");
            } else if (option->on_flag) {
                option->on_flag();
            }
            continue;
        }

        if (!value && i < argc && !is_option_token(argv[i])) {
            value = std::string_view{argv[i++]};
        }
        if (!value && !option->value_optional) {
            fail(option->name + " requires a value");
            continue;
        }
        if (!option->on_value) {
            continue;
        }
        if (auto error = option->on_value(value)) {
            fail(*error);
        }
    }
    return !failed_;
}

auto CommandLine::option_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(options_.size());
    for (auto const& option : options_) {
        names.push_back(option.name);
    }
    return names;
}

auto CommandLine::add_option(Option option) -> void {
    index_[option.name] = options_.size();
    options_.push_back(std::move(option));
}

auto CommandLine::lookup(std::string_view name) -> Option* {
    auto found = index_.find(std::string(name));
    return found == index_.end() ? nullptr : &options_[found->second];
}

auto CommandLine::report(std::string_view message) -> void {
    auto line = (program_.empty() ? std::string("versewall") : program_) + ": " + std::string(message);
    if (logger_) {
        logger_(line);
        return;
    }
    std::cerr << line << '\n';
}

auto CommandLine::fail(std::string_view message) -> void {
    failed_ = true;
    report(message);
}

} // namespace VW::Cli
