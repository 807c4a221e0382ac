#pragma once
#include <array>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace VW {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        InvalidArgument,
        MalformedInput,    // settings, poem, palette or layout file that does not parse
        NotFound,
        NotSupported,
        TransientIO,       // write or rename of an output file
        RenderFailed,      // scene build or rasterization of one target
        OSApiRejected,     // the wallpaper port refused an install
        FallbackTriggered, // the per-monitor path gave way to the single image
        Cancelled
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

namespace detail {
inline constexpr std::array<std::string_view, 11> kErrorCodeNames{
        "invalid_error",   "unknown_error",   "invalid_argument",   "malformed_input",
        "not_found",       "not_supported",   "transient_io",       "render_failed",
        "os_api_rejected", "fallback_triggered", "cancelled"};
} // namespace detail

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    auto index = static_cast<std::size_t>(code);
    return index < detail::kErrorCodeNames.size() ? detail::kErrorCodeNames[index] : "unknown_error";
}

// "<code>" or "<code>:<message>".
[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    std::string text{errorCodeToString(error.code)};
    if (error.message && !error.message->empty()) {
        text += ':';
        text += *error.message;
    }
    return text;
}

} // namespace VW
