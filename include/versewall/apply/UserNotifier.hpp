#pragma once

#include <string>
#include <string_view>

namespace VW::Apply {

enum class NoticeKind {
    Success,
    Failure,
    Fallback,
};

auto notice_kind_name(NoticeKind kind) -> std::string_view;

// Surfaces apply outcomes to the user. Only called for non-silent requests.
class UserNotifier {
public:
    virtual ~UserNotifier() = default;
    virtual auto notify(NoticeKind kind, std::string const& message) -> void = 0;
};

// Writes notices through the logger with the "Notice" tag.
class LogNotifier final : public UserNotifier {
public:
    auto notify(NoticeKind kind, std::string const& message) -> void override;
};

} // namespace VW::Apply
