#include <versewall/apply/UserNotifier.hpp>

#include "log/TaggedLogger.hpp"

namespace VW::Apply {

auto notice_kind_name(NoticeKind kind) -> std::string_view {
    switch (kind) {
    case NoticeKind::Success:
        return "success";
    case NoticeKind::Failure:
        return "failure";
    case NoticeKind::Fallback:
        return "fallback";
    }
    return "failure";
}

auto LogNotifier::notify(NoticeKind kind, std::string const& message) -> void {
    if (kind == NoticeKind::Success) {
        vw_log(message, "Notice");
    } else {
        vw_log(std::string(notice_kind_name(kind)) + ": " + message, "Notice", "Warning");
    }
}

} // namespace VW::Apply
