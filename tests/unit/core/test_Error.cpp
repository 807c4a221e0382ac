#include "core/Error.hpp"
#include "core/FileIO.hpp"

#include "VerseWallTestHelper.hpp"

#include <doctest/doctest.h>

#include <utility>
#include <vector>

using namespace VW;

TEST_SUITE("core.error") {
    TEST_CASE("every code has a stable label") {
        std::vector<std::pair<Error::Code, std::string_view>> const expected{
                {Error::Code::InvalidError, "invalid_error"},
                {Error::Code::UnknownError, "unknown_error"},
                {Error::Code::InvalidArgument, "invalid_argument"},
                {Error::Code::MalformedInput, "malformed_input"},
                {Error::Code::NotFound, "not_found"},
                {Error::Code::NotSupported, "not_supported"},
                {Error::Code::TransientIO, "transient_io"},
                {Error::Code::RenderFailed, "render_failed"},
                {Error::Code::OSApiRejected, "os_api_rejected"},
                {Error::Code::FallbackTriggered, "fallback_triggered"},
                {Error::Code::Cancelled, "cancelled"},
        };
        for (auto const& [code, label] : expected) {
            CAPTURE(label);
            CHECK(errorCodeToString(code) == label);
            CHECK(describeError(Error{code, ""}) == label);
        }
        CHECK(errorCodeToString(static_cast<Error::Code>(999)) == "unknown_error");
    }

    TEST_CASE("describeError appends the message") {
        CHECK(describeError(Error{Error::Code::OSApiRejected, "refused"}) == "os_api_rejected:refused");
        CHECK(describeError(Error{Error::Code::RenderFailed, "DISPLAY2"}) == "render_failed:DISPLAY2");
    }

    TEST_CASE("readTextFile distinguishes missing files") {
        Test::TempDir dir("versewall_fileio");
        auto missing = readTextFile(dir.path / "missing.txt");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::NotFound);

        auto path = dir.path / "poem.txt";
        Test::write_text(path, "月落乌啼霜满天");
        auto text = readTextFile(path);
        REQUIRE(text.has_value());
        CHECK(*text == "月落乌啼霜满天");
    }
}
