#include <doctest/doctest.h>

#include "VerseWallTestHelper.hpp"

#include <versewall/render/AtomicFileWriter.hpp>

#include <string_view>

using namespace VW;
using VW::Render::AtomicFileWriter;

namespace {

auto bytes_of(std::string_view text) -> std::vector<std::uint8_t> {
    return {text.begin(), text.end()};
}

} // namespace

TEST_SUITE("render.atomic_writer") {

TEST_CASE("write replaces the file and leaves no temp behind") {
    Test::TempDir dir("versewall_atomic");
    AtomicFileWriter writer;
    auto target = dir.path / "nested" / "wallpaper.png";

    REQUIRE(writer.write(target, bytes_of("first")).has_value());
    REQUIRE(writer.write(target, bytes_of("second")).has_value());

    CHECK(Test::read_bytes(target) == bytes_of("second"));
    CHECK(Test::files_in(target.parent_path()) == std::set<std::string>{"wallpaper.png"});
}

TEST_CASE("a refused rename falls back to copy and delete") {
    Test::TempDir dir("versewall_atomic_copy");
    int renames = 0;
    AtomicFileWriter writer([&](std::filesystem::path const&, std::filesystem::path const&) {
        ++renames;
        return std::make_error_code(std::errc::cross_device_link);
    }, false);
    auto final_path = dir.path / "wallpaper.png";
    auto temp_path = dir.path / "wallpaper_0_batch.tmp.png";
    Test::write_text(final_path, "old");

    REQUIRE(writer.write_temp(temp_path, bytes_of("new")).has_value());
    REQUIRE(writer.commit(temp_path, final_path).has_value());

    CHECK(renames == 1);
    CHECK(Test::read_bytes(final_path) == bytes_of("new"));
    CHECK_FALSE(std::filesystem::exists(temp_path));
}

TEST_CASE("committing a missing temp file fails with TransientIO") {
    Test::TempDir dir("versewall_atomic_missing");
    AtomicFileWriter writer;
    auto result = writer.commit(dir.path / "absent.tmp", dir.path / "final.png");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::TransientIO);
    CHECK_FALSE(std::filesystem::exists(dir.path / "final.png"));
}

TEST_CASE("writing below a regular file fails without leaving debris") {
    Test::TempDir dir("versewall_atomic_blocked");
    Test::write_text(dir.path / "blocker", "x");
    AtomicFileWriter writer;
    auto result = writer.write(dir.path / "blocker" / "out.png", bytes_of("data"));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::TransientIO);
    CHECK(Test::files_in(dir.path) == std::set<std::string>{"blocker"});
}

TEST_CASE("a failed temp write keeps the previous file") {
    Test::TempDir dir("versewall_atomic_keep");
    AtomicFileWriter writer;
    auto target = dir.path / "wallpaper.png";
    REQUIRE(writer.write(target, bytes_of("previous")).has_value());

    // A directory in the temp file's place makes the open fail.
    auto temp_path = dir.path / "wallpaper.png.tmp";
    std::filesystem::create_directory(temp_path);
    auto result = writer.write(target, bytes_of("replacement"));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::TransientIO);

    CHECK(Test::read_bytes(target) == bytes_of("previous"));
    CHECK(Test::files_in(dir.path) == std::set<std::string>{"wallpaper.png"});
}

TEST_CASE("a failed commit removes the temp file") {
    Test::TempDir dir("versewall_atomic_commit");
    AtomicFileWriter writer([](std::filesystem::path const&, std::filesystem::path const&) {
        return std::make_error_code(std::errc::cross_device_link);
    }, false);
    // The canonical path is a non-empty directory, so the copy fallback fails too.
    auto target = dir.path / "wallpaper.png";
    Test::write_text(target / "keep.txt", "previous");

    auto result = writer.write(target, bytes_of("replacement"));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::TransientIO);

    CHECK(Test::read_bytes(target / "keep.txt") == bytes_of("previous"));
    CHECK(Test::files_in(dir.path) == std::set<std::string>{"wallpaper.png"});
}

}
