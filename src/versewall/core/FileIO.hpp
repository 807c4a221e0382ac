#pragma once

#include "core/Error.hpp"

#include <filesystem>
#include <string>

namespace VW {

// Whole-file read. A missing file is NotFound; a read failure is TransientIO.
auto readTextFile(std::filesystem::path const& path) -> Expected<std::string>;

} // namespace VW
