#include "core/FileIO.hpp"

#include <fstream>
#include <sstream>

namespace VW {

auto readTextFile(std::filesystem::path const& path) -> Expected<std::string> {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::unexpected(Error{Error::Code::NotFound, "File not found: " + path.string()});
    }
    std::ostringstream oss;
    oss << stream.rdbuf();
    if (!stream.good() && !stream.eof()) {
        return std::unexpected(Error{Error::Code::TransientIO, "Failed to read file: " + path.string()});
    }
    return oss.str();
}

} // namespace VW
