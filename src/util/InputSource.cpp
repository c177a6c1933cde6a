#include "util/InputSource.hpp"

#include <fstream>
#include <iterator>
#include <sstream>

#include "util/Logger.hpp"

namespace gitscribe {

static Error tooLarge(const std::string& source, size_t maxBytes) {
    return Error{ErrorCode::InputTooLarge,
                 source + " exceeds the maximum input size of " + std::to_string(maxBytes) + " bytes"};
}

Expected<std::string> readFileBytes(const std::filesystem::path& filePath, size_t maxBytes) {
    std::error_code ec;
    auto size = std::filesystem::file_size(filePath, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Cannot read " + filePath.string() + ": " + ec.message()};
    }
    if (size > maxBytes) return tooLarge(filePath.string(), maxBytes);

    std::ifstream in(filePath, std::ios::binary);
    if (!in) return Error{ErrorCode::IoError, "Cannot open " + filePath.string()};
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) return Error{ErrorCode::IoError, "Failed reading " + filePath.string()};

    Logger::instance().debug("Read " + std::to_string(data.size()) + " bytes from " + filePath.string());
    return data;
}

Expected<std::string> readInput(const std::string& source, std::istream& stream, size_t maxBytes) {
    if (source.empty()) return Error{ErrorCode::InvalidArgs, "No input given"};
    if (source != "-") return readFileBytes(source, maxBytes);

    std::ostringstream buffer;
    buffer << stream.rdbuf();
    std::string data = buffer.str();
    if (data.size() > maxBytes) return tooLarge("stdin", maxBytes);
    return data;
}

}
