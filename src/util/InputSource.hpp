#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>

#include "util/Expected.hpp"

namespace gitscribe {

/**
 * @brief Load captured tool output for decoding
 *
 * The decoders work on fully buffered text. Input comes from a file written
 * by the process collaborator or, when the path is "-", from a stream
 * (normally stdin).
 *
 * @param source File path, or "-" to read the stream
 * @param stream Stream used for "-"
 * @param maxBytes Reject input larger than this with ErrorCode::InputTooLarge
 * @return Raw bytes (NUL bytes preserved), or an error
 */
Expected<std::string> readInput(const std::string& source, std::istream& stream, size_t maxBytes);

/// Read a whole file; IoError if it cannot be opened or read.
Expected<std::string> readFileBytes(const std::filesystem::path& filePath, size_t maxBytes);

}
