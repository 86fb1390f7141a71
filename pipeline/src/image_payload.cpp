#include "editrelay/pipeline/core.hpp"
#include <caf/error.hpp>
#include <caf/sec.hpp>
#include <fstream>
#include <iterator>
#include <system_error>

namespace editrelay {
namespace pipeline {

caf::expected<ImagePayload> ImagePayload::from_file(const std::filesystem::path& path,
                                                    std::size_t max_bytes) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return caf::make_error(caf::sec::invalid_argument, "Image file not found: " + path.string());
    }

    auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        return caf::make_error(caf::sec::runtime_error,
                               "Cannot determine image size: " + path.string() + " (" + ec.message() + ")");
    }
    if (file_size > max_bytes) {
        return caf::make_error(caf::sec::invalid_argument,
                               "Image exceeds the size limit of " + std::to_string(max_bytes) +
                                   " bytes: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return caf::make_error(caf::sec::runtime_error, "Cannot open image file: " + path.string());
    }

    std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return caf::make_error(caf::sec::runtime_error, "Failed to read image file: " + path.string());
    }

    return ImagePayload(std::move(bytes), path.filename().string());
}

} // namespace pipeline
} // namespace editrelay
