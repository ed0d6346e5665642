// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "texel/asset/reader.h"

#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace texel::asset {

IoError::IoError(Kind kind, std::string message) : kind_(kind), message_(std::move(message)) {}

IoError IoError::NotFound(const std::filesystem::path& path) {
    return IoError(Kind::NotFound, fmt::format("file not found: {}", path.string()));
}

IoError IoError::Other(std::string message) {
    return IoError(Kind::Other, std::move(message));
}

VecReader::VecReader(std::vector<u8> bytes) : bytes_(std::move(bytes)) {}

core::Result<void, IoError> VecReader::ReadToEnd(std::vector<u8>& buffer) {
    buffer.insert(buffer.end(), bytes_.begin() + static_cast<std::ptrdiff_t>(position_), bytes_.end());
    position_ = bytes_.size();
    return core::Result<void, IoError>::Ok();
}

FileReader::FileReader(std::filesystem::path path) : path_(std::move(path)) {}

core::Result<void, IoError> FileReader::ReadToEnd(std::vector<u8>& buffer) {
    using R = core::Result<void, IoError>;

    if (consumed_) {
        return R::Ok();
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec)) {
        return R::Err(IoError::NotFound(path_));
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        return R::Err(IoError(IoError::Kind::PermissionDenied,
            fmt::format("failed to open file: {}", path_.string())));
    }

    const auto size = std::filesystem::file_size(path_, ec);
    if (!ec) {
        buffer.reserve(buffer.size() + static_cast<usize>(size));
    }

    buffer.insert(buffer.end(), std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return R::Err(IoError::Other(fmt::format("failed to read file: {}", path_.string())));
    }

    consumed_ = true;
    return R::Ok();
}

} // namespace texel::asset
