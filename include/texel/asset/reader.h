// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "texel/core/common.h"
#include "texel/core/result.h"

namespace texel::asset {

/**
 * @brief Failure while pulling bytes out of a Reader
 */
class IoError {
public:
    enum class Kind {
        NotFound,
        PermissionDenied,
        UnexpectedEof,
        Other
    };

    IoError(Kind kind, std::string message);

    static IoError NotFound(const std::filesystem::path& path);
    static IoError Other(std::string message);

    Kind GetKind() const { return kind_; }
    std::string Message() const { return message_; }

private:
    Kind kind_;
    std::string message_;
};

/**
 * @brief Byte source handed to asset loaders
 *
 * A reader is consumed once; ReadToEnd appends whatever is left to `buffer`.
 */
class Reader {
public:
    virtual ~Reader() = default;

    virtual core::Result<void, IoError> ReadToEnd(std::vector<u8>& buffer) = 0;
};

// In-memory reader, mostly for tests and embedded assets.
class VecReader final : public Reader {
public:
    explicit VecReader(std::vector<u8> bytes);

    core::Result<void, IoError> ReadToEnd(std::vector<u8>& buffer) override;

private:
    std::vector<u8> bytes_;
    usize position_ = 0;
};

class FileReader final : public Reader {
public:
    explicit FileReader(std::filesystem::path path);

    const std::filesystem::path& Path() const { return path_; }

    core::Result<void, IoError> ReadToEnd(std::vector<u8>& buffer) override;

private:
    std::filesystem::path path_;
    bool consumed_ = false;
};

} // namespace texel::asset
