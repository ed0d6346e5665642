// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

namespace texel
{

/**
 * @brief Base exception class for texel errors
 */
class TexelError : public std::runtime_error
{
public:
    explicit TexelError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Asset loading errors
 */
class AssetError : public TexelError
{
public:
    explicit AssetError(const std::string& message) : TexelError("Asset error: " + message) {}
};

/**
 * @brief Configuration errors
 */
class ConfigError : public TexelError
{
public:
    explicit ConfigError(const std::string& message) : TexelError("Config error: " + message) {}
};

} // namespace texel
