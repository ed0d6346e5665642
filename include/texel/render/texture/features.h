// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

// Compile-time image format features. The build defines TEXEL_FEATURE_<NAME> for every
// format whose codec is linked in.
namespace texel::render::features {

#ifdef TEXEL_FEATURE_BASIS_UNIVERSAL
inline constexpr bool kBasisUniversal = true;
#else
inline constexpr bool kBasisUniversal = false;
#endif

#ifdef TEXEL_FEATURE_BMP
inline constexpr bool kBmp = true;
#else
inline constexpr bool kBmp = false;
#endif

#ifdef TEXEL_FEATURE_PNG
inline constexpr bool kPng = true;
#else
inline constexpr bool kPng = false;
#endif

#ifdef TEXEL_FEATURE_DDS
inline constexpr bool kDds = true;
#else
inline constexpr bool kDds = false;
#endif

#ifdef TEXEL_FEATURE_TGA
inline constexpr bool kTga = true;
#else
inline constexpr bool kTga = false;
#endif

#ifdef TEXEL_FEATURE_JPEG
inline constexpr bool kJpeg = true;
#else
inline constexpr bool kJpeg = false;
#endif

#ifdef TEXEL_FEATURE_KTX2
inline constexpr bool kKtx2 = true;
#else
inline constexpr bool kKtx2 = false;
#endif

#ifdef TEXEL_FEATURE_WEBP
inline constexpr bool kWebp = true;
#else
inline constexpr bool kWebp = false;
#endif

#ifdef TEXEL_FEATURE_PNM
inline constexpr bool kPnm = true;
#else
inline constexpr bool kPnm = false;
#endif

} // namespace texel::render::features
