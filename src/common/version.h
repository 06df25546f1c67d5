#pragma once

// otalink version information.

namespace otalink {

constexpr int kVersionMajor = 1;
constexpr int kVersionMinor = 0;
constexpr int kVersionPatch = 0;

constexpr const char* kVersionString = "1.0.0";
constexpr const char* kFullVersionString = "otalink 1.0.0";

#ifndef OTALINK_BUILD_TYPE
#define OTALINK_BUILD_TYPE "Release"
#endif

constexpr const char* kBuildType = OTALINK_BUILD_TYPE;

}  // namespace otalink
