#pragma once

/**
 * @file version.hpp
 * @brief semdiff version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace semdiff {

/// semdiff version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Rules file format understood by this build
constexpr const char* kRulesVersion = "semdiff.rules.v1";

}  // namespace semdiff
