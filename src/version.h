/**
 * @file version.h
 * @brief memex version information
 */

#pragma once

#include <string>

namespace memex {

/**
 * @brief Version information
 *
 * This is the software version written into the repository header's creator
 * field. The on-disk format has its own version (see repository_format.h).
 */
class Version {
 public:
  /**
   * @brief Get version string
   * @return Version string (e.g., "0.1.0")
   */
  static std::string String() { return "0.1.0"; }

  /**
   * @brief Creator string stored in new repository headers
   */
  static std::string Creator() { return "memex " + String(); }
};

}  // namespace memex
