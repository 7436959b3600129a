/**
 * @file fd_guard.h
 * @brief RAII guards for file descriptors and cleanup actions
 *
 * The repository file, the chunk store and the action log each hold a raw
 * POSIX descriptor so that writes can be followed by fsync(); these guards
 * keep the descriptors and temporary files from leaking on error paths.
 */

#pragma once

#include <unistd.h>

#include <utility>

namespace memex::utils {

/**
 * @brief RAII guard for file descriptors
 *
 * Closes the descriptor when the guard goes out of scope unless ownership
 * was handed over with Release().
 *
 * Usage:
 * @code
 * FDGuard guard{::open(path.c_str(), O_RDWR | O_CLOEXEC)};
 * if (guard.Get() < 0) {
 *   return MakeUnexpected(...);
 * }
 * store.fd_ = std::move(guard);
 * @endcode
 */
class FDGuard {
 public:
  /**
   * @brief Construct a guard for the given file descriptor
   * @param file_descriptor File descriptor to guard (-1 for invalid)
   */
  explicit FDGuard(int file_descriptor = -1) : fd_(file_descriptor) {}

  /**
   * @brief Destructor - closes FD if not released
   */
  ~FDGuard() {
    if (fd_ >= 0 && !released_) {
      close(fd_);
    }
  }

  // Disable copy
  FDGuard(const FDGuard&) = delete;
  FDGuard& operator=(const FDGuard&) = delete;

  // Enable move
  FDGuard(FDGuard&& other) noexcept : fd_(other.fd_), released_(other.released_) {
    other.fd_ = -1;
    other.released_ = true;
  }

  FDGuard& operator=(FDGuard&& other) noexcept {
    if (this != &other) {
      // Close current FD if owned
      if (fd_ >= 0 && !released_) {
        close(fd_);
      }
      fd_ = other.fd_;
      released_ = other.released_;
      other.fd_ = -1;
      other.released_ = true;
    }
    return *this;
  }

  /**
   * @brief Release ownership of the FD (won't be closed on destruction)
   */
  void Release() { released_ = true; }

  /**
   * @brief Close the descriptor now
   * @return 0 on success (or when nothing is owned), -1 with errno set on failure
   */
  int Close() {
    int result = 0;
    if (fd_ >= 0 && !released_) {
      result = close(fd_);
    }
    fd_ = -1;
    released_ = false;
    return result;
  }

  /**
   * @brief Get the file descriptor
   */
  [[nodiscard]] int Get() const { return fd_; }

  /**
   * @brief Whether a descriptor is held
   */
  [[nodiscard]] bool IsValid() const { return fd_ >= 0; }

 private:
  int fd_ = -1;
  bool released_ = false;
};

/**
 * @brief RAII guard for generic cleanup actions
 *
 * Runs the cleanup function on scope exit unless released.
 *
 * Usage:
 * @code
 * ScopeGuard remove_tmp([&]() { std::filesystem::remove(tmp_path, ec); });
 * // ... write and fsync tmp_path ...
 * std::filesystem::rename(tmp_path, final_path);
 * remove_tmp.Release();
 * @endcode
 */
template <typename CleanupFunc>
class ScopeGuard {
 public:
  /**
   * @brief Construct a guard with a cleanup function
   * @param cleanup Function to call on destruction
   */
  explicit ScopeGuard(CleanupFunc cleanup) : cleanup_(std::move(cleanup)) {}

  /**
   * @brief Destructor - calls cleanup function if not released
   */
  ~ScopeGuard() {
    if (!released_) {
      cleanup_();
    }
  }

  // Disable copy
  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;

  // Enable move
  ScopeGuard(ScopeGuard&& other) noexcept : cleanup_(std::move(other.cleanup_)), released_(other.released_) {
    other.released_ = true;
  }

  ScopeGuard& operator=(ScopeGuard&& other) noexcept {
    if (this != &other) {
      if (!released_) {
        cleanup_();
      }
      cleanup_ = std::move(other.cleanup_);
      released_ = other.released_;
      other.released_ = true;
    }
    return *this;
  }

  /**
   * @brief Release the guard (cleanup won't be called)
   */
  void Release() { released_ = true; }

 private:
  CleanupFunc cleanup_;
  bool released_ = false;
};

}  // namespace memex::utils
