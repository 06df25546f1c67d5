#pragma once

#include <cassert>
#include <thread>

namespace otalink::utils {

/**
 * Records the thread that constructed it and asserts, in debug builds, that
 * later check() calls come from that same thread. Used by components whose
 * state machine is driven from a single thread of control.
 *
 * In release builds (NDEBUG defined) every operation is a no-op.
 */
class ThreadChecker {
 public:
#ifndef NDEBUG
  ThreadChecker() noexcept : owner_(std::this_thread::get_id()) {}

  // The moved-to checker owns the thread; the source accepts any thread.
  ThreadChecker(ThreadChecker&& other) noexcept : owner_(other.owner_) { other.detach(); }
  ThreadChecker& operator=(ThreadChecker&& other) noexcept {
    if (this != &other) {
      owner_ = other.owner_;
      other.detach();
    }
    return *this;
  }

  ThreadChecker(const ThreadChecker&) = delete;
  ThreadChecker& operator=(const ThreadChecker&) = delete;

  void check() const noexcept {
    assert(is_owner_thread() && "ThreadChecker: called from wrong thread!");
  }

  // A detached checker binds to whichever thread asks first.
  [[nodiscard]] bool is_owner_thread() const noexcept {
    return owner_ == std::thread::id{} || owner_ == std::this_thread::get_id();
  }

  void detach() noexcept { owner_ = std::thread::id{}; }
  void rebind_to_current() noexcept { owner_ = std::this_thread::get_id(); }

 private:
  std::thread::id owner_;

#else  // NDEBUG

 public:
  ThreadChecker() noexcept = default;
  ThreadChecker(ThreadChecker&&) noexcept = default;
  ThreadChecker& operator=(ThreadChecker&&) noexcept = default;
  ThreadChecker(const ThreadChecker&) = delete;
  ThreadChecker& operator=(const ThreadChecker&) = delete;

  void check() const noexcept {}
  [[nodiscard]] static constexpr bool is_owner_thread() noexcept { return true; }
  void detach() noexcept {}
  void rebind_to_current() noexcept {}

#endif  // NDEBUG
};

}  // namespace otalink::utils

// OTALINK_THREAD_CHECKER(name)   declare a checker member (debug only)
// OTALINK_DCHECK_THREAD(checker) assert the calling thread owns the checker
#ifndef NDEBUG
#define OTALINK_THREAD_CHECKER(name) ::otalink::utils::ThreadChecker name
#define OTALINK_DCHECK_THREAD(checker) (checker).check()
#else
#define OTALINK_THREAD_CHECKER(name) static_assert(true, "")
#define OTALINK_DCHECK_THREAD(checker) ((void)0)
#endif
