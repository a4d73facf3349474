/** LICENSE TEMPLATE */
#pragma once
#include <utility>

template <typename DeferFn> class ScopedDefer
{
public:
  ScopedDefer(const ScopedDefer &) = delete;
  ScopedDefer &operator=(const ScopedDefer &) = delete;

  explicit ScopedDefer(DeferFn &&fn) noexcept : defer_fn(std::move(fn)) {}
  ~ScopedDefer() noexcept
  {
    if (!mCancelled) {
      defer_fn();
    }
  }

  // Disarms the deferred call, e.g. once ownership of what it was guarding has been handed off.
  void
  Cancel() noexcept
  {
    mCancelled = true;
  }

private:
  DeferFn defer_fn;
  bool mCancelled{ false };
};
