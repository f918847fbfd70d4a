// File: src/support/cancellation.hpp
// Purpose: Cooperative cancellation shared between an invocation, the
//          conversions it performs and the action it finally runs.
// Key invariants: Cancellation is one-way; a token never becomes uncancelled.
// Ownership/Lifetime: Source and tokens share the flag; any of them may
//                     outlive the others.
// Links: DESIGN.md
#pragma once

#include <atomic>
#include <memory>
#include <stdexcept>

namespace arbiter::support
{

/// @brief Read-only view of a cancellation flag.
/// @details A default-constructed token is never cancelled.
class CancellationToken
{
  public:
    CancellationToken() = default;

    /// @brief True once the owning source has requested cancellation.
    bool isCancellationRequested() const noexcept
    {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

    /// @brief True when the token is attached to a source.
    bool canBeCancelled() const noexcept
    {
        return flag_ != nullptr;
    }

  private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
        : flag_(std::move(flag))
    {
    }

    std::shared_ptr<const std::atomic<bool>> flag_;
};

/// @brief Owner side of a cancellation flag.
class CancellationSource
{
  public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    /// @brief Token observing this source.
    CancellationToken token() const
    {
        return CancellationToken(flag_);
    }

    /// @brief Request cancellation; idempotent.
    void cancel() noexcept
    {
        flag_->store(true, std::memory_order_release);
    }

    bool isCancellationRequested() const noexcept
    {
        return flag_->load(std::memory_order_acquire);
    }

  private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/// @brief Raised through futures of work abandoned because of cancellation.
class OperationCancelled : public std::runtime_error
{
  public:
    OperationCancelled() : std::runtime_error("operation cancelled") {}
};

} // namespace arbiter::support
