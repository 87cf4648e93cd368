#pragma once

#include "dbjob/platform/platform.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

#include <cstdint>

class CancellationRegistration;

namespace cancellation {

    struct State {
        std::atomic<bool> canceled{false};
        std::mutex mutex;
        std::uint64_t last_callback_id = 0;
        std::map<std::uint64_t, std::function<void()>> callbacks;
    };

} // namespace cancellation

// Cooperative cancellation flag, cheap to copy. A default constructed token is never canceled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancellationRequested() const noexcept;
    bool canBeCanceled() const noexcept;

    // The callback is invoked once, on the thread that requests cancellation,
    // or immediately if cancellation was already requested.
    CancellationRegistration registerCallback(std::function<void()> callback) const;

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<cancellation::State> state_);

    std::shared_ptr<cancellation::State> state;
};

class CancellationSource {
public:
    CancellationSource();

    CancellationToken getToken() const;
    void cancel();
    bool isCancellationRequested() const noexcept;

private:
    std::shared_ptr<cancellation::State> state;
};

// Unregisters the callback on destruction.
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    CancellationRegistration(std::weak_ptr<cancellation::State> state_, std::uint64_t id_);

    CancellationRegistration(const CancellationRegistration &) = delete;
    CancellationRegistration & operator= (const CancellationRegistration &) = delete;

    CancellationRegistration(CancellationRegistration && other) noexcept;
    CancellationRegistration & operator= (CancellationRegistration && other) noexcept;

    ~CancellationRegistration();

    void reset();

private:
    std::weak_ptr<cancellation::State> state;
    std::uint64_t id = 0;
};
