#include "dbjob/cancellation.h"
#include "dbjob/log/log.h"


CancellationToken::CancellationToken(std::shared_ptr<cancellation::State> state_)
    : state(std::move(state_))
{
}

bool CancellationToken::isCancellationRequested() const noexcept {
    return (state && state->canceled.load());
}

bool CancellationToken::canBeCanceled() const noexcept {
    return static_cast<bool>(state);
}

CancellationRegistration CancellationToken::registerCallback(std::function<void()> callback) const {
    if (!state || !callback)
        return CancellationRegistration{};

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (!state->canceled) {
            const auto id = ++state->last_callback_id;
            state->callbacks.emplace(id, std::move(callback));
            return CancellationRegistration{state, id};
        }
    }

    callback();
    return CancellationRegistration{};
}

CancellationSource::CancellationSource()
    : state(std::make_shared<cancellation::State>())
{
}

CancellationToken CancellationSource::getToken() const {
    return CancellationToken{state};
}

// Callbacks run under the state lock, so a registration that has been reset is never invoked afterwards.
void CancellationSource::cancel() {
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->canceled.exchange(true))
        return;

    for (auto & callback : state->callbacks) {
        try {
            callback.second();
        }
        catch (const std::exception & ex) {
            LOG("Cancellation callback failed: " << ex.what());
        }
    }

    state->callbacks.clear();
}

bool CancellationSource::isCancellationRequested() const noexcept {
    return state->canceled.load();
}

CancellationRegistration::CancellationRegistration(std::weak_ptr<cancellation::State> state_, std::uint64_t id_)
    : state(std::move(state_))
    , id(id_)
{
}

CancellationRegistration::CancellationRegistration(CancellationRegistration && other) noexcept
    : state(std::move(other.state))
    , id(other.id)
{
    other.id = 0;
}

CancellationRegistration & CancellationRegistration::operator= (CancellationRegistration && other) noexcept {
    if (this != &other) {
        reset();
        state = std::move(other.state);
        id = other.id;
        other.id = 0;
    }
    return *this;
}

CancellationRegistration::~CancellationRegistration() {
    reset();
}

void CancellationRegistration::reset() {
    if (id == 0)
        return;

    if (auto locked_state = state.lock()) {
        std::lock_guard<std::mutex> lock(locked_state->mutex);
        locked_state->callbacks.erase(id);
    }

    state.reset();
    id = 0;
}
