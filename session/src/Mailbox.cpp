/**
 * @file Mailbox.cpp
 * @brief Mailbox implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <pxv/session/Mailbox.hpp>
#include <pxv/core/Assert.hpp>

#include <string>

namespace pxv::session {

Mailbox::Mailbox(core::u32 capacity)
    : _capacity{capacity}
    , _queue{capacity}
{
    PXV_VERIFY(capacity > 0);
}

Mailbox::~Mailbox() = default;

core::Expected<void> Mailbox::deliver(const AgentUpdate &update)
{
    if (!_open.load(std::memory_order_acquire))
    {
        return core::makeError(core::ErrorCode::kChannelClosed, "mailbox is closed");
    }
    if (!_queue.push(update))
    {
        return core::makeError(core::ErrorCode::kBufferOverflow,
                               "mailbox full (" + std::to_string(_capacity) + " updates)");
    }

    {
        std::lock_guard lock{_waitMutex};
    }
    _ready.notify_one();
    return {};
}

bool Mailbox::isOpen() const noexcept
{
    return _open.load(std::memory_order_acquire);
}

void Mailbox::close() noexcept
{
    {
        std::lock_guard lock{_waitMutex};
        _open.store(false, std::memory_order_release);
    }
    _ready.notify_all();
}

bool Mailbox::tryPop(AgentUpdate &out)
{
    return _queue.pop(out);
}

bool Mailbox::waitPop(AgentUpdate &out, std::chrono::milliseconds timeout)
{
    if (_queue.pop(out))
    {
        return true;
    }

    std::unique_lock lock{_waitMutex};
    _ready.wait_for(lock, timeout, [this] {
        return _queue.read_available() > 0 || !_open.load(std::memory_order_acquire);
    });
    lock.unlock();

    return _queue.pop(out);
}

core::usize Mailbox::size() const noexcept
{
    return _queue.read_available();
}

} // namespace pxv::session
