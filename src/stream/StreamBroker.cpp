// SPDX-License-Identifier: Apache-2.0
#include "StreamBroker.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <utility>

namespace agentshell
{

Subscription::Subscription(Key, std::string name, std::size_t capacity):
    _name(std::move(name)), _capacity(std::max<std::size_t>(capacity, 1))
{
}

auto Subscription::name() const -> const std::string&
{
    return _name;
}

auto Subscription::next(std::chrono::milliseconds timeout) -> std::optional<StreamEvent>
{
    auto lock = std::unique_lock(_mutex);
    _cv.wait_for(lock, timeout, [this] { return !_buffer.empty() || _closed; });
    if (_buffer.empty())
        return std::nullopt;

    auto event = std::move(_buffer.front());
    _buffer.pop_front();
    return event;
}

auto Subscription::next(std::stop_token stopToken) -> std::optional<StreamEvent>
{
    auto lock = std::unique_lock(_mutex);
    _cv.wait(lock, stopToken, [this] { return !_buffer.empty() || _closed; });
    if (_buffer.empty())
        return std::nullopt;

    auto event = std::move(_buffer.front());
    _buffer.pop_front();
    return event;
}

auto Subscription::tryNext() -> std::optional<StreamEvent>
{
    auto lock = std::lock_guard(_mutex);
    if (_buffer.empty())
        return std::nullopt;

    auto event = std::move(_buffer.front());
    _buffer.pop_front();
    return event;
}

auto Subscription::pending() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return _buffer.size();
}

auto Subscription::coalescedCount() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return _coalesced;
}

auto Subscription::isClosed() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _closed;
}

void Subscription::deliver(const StreamEvent& event)
{
    {
        auto lock = std::lock_guard(_mutex);
        if (_closed)
            return;

        _buffer.push_back(event);

        // Over capacity: fold the oldest delta into its successor until we fit or nothing merges.
        while (_buffer.size() > _capacity)
        {
            auto const pair = std::ranges::adjacent_find(_buffer, canCoalesce);
            if (pair == _buffer.end())
                break;

            auto& older = std::get<AssistantDelta>(pair->payload);
            auto& newer = std::get<AssistantDelta>(std::next(pair)->payload);
            newer.text.insert(0, older.text);
            _buffer.erase(pair);
            ++_coalesced;
        }
    }
    _cv.notify_one();
}

void Subscription::close()
{
    {
        auto lock = std::lock_guard(_mutex);
        _closed = true;
    }
    _cv.notify_all();
}

StreamBroker::StreamBroker(std::size_t defaultCapacity): _defaultCapacity(defaultCapacity)
{
}

StreamBroker::~StreamBroker()
{
    closeAll();
}

auto StreamBroker::subscribe(std::string name, std::optional<std::size_t> capacity)
    -> std::shared_ptr<Subscription>
{
    auto subscription =
        std::make_shared<Subscription>(Subscription::Key {}, std::move(name), capacity.value_or(_defaultCapacity));

    auto lock = std::lock_guard(_mutex);
    _subscribers.push_back(subscription);
    log::debug("Stream subscriber '{}' attached", subscription->name());
    return subscription;
}

void StreamBroker::unsubscribe(const std::shared_ptr<Subscription>& subscription)
{
    if (!subscription)
        return;

    {
        auto lock = std::lock_guard(_mutex);
        std::erase(_subscribers, subscription);
    }
    subscription->close();
    log::debug("Stream subscriber '{}' detached", subscription->name());
}

auto StreamBroker::publish(std::uint64_t runId, StreamPayload payload) -> std::uint64_t
{
    auto lock = std::lock_guard(_mutex);
    auto const event = StreamEvent {
        .sequence = _nextSequence++,
        .runId = runId,
        .payload = std::move(payload),
    };

    for (const auto& subscriber: _subscribers)
        subscriber->deliver(event);

    return event.sequence;
}

auto StreamBroker::subscriberCount() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return _subscribers.size();
}

void StreamBroker::closeAll()
{
    auto subscribers = std::vector<std::shared_ptr<Subscription>> {};
    {
        auto lock = std::lock_guard(_mutex);
        subscribers.swap(_subscribers);
    }
    for (const auto& subscriber: subscribers)
        subscriber->close();
}

} // namespace agentshell
