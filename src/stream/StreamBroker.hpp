// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stream/StreamEvent.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace agentshell
{

class StreamBroker;

/// @brief A subscriber's live feed of stream events.
///
/// Events are buffered per subscriber. When the buffer exceeds its capacity, the oldest pair
/// of adjacent assistant deltas of the same message is merged into one; other events are
/// never dropped, so the buffer may temporarily grow past its capacity.
class Subscription
{
    struct Key
    {
        explicit Key() = default;
    };

  public:
    /// @brief Constructible only through StreamBroker::subscribe().
    Subscription(Key, std::string name, std::size_t capacity);

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    [[nodiscard]] auto name() const -> const std::string&;

    /// @brief Waits up to `timeout` for the next event.
    /// @return The event, or nullopt on timeout or when the subscription is closed and drained.
    [[nodiscard]] auto next(std::chrono::milliseconds timeout) -> std::optional<StreamEvent>;

    /// @brief Waits for the next event until one arrives, the subscription closes, or stop is requested.
    [[nodiscard]] auto next(std::stop_token stopToken) -> std::optional<StreamEvent>;

    /// @brief Returns the next event without waiting.
    [[nodiscard]] auto tryNext() -> std::optional<StreamEvent>;

    /// @brief Number of buffered events.
    [[nodiscard]] auto pending() const -> std::size_t;

    /// @brief Number of deltas merged away due to backpressure.
    [[nodiscard]] auto coalescedCount() const -> std::size_t;

    /// @brief True once the broker has closed this feed.
    [[nodiscard]] auto isClosed() const -> bool;

  private:
    friend class StreamBroker;

    void deliver(const StreamEvent& event);
    void close();

    std::string _name;
    std::size_t _capacity;
    mutable std::mutex _mutex;
    std::condition_variable_any _cv;
    std::deque<StreamEvent> _buffer;
    std::size_t _coalesced = 0;
    bool _closed = false;
};

/// @brief Fans out events from the agent loop to all subscribed panes in publication order.
///
/// Publication assigns a global sequence number and delivers to every current subscriber
/// while holding the broker lock, so all subscribers observe one identical order.
/// Delivery only appends to a subscriber's buffer and never waits for the consumer.
class StreamBroker
{
  public:
    /// @param defaultCapacity Buffer capacity for subscriptions that do not specify one.
    explicit StreamBroker(std::size_t defaultCapacity = 256);
    ~StreamBroker();

    StreamBroker(const StreamBroker&) = delete;
    StreamBroker& operator=(const StreamBroker&) = delete;

    /// @brief Creates a live feed. Only events published after this call are delivered.
    [[nodiscard]] auto subscribe(std::string name, std::optional<std::size_t> capacity = std::nullopt)
        -> std::shared_ptr<Subscription>;

    /// @brief Removes and closes a feed. Buffered events remain readable.
    void unsubscribe(const std::shared_ptr<Subscription>& subscription);

    /// @brief Publishes an event of the given run to all current subscribers.
    /// @return The sequence number assigned to the event.
    auto publish(std::uint64_t runId, StreamPayload payload) -> std::uint64_t;

    [[nodiscard]] auto subscriberCount() const -> std::size_t;

    /// @brief Closes all feeds, e.g. on shutdown.
    void closeAll();

  private:
    std::size_t _defaultCapacity;
    mutable std::mutex _mutex;
    std::uint64_t _nextSequence = 1;
    std::vector<std::shared_ptr<Subscription>> _subscribers;
};

} // namespace agentshell
