// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agentshell/Console.hpp>
#include <stream/StreamBroker.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace agentshell
{

/// @brief A view fed by its own StreamBroker subscription on its own thread.
///
/// Derived panes must call stop() in their destructor, before their own members go away.
class Pane
{
  public:
    Pane(std::string name, Console& console);
    virtual ~Pane();

    Pane(const Pane&) = delete;
    Pane& operator=(const Pane&) = delete;

    [[nodiscard]] auto name() const -> const std::string& { return _name; }

    /// @brief Subscribes to the broker and starts rendering on a worker thread.
    void start(StreamBroker& broker, std::optional<std::size_t> capacity = std::nullopt);

    /// @brief Unsubscribes and joins the worker. Idempotent.
    void stop();

    /// @brief Renders a single event.
    virtual void render(const StreamEvent& event) = 0;

  protected:
    [[nodiscard]] auto console() -> Console& { return _console; }

  private:
    std::string _name;
    Console& _console;
    StreamBroker* _broker = nullptr;
    std::shared_ptr<Subscription> _subscription;
    std::jthread _worker;
};

/// @brief The conversation: streamed assistant text, tool activity and run outcomes.
class ChatPane final: public Pane
{
  public:
    explicit ChatPane(Console& console);
    ~ChatPane() override;

    void render(const StreamEvent& event) override;

  private:
    bool _inMessage = false;

    void endMessage();
};

/// @brief File activity of the file tools: what was read, written or patched.
class EditorPane final: public Pane
{
  public:
    explicit EditorPane(Console& console, std::size_t previewLines = 20);
    ~EditorPane() override;

    void render(const StreamEvent& event) override;

  private:
    std::size_t _previewLines;
};

/// @brief Commands run by the terminal tool and their output.
class TerminalPane final: public Pane
{
  public:
    explicit TerminalPane(Console& console, std::size_t maxLines = 40);
    ~TerminalPane() override;

    void render(const StreamEvent& event) override;

  private:
    std::size_t _maxLines;
};

} // namespace agentshell
