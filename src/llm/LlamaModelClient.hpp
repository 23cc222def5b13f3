// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <llm/ModelClient.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

struct llama_model;
struct llama_context;

namespace agentshell
{

/// @brief Configuration for the llama.cpp model client.
struct LlamaModelConfig
{
    std::string modelPath;
    int contextSize = 8192;
    int gpuLayers = -1; // -1 means auto
    int threads = 0;    // 0 means auto
    float temperature = 0.7f;
    float topP = 0.9f;
    int topK = 40;
    int seed = -1; // -1 means random
    int maxTokens = 0; // 0 means up to the context size
};

/// @brief Renders the transcript into chat-template messages as (role, content) pairs.
///
/// Tool calls are rendered back into the `<tool_call>` form the model produced, adjacent
/// assistant content is merged, and tool results use the "tool" role. The tool catalog is
/// appended to the system prompt.
[[nodiscard]] auto renderChatMessages(const ModelRequest& request) -> std::vector<std::pair<std::string, std::string>>;

/// @brief Runs a local GGUF model through llama.cpp.
///
/// Only one completion runs at a time; a second completeStream() call waits until the
/// previous stream has been destroyed.
class LlamaModelClient: public ModelClient
{
  public:
    LlamaModelClient();
    ~LlamaModelClient() override;

    LlamaModelClient(const LlamaModelClient&) = delete;
    LlamaModelClient& operator=(const LlamaModelClient&) = delete;

    /// @brief Loads a GGUF model from disk.
    /// @param config The model configuration including the model path.
    /// @return Success or a ModelLoadError.
    [[nodiscard]] auto load(const LlamaModelConfig& config) -> VoidResult;

    [[nodiscard]] auto completeStream(const ModelRequest& request, std::stop_token stopToken)
        -> Result<std::unique_ptr<ModelStream>> override;

    /// @brief Returns true if a model is currently loaded.
    [[nodiscard]] auto isLoaded() const -> bool;

  private:
    struct Impl;
    class Stream;

    std::unique_ptr<Impl> _impl;
};

} // namespace agentshell
