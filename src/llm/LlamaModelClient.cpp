// SPDX-License-Identifier: Apache-2.0
#include "LlamaModelClient.hpp"

#include <core/Log.hpp>
#include <llm/ToolCallParser.hpp>
#include <tools/ToolSchema.hpp>

#include <llama.h>

#include <algorithm>
#include <array>
#include <deque>
#include <format>
#include <optional>
#include <thread>

namespace agentshell
{

struct LlamaModelClient::Impl
{
    llama_model* model = nullptr;
    llama_context* ctx = nullptr;
    LlamaModelConfig config;
    std::mutex generationMutex;
    std::atomic<std::uint64_t> nextCallId = 1;

    ~Impl()
    {
        if (ctx)
            llama_free(ctx);
        if (model)
            llama_model_free(model);
    }
};

namespace
{

    /// @brief Line buffer for llama.cpp log continuation messages.
    auto llamaLineBuffer = std::string {};

    auto mapGgmlLevel(ggml_log_level level) -> std::optional<log::Level>
    {
        switch (level)
        {
            case GGML_LOG_LEVEL_ERROR: return log::Level::Error;
            case GGML_LOG_LEVEL_WARN: return log::Level::Warning;
            case GGML_LOG_LEVEL_INFO: return log::Level::Debug;
            case GGML_LOG_LEVEL_DEBUG: return log::Level::Trace;
            default: return std::nullopt;
        }
    }

    /// @brief Forwards llama.cpp log output to our log, one complete line at a time.
    void llamaLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;

        llamaLineBuffer += std::string_view { text };

        while (true)
        {
            auto const nlPos = llamaLineBuffer.find('\n');
            if (nlPos == std::string::npos)
                break;

            auto line = llamaLineBuffer.substr(0, nlPos);
            auto const end = line.find_last_not_of(" \t\r");
            if (end != std::string::npos)
                line = line.substr(0, end + 1);

            if (!line.empty())
                log::write(mapGgmlLevel(level).value_or(log::Level::Debug), line);

            llamaLineBuffer.erase(0, nlPos + 1);
        }
    }

    auto toolCatalogPrompt(const std::vector<ToolDefinition>& tools) -> std::string
    {
        if (tools.empty())
            return {};

        auto text = std::string {
            "\n\n# Tools\n\nYou may call one or more functions to assist with the user query.\n"
            "Function signatures are provided within <tools></tools> XML tags:\n<tools>\n"
        };
        for (const auto& tool: tools)
            text += schema::toCatalogEntry(tool).dump() + "\n";
        text += "</tools>\n\nFor each function call, return a json object with function name and arguments "
                "within <tool_call></tool_call> XML tags:\n"
                "<tool_call>\n{\"name\": <function-name>, \"arguments\": <args-json-object>}\n</tool_call>";
        return text;
    }

} // namespace

auto renderChatMessages(const ModelRequest& request) -> std::vector<std::pair<std::string, std::string>>
{
    auto messages = std::vector<std::pair<std::string, std::string>> {};
    messages.emplace_back("system", request.systemPrompt + toolCatalogPrompt(request.tools));

    auto const append = [&](std::string_view role, std::string content) {
        if (messages.back().first == role && role == "assistant")
        {
            messages.back().second += "\n" + content;
            return;
        }
        messages.emplace_back(std::string(role), std::move(content));
    };

    for (const auto& turn: request.transcript)
    {
        if (auto const* user = std::get_if<UserMessage>(&turn))
            append("user", user->text);
        else if (auto const* assistant = std::get_if<AssistantMessage>(&turn))
            append("assistant", assistant->text);
        else if (auto const* call = std::get_if<ToolCallTurn>(&turn))
        {
            auto const body = nlohmann::json { { "name", call->call.name }, { "arguments", call->call.arguments } };
            append("assistant", std::format("<tool_call>\n{}\n</tool_call>", body.dump()));
            if (call->cancelled)
                append("tool", std::format("Error [{}]: tool call '{}' was cancelled",
                                           errorCodeName(ErrorCode::Cancelled), call->call.name));
        }
        else if (auto const* result = std::get_if<ToolResultTurn>(&turn))
            append("tool", result->result.toModelText());
    }
    return messages;
}

/// @brief Token-by-token generation over a prompt already decoded into the context.
class LlamaModelClient::Stream: public ModelStream
{
  public:
    Stream(Impl& impl, std::unique_lock<std::mutex> lock, std::stop_token stopToken, int budget):
        _impl(impl), _lock(std::move(lock)), _stopToken(std::move(stopToken)), _budget(budget)
    {
        auto const& config = impl.config;
        _sampler = llama_sampler_chain_init(llama_sampler_chain_default_params());
        llama_sampler_chain_add(_sampler, llama_sampler_init_temp(config.temperature));
        llama_sampler_chain_add(_sampler, llama_sampler_init_top_k(config.topK));
        llama_sampler_chain_add(_sampler, llama_sampler_init_top_p(config.topP, 1));
        llama_sampler_chain_add(
            _sampler,
            llama_sampler_init_dist(config.seed < 0 ? LLAMA_DEFAULT_SEED : static_cast<uint32_t>(config.seed)));
    }

    ~Stream() override { llama_sampler_free(_sampler); }

    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    auto next() -> Result<ModelEvent> override
    {
        while (_queue.empty())
        {
            if (_finished)
                return EndOfTurn {};

            if (_stopToken.stop_requested())
                return makeError(ErrorCode::Cancelled, "Generation cancelled");

            if (auto stepped = step(); !stepped)
                return std::unexpected(stepped.error());
        }

        auto event = std::move(_queue.front());
        _queue.pop_front();
        return event;
    }

  private:
    Impl& _impl;
    std::unique_lock<std::mutex> _lock;
    std::stop_token _stopToken;
    int _budget;
    llama_sampler* _sampler = nullptr;
    ToolCallParser _parser;
    std::deque<ModelEvent> _queue;
    bool _finished = false;

    auto step() -> VoidResult
    {
        auto const* vocab = llama_model_get_vocab(_impl.model);
        auto const token = llama_sampler_sample(_sampler, _impl.ctx, -1);

        if (llama_vocab_is_eog(vocab, token) || _budget-- <= 0)
        {
            enqueue(_parser.finish());
            _queue.emplace_back(EndOfTurn {});
            _finished = true;
            return {};
        }

        auto tokenBuf = std::array<char, 256> {};
        auto const tokenLen =
            llama_token_to_piece(vocab, token, tokenBuf.data(), static_cast<int32_t>(tokenBuf.size()), 0, true);
        if (tokenLen > 0)
            enqueue(_parser.feed(std::string_view(tokenBuf.data(), static_cast<size_t>(tokenLen))));

        // llama_batch_get_one requires non-const pointer
        auto mutableToken = token;
        if (llama_decode(_impl.ctx, llama_batch_get_one(&mutableToken, 1)) != 0)
            return makeError(ErrorCode::ModelError, "Failed to decode generated token");
        return {};
    }

    void enqueue(std::vector<ModelEvent> events)
    {
        for (auto& event: events)
        {
            if (auto* directive = std::get_if<ToolCallDirective>(&event); directive && directive->call.id.empty())
                directive->call.id = std::format("call_{}", _impl.nextCallId++);
            _queue.push_back(std::move(event));
        }
    }
};

LlamaModelClient::LlamaModelClient(): _impl(std::make_unique<Impl>())
{
}

LlamaModelClient::~LlamaModelClient() = default;

auto LlamaModelClient::load(const LlamaModelConfig& config) -> VoidResult
{
    log::info("Loading model: {}", config.modelPath);

    llama_log_set(llamaLogCallback, nullptr);

    auto modelParams = llama_model_default_params();
    modelParams.n_gpu_layers = config.gpuLayers >= 0 ? config.gpuLayers : 999; // Auto: offload as many as possible

    auto* model = llama_model_load_from_file(config.modelPath.c_str(), modelParams);
    if (!model)
        return makeError(ErrorCode::ModelLoadError, std::format("Failed to load model: {}", config.modelPath));

    auto ctxParams = llama_context_default_params();
    ctxParams.n_ctx = static_cast<uint32_t>(config.contextSize);
    ctxParams.n_threads = config.threads > 0 ? static_cast<uint32_t>(config.threads)
                                             : static_cast<uint32_t>(std::thread::hardware_concurrency());
    ctxParams.n_threads_batch = ctxParams.n_threads;

    auto* ctx = llama_init_from_model(model, ctxParams);
    if (!ctx)
    {
        llama_model_free(model);
        return makeError(ErrorCode::ModelLoadError, "Failed to create llama context");
    }

    _impl->model = model;
    _impl->ctx = ctx;
    _impl->config = config;

    log::info("Model loaded successfully (context size: {})", config.contextSize);
    return {};
}

auto LlamaModelClient::completeStream(const ModelRequest& request, std::stop_token stopToken)
    -> Result<std::unique_ptr<ModelStream>>
{
    if (!isLoaded())
        return makeError(ErrorCode::ModelError, "No model loaded");

    auto lock = std::unique_lock(_impl->generationMutex);
    auto const contextSize = _impl->config.contextSize;

    auto const rendered = renderChatMessages(request);
    auto llamaMsgs = std::vector<llama_chat_message> {};
    llamaMsgs.reserve(rendered.size());
    for (const auto& [role, content]: rendered)
        llamaMsgs.push_back(llama_chat_message { .role = role.c_str(), .content = content.c_str() });

    auto const* tmpl = llama_model_chat_template(_impl->model, nullptr);
    auto const chatTemplate = tmpl ? std::string(tmpl) : std::string("chatml");

    auto buf = std::vector<char>(static_cast<size_t>(contextSize) * 4);
    auto len = llama_chat_apply_template(
        chatTemplate.c_str(), llamaMsgs.data(), llamaMsgs.size(), true, buf.data(), static_cast<int32_t>(buf.size()));
    if (len > static_cast<int32_t>(buf.size()))
    {
        buf.resize(static_cast<size_t>(len));
        len = llama_chat_apply_template(chatTemplate.c_str(), llamaMsgs.data(), llamaMsgs.size(), true, buf.data(),
                                        static_cast<int32_t>(buf.size()));
    }
    if (len < 0)
        return makeError(ErrorCode::ModelError, "Failed to apply chat template");

    auto const prompt = std::string(buf.data(), static_cast<size_t>(len));

    auto const* vocab = llama_model_get_vocab(_impl->model);
    auto tokens = std::vector<llama_token>(static_cast<size_t>(contextSize));
    auto const nTokens = llama_tokenize(vocab, prompt.c_str(), static_cast<int32_t>(prompt.size()), tokens.data(),
                                        static_cast<int32_t>(tokens.size()), true, true);
    if (nTokens < 0 || nTokens >= contextSize)
        return makeError(ErrorCode::ModelError,
                         std::format("Prompt does not fit into the context window ({} tokens)", contextSize));
    tokens.resize(static_cast<size_t>(nTokens));

    if (auto* mem = llama_get_memory(_impl->ctx))
        llama_memory_clear(mem, true);

    if (llama_decode(_impl->ctx, llama_batch_get_one(tokens.data(), nTokens)) != 0)
        return makeError(ErrorCode::ModelError, "Failed to decode prompt");

    auto budget = contextSize - nTokens;
    if (_impl->config.maxTokens > 0)
        budget = std::min(budget, _impl->config.maxTokens);

    log::debug("Prompt decoded: {} tokens, generation budget {}", nTokens, budget);
    return std::make_unique<Stream>(*_impl, std::move(lock), std::move(stopToken), budget);
}

auto LlamaModelClient::isLoaded() const -> bool
{
    return _impl->model != nullptr && _impl->ctx != nullptr;
}

} // namespace agentshell
