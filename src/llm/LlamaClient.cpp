// SPDX-License-Identifier: Apache-2.0
#include "LlamaClient.hpp"

#include <core/Log.hpp>
#include <llm/TokenChannel.hpp>

#include <llama.h>

#include <array>
#include <chrono>
#include <format>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace podbuddy
{

struct LlamaClient::Impl
{
    llama_model* model = nullptr;
    llama_context* ctx = nullptr;
    int ctxSize = 0;
    SamplerConfig sampler;

    // Serializes access to ctx across generation threads.
    std::mutex generationMutex;

    ~Impl()
    {
        if (ctx)
            llama_free(ctx);
        if (model)
            llama_model_free(model);
    }

    auto buildPrompt(std::span<const ChatMessage> messages) const -> Result<std::string>;
    void generate(std::stop_token stopToken, std::string prompt, TokenChannel& channel);
};

namespace
{

    // chat() has no caller-supplied per-token timeout; generation of a short reply stays well below this.
    constexpr auto ChatTokenTimeout = std::chrono::milliseconds { 120'000 };

    /// @brief Line buffer for llama.cpp log continuation messages.
    auto llamaLineBuffer = std::string {};

    auto mapGgmlLevel(ggml_log_level level) -> std::optional<log::Level>
    {
        switch (level)
        {
            case GGML_LOG_LEVEL_ERROR: return log::Level::Error;
            case GGML_LOG_LEVEL_WARN: return log::Level::Warning;
            case GGML_LOG_LEVEL_INFO: return log::Level::Info;
            case GGML_LOG_LEVEL_DEBUG: return log::Level::Debug;
            default: return std::nullopt;
        }
    }

    /// @brief Forwards llama.cpp log output to podbuddy::log, one complete line at a time.
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

            // llama.cpp is chatty at info level; keep it out of the default output.
            if (!line.empty())
            {
                auto const logLevel = mapGgmlLevel(level).value_or(log::Level::Debug);
                log::write(logLevel == log::Level::Info ? log::Level::Debug : logLevel, line);
            }

            llamaLineBuffer.erase(0, nlPos + 1);
        }
    }

    /// @brief TokenStream owning the generation thread that feeds it.
    class LlamaTokenStream final: public TokenStream
    {
      public:
        LlamaTokenStream() = default;

        ~LlamaTokenStream() override
        {
            cancel();
            // jthread joins on destruction
        }

        void start(std::jthread worker) { _worker = std::move(worker); }

        [[nodiscard]] auto channel() -> TokenChannel& { return _channel; }

        [[nodiscard]] auto next(std::chrono::milliseconds timeout) -> Result<std::optional<std::string>> override
        {
            return _channel.next(timeout);
        }

        void cancel() override
        {
            _channel.cancel();
            _worker.request_stop();
        }

      private:
        TokenChannel _channel;
        std::jthread _worker;
    };

} // namespace

auto LlamaClient::Impl::buildPrompt(std::span<const ChatMessage> messages) const -> Result<std::string>
{
    auto const* tmpl = llama_model_chat_template(model, nullptr);
    auto chatTemplate = tmpl ? std::string(tmpl) : std::string("chatml");

    auto llamaMsgs = std::vector<llama_chat_message> {};
    llamaMsgs.reserve(messages.size());

    // llama_chat_message only stores pointers
    auto roleStrings = std::vector<std::string> {};
    roleStrings.reserve(messages.size());

    for (const auto& msg: messages)
    {
        roleStrings.emplace_back(roleToString(msg.role));
        llamaMsgs.push_back(llama_chat_message {
            .role = roleStrings.back().c_str(),
            .content = msg.content.c_str(),
        });
    }

    auto buf = std::vector<char>(static_cast<size_t>(ctxSize) * 4);
    auto len = llama_chat_apply_template(chatTemplate.c_str(),
                                         llamaMsgs.data(),
                                         llamaMsgs.size(),
                                         true,
                                         buf.data(),
                                         static_cast<int32_t>(buf.size()));
    if (len > static_cast<int32_t>(buf.size()))
    {
        buf.resize(static_cast<size_t>(len));
        len = llama_chat_apply_template(chatTemplate.c_str(),
                                        llamaMsgs.data(),
                                        llamaMsgs.size(),
                                        true,
                                        buf.data(),
                                        static_cast<int32_t>(buf.size()));
    }

    if (len < 0)
        return makeError(ErrorCode::InferenceError, "Failed to apply chat template");

    return std::string(buf.data(), static_cast<size_t>(len));
}

void LlamaClient::Impl::generate(std::stop_token stopToken, std::string prompt, TokenChannel& channel)
{
    auto lock = std::lock_guard(generationMutex);
    if (stopToken.stop_requested() || channel.cancelled())
        return;

    auto const vocab = llama_model_get_vocab(model);
    auto tokens = std::vector<llama_token>(static_cast<size_t>(ctxSize));
    auto const nTokens = llama_tokenize(vocab,
                                        prompt.c_str(),
                                        static_cast<int32_t>(prompt.size()),
                                        tokens.data(),
                                        static_cast<int32_t>(tokens.size()),
                                        true,
                                        true);
    if (nTokens < 0)
    {
        channel.fail(Error { ErrorCode::InferenceError, "Prompt exceeds the context size" });
        return;
    }
    tokens.resize(static_cast<size_t>(nTokens));

    if (auto* mem = llama_get_memory(ctx))
        llama_memory_clear(mem, true);

    auto batch = llama_batch_get_one(tokens.data(), nTokens);
    if (llama_decode(ctx, batch) != 0)
    {
        channel.fail(Error { ErrorCode::InferenceError, "Failed to decode prompt" });
        return;
    }

    auto* smpl = llama_sampler_chain_init(llama_sampler_chain_default_params());
    llama_sampler_chain_add(smpl,
                            llama_sampler_init_penalties(sampler.repeatLastN, sampler.repeatPenalty, 0.0f, 0.0f));
    llama_sampler_chain_add(smpl, llama_sampler_init_top_k(sampler.topK));
    llama_sampler_chain_add(smpl, llama_sampler_init_top_p(sampler.topP, 1));
    llama_sampler_chain_add(smpl, llama_sampler_init_temp(sampler.temperature));
    llama_sampler_chain_add(
        smpl,
        llama_sampler_init_dist(sampler.seed < 0 ? LLAMA_DEFAULT_SEED : static_cast<uint32_t>(sampler.seed)));

    auto maxTokens = ctxSize - nTokens;
    if (sampler.maxTokens > 0 && sampler.maxTokens < maxTokens)
        maxTokens = sampler.maxTokens;

    auto generated = 0;
    for (; generated < maxTokens; ++generated)
    {
        if (stopToken.stop_requested() || channel.cancelled())
        {
            log::debug("Generation stopped after {} tokens", generated);
            break;
        }

        auto const newTokenId = llama_sampler_sample(smpl, ctx, -1);
        if (llama_vocab_is_eog(vocab, newTokenId))
            break;

        auto tokenBuf = std::array<char, 256> {};
        auto const tokenLen = llama_token_to_piece(
            vocab, newTokenId, tokenBuf.data(), static_cast<int32_t>(tokenBuf.size()), 0, true);
        if (tokenLen > 0)
            channel.push(std::string(tokenBuf.data(), static_cast<size_t>(tokenLen)));

        // llama_batch_get_one requires non-const pointer
        auto mutableTokenId = newTokenId;
        auto singleTokenBatch = llama_batch_get_one(&mutableTokenId, 1);
        if (llama_decode(ctx, singleTokenBatch) != 0)
        {
            llama_sampler_free(smpl);
            channel.fail(Error { ErrorCode::InferenceError, "Failed to decode generated token" });
            return;
        }
    }

    llama_sampler_free(smpl);
    log::trace("Generated {} tokens", generated);
    channel.close();
}

LlamaClient::LlamaClient(): _impl(std::make_unique<Impl>())
{
}

LlamaClient::~LlamaClient() = default;

auto LlamaClient::load(const LlamaClientConfig& config) -> VoidResult
{
    log::info("Loading model: {}", config.modelPath);

    llama_log_set(llamaLogCallback, nullptr);

    auto modelParams = llama_model_default_params();
    if (config.gpuLayers >= 0)
        modelParams.n_gpu_layers = config.gpuLayers;
    else
        modelParams.n_gpu_layers = 999; // Auto: offload as many as possible

    auto* model = llama_model_load_from_file(config.modelPath.c_str(), modelParams);
    if (!model)
        return makeError(ErrorCode::ModelLoadError,
                         std::format("Failed to load model: {}", config.modelPath));

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
    _impl->ctxSize = config.contextSize;
    _impl->sampler = config.sampler;

    log::info("Model loaded successfully (context size: {})", config.contextSize);
    return {};
}

auto LlamaClient::warmUp() -> VoidResult
{
    auto const start = std::chrono::steady_clock::now();
    auto const messages = std::array { ChatMessage { .role = Role::User, .content = "Hi" } };
    auto reply = chat(messages);
    if (!reply)
        return std::unexpected(reply.error());

    auto const elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    log::info("LLM warmed up in {}", elapsed);
    return {};
}

auto LlamaClient::streamChat(std::span<const ChatMessage> messages) -> Result<std::unique_ptr<TokenStream>>
{
    if (!isReady())
        return makeError(ErrorCode::ModelUnavailable, "No model loaded");

    auto prompt = _impl->buildPrompt(messages);
    if (!prompt)
        return std::unexpected(prompt.error());

    auto stream = std::make_unique<LlamaTokenStream>();
    auto& channel = stream->channel();
    stream->start(std::jthread([impl = _impl.get(), &channel, prompt = std::move(*prompt)](
                                   std::stop_token stopToken) mutable {
        impl->generate(std::move(stopToken), std::move(prompt), channel);
    }));
    return std::unique_ptr<TokenStream>(std::move(stream));
}

auto LlamaClient::chat(std::span<const ChatMessage> messages) -> Result<std::string>
{
    auto stream = streamChat(messages);
    if (!stream)
        return std::unexpected(stream.error());
    return collectStream(**stream, ChatTokenTimeout);
}

auto LlamaClient::isReady() const -> bool
{
    return _impl->model != nullptr && _impl->ctx != nullptr;
}

auto LlamaClient::contextSize() const -> int
{
    return _impl->ctxSize;
}

} // namespace podbuddy
