// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/LlmClient.hpp>

#include <memory>
#include <span>
#include <string>

namespace podbuddy
{

/// @brief Token sampling chain: penalties, top-k, top-p, temperature, then a seeded draw.
struct SamplerConfig
{
    float temperature = 0.7f;
    float topP = 0.9f;
    int topK = 40;
    float repeatPenalty = 1.1f;
    int repeatLastN = 64;
    int seed = -1;       // random
    int maxTokens = 256; // <= 0 generates until the context is full
};

/// @brief Configuration for the in-process llama.cpp client.
struct LlamaClientConfig
{
    std::string modelPath;
    int contextSize = 8192;
    int gpuLayers = -1; // -1 means auto
    int threads = 0;    // 0 means auto
    SamplerConfig sampler;
};

/// @brief LlmClient backed by llama.cpp running in-process.
///
/// Each streamChat() call starts generation on a worker thread that feeds a
/// TokenChannel. Only one generation runs at a time; a second stream waits
/// until the first one finished or was cancelled. The client must outlive
/// every stream it returns.
class LlamaClient final: public LlmClient
{
  public:
    LlamaClient();
    ~LlamaClient() override;

    LlamaClient(const LlamaClient&) = delete;
    LlamaClient& operator=(const LlamaClient&) = delete;

    /// @brief Loads a GGUF model from disk.
    /// @param config The client configuration including model path.
    /// @return Success or an error.
    [[nodiscard]] auto load(const LlamaClientConfig& config) -> VoidResult;

    /// @brief Runs a tiny throw-away completion so the first real turn does not pay the warm-up cost.
    [[nodiscard]] auto warmUp() -> VoidResult;

    [[nodiscard]] auto streamChat(std::span<const ChatMessage> messages)
        -> Result<std::unique_ptr<TokenStream>> override;
    [[nodiscard]] auto chat(std::span<const ChatMessage> messages) -> Result<std::string> override;
    [[nodiscard]] auto isReady() const -> bool override;

    /// @brief Returns the model's context size.
    [[nodiscard]] auto contextSize() const -> int;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace podbuddy
