// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <memory/MemoryStore.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <mutex>
#include <string>

namespace podbuddy
{

/// @brief MemoryStore persisted as a single JSON document on disk.
///
/// Every mutation is written back immediately. Topic and opinion lists keep
/// only the newest MaxEntries items.
class JsonMemoryStore final: public MemoryStore
{
  public:
    static constexpr auto MaxEntries = std::size_t { 100 };
    static constexpr auto SummaryEntries = std::size_t { 5 };

    /// @brief Constructs a store backed by @p path. Nothing is read until load() is called.
    explicit JsonMemoryStore(std::string path);

    /// @brief Loads the document from disk.
    ///
    /// A missing file is not an error; the store simply starts empty.
    [[nodiscard]] auto load() -> VoidResult;

    void recordTopic(std::string_view topic) override;
    void recordOpinion(std::string_view topic, std::string_view text) override;
    auto extractOpinions(std::string_view text, std::string_view topic) -> bool override;
    [[nodiscard]] auto contextSummary() const -> std::string override;
    [[nodiscard]] auto getPreference(std::string_view key) const -> std::optional<std::string> override;
    void setPreference(std::string_view key, std::string_view value) override;
    void incrementSession() override;
    [[nodiscard]] auto save() -> VoidResult override;

    [[nodiscard]] auto sessionCount() const -> int;
    [[nodiscard]] auto topicCount() const -> std::size_t;
    [[nodiscard]] auto opinionCount() const -> std::size_t;
    [[nodiscard]] auto path() const -> const std::string&;

  private:
    std::string _path;
    nlohmann::json _data;
    mutable std::mutex _mutex;

    auto saveLocked() -> VoidResult;
    void saveOrWarn();
};

} // namespace podbuddy
