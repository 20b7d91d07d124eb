#pragma once

#include "persistence/provider.hpp"

#include <filesystem>

namespace weave {

// ─── JsonFileProvider ──────────────────────────────────────────
// One pretty-printed JSON file per key inside `data_dir`:
//   "graph:chat/1"  →  <data_dir>/graph~3a~chat~2f~1.json
//
// Filenames go through encodeKey(), so no key can name a path outside
// the directory. Writes land in a sibling ".tmp" file that is renamed
// over the target; readers never see a half-written document.

class JsonFileProvider : public Provider {
public:
    explicit JsonFileProvider(std::filesystem::path data_dir);

    std::optional<nlohmann::json> get(const std::string& key) override;
    void set(const std::string& key, const nlohmann::json& value) override;
    void remove(const std::string& key) override;
    std::vector<std::string> list(const std::string& prefix = "") override;
    void clear(const std::string& prefix = "") override;
    void close() override { closed_ = true; }

    bool isClosed() const override { return closed_; }
    std::string name() const override { return "JsonFileProvider"; }
    const std::filesystem::path& directory() const { return data_dir_; }

    std::filesystem::path pathFor(const std::string& key) const;

private:
    void assertOpen() const;

    std::filesystem::path data_dir_;
    bool closed_ = false;
};

} // namespace weave
