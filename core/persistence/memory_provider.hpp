#pragma once

#include "persistence/provider.hpp"

#include <map>

namespace weave {

/// In-process store. Nothing survives the instance; close() drops the data.
class MemoryProvider : public Provider {
public:
    std::optional<nlohmann::json> get(const std::string& key) override;
    void set(const std::string& key, const nlohmann::json& value) override;
    void remove(const std::string& key) override;
    std::vector<std::string> list(const std::string& prefix = "") override;
    void clear(const std::string& prefix = "") override;
    void close() override;

    bool isClosed() const override { return closed_; }
    std::string name() const override { return "MemoryProvider"; }
    size_t size() const { return store_.size(); }

private:
    void assertOpen() const;

    std::map<std::string, nlohmann::json> store_;
    bool closed_ = false;
};

} // namespace weave
