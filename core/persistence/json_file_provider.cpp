#include "persistence/json_file_provider.hpp"
#include "graph/errors.hpp"
#include "log/log.hpp"
#include "persistence/sanitize.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace weave {

namespace {

const std::string kExtension = ".json";

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

JsonFileProvider::JsonFileProvider(fs::path data_dir)
    : data_dir_(std::move(data_dir)) {}

void JsonFileProvider::assertOpen() const {
    if (closed_) throw ProviderClosedError(name());
}

fs::path JsonFileProvider::pathFor(const std::string& key) const {
    if (key.empty()) {
        throw StorageError("[" + name() + "] key must not be empty");
    }
    return data_dir_ / (encodeKey(key) + kExtension);
}

std::optional<nlohmann::json> JsonFileProvider::get(const std::string& key) {
    assertOpen();
    fs::path path = pathFor(key);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) throw StorageError("[" + name() + "] " + path.string() + ": " + ec.message());
        return std::nullopt;
    }

    std::ifstream in(path);
    if (!in) {
        throw StorageError("[" + name() + "] cannot open " + path.string());
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& e) {
        throw StorageError("[" + name() + "] " + path.string() + ": " + e.what());
    }
}

void JsonFileProvider::set(const std::string& key, const nlohmann::json& value) {
    assertOpen();
    fs::path path = pathFor(key);

    std::error_code ec;
    fs::create_directories(data_dir_, ec);
    if (ec) {
        throw StorageError("[" + name() + "] cannot create " + data_dir_.string() +
                           ": " + ec.message());
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw StorageError("[" + name() + "] cannot write " + tmp.string());
        }
        out << value.dump(2);
        out.flush();
        if (!out) {
            throw StorageError("[" + name() + "] write failed: " + tmp.string());
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw StorageError("[" + name() + "] cannot replace " + path.string());
    }
}

void JsonFileProvider::remove(const std::string& key) {
    assertOpen();
    fs::path path = pathFor(key);
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw StorageError("[" + name() + "] cannot remove " + path.string() +
                           ": " + ec.message());
    }
}

std::vector<std::string> JsonFileProvider::list(const std::string& prefix) {
    assertOpen();
    std::vector<std::string> keys;

    std::error_code ec;
    if (!fs::is_directory(data_dir_, ec)) return keys;

    fs::directory_iterator it(data_dir_, ec);
    if (ec) {
        throw StorageError("[" + name() + "] cannot list " + data_dir_.string() +
                           ": " + ec.message());
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file()) continue;
        std::string filename = entry.path().filename().string();
        if (!endsWith(filename, kExtension)) continue;

        std::string key;
        if (!decodeKey(filename.substr(0, filename.size() - kExtension.size()), key)) {
            log::get()->debug("Ignoring foreign file {} in {}", filename, data_dir_.string());
            continue;
        }
        if (key.compare(0, prefix.size(), prefix) == 0) keys.push_back(std::move(key));
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void JsonFileProvider::clear(const std::string& prefix) {
    assertOpen();
    for (const auto& key : list(prefix)) remove(key);
}

} // namespace weave
