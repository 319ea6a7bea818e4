#pragma once
#include "Codec.hpp"
#include <algorithm>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <spdlog/spdlog.h>

namespace Deepvale {

// String-keyed registry of shared entries, iterable in registration order
template<typename T>
class Registry {
public:
    explicit Registry(std::string name = "registry") : m_name(std::move(name)) {}

    bool registerEntry(const std::string& id, std::shared_ptr<T> entry) {
        if (m_frozen) {
            spdlog::error("Cannot register '{}' to frozen {}", id, m_name);
            return false;
        }

        if (m_entries.contains(id)) {
            spdlog::warn("Overwriting {} entry: {}", m_name, id);
        } else {
            m_order.push_back(id);
        }

        m_entries[id] = std::move(entry);
        spdlog::debug("Registered {} entry: {}", m_name, id);
        return true;
    }

    std::shared_ptr<T> get(const std::string& id) const {
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            return nullptr;
        }
        return it->second;
    }

    bool contains(const std::string& id) const {
        return m_entries.contains(id);
    }

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    // Entries in the order they were first registered
    std::vector<std::shared_ptr<T>> values() const {
        std::vector<std::shared_ptr<T>> result;
        result.reserve(m_order.size());
        for (const auto& id : m_order) {
            result.push_back(m_entries.at(id));
        }
        return result;
    }

    const std::vector<std::string>& getIds() const { return m_order; }

    void freeze() {
        m_frozen = true;
        spdlog::info("{} frozen with {} entries", m_name, m_entries.size());
    }

    bool isFrozen() const {
        return m_frozen;
    }

    void clear() {
        if (m_frozen) {
            spdlog::error("Cannot clear frozen {}", m_name);
            return;
        }
        m_entries.clear();
        m_order.clear();
    }

    // Decodes a string id into the registered entry
    Codec<std::shared_ptr<T>> referenceCodec() const {
        return Codec<std::shared_ptr<T>>([this](simdjson::ondemand::value json) -> DecodeResult<std::shared_ptr<T>> {
            std::string_view idView;
            auto error = json.get_string().get(idView);
            if (error) {
                return DecodeResult<std::shared_ptr<T>>::failure("Expected string for " + m_name + " reference");
            }

            std::string id(idView);
            auto entry = get(id);
            if (!entry) {
                return DecodeResult<std::shared_ptr<T>>::failure(m_name + " entry not found: " + id);
            }

            return DecodeResult<std::shared_ptr<T>>::success(entry);
        });
    }

private:
    std::string m_name;
    std::unordered_map<std::string, std::shared_ptr<T>> m_entries;
    std::vector<std::string> m_order;
    bool m_frozen = false;
};

// Walks a directory of JSON files, one entry per file, id = file stem
class RegistryLoader {
public:
    // Returns false to count the file as failed
    using EntryHandler = std::function<bool(const std::string& id, simdjson::ondemand::value json)>;

    /**
     * Parse every *.json file under `directory` (recursively, sorted by path)
     * and hand it to `handler`. Returns the number of files handled successfully.
     */
    static size_t loadFromDirectory(const std::filesystem::path& directory, const EntryHandler& handler) {
        spdlog::info("Loading entries from: {}", directory.string());

        std::error_code ec;
        if (!std::filesystem::is_directory(directory, ec)) {
            spdlog::warn("Directory does not exist: {}", directory.string());
            return 0;
        }

        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::recursive_directory_iterator(directory, ec)) {
            if (entry.is_regular_file() && entry.path().extension() == ".json") {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());

        simdjson::ondemand::parser parser;
        size_t loadedCount = 0;

        for (const auto& path : files) {
            std::string id = path.stem().string();

            simdjson::padded_string json;
            auto error = simdjson::padded_string::load(path.string()).get(json);
            if (error) {
                spdlog::error("Failed to read {}: {}", path.string(), simdjson::error_message(error));
                continue;
            }

            simdjson::ondemand::document doc;
            simdjson::ondemand::value value;
            error = parser.iterate(json).get(doc);
            if (!error) {
                error = doc.get_value().get(value);
            }
            if (error) {
                spdlog::error("Failed to parse {}: {}", path.string(), simdjson::error_message(error));
                continue;
            }

            if (handler(id, value)) {
                loadedCount++;
            }
        }

        spdlog::info("Loaded {} of {} entries from {}", loadedCount, files.size(), directory.string());
        return loadedCount;
    }
};

} // namespace Deepvale
