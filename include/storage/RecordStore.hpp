#pragma once

#include "storage/Codec.hpp"
#include "storage/errors.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace compass::storage {

/*
 * A JSON array of records in one container file.
 *
 * Every load runs each entry through normalize(); if anything came back
 * changed, the normalized collection is written back before returning.
 * A container that cannot be decoded is copied aside to <stem>.backup.json
 * and replaced with an empty one. Mutations hold mutex_ across the whole
 * load-modify-save cycle.
 */
template <typename T>
class RecordStore {
public:
    RecordStore(std::filesystem::path containerPath, std::string name)
        : path_(std::move(containerPath)), name_(std::move(name)) {}

    virtual ~RecordStore() = default;

    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

    std::vector<T> loadAll() {
        std::vector<T> records;
        {
            std::scoped_lock lock(mutex_);
            records = loadUnlocked();
        }
        afterLoad(records);
        return records;
    }

    void saveAll(const std::vector<T>& records) {
        std::scoped_lock lock(mutex_);
        saveUnlocked(records);
    }

    T findById(const std::string& id) {
        for (auto& r : loadAll())
            if (r.id == id) return std::move(r);
        throw NotFound(name_, id);
    }

    [[nodiscard]] const std::filesystem::path& containerPath() const { return path_; }

    [[nodiscard]] std::filesystem::path corruptBackupPath() const {
        return siblingWithSuffix(".backup.json");
    }

protected:
    struct Normalized {
        T record;
        bool changed{false};
    };

    virtual Normalized normalize(const nlohmann::json& raw) = 0;

    // Runs outside the lock on every loaded collection; fills derived fields.
    virtual void afterLoad(std::vector<T>&) {}

    [[nodiscard]] std::filesystem::path siblingWithSuffix(const std::string& suffix) const {
        return path_.parent_path() / (path_.stem().string() + suffix);
    }

    [[nodiscard]] const std::string& name() const { return name_; }

    std::vector<T> loadUnlocked() {
        namespace fs = std::filesystem;
        using logging::LogRegistry;

        if (!fs::exists(path_)) {
            LogRegistry::storage()->info("[RecordStore] Creating empty {} container at {}", name_, path_.string());
            util::writeFileAtomic(path_, encodeContainer({}));
            return {};
        }

        const auto bytes = util::readFileToString(path_);

        std::vector<nlohmann::json> raw;
        try {
            raw = decodeContainer(bytes);
        } catch (const CorruptContainer& e) {
            const auto backup = corruptBackupPath();
            LogRegistry::storage()->warn("[RecordStore] {} container {} is corrupt ({}), moving original to {}",
                                         name_, path_.string(), e.what(), backup.string());
            util::writeFile(backup, bytes);
            util::writeFileAtomic(path_, encodeContainer({}));
            return {};
        }

        std::vector<T> records;
        records.reserve(raw.size());
        bool changed = false;

        for (const auto& entry : raw) {
            if (!entry.is_object()) {
                LogRegistry::storage()->warn("[RecordStore] Dropping non-object {} entry: {}", name_, entry.dump());
                changed = true;
                continue;
            }
            auto n = normalize(entry);
            changed = changed || n.changed;
            records.push_back(std::move(n.record));
        }

        if (changed) {
            LogRegistry::storage()->info("[RecordStore] Migrated {} container {}, writing back", name_, path_.string());
            saveUnlocked(records);
        }

        return records;
    }

    void saveUnlocked(const std::vector<T>& records) {
        std::vector<nlohmann::json> encoded;
        encoded.reserve(records.size());
        for (const auto& r : records) encoded.emplace_back(r);
        util::writeFileAtomic(path_, encodeContainer(encoded));
    }

    // Runs f under the store mutex; f uses the *Unlocked helpers.
    template <typename F>
    auto withLock(F&& f) {
        std::scoped_lock lock(mutex_);
        return std::forward<F>(f)();
    }

    std::mutex mutex_;

private:
    std::filesystem::path path_;
    std::string name_;
};

}
