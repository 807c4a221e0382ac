#pragma once

#include "core/Error.hpp"

#include <versewall/render/AtomicFileWriter.hpp>
#include <versewall/settings/AppSettings.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace VW::Settings {

/**
 * SettingsStore - the shared, observable settings object.
 *
 * One instance is constructed by the application and handed to every
 * consumer by reference. update() applies a mutator to a copy of the current
 * snapshot, persists it and notifies subscribers with the names of the fields
 * that changed. Subscribers are called on the updating thread, outside the
 * store's lock, so they may read the store again.
 *
 * An empty path keeps the store in memory only.
 */
class SettingsStore {
public:
    using Listener = std::function<void(AppSettings const& settings, std::vector<std::string> const& changed)>;
    using Mutator  = std::function<void(AppSettings&)>;

    class Subscription;

    explicit SettingsStore(std::filesystem::path path, AppSettings initial = {});
    ~SettingsStore();

    SettingsStore(SettingsStore const&)                    = delete;
    auto operator=(SettingsStore const&) -> SettingsStore& = delete;

    // Replaces the snapshot with the file's content. A missing file leaves the
    // defaults in place and reports NotFound; malformed JSON reports MalformedInput.
    auto load() -> Expected<void>;
    auto save() const -> Expected<void>;

    [[nodiscard]] auto snapshot() const -> AppSettings;

    // Returns the changed field names. The snapshot and the subscribers are
    // updated even when persisting fails; the error then reports only that.
    auto update(Mutator const& mutator) -> Expected<std::vector<std::string>>;

    [[nodiscard]] auto subscribe(Listener listener) -> Subscription;

    [[nodiscard]] auto path() const -> std::filesystem::path const& { return path_; }

private:
    struct Registry {
        std::mutex                                    mutex;
        std::uint64_t                                 next_id = 1;
        std::vector<std::pair<std::uint64_t, Listener>> listeners;
    };

    std::filesystem::path     path_;
    Render::AtomicFileWriter  writer_;
    mutable std::mutex        mutex_;
    AppSettings               current_;
    std::shared_ptr<Registry> registry_;
};

// Unsubscribes when destroyed. Outliving the store is harmless.
class SettingsStore::Subscription {
public:
    Subscription() = default;
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    auto operator=(Subscription&& other) noexcept -> Subscription&;
    Subscription(Subscription const&)                    = delete;
    auto operator=(Subscription const&) -> Subscription& = delete;

    auto reset() -> void;
    [[nodiscard]] auto active() const -> bool;

private:
    friend class SettingsStore;
    Subscription(std::weak_ptr<Registry> registry, std::uint64_t id);

    std::weak_ptr<Registry> registry_;
    std::uint64_t           id_ = 0;
};

} // namespace VW::Settings
