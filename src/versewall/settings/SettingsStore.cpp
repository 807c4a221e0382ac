#include <versewall/settings/SettingsJson.hpp>
#include <versewall/settings/SettingsStore.hpp>

#include "core/FileIO.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <span>
#include <utility>

namespace VW::Settings {

SettingsStore::SettingsStore(std::filesystem::path path, AppSettings initial)
    : path_(std::move(path))
    , current_(std::move(initial))
    , registry_(std::make_shared<Registry>()) {}

SettingsStore::~SettingsStore() = default;

auto SettingsStore::load() -> Expected<void> {
    if (path_.empty()) {
        return {};
    }
    auto text = readTextFile(path_);
    if (!text) {
        return std::unexpected(text.error());
    }
    auto parsed = parse_settings(*text);
    if (!parsed) {
        vw_log("Settings file " + path_.string() + " ignored: " + describeError(parsed.error()), "Settings", "Warning");
        return std::unexpected(parsed.error());
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = std::move(*parsed);
    }
    vw_log("Loaded settings from " + path_.string(), "Settings");
    return {};
}

auto SettingsStore::save() const -> Expected<void> {
    if (path_.empty()) {
        return {};
    }
    auto text = serialize_settings(snapshot());
    auto bytes = std::span<std::uint8_t const>(reinterpret_cast<std::uint8_t const*>(text.data()), text.size());
    return writer_.write(path_, bytes);
}

auto SettingsStore::snapshot() const -> AppSettings {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

auto SettingsStore::update(Mutator const& mutator) -> Expected<std::vector<std::string>> {
    AppSettings next;
    std::vector<std::string> changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        next = current_;
        mutator(next);
        changed = changed_fields(current_, next);
        if (changed.empty()) {
            return changed;
        }
        current_ = next;
    }

    std::string names;
    for (auto const& name : changed) {
        names += names.empty() ? name : "," + name;
    }
    vw_log("Settings changed: " + names, "Settings");

    auto saved = save();
    if (!saved) {
        vw_log("Saving settings failed: " + describeError(saved.error()), "Settings", "Error");
    }

    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        for (auto const& entry : registry_->listeners) {
            listeners.push_back(entry.second);
        }
    }
    for (auto const& listener : listeners) {
        listener(next, changed);
    }

    if (!saved) {
        return std::unexpected(saved.error());
    }
    return changed;
}

auto SettingsStore::subscribe(Listener listener) -> Subscription {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    auto id = registry_->next_id++;
    registry_->listeners.emplace_back(id, std::move(listener));
    return Subscription{registry_, id};
}

SettingsStore::Subscription::Subscription(std::weak_ptr<Registry> registry, std::uint64_t id)
    : registry_(std::move(registry))
    , id_(id) {}

SettingsStore::Subscription::~Subscription() {
    reset();
}

SettingsStore::Subscription::Subscription(Subscription&& other) noexcept
    : registry_(std::move(other.registry_))
    , id_(std::exchange(other.id_, 0)) {}

auto SettingsStore::Subscription::operator=(Subscription&& other) noexcept -> Subscription& {
    if (this != &other) {
        reset();
        registry_ = std::move(other.registry_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

auto SettingsStore::Subscription::reset() -> void {
    if (id_ == 0) {
        return;
    }
    if (auto registry = registry_.lock()) {
        std::lock_guard<std::mutex> lock(registry->mutex);
        std::erase_if(registry->listeners, [this](auto const& entry) { return entry.first == id_; });
    }
    registry_.reset();
    id_ = 0;
}

auto SettingsStore::Subscription::active() const -> bool {
    return id_ != 0 && !registry_.expired();
}

} // namespace VW::Settings
