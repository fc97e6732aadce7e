#include "MacroRegistry.hpp"
#include "MacroLoader.hpp"
#include "LogUtils.hpp"

MacroRegistry::MacroRegistry(std::filesystem::path macros_path)
    : macros_path_(std::move(macros_path)),
      catalog_(std::make_shared<const MacroCatalog>()) {
    reload();
}

void MacroRegistry::reload() {
    std::lock_guard<std::mutex> reload_lock(reload_mutex_);

    auto catalog = std::make_shared<const MacroCatalog>(MacroLoader(macros_path_).load());
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        catalog_ = catalog;
    }

    std::vector<ReloadListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener(*catalog);
        } catch (const std::exception& e) {
            LogUtils::error("Reload listener failed: {}", e.what());
        }
    }
}

std::future<void> MacroRegistry::reload_async() {
    return std::async(std::launch::async, [this]() { reload(); });
}

std::shared_ptr<const MacroCatalog> MacroRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return catalog_;
}

std::vector<MacroSummary> MacroRegistry::list() const {
    auto catalog = snapshot();
    std::vector<MacroSummary> result;
    result.reserve(catalog->macros.size());
    for (const auto& [key, definition] : catalog->macros) {
        result.push_back(MacroSummary{
            key, definition.name, definition.description, definition.parameters, definition.steps.size()
        });
    }
    return result;
}

std::vector<LoadError> MacroRegistry::load_errors() const {
    return snapshot()->errors;
}

std::vector<KnowledgeBase> MacroRegistry::knowledge_bases() const {
    std::vector<KnowledgeBase> result;
    for (const auto& [product, kb] : snapshot()->knowledge_bases) result.push_back(kb);
    return result;
}

void MacroRegistry::on_reloaded(ReloadListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_.push_back(std::move(listener));
}
