#pragma once

#include "MacroCatalog.hpp"
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Owns the current macro catalog. A reload builds a complete new catalog and
// swaps it in, so readers keep whichever snapshot they already hold.
class MacroRegistry {
public:
    using ReloadListener = std::function<void(const MacroCatalog&)>;

    explicit MacroRegistry(std::filesystem::path macros_path);

    void reload();
    std::future<void> reload_async();

    std::shared_ptr<const MacroCatalog> snapshot() const;

    // Sorted by name
    std::vector<MacroSummary> list() const;
    std::vector<LoadError> load_errors() const;

    // Sorted by product name
    std::vector<KnowledgeBase> knowledge_bases() const;

    // Called after every published reload, on the reloading thread
    void on_reloaded(ReloadListener listener);

    const std::filesystem::path& macros_path() const { return macros_path_; }

private:
    std::filesystem::path macros_path_;

    std::mutex reload_mutex_;
    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const MacroCatalog> catalog_;

    std::mutex listener_mutex_;
    std::vector<ReloadListener> listeners_;
};
