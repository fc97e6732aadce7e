#pragma once

#include "CancellationToken.hpp"
#include "MacroStep.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct BackendResult {
    bool success = false;
    std::string message;
};

// Element lookups hand back an opaque reference key ("e12") issued by the backend
struct ElementResult {
    bool success = false;
    std::string ref;
    std::string description;
    std::string message;
};

struct ValueResult {
    bool success = false;
    std::string value;
    std::string message;
};

struct ChildrenResult {
    bool success = false;
    std::vector<std::string> refs;
    std::string message;
};

struct PropertiesResult {
    bool success = false;
    std::map<std::string, std::string> properties;
    std::string message;
};

struct ScreenshotResult {
    bool success = false;
    std::vector<uint8_t> png;
    std::string message;
};

struct SessionStatus {
    bool attached = false;
    std::string window_title;
    int pid = 0;
};

struct LaunchOptions {
    std::string exe_path;
    std::optional<std::string> arguments;
    std::optional<std::string> working_directory;
    bool if_not_running = true;
    int timeout_sec = 30;
};

struct WindowCriteria {
    std::string title_contains;
    ElementCriteria element;
    int timeout_sec = 30;
    int poll_ms = 500;
};

// Capability set of an automation session. Implementations hold
// non-reentrant session state; callers serialize access.
class AutomationBackend {
public:
    virtual ~AutomationBackend() = default;

    // Session
    virtual BackendResult attach(const std::string& process_name) = 0;
    virtual BackendResult attach(int pid) = 0;
    virtual bool is_attached() = 0;
    virtual SessionStatus status() = 0;
    virtual BackendResult launch_and_attach(const LaunchOptions& options, const CancellationToken& cancel) = 0;
    virtual BackendResult wait_for_window_ready(const WindowCriteria& criteria, const CancellationToken& cancel) = 0;
    virtual BackendResult focus() = 0;

    // Element lookup
    virtual ElementResult find(const ElementCriteria& criteria) = 0;
    virtual ElementResult find_by_path(const std::vector<std::string>& path) = 0;
    virtual ChildrenResult get_children(const std::optional<std::string>& ref) = 0;

    // Element interaction
    virtual BackendResult click(const std::string& ref) = 0;
    virtual BackendResult right_click(const std::string& ref) = 0;
    virtual BackendResult type_text(const std::string& text) = 0;
    virtual BackendResult send_keys(const std::string& keys) = 0;
    virtual BackendResult set_value(const std::string& ref, const std::string& value) = 0;
    virtual ValueResult get_value(const std::string& ref) = 0;
    virtual ValueResult read_property(const std::string& ref, const std::string& property) = 0;
    virtual PropertiesResult get_properties(const std::string& ref) = 0;
    virtual BackendResult file_dialog(const std::string& path) = 0;

    // Empty when the reference is unknown
    virtual std::optional<bool> is_enabled(const std::string& ref) = 0;

    // Inspection
    virtual ValueResult snapshot(int max_depth) = 0;
    virtual ScreenshotResult screenshot() = 0;
};
