#pragma once

#include "AutomationBackend.hpp"
#include "RpcClient.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

// Backend session owned by another process, reached through an RpcClient.
// Transport failures propagate as TransportError; server-side failures come
// back as unsuccessful results.
class RemoteBackend : public AutomationBackend {
public:
    // call_timeout_ms of 0 leaves calls without a deadline of their own
    explicit RemoteBackend(std::shared_ptr<RpcClient> client, int call_timeout_ms = 0);

    BackendResult attach(const std::string& process_name) override;
    BackendResult attach(int pid) override;
    bool is_attached() override;
    SessionStatus status() override;
    BackendResult launch_and_attach(const LaunchOptions& options, const CancellationToken& cancel) override;
    BackendResult wait_for_window_ready(const WindowCriteria& criteria, const CancellationToken& cancel) override;
    BackendResult focus() override;

    ElementResult find(const ElementCriteria& criteria) override;
    ElementResult find_by_path(const std::vector<std::string>& path) override;
    ChildrenResult get_children(const std::optional<std::string>& ref) override;

    BackendResult click(const std::string& ref) override;
    BackendResult right_click(const std::string& ref) override;
    BackendResult type_text(const std::string& text) override;
    BackendResult send_keys(const std::string& keys) override;
    BackendResult set_value(const std::string& ref, const std::string& value) override;
    ValueResult get_value(const std::string& ref) override;
    ValueResult read_property(const std::string& ref, const std::string& property) override;
    PropertiesResult get_properties(const std::string& ref) override;
    BackendResult file_dialog(const std::string& path) override;

    std::optional<bool> is_enabled(const std::string& ref) override;

    ValueResult snapshot(int max_depth) override;
    ScreenshotResult screenshot() override;

    RpcClient& client() { return *client_; }

private:
    nlohmann::json invoke(const std::string& method,
                          const nlohmann::json& args,
                          const CancellationToken& cancel = {});
    BackendResult simple(const std::string& method, const nlohmann::json& args);
    ValueResult value(const std::string& method, const nlohmann::json& args);
    ElementResult element(const std::string& method, const nlohmann::json& args);

    std::shared_ptr<RpcClient> client_;
    int call_timeout_ms_;
};
