#include "BackendFactory.hpp"
#include "RemoteBackend.hpp"
#include "LogUtils.hpp"

BackendFactory::BackendFactory() {
    builders_["remote"] = [](const BackendOptions& options) -> std::unique_ptr<AutomationBackend> {
        auto client = std::make_shared<RpcClient>();
        client->connect(options.socket_path, options.connect_timeout_ms);
        LogUtils::info("Using remote backend at {}", options.socket_path);
        return std::make_unique<RemoteBackend>(std::move(client), options.call_timeout_ms);
    };
}
