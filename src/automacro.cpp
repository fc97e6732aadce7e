#include "LogUtils.hpp"
#include "ParameterContext.hpp"
#include "BackendFactory.hpp"
#include "BackendDispatcher.hpp"
#include "CancellationToken.hpp"
#include "MacroExecutor.hpp"
#include "MacroLoader.hpp"
#include "MacroRegistry.hpp"
#include "RpcServer.hpp"
#include "SignalManager.hpp"
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace {

BackendOptions backend_options(const AppConfig& config, const std::string& socket_path) {
    BackendOptions options;
    options.socket_path = socket_path;
    options.connect_timeout_ms = config.rpc.connect_timeout_ms;
    options.call_timeout_ms = config.rpc.call_timeout_ms;
    return options;
}

int list_macros(const AppConfig& config) {
    MacroRegistry registry(config.macros_dir);
    const auto macros = registry.list();
    const auto errors = registry.load_errors();

    std::cout << "Macros in " << config.macros_dir << " (" << macros.size() << "):\n";
    for (const auto& macro : macros) {
        std::cout << "  " << macro.key;
        if (!macro.description.empty()) {
            std::cout << " - " << macro.description;
        }
        std::cout << " [" << macro.step_count << " steps]\n";
        for (const auto& param : macro.parameters) {
            std::cout << "      " << param.name << (param.required ? " (required)" : "");
            if (param.default_value) {
                std::cout << " default=" << *param.default_value;
            }
            if (!param.description.empty()) {
                std::cout << "  " << param.description;
            }
            std::cout << "\n";
        }
    }

    if (!errors.empty()) {
        std::cout << "\nLoad errors (" << errors.size() << "):\n";
        for (const auto& error : errors) {
            std::cout << "  " << error.file_path;
            if (!error.macro_name.empty()) {
                std::cout << " (" << error.macro_name << ")";
            }
            std::cout << ": " << error.message << "\n";
        }
    }

    const auto knowledge_bases = registry.knowledge_bases();
    if (!knowledge_bases.empty()) {
        std::cout << "\nKnowledge bases (" << knowledge_bases.size() << "):\n";
        for (const auto& kb : knowledge_bases) {
            std::cout << kb.summary << "\n";
        }
    }
    return 0;
}

void print_result(const ExecutionResult& result) {
    std::cout << result.message << "\n";
    if (!result.success && result.failed_step) {
        std::cout << "Failed at step " << *result.failed_step << " of " << result.total_steps
                  << " (" << result.failed_action << "): " << result.error << "\n";
    }
}

int run_macro(const ParameterContext& context, bool from_file) {
    const AppConfig& config = context.get_config();

    MacroDefinition definition;
    if (from_file) {
        const std::filesystem::path file = context.get_macro_file();
        std::ifstream in(file);
        if (!in) {
            throw std::runtime_error("Cannot read macro file: " + file.string());
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        definition = MacroLoader::parse_document(buffer.str(), file.stem().string());
    }

    MacroRegistry registry(config.macros_dir);
    auto backend = BackendFactory::create_backend(config.backend, backend_options(config, config.socket_path));
    MacroExecutor executor(registry, *backend, config.execution);

    CancellationSource interrupt;
    SignalManager::register_signal(SIGINT, [&interrupt](int) {
        LogUtils::warn("Interrupt received, cancelling macro");
        interrupt.cancel();
    }, true);
    SignalManager::register_signal(SIGTERM, [&interrupt](int) { interrupt.cancel(); }, true);

    ExecutionResult result;
    {
        SignalManager::SignalGuard signals;
        result = from_file
            ? executor.execute_definition(definition, context.get_macro_params(), interrupt.token())
            : executor.execute(context.get_macro_name(), context.get_macro_params(), interrupt.token());
    }

    print_result(result);
    return result.success ? 0 : 1;
}

int serve(const AppConfig& config) {
    // A remote backend needs a session server of its own; pointing it at our socket would loop
    std::string upstream = config.socket_path;
    if (config.backend == "remote") {
        if (config.rpc.upstream_socket.empty() || config.rpc.upstream_socket == config.socket_path) {
            throw std::runtime_error("Serving with the remote backend requires rpc.upstream_socket "
                                     "pointing at a different session server");
        }
        upstream = config.rpc.upstream_socket;
    }

    auto backend = BackendFactory::create_backend(config.backend, backend_options(config, upstream));
    MacroRegistry registry(config.macros_dir);
    MacroExecutor executor(registry, *backend, config.execution);
    BackendDispatcher dispatcher(*backend, &registry, &executor);

    ServerConfig server_config = config.server;
    server_config.socket_path = config.socket_path;
    RpcServer server(server_config, dispatcher);

    SignalManager::register_signal(SIGINT, [&server](int) { server.request_stop(); }, true);
    SignalManager::register_signal(SIGTERM, [&server](int) { server.request_stop(); }, true);
    SignalManager::SignalGuard signals;

    LogUtils::info("Serving {} macros on {}", registry.list().size(), config.socket_path);
    server.run();
    return 0;
}

int show_status(const AppConfig& config) {
    auto backend = BackendFactory::create_backend(config.backend, backend_options(config, config.socket_path));
    SessionStatus status = backend->status();
    if (!status.attached) {
        std::cout << "Not attached\n";
        return 1;
    }
    std::cout << "Attached to pid " << status.pid;
    if (!status.window_title.empty()) {
        std::cout << " (" << status.window_title << ")";
    }
    std::cout << "\n";
    return 0;
}

}

int main(int argc, char* argv[]) {
    int result = 0;

    try {
        // 1. Create parameter context and initialize
        ParameterContext context;
        if (!context.init(argc, argv)) {
            goto end;
        }

        // 2. Start logging with the merged configuration
        const AppConfig& config = context.get_config();
        LogUtils::init(config.log.level, config.log.file);

        // 3. Run the selected mode
        try {
            switch (context.get_mode()) {
                case RunMode::List:   result = list_macros(config); break;
                case RunMode::Run:    result = run_macro(context, false); break;
                case RunMode::File:   result = run_macro(context, true); break;
                case RunMode::Serve:  result = serve(config); break;
                case RunMode::Status: result = show_status(config); break;
                case RunMode::None:
                    LogUtils::error("Nothing to do: choose --list, --run, --file, --serve or --status");
                    result = 1;
                    break;
            }
        } catch (const std::exception& e) {
            LogUtils::error("Error during execution: " + std::string(e.what()));
            result = 1;
        }

    } catch (const std::exception& e) {
        LogUtils::error("Error: " + std::string(e.what()));
        LogUtils::error("Use --help or -? to show usage information");
        result = 1;
    }

end:
    LogUtils::shutdown();
    return result;
}
