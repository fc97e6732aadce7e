#include "ParameterContext.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>

#ifndef AUTOMACRO_VERSION
#define AUTOMACRO_VERSION "0.1.0"
#endif

#ifndef AUTOMACRO_BUILD_TARGET
#define AUTOMACRO_BUILD_TARGET "unknown"
#endif

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--config-file", 'c', "Specify config file path", true},
    {"--macros-dir", 'd', "Directory holding macro documents", true},
    {"--socket", 's', "Automation server socket path", true},
    {"--backend", 'b', "Automation backend to drive", true},
    {"--list", 'l', "List macros and load errors", false},
    {"--run", 'r', "Run the named macro", true},
    {"--file", 'f', "Run a macro document directly", true},
    {"--param", 'p', "Macro parameter as KEY=VALUE (repeatable)", true},
    {"--serve", 'S', "Host the automation server", false},
    {"--status", 't', "Show the automation session status", false},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help() {
    const size_t value_width = 8;
    size_t long_width = 0;
    for (const auto& opt : valid_options) {
        long_width = std::max(long_width, opt.long_opt.size());
    }

    std::cout << "Usage: automacro [OPTIONS]...\n\nOptions:\n";
    for (const auto& opt : valid_options) {
        std::string spec = opt.long_opt + (opt.requires_value ? "=VALUE" : "");
        std::cout << "  -" << opt.short_opt << ", "
                  << std::left << std::setw(static_cast<int>(long_width + value_width)) << spec
                  << "  " << opt.description << "\n";
    }

    std::cout << "\nExamples:\n"
              << "  automacro --list -d ./macros\n"
              << "  automacro --run notepad/save_as -p path=/tmp/out.txt\n"
              << "  automacro --file ./login.yaml -p user=admin -v\n"
              << "  automacro --serve -c automacro.yaml\n\n";
}

void ParameterContext::show_version() {
    std::cout << "automacro version: " << AUTOMACRO_VERSION << std::endl;
    std::cout << "build: " << AUTOMACRO_BUILD_TARGET << std::endl;
}

void ParameterContext::merge_yaml(const YAML::Node& config) {
    if (!config || config.IsNull()) {
        return;
    }
    YAML::convert<AppConfig>::decode(config, config_);
}

void ParameterContext::merge_yaml(const std::string& file_path) {
    try {
        YAML::Node config = YAML::LoadFile(file_path);
        merge_yaml(config);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file '" + file_path + "': " + e.what());
    } catch (const std::exception& e) {
        throw std::runtime_error("Error processing YAML file '" + file_path + "': " + e.what());
    }
}

void ParameterContext::merge_yaml() {
    if (cli_params.count("--config-file")) {
        merge_yaml(cli_params["--config-file"]);
    }
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Handle long option format (--key=value or --key value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + key);
            }

            if (it->requires_value) {
                if (pos == std::string::npos) {
                    if (i + 1 >= argc) {
                        throw std::runtime_error("Option requires a value: " + key);
                    }
                    value = argv[++i];
                }
            } else if (pos != std::string::npos) {
                throw std::runtime_error("Option does not take a value: " + key);
            }
        }
        // Handle short option format (-k value)
        else if (arg.size() > 1 && arg[0] == '-') {
            if (arg.length() != 2) {
                throw std::runtime_error("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + arg);
                }
                value = argv[++i];
            }
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }

        if (key == "--param") {
            cli_param_pairs.push_back(value);
        } else {
            cli_params[key] = value;
        }
    }
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    parse_commandline(argc, argv);
    merge_commandline();
}

void ParameterContext::merge_commandline() {
    if (cli_params.count("--macros-dir"))
        config_.macros_dir = cli_params["--macros-dir"];

    if (cli_params.count("--socket"))
        config_.socket_path = cli_params["--socket"];

    if (cli_params.count("--backend"))
        config_.backend = cli_params["--backend"];

    if (cli_params.count("--verbose")) {
        verbose_ = true;
        config_.log.level = LogUtils::Level::Debug;
    }

    for (const auto& pair : cli_param_pairs) {
        size_t pos = pair.find('=');
        std::string key = pos == std::string::npos ? "" : StringUtils::trimmed(pair.substr(0, pos));
        if (key.empty()) {
            throw std::runtime_error("Invalid parameter '" + pair + "': expected KEY=VALUE");
        }
        macro_params_[key] = pair.substr(pos + 1);
    }

    resolve_mode();
}

void ParameterContext::resolve_mode() {
    std::vector<std::string> modes;
    for (const char* opt : {"--list", "--run", "--file", "--serve", "--status"}) {
        if (cli_params.count(opt)) modes.push_back(opt);
    }
    if (modes.size() > 1) {
        throw std::runtime_error("Conflicting options: " + StringUtils::join(modes, ", "));
    }

    mode_ = RunMode::None;
    if (cli_params.count("--list")) {
        mode_ = RunMode::List;
    } else if (cli_params.count("--run")) {
        mode_ = RunMode::Run;
        macro_name_ = cli_params["--run"];
        if (macro_name_.empty()) throw std::runtime_error("--run requires a macro name");
    } else if (cli_params.count("--file")) {
        mode_ = RunMode::File;
        macro_file_ = cli_params["--file"];
        if (macro_file_.empty()) throw std::runtime_error("--file requires a path");
    } else if (cli_params.count("--serve")) {
        mode_ = RunMode::Serve;
    } else if (cli_params.count("--status")) {
        mode_ = RunMode::Status;
    }
}

void ParameterContext::merge_environment_vars() {
    const std::vector<std::pair<std::string, std::string>> env_mappings = {
        {"AUTOMACRO_MACROS_PATH", "macros_dir"},
        {"AUTOMACRO_SOCKET", "socket_path"},
        {"AUTOMACRO_BACKEND", "backend"},
        {"AUTOMACRO_LOG_LEVEL", "log_level"}
    };

    for (const auto& [env_var, key] : env_mappings) {
        const char* env_value = std::getenv(env_var.c_str());
        if (!env_value || env_value[0] == '\0') {
            continue;
        }
        if (key == "macros_dir") {
            config_.macros_dir = env_value;
        } else if (key == "socket_path") {
            config_.socket_path = env_value;
        } else if (key == "backend") {
            config_.backend = env_value;
        } else if (key == "log_level") {
            config_.log.level = LogUtils::parse_level(env_value);
        }
    }
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    merge_yaml();
    merge_environment_vars();
    merge_commandline();
    return true;
}

const AppConfig& ParameterContext::get_config() const {
    return config_;
}

RunMode ParameterContext::get_mode() const {
    return mode_;
}

const std::string& ParameterContext::get_macro_name() const {
    return macro_name_;
}

const std::string& ParameterContext::get_macro_file() const {
    return macro_file_;
}

const ParamMap& ParameterContext::get_macro_params() const {
    return macro_params_;
}

bool ParameterContext::is_verbose() const {
    return verbose_;
}
