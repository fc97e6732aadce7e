#pragma once

#include "ConfigParser.hpp"
#include "AppConfig.hpp"
#include "MacroStep.hpp"

#include <unordered_map>
#include <vector>
#include <string>

enum class RunMode {
    None,
    List,
    Run,
    File,
    Serve,
    Status
};

class ParameterContext {
public:
    ParameterContext();

    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_commandline(int argc, char* argv[]);
    void merge_environment_vars();
    void merge_yaml(const YAML::Node& config);
    void merge_yaml(const std::string& file_path);
    void merge_yaml();

    const AppConfig& get_config() const;
    RunMode get_mode() const;
    const std::string& get_macro_name() const;
    const std::string& get_macro_file() const;
    const ParamMap& get_macro_params() const;
    bool is_verbose() const;

private:
    AppConfig config_;
    RunMode mode_ = RunMode::None;
    std::string macro_name_;
    std::string macro_file_;
    ParamMap macro_params_;
    bool verbose_ = false;

    // Command line storage; --param may repeat, so its values are kept apart
    std::unordered_map<std::string, std::string> cli_params;
    std::vector<std::string> cli_param_pairs;

    void resolve_mode();

    struct CommandOption {
        std::string long_opt;
        char short_opt;
        std::string description;
        bool requires_value;
    };

    static const std::vector<CommandOption> valid_options;
};
