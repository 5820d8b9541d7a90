#include "src/server/config.h"
#include "src/server/docker_backend.h"
#include "src/server/namespace_backend.h"

#include <fstream>
#include <google/protobuf/io/tokenizer.h>
#include <google/protobuf/text_format.h>
#include <sstream>

namespace evalbox {

namespace {

class ConfigErrorCollector : public google::protobuf::io::ErrorCollector {
public:
    void AddError(int line, google::protobuf::io::ColumnNumber column, const std::string& message) override {
        if (!first_error_.empty()) return;
        std::stringstream ss;
        ss << "line " << line + 1 << ", column " << column + 1 << ": " << message;
        first_error_ = ss.str();
    }

    const std::string& first_error() const { return first_error_; }

private:
    std::string first_error_;
};

bool IsPythonIdentifier(const std::string& name) {
    if (name.empty()) return false;
    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        bool letter = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
        bool digit = c >= '0' && c <= '9';
        if (!letter && !(digit && i > 0)) return false;
    }
    return true;
}

} // namespace

void ApplyDefaults(EngineConfig* config) {
    if (!config->has_execution_timeout_seconds()) config->set_execution_timeout_seconds(30);
    if (!config->has_memory_limit_bytes()) config->set_memory_limit_bytes(256ull * 1024 * 1024);
    if (!config->has_cpu_quota_micros()) config->set_cpu_quota_micros(50000);
    if (!config->has_cpu_period_micros()) config->set_cpu_period_micros(100000);
    if (!config->has_cpu_time_limit_seconds()) config->set_cpu_time_limit_seconds(30);
    if (!config->has_max_processes()) config->set_max_processes(64);
    if (!config->has_sandbox_ttl_seconds()) config->set_sandbox_ttl_seconds(300);
    if (!config->has_reaper_interval_seconds()) config->set_reaper_interval_seconds(60);
    if (config->backend() == EngineConfig::BACKEND_UNSPECIFIED) config->set_backend(EngineConfig::DOCKER);
    if (!config->has_docker_binary()) config->set_docker_binary("docker");
    if (!config->has_docker_image()) config->set_docker_image("python:3.11-slim");
    if (!config->has_docker_command_timeout_seconds()) config->set_docker_command_timeout_seconds(30);
    if (!config->has_python_binary()) config->set_python_binary("python3");
    if (!config->has_entry_point()) config->set_entry_point("solution");
    if (!config->has_listen_address()) config->set_listen_address("0.0.0.0:50051");
    if (!config->has_max_concurrent_executions()) config->set_max_concurrent_executions(10);
    if (config->log_level() == EngineConfig::LOG_LEVEL_UNSPECIFIED) config->set_log_level(EngineConfig::LOG_INFO);
}

EngineConfig DefaultConfig() {
    EngineConfig config;
    ApplyDefaults(&config);
    return config;
}

std::string ValidateConfig(const EngineConfig& config) {
    if (config.execution_timeout_seconds() == 0) return "execution_timeout_seconds must be positive";
    if (config.execution_timeout_seconds() >= config.sandbox_ttl_seconds()) {
        return "execution_timeout_seconds must be shorter than sandbox_ttl_seconds";
    }
    if (config.memory_limit_bytes() == 0) return "memory_limit_bytes must be positive";
    if (config.cpu_period_micros() == 0) return "cpu_period_micros must be positive";
    if (config.cpu_quota_micros() == 0) return "cpu_quota_micros must be positive";
    if (config.cpu_time_limit_seconds() == 0) return "cpu_time_limit_seconds must be positive";
    if (config.max_processes() == 0) return "max_processes must be positive";
    if (config.reaper_interval_seconds() == 0) return "reaper_interval_seconds must be positive";
    if (config.max_concurrent_executions() == 0) return "max_concurrent_executions must be positive";
    if (config.docker_command_timeout_seconds() == 0) return "docker_command_timeout_seconds must be positive";
    if (config.backend() == EngineConfig::DOCKER && config.docker_image().empty()) return "docker_image must be set";
    if (config.python_binary().empty()) return "python_binary must be set";
    if (!IsPythonIdentifier(config.entry_point())) {
        return "entry_point '" + config.entry_point() + "' is not a valid Python identifier";
    }
    if (config.listen_address().empty()) return "listen_address must be set";
    return "";
}

bool ParseConfig(const std::string& text, EngineConfig* config, std::string* error) {
    ConfigErrorCollector collector;
    google::protobuf::TextFormat::Parser parser;
    parser.RecordErrorsTo(&collector);

    EngineConfig parsed;
    if (!parser.ParseFromString(text, &parsed)) {
        if (error) *error = collector.first_error().empty() ? "malformed config" : collector.first_error();
        return false;
    }
    ApplyDefaults(&parsed);

    std::string problem = ValidateConfig(parsed);
    if (!problem.empty()) {
        if (error) *error = problem;
        return false;
    }
    *config = parsed;
    return true;
}

bool LoadConfig(const std::string& path, EngineConfig* config, std::string* error) {
    std::ifstream in(path);
    if (!in) {
        if (error) *error = "cannot open " + path;
        return false;
    }
    std::stringstream contents;
    contents << in.rdbuf();
    if (!ParseConfig(contents.str(), config, error)) {
        if (error) *error = path + ": " + *error;
        return false;
    }
    return true;
}

LogLevel ToLogLevel(EngineConfig::LogLevel level) {
    switch (level) {
        case EngineConfig::LOG_DEBUG: return LogLevel::DEBUG;
        case EngineConfig::LOG_WARNING: return LogLevel::WARNING;
        case EngineConfig::LOG_ERROR: return LogLevel::ERROR;
        default: return LogLevel::INFO;
    }
}

SandboxOptions MakeSandboxOptions(const EngineConfig& config) {
    SandboxOptions options;
    options.limits.memory_bytes = config.memory_limit_bytes();
    options.limits.cpu_quota_micros = config.cpu_quota_micros();
    options.limits.cpu_period_micros = config.cpu_period_micros();
    options.limits.cpu_time_seconds = config.cpu_time_limit_seconds();
    options.limits.max_processes = config.max_processes();
    options.limits.network_disabled = true;
    options.limits.read_only_mount = true;
    options.default_timeout = std::chrono::seconds(config.execution_timeout_seconds());
    options.ttl = std::chrono::seconds(config.sandbox_ttl_seconds());
    return options;
}

std::unique_ptr<IsolationBackend> MakeBackend(const EngineConfig& config) {
    if (config.backend() == EngineConfig::NAMESPACE) {
        NamespaceBackendOptions options;
        options.interpreter = config.python_binary();
        return std::make_unique<NamespaceBackend>(options);
    }
    DockerBackendOptions options;
    options.docker_binary = config.docker_binary();
    options.image = config.docker_image();
    options.command_timeout = std::chrono::seconds(config.docker_command_timeout_seconds());
    return std::make_unique<DockerBackend>(options);
}

} // namespace evalbox
