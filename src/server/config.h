#pragma once

#include "proto/config.pb.h"
#include "src/server/isolation.h"
#include "src/server/logger.h"
#include "src/server/sandbox.h"

#include <memory>
#include <string>

namespace evalbox {

// Fills every unset field with its default.
void ApplyDefaults(EngineConfig* config);
EngineConfig DefaultConfig();

// Returns an empty string when the config is usable, otherwise the first problem.
std::string ValidateConfig(const EngineConfig& config);

// Parses protobuf text format, applies defaults and validates. Unknown fields
// are errors.
bool ParseConfig(const std::string& text, EngineConfig* config, std::string* error);
bool LoadConfig(const std::string& path, EngineConfig* config, std::string* error);

LogLevel ToLogLevel(EngineConfig::LogLevel level);
SandboxOptions MakeSandboxOptions(const EngineConfig& config);
std::unique_ptr<IsolationBackend> MakeBackend(const EngineConfig& config);

} // namespace evalbox
