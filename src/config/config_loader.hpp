#pragma once

#include <filesystem>
#include <map>
#include <string>

#include "config/config_schema.hpp"

namespace trialbench::config {

// Reads, applies defaults, applies TRIALBENCH_* overrides and validates.
// Throws std::runtime_error naming the file on any failure.
Config LoadConfig(const std::filesystem::path& path);

// Same as LoadConfig on an already-parsed document; used by tests.
Config ParseConfig(const std::string& text);

// Throws std::runtime_error describing the first violation.
void ValidateConfig(Config& config);

void ApplyEnvOverrides(Config& config);

// KEY=VALUE lines with optional "export " prefix and matching quotes.
// Blank lines and # comments are skipped. Throws when the file is unreadable.
std::map<std::string, std::string> ParseEnvFile(const std::filesystem::path& path);
std::map<std::string, std::string> ParseEnvText(const std::string& text);

const OrchestratorConfig* FindOrchestrator(const Config& config, const std::string& name);

}  // namespace trialbench::config
