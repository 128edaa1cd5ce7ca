#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

enum class Commitment : uint8_t {
    Processed = 0,
    Confirmed = 1,
    Finalized = 2
};

const char* to_string(Commitment c);
std::optional<Commitment> parse_commitment(std::string_view s);

struct Endpoint {
    std::string name;
    std::string url;
    std::string x_token;
    std::string provider;
};

struct RunConfig {
    std::string account;          // watched account, base58
    std::size_t transactions{0};  // distinct signatures to race before stopping
    Commitment commitment{Commitment::Confirmed};
    std::vector<Endpoint> endpoints;
    std::string log_dir{"logs"};
    std::string report_path;      // JSON report, empty to skip
    bool verbose{false};
};

// All three throw ConfigError.
RunConfig parse_run_config(std::string_view json);
RunConfig load_run_config(const std::string& path);
void validate_run_config(const RunConfig& cfg);

// KEY=VALUE lines; sets only variables that are not already set.
void load_env_file(const std::string& filepath = ".env");
