#include "run_config.hpp"

#include <cstdlib>
#include <fstream>
#include <simdjson.h>
#include <unordered_set>
#include <utility>

#include "codec/base58.hpp"
#include "providers/provider_registry.hpp"
#include "util/log.hpp"

namespace {

std::string read_string(simdjson::ondemand::value& v, std::string_view key) {
    std::string_view sv;
    if (v.get_string().get(sv)) {
        throw ConfigError("'" + std::string(key) + "' must be a string");
    }
    return std::string(sv);
}

std::string resolve_token(std::string token, const std::string& endpoint) {
    if (token.empty() || token[0] != '$') return token;
    const std::string var = token.substr(1);
    const char* value = std::getenv(var.c_str());
    if (value == nullptr) {
        throw ConfigError("endpoint '" + endpoint + "': environment variable " + var + " is not set");
    }
    return std::string(value);
}

Endpoint parse_endpoint(simdjson::ondemand::value& v) {
    simdjson::ondemand::object obj;
    if (v.get_object().get(obj)) throw ConfigError("'endpoints' entries must be objects");

    Endpoint ep;
    for (auto field_res : obj) {
        simdjson::ondemand::field field;
        if (std::move(field_res).get(field)) throw ConfigError("malformed endpoint entry");
        std::string_view key;
        if (field.unescaped_key().get(key)) throw ConfigError("malformed endpoint key");

        if (key == "name")          ep.name = read_string(field.value(), key);
        else if (key == "url")      ep.url = read_string(field.value(), key);
        else if (key == "x_token")  ep.x_token = read_string(field.value(), key);
        else if (key == "provider") ep.provider = read_string(field.value(), key);
        else log_warn("[config] Ignoring unknown endpoint key '", key, "'");
    }
    ep.x_token = resolve_token(std::move(ep.x_token), ep.name);
    return ep;
}

RunConfig parse_padded(const simdjson::padded_string& json) {
    simdjson::ondemand::parser parser;
    simdjson::ondemand::document doc;
    if (auto err = parser.iterate(json).get(doc)) {
        throw ConfigError(std::string("invalid JSON: ") + simdjson::error_message(err));
    }
    simdjson::ondemand::object root;
    if (auto err = doc.get_object().get(root)) {
        throw ConfigError(std::string("config root must be an object: ") + simdjson::error_message(err));
    }

    RunConfig cfg;
    try {
        for (auto field_res : root) {
            simdjson::ondemand::field field;
            if (auto err = std::move(field_res).get(field)) throw ConfigError(std::string("invalid JSON: ") + simdjson::error_message(err));
            std::string_view key;
            if (field.unescaped_key().get(key)) throw ConfigError("malformed key");

            simdjson::ondemand::value& v = field.value();
            if (key == "account") {
                cfg.account = read_string(v, key);
            } else if (key == "transactions") {
                std::uint64_t n = 0;
                if (v.get_uint64().get(n)) throw ConfigError("'transactions' must be a non-negative integer");
                cfg.transactions = static_cast<std::size_t>(n);
            } else if (key == "commitment") {
                const std::string s = read_string(v, key);
                auto c = parse_commitment(s);
                if (!c) throw ConfigError("unknown commitment '" + s + "'");
                cfg.commitment = *c;
            } else if (key == "log_dir") {
                cfg.log_dir = read_string(v, key);
            } else if (key == "report_path") {
                cfg.report_path = read_string(v, key);
            } else if (key == "verbose") {
                bool b = false;
                if (v.get_bool().get(b)) throw ConfigError("'verbose' must be a boolean");
                cfg.verbose = b;
            } else if (key == "endpoints") {
                simdjson::ondemand::array arr;
                if (v.get_array().get(arr)) throw ConfigError("'endpoints' must be an array");
                for (auto el_res : arr) {
                    simdjson::ondemand::value el;
                    if (el_res.get(el)) throw ConfigError("malformed 'endpoints' array");
                    cfg.endpoints.push_back(parse_endpoint(el));
                }
            } else {
                log_warn("[config] Ignoring unknown key '", key, "'");
            }
        }
    } catch (const simdjson::simdjson_error& e) {
        throw ConfigError(std::string("invalid JSON: ") + e.what());
    }

    validate_run_config(cfg);
    return cfg;
}

} // namespace

const char* to_string(Commitment c) {
    switch (c) {
        case Commitment::Processed: return "processed";
        case Commitment::Confirmed: return "confirmed";
        case Commitment::Finalized: return "finalized";
    }
    return "confirmed";
}

std::optional<Commitment> parse_commitment(std::string_view s) {
    if (s == "processed") return Commitment::Processed;
    if (s == "confirmed") return Commitment::Confirmed;
    if (s == "finalized") return Commitment::Finalized;
    return std::nullopt;
}

RunConfig parse_run_config(std::string_view json) {
    simdjson::padded_string padded(json);
    return parse_padded(padded);
}

RunConfig load_run_config(const std::string& path) {
    simdjson::padded_string json;
    if (auto err = simdjson::padded_string::load(path).get(json)) {
        throw ConfigError("cannot read " + path + ": " + simdjson::error_message(err));
    }
    return parse_padded(json);
}

void validate_run_config(const RunConfig& cfg) {
    auto key = base58_decode(cfg.account);
    if (cfg.account.empty() || !key || key->size() != 32) {
        throw ConfigError("'account' must be a base58 32-byte public key");
    }
    if (cfg.transactions == 0) {
        throw ConfigError("'transactions' must be greater than zero");
    }
    if (cfg.endpoints.empty()) {
        throw ConfigError("at least one endpoint is required");
    }

    std::unordered_set<std::string> names;
    for (const auto& ep : cfg.endpoints) {
        if (ep.name.empty()) throw ConfigError("endpoint name must not be empty");
        if (!names.insert(ep.name).second) throw ConfigError("duplicate endpoint name '" + ep.name + "'");
        if (ep.url.empty()) throw ConfigError("endpoint '" + ep.name + "' has no url");
        if (ProviderRegistry::instance().find(ep.provider) == nullptr) {
            throw ConfigError("endpoint '" + ep.name + "': unknown provider '" + ep.provider +
                              "' (known: " + ProviderRegistry::instance().joined_names() + ")");
        }
    }
}

void load_env_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return; // no .env, use the process environment
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);

        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r") + 1);

        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty() && std::getenv(key.c_str()) == nullptr) {
            setenv(key.c_str(), value.c_str(), 0);
        }
    }
}
