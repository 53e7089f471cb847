#include "unistore/storage_config.hpp"

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace unistore {

// --- BackendConfig ---

namespace {

bool has_param(const BackendConfig& config, const char* key) {
    auto it = config.params.find(key);
    return it != config.params.end() && !it->second.empty();
}

bool is_unsigned_number(const std::string& value) {
    return !value.empty() && value.find_first_not_of("0123456789") == std::string::npos;
}

}  // namespace

std::string BackendConfig::validate() const {
    if (type.empty()) return "backend type is required";
    if (type == "filesystem" || type == "local") {
        if (!has_param(*this, "path"))
            return "filesystem backend requires 'path'";
    } else if (type == "memory" || type == "null") {
        // No required parameters
    } else if (type == "bunny") {
        if (!has_param(*this, "storage_zone"))
            return "bunny backend requires 'storage_zone'";
        if (!has_param(*this, "access_key"))
            return "bunny backend requires 'access_key'";
        for (const char* key : {"connect_timeout_secs", "request_timeout_secs"}) {
            auto it = params.find(key);
            if (it != params.end() && !is_unsigned_number(it->second))
                return std::string("bunny backend '") + key + "' must be a number of seconds";
        }
    } else {
        return "unknown backend type: " + type;
    }
    return {};
}

// --- MigrationConfig ---

namespace {

void parse_backend_json(const nlohmann::json& j, BackendConfig& target) {
    if (j.contains("type")) target.type = j["type"].get<std::string>();
    for (auto& [key, val] : j.items()) {
        if (key == "type") continue;
        // Numbers and booleans are accepted and kept in their JSON spelling
        target.params[key] = val.is_string() ? val.get<std::string>() : val.dump();
    }
}

}  // namespace

bool MigrationConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("mode")) {
            auto m = j["mode"].get<std::string>();
            if (m == "transfer") {
                mode = MigrationMode::Transfer;
            } else if (m == "purge") {
                mode = MigrationMode::Purge;
            } else {
                std::cerr << "Error parsing config: unknown mode '" << m << "'\n";
                return false;
            }
        }
        if (j.contains("delete_source")) delete_source = j["delete_source"].get<bool>();
        if (j.contains("timeout")) timeout_secs = j["timeout"].get<size_t>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("source") && j["source"].is_object()) {
            parse_backend_json(j["source"], source);
        }
        if (j.contains("destination") && j["destination"].is_object()) {
            parse_backend_json(j["destination"], destination);
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

std::string MigrationConfig::validate() const {
    if (source.empty()) return "source backend type is required";
    auto err = source.validate();
    if (!err.empty()) return "source: " + err;
    if (metrics_interval_secs == 0) return "metrics_interval must be > 0";

    if (mode == MigrationMode::Purge) {
        if (delete_source) return "delete_source has no meaning in purge mode";
        return {};
    }

    if (destination.empty()) return "destination backend type is required";
    err = destination.validate();
    if (!err.empty()) return "destination: " + err;
    return {};
}

}  // namespace unistore
