#include "CatalogConfig.h"
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

void to_json(nlohmann::json& j, const LoaderOptions& o) {
    j = nlohmann::json{
        {"delimiter", std::string(1, o.delimiter)}
    };
}

void from_json(const nlohmann::json& j, LoaderOptions& o) {
    if (j.contains("delimiter")) {
        std::string delimiter = j.at("delimiter").get<std::string>();
        if (delimiter.size() != 1) {
            throw std::invalid_argument("Delimiter must be a single character, got \"" + delimiter + "\".");
        }
        o.delimiter = delimiter[0];
    }
}

void to_json(nlohmann::json& j, const CatalogConfig& c) {
    j = nlohmann::json{
        {"loader", c.loader},
        {"log_level", c.logLevel}
    };
}

void from_json(const nlohmann::json& j, CatalogConfig& c) {
    if (j.contains("loader")) {
        c.loader = j.at("loader").get<LoaderOptions>();
    }
    if (j.contains("log_level")) {
        j.at("log_level").get_to(c.logLevel);
    }
}

CatalogConfig loadCatalogConfig(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return CatalogConfig{};
    }

    nlohmann::json j;
    try {
        ifs >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + std::string(e.what()));
    }

    try {
        return j.get<CatalogConfig>();
    } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + std::string(e.what()));
    }
}

void applyLogLevel(const CatalogConfig& config) {
    spdlog::level::level_enum level = spdlog::level::from_str(config.logLevel);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && config.logLevel != "off") {
        throw std::invalid_argument("Unknown log level: " + config.logLevel);
    }
    spdlog::set_level(level);
}
