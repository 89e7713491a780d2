#ifndef CATALOG_CONFIG_H
#define CATALOG_CONFIG_H

#include <string>
#include <nlohmann/json.hpp>

struct LoaderOptions {
    char delimiter = ',';
};

struct CatalogConfig {
    LoaderOptions loader;
    std::string logLevel = "warn";
};

void to_json(nlohmann::json& j, const LoaderOptions& o);
void from_json(const nlohmann::json& j, LoaderOptions& o);
void to_json(nlohmann::json& j, const CatalogConfig& c);
void from_json(const nlohmann::json& j, CatalogConfig& c);

// A missing file yields the defaults. Throws std::runtime_error on malformed JSON.
CatalogConfig loadCatalogConfig(const std::string& path);

// Sets the spdlog global level. Throws std::invalid_argument on an unknown level name.
void applyLogLevel(const CatalogConfig& config);

#endif // CATALOG_CONFIG_H
