/**
 * PORTWAY - API Gateway Request Kernel
 * Plugin Registry - plugin constructors keyed by type tag
 */

#ifndef PORTWAY_PIPELINE_PLUGIN_REGISTRY_HPP
#define PORTWAY_PIPELINE_PLUGIN_REGISTRY_HPP

#include "config/config.hpp"
#include "pipeline/plugin.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace portway::pipeline {

/**
 * Builds a plugin instance from its configuration.
 * scope identifies the owner ("route:<name>#<index>" or "global#<index>") and
 * namespaces any per-instance state. Throws config::ConfigError on bad options.
 */
using PluginFactory = std::function<PluginPtr(const config::PluginConfig&, const std::string& scope)>;

class PluginRegistry {
public:
    PluginRegistry() = default;

    // Non-copyable
    PluginRegistry(const PluginRegistry&) = delete;
    PluginRegistry& operator=(const PluginRegistry&) = delete;

    /**
     * Register (or replace) the factory for a type tag
     */
    void add(std::string type, PluginFactory factory);

    bool contains(const std::string& type) const;

    std::vector<std::string> types() const;

    /**
     * @throws config::ConfigError for unknown types or invalid options
     */
    PluginPtr create(const config::PluginConfig& config, const std::string& scope) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, PluginFactory> factories_;
};

} // namespace portway::pipeline

#endif // PORTWAY_PIPELINE_PLUGIN_REGISTRY_HPP
