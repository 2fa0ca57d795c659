/**
 * PORTWAY - API Gateway Request Kernel
 * Plugin Registry implementation
 */

#include "pipeline/plugin_registry.hpp"

#include <spdlog/spdlog.h>

namespace portway::pipeline {

void PluginRegistry::add(std::string type, PluginFactory factory) {
    std::lock_guard lock(mutex_);
    spdlog::debug("PluginRegistry: Registered plugin type '{}'", type);
    factories_[std::move(type)] = std::move(factory);
}

bool PluginRegistry::contains(const std::string& type) const {
    std::lock_guard lock(mutex_);
    return factories_.contains(type);
}

std::vector<std::string> PluginRegistry::types() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& [type, factory] : factories_) {
        result.push_back(type);
    }
    return result;
}

PluginPtr PluginRegistry::create(const config::PluginConfig& config, const std::string& scope) const {
    PluginFactory factory;
    {
        std::lock_guard lock(mutex_);
        auto it = factories_.find(config.type);
        if (it == factories_.end()) {
            throw config::ConfigError("Unknown plugin type '" + config.type + "' in " + scope);
        }
        factory = it->second;
    }

    PluginPtr plugin;
    try {
        plugin = factory(config, scope);
    } catch (const config::ConfigError&) {
        throw;
    } catch (const std::exception& e) {
        throw config::ConfigError("Plugin '" + config.type + "' in " + scope + ": " + e.what());
    }

    if (!plugin) {
        throw config::ConfigError("Plugin '" + config.type + "' in " + scope + " produced no instance");
    }
    return plugin;
}

} // namespace portway::pipeline
