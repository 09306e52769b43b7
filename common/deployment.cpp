// ============================================================
// deployment.cpp -- DeploymentConfig environment mapping
// ============================================================

#include "deployment.hpp"
#include <cstdlib>

std::map<std::string, std::string> DeploymentConfig::env() const {
    std::map<std::string, std::string> results;
    results[ENV_DEPLOYMENT_ID] = id;

    if (server_addr.empty()) {
        // No address means the server is disabled, even if not said so
        results[ENV_SERVER_DISABLE] = "1";
    } else {
        results[ENV_SERVER_ADDR] = server_addr;
        if (server_insecure) {
            results[ENV_SERVER_INSECURE] = "1";
        }
    }
    return results;
}

DeploymentConfig DeploymentConfig::from_env(
    const std::function<const char*(const char*)>& lookup)
{
    auto get = [&](const char* name) -> std::string {
        const char* v = lookup ? lookup(name) : std::getenv(name);
        return v ? std::string(v) : std::string();
    };

    DeploymentConfig cfg;
    cfg.id = get(ENV_DEPLOYMENT_ID);
    if (get(ENV_SERVER_DISABLE).empty()) {
        cfg.server_addr     = get(ENV_SERVER_ADDR);
        cfg.server_insecure = !get(ENV_SERVER_INSECURE).empty();
    }
    return cfg;
}
