#pragma once

// ============================================================
// deployment.hpp -- Deployment configuration <-> environment
//
// A platform launching a workload passes this configuration to the
// workload's entrypoint through environment variables. The snapcp
// client reads the same variables back to find its server.
// ============================================================

#include <map>
#include <string>
#include <functional>

static constexpr const char* ENV_DEPLOYMENT_ID   = "SNAPCP_DEPLOYMENT_ID";
static constexpr const char* ENV_SERVER_ADDR     = "SNAPCP_SERVER_ADDR";
static constexpr const char* ENV_SERVER_DISABLE  = "SNAPCP_SERVER_DISABLE";
static constexpr const char* ENV_SERVER_INSECURE = "SNAPCP_SERVER_INSECURE";

struct DeploymentConfig {
    std::string id;
    std::string server_addr;        // empty = server disabled
    bool        server_insecure{false};

    // Environment variables the entrypoint needs. Exactly one of
    // SNAPCP_SERVER_DISABLE / SNAPCP_SERVER_ADDR is present.
    std::map<std::string, std::string> env() const;

    // Inverse of env(). 'lookup' returns nullptr for unset variables;
    // the default reads the process environment.
    static DeploymentConfig from_env(
        const std::function<const char*(const char*)>& lookup = nullptr);

    bool server_disabled() const { return server_addr.empty(); }
};
