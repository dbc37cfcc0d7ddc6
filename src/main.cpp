#include <memory>
#include <string>
#include <thread>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>

#include "activities/activity_service.hpp"
#include "activities/catalog.hpp"
#include "activities/config.hpp"
#include "activities/errors.hpp"
#include "activities/http_router.hpp"
#include "activities/http_server.hpp"
#include "activities/logging.hpp"
#include "activities/registry.hpp"

namespace {

std::vector<activities::Activity> load_catalog(const activities::ServerConfig& config) {
    if (config.catalog_path.empty()) {
        return activities::catalog::default_catalog();
    }
    return activities::catalog::load_file(config.catalog_path);
}

} // anonymous namespace

int main(int argc, char** argv) {
    using namespace activities;

    ServerConfig config;
    std::unique_ptr<ActivityRegistry> registry;
    try {
        config = load_config(argc, argv);
        registry = std::make_unique<ActivityRegistry>(load_catalog(config), config.enforce_capacity);
    } catch (const ConfigError& e) {
        log_error(LOG_DOMAIN, "invalid_configuration", {{"error", e.what()}});
        return 1;
    } catch (const CatalogError& e) {
        log_error(LOG_DOMAIN, "invalid_catalog",
            {{"error", e.what()}, {"path", config.catalog_path}});
        return 1;
    }

    log_info(LOG_DOMAIN, "catalog_loaded",
        {{"activities", registry->size()},
         {"source", config.catalog_path.empty() ? "builtin" : config.catalog_path},
         {"enforce_capacity", config.enforce_capacity}});

    HttpRouter router(*registry);
    std::unique_ptr<HttpServer> http_server;
    try {
        http_server = std::make_unique<HttpServer>(config.host, config.http_port, router);
    } catch (const boost::system::system_error& e) {
        log_error(LOG_DOMAIN, "http_bind_failed",
            {{"address", config.http_address()}, {"error", e.what()}});
        return 1;
    }

    grpc::EnableDefaultHealthCheckService(true);

    ActivityServiceImpl service(*registry);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(config.grpc_address(), grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        log_error(LOG_DOMAIN, "grpc_bind_failed", {{"address", config.grpc_address()}});
        return 1;
    }

    log_info(LOG_DOMAIN, "grpc_server_started", {{"port", config.grpc_port}});

    // A fatal accept failure takes the gRPC side down with it so the process exits.
    bool http_ok = true;
    std::thread http_thread([&config, &http_server, &server, &http_ok] {
        http_ok = http_server->run();
        if (!http_ok) {
            log_error(LOG_DOMAIN, "http_server_failed", {{"address", config.http_address()}});
            server->Shutdown();
        }
    });

    server->Wait();
    http_server->stop();
    http_thread.join();

    return http_ok ? 0 : 1;
}
