#include "auth/caller_identity.hpp"
#include "config/config.hpp"
#include "database/db_manager.hpp"
#include "groups/group_directory.hpp"
#include "keys/key_service.hpp"
#include "messaging/conversation_directory.hpp"
#include "messaging/message_relay.hpp"
#include "messaging/relationship_service.hpp"
#include "metrics/metrics_aggregator.hpp"
#include "server/connection_registry.hpp"
#include "server/http_server.hpp"
#include "server/request_handler.hpp"
#include "storage/in_memory_storage.hpp"
#include "utils/clock.hpp"
#include "utils/logger.hpp"
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <memory>

sealgate::HttpServer* g_server = nullptr;

void signalHandler(int) {
    if (g_server) {
        std::cout << "\nShutting down server..." << std::endl;
        g_server->stop();
    }
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    sealgate::Config config = sealgate::Config::fromEnvironment();

    // Allow port override via command line argument
    if (argc > 1) {
        char* end = nullptr;
        long port = std::strtol(argv[1], &end, 10);
        if (*end != '\0' || port < 1 || port > 65535) {
            std::cerr << "Invalid port: " << argv[1] << std::endl;
            return 1;
        }
        config.server_port = static_cast<unsigned short>(port);
    }

    sealgate::Logger& logger = sealgate::Logger::getInstance();
    sealgate::LogLevel level;
    if (sealgate::Logger::parseLevel(config.log_level, level)) {
        logger.setMinLevel(level);
    } else {
        logger.warning("Unknown log level " + config.log_level + ", keeping DEBUG");
    }
    logger.setLogFile(config.log_file);
    logger.info("Starting sealgate server...");

    std::unique_ptr<sealgate::Storage> storage;
    if (config.storage_backend == "memory") {
        logger.warning("Using in-memory storage; nothing survives a restart");
        storage = std::make_unique<sealgate::InMemoryStorage>();
    } else {
        storage = std::make_unique<sealgate::DatabaseManager>(config.db_host, config.db_port, config.db_name,
                                                              config.db_user, config.db_password,
                                                              config.db_pool_size);
    }
    if (!storage->initialize()) {
        logger.error("Failed to initialize storage");
        return 1;
    }

    sealgate::CallerVerifier verifier(config.gateway_secret);
    if (verifier.trustsHeaders()) {
        logger.warning("SEALGATE_GATEWAY_SECRET is empty; caller headers are trusted without a signature");
    }

    sealgate::SystemClock clock;
    sealgate::ConnectionRegistry registry;

    sealgate::RelationshipService relationships(*storage, clock);
    sealgate::KeyService keys(*storage, clock, config.keys);
    sealgate::ConversationDirectory conversations(*storage, clock);
    sealgate::GroupDirectory groups(*storage, clock, config.groups, &registry);
    sealgate::MessageRelay relay(*storage, clock, config.messaging, &registry);
    sealgate::MetricsAggregator metrics(*storage, clock, config.keys, config.metrics_cache_seconds, &registry);

    sealgate::Services services{relationships, keys, conversations, groups, relay, metrics};
    sealgate::RequestHandler handler(config, services, verifier);

    logger.info("Server will listen on " + config.server_address + ":" + std::to_string(config.server_port));

    sealgate::HttpServer server(config, handler, verifier, registry);
    g_server = &server;

    if (!server.start()) {
        logger.error("Failed to start server");
        g_server = nullptr;
        return 1;
    }

    g_server = nullptr;
    return 0;
}
