/// @file main.cpp
/// @brief keyringd entry point.
///
/// Standalone executable hosting the signing-key service with an
/// in-memory secret store, suitable for development and testing.

#include "keyring/foundation/config_manager.hpp"
#include "keyring/foundation/keyring_logger.hpp"
#include "keyring/foundation/keyring_metrics.hpp"
#include "keyring/keys/secret_store.hpp"
#include "keyring/rotation/rotation_config.hpp"
#include "keyring/rotation/rotation_events.hpp"
#include "keyring/service/keyring_service.hpp"
#include "keyring/service/service_runner.hpp"
#include "keyring/version.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    keyring::service::SignalHandler signals;

    auto configPath =
        keyring::service::resolveConfigPath(argc, argv, keyring::service::kDefaultConfigPath);

    // A missing default file means "run with defaults"; an explicit path must load.
    keyring::foundation::ConfigManager config;
    const bool explicitPath =
        configPath != std::filesystem::path(keyring::service::kDefaultConfigPath);
    if (explicitPath || std::filesystem::exists(configPath)) {
        auto loadResult = keyring::service::loadConfig(config, configPath);
        if (!loadResult) {
            std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    auto rotationConfig = keyring::rotation::loadRotationConfig(config);
    if (!rotationConfig) {
        std::cerr << "Invalid keyring config: " << rotationConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto& metrics = keyring::foundation::KeyringMetrics::instance();

    keyring::service::KeyringCollaborators collaborators;
    collaborators.secretStore = std::make_shared<keyring::keys::InMemorySecretStore>();
    collaborators.events = std::make_shared<keyring::rotation::MetricsEventSink>(metrics);
    collaborators.metrics = &metrics;

    keyring::service::KeyringService service(std::move(rotationConfig).value(), collaborators);

    auto started = service.start();
    if (!started) {
        std::cerr << "Failed to start keyring: " << started.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto health = service.keyHealth();
    std::cout << "keyringd " << keyring::Version::string << " started (config: "
              << configPath.string() << ", active kid: " << health.activeKeyId << ")\n";

    signals.waitForShutdown();

    keyring::service::GracefulShutdown shutdown;
    shutdown.addHook("rotation scheduler", [&service]() { service.stop(); });
    shutdown.addHook("logger", []() {
        auto flushed = keyring::foundation::KeyringLogger::instance().flush();
        if (!flushed) {
            std::cerr << "Logger flush failed: " << flushed.error().message() << "\n";
        }
    });
    shutdown.execute();

    std::cout << "keyringd stopped\n";
    return EXIT_SUCCESS;
}
