#include "settings.hpp"
#include "errors.hpp"

Settings& Settings::instance() {
    static Settings settings;
    return settings;
}

void Settings::configure(const CoordinationConfig& config, ClientFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    factory_ = std::move(factory);
}

void Settings::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = CoordinationConfig{};
    factory_ = nullptr;
}

CoordinationConfig Settings::coordination() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

bool Settings::has_hosts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !config_.hosts.empty();
}

std::unique_ptr<RemoteLockClient> Settings::create_client() const {
    ClientFactory factory;
    CoordinationConfig config;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        factory = factory_;
        config = config_;
    }
    if (!factory)
        throw ConfigurationError("No coordination client factory configured.");
    auto client = factory(config);
    if (!client)
        throw ConfigurationError("Coordination client factory returned no client.");
    return client;
}
