#include "config_store.hpp"
#include "errors.hpp"

namespace covercalc {

ConfigStore::ConfigStore(UnderwritingConfig config)
    : current_(std::make_shared<const UnderwritingConfig>(std::move(config))),
      generation_(1) {}

std::shared_ptr<ConfigStore> ConfigStore::from_file(const std::string& file_path) {
    return std::make_shared<ConfigStore>(parse_underwriting_config_from_file(file_path));
}

std::shared_ptr<const UnderwritingConfig> ConfigStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

uint64_t ConfigStore::replace(UnderwritingConfig config) {
    validate_underwriting_config(config);
    auto next = std::make_shared<const UnderwritingConfig>(std::move(config));
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(next);
    return ++generation_;
}

uint64_t ConfigStore::reload() {
    std::string path = snapshot()->source_path;
    if (path.empty()) {
        throw ConfigurationError("cannot reload a configuration that was not loaded from a file");
    }
    return replace(parse_underwriting_config_from_file(path));
}

uint64_t ConfigStore::replace_rules(RuleSet rules) {
    UnderwritingConfig next = *snapshot();
    next.compliance = std::move(rules);
    return replace(std::move(next));
}

uint64_t ConfigStore::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

} // namespace covercalc
