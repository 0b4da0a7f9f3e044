#ifndef COVERCALC_CONFIG_STORE_HPP
#define COVERCALC_CONFIG_STORE_HPP

#include "underwriting_config.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace covercalc {

/**
 * @brief Holder of the current configuration snapshot
 *
 * Readers take a shared_ptr to an immutable snapshot and keep using it for
 * the whole operation; reload() swaps in a new snapshot without disturbing
 * them. A failed reload leaves the current snapshot in place.
 */
class ConfigStore {
public:
    explicit ConfigStore(UnderwritingConfig config);

    // Load from file; throws ConfigurationError
    static std::shared_ptr<ConfigStore> from_file(const std::string& file_path);

    std::shared_ptr<const UnderwritingConfig> snapshot() const;

    // Replace the snapshot. Returns the new generation number.
    uint64_t replace(UnderwritingConfig config);

    // Re-read the file the current snapshot came from; throws ConfigurationError
    // if there is none or it fails to parse
    uint64_t reload();

    // Swap only the compliance rule set, keeping everything else
    uint64_t replace_rules(RuleSet rules);

    uint64_t generation() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const UnderwritingConfig> current_;
    uint64_t generation_;
};

} // namespace covercalc

#endif // COVERCALC_CONFIG_STORE_HPP
