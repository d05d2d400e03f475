/**
 * @file i_system.hpp
 * @brief Interface for all ECS systems in the simulation
 */

#pragma once

#include <entt/entt.hpp>
#include "quadsim/core/sim_config.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * Every system steps once per tick over the shared registry and receives the
 * simulation config before its first update.
 */
class ISystem {
protected:
    SimConfig sysConfig;

public:
    virtual ~ISystem() = default;

    /**
     * @brief Updates the system for one simulation step
     *
     * @param registry EnTT registry containing all entities and components
     */
    virtual void update(entt::registry& registry) = 0;

    /**
     * @brief Sets the simulation configuration
     *
     * @param config Validated simulation configuration
     */
    virtual void setSystemConfig(const SimConfig& config) {
        sysConfig = config;
    }

    virtual const SimConfig& getSystemConfig() const {
        return sysConfig;
    }
};

/**
 * @brief Base for systems that carry settings beyond SimConfig
 */
template<typename SpecificConfig>
class ConfigurableSystem : public ISystem {
protected:
    SpecificConfig specificConfig;

public:
    void setSpecificConfig(const SpecificConfig& config) {
        specificConfig = config;
    }

    const SpecificConfig& getSpecificConfig() const {
        return specificConfig;
    }
};

} // namespace Systems
