#ifndef I_CLIMATE_DIRECTORY_H
#define I_CLIMATE_DIRECTORY_H

#include <string>

class ZoneRegulator;
class CircuitAggregator;

/**
 * @brief Id lookup used by aggregators to reach their members
 *
 * Aggregators hold ids only; a lookup returning nullptr means the member
 * was removed (UNKNOWN_MEMBER).
 */
class IClimateDirectory {
public:
    virtual ~IClimateDirectory() = default;

    virtual ZoneRegulator* findZone(const std::string& id) const = 0;
    virtual CircuitAggregator* findCircuit(const std::string& id) const = 0;
};

#endif // I_CLIMATE_DIRECTORY_H
