/**
 * @file coast_policy.hpp
 * @brief Airbrake extension policy used during the Coast phase
 *
 * Coast is the only phase allowed to command a non-zero extension. How much
 * to extend is delegated to a CoastPolicy so the control law can be swapped
 * without touching phase detection. The state machine clamps whatever the
 * policy returns to [0, 1].
 */

#ifndef AIRBRAKES_STATE_COAST_POLICY_HPP
#define AIRBRAKES_STATE_COAST_POLICY_HPP

#include "processing/data_processor.hpp"

namespace airbrakes {

class CoastPolicy {
public:
    virtual ~CoastPolicy() = default;

    /**
     * @brief Desired extension for this tick
     * @param data Processor outputs of the current tick
     * @return Extension, nominally in [0, 1]
     */
    virtual double extension(const ProcessedData& data) = 0;
};

/**
 * @brief Constant extension for the whole coast
 */
class FixedExtensionPolicy : public CoastPolicy {
public:
    explicit FixedExtensionPolicy(double extension) : extension_(extension) {}

    double extension(const ProcessedData&) override { return extension_; }

private:
    double extension_;
};

} // namespace airbrakes

#endif // AIRBRAKES_STATE_COAST_POLICY_HPP
