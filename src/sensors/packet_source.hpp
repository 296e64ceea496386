/**
 * @file packet_source.hpp
 * @brief Boundary to the IMU vendor driver
 *
 * Purpose: The acquisition thread pulls packets through this interface. A
 * driver decodes its wire frames, classifies each one by descriptor set into
 * RawPacket or EstimatedPacket, and appends them in collection order.
 *
 * Implementations in this repo:
 * - ScriptedPacketSource (validation/synthetic_flight.hpp): replays a
 *   generated flight for tests and the desktop executable
 *
 * Sample Input:
 *   PacketBatch batch;
 *   bool ok = source.receive(10, batch);  // wait up to 10 ms
 *
 * Expected Output:
 *   ok == true, batch holds 0..n packets (0 = nothing arrived in time)
 *   ok == false on a transient read failure; the caller retries
 */

#ifndef AIRBRAKES_SENSORS_PACKET_SOURCE_HPP
#define AIRBRAKES_SENSORS_PACKET_SOURCE_HPP

#include "core/packet_types.hpp"

namespace airbrakes {

class PacketSource {
public:
    virtual ~PacketSource() = default;

    /**
     * @brief Receive the packets available within a bounded wait
     *
     * Called only from the acquisition thread.
     *
     * @param timeout_ms Maximum time to wait [ms]
     * @param out Packets are appended here, in collection order
     * @return false on a transient failure (nothing appended)
     */
    virtual bool receive(int timeout_ms, PacketBatch& out) = 0;
};

} // namespace airbrakes

#endif // AIRBRAKES_SENSORS_PACKET_SOURCE_HPP
