#ifndef STAS_CLOCK_H
#define STAS_CLOCK_H

#include <chrono>

namespace nvmestas {
namespace engine {

/**
 * @brief Time source used by the dispatcher and by retry bookkeeping.
 * @details Production code uses SteadyClock. Tests substitute a manually advanced clock.
 */
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
};

} // namespace engine
} // namespace nvmestas

#endif // STAS_CLOCK_H
