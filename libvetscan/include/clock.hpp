#ifndef VETSCAN_CLOCK_HPP
#define VETSCAN_CLOCK_HPP

#include <chrono>

namespace vetscan {

/**
 * @brief Time source for processing_time_seconds.
 */
class IClock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;
    [[nodiscard]] virtual time_point now() const = 0;
};

class SteadyClock final : public IClock {
public:
    [[nodiscard]] time_point now() const override { return std::chrono::steady_clock::now(); }
};

} // namespace vetscan

#endif // VETSCAN_CLOCK_HPP
