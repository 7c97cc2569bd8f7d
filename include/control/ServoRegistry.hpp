#pragma once
#include "control/ServoTypes.hpp"
#include "hardware/PwmOutput.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * Servo id → {descriptor, PWM output, runtime state}.
 *
 * Not thread-safe; ServoController serializes every access.
 */
class ServoRegistry {
public:
    struct Entry {
        ServoDescriptor descriptor;
        std::unique_ptr<PwmOutput> output;
        ServoState state;
    };

    ServoRegistry() = default;
    ~ServoRegistry();
    ServoRegistry(const ServoRegistry&) = delete;
    ServoRegistry& operator=(const ServoRegistry&) = delete;

    // Adds or replaces. A replaced entry's output is closed.
    void registerServo(const std::string& id, const ServoDescriptor& descriptor,
                       std::unique_ptr<PwmOutput> output);

    // Closes every output and drops all descriptors and state.
    void clear();

    std::optional<ServoDescriptor> get(const std::string& id) const;

    Entry* find(const std::string& id);
    const Entry* find(const std::string& id) const;

    std::vector<std::string> ids() const;
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::map<std::string, Entry> entries_;
};
