#include "control/ServoRegistry.hpp"
#include "app/Log.hpp"
#include <utility>

static void close_quietly(const std::string& id, PwmOutput* output) {
    if (!output) return;
    try {
        output->close();
    } catch (const std::exception& e) {
        logWarn("Servo") << "Failed to release output for " << id << ": " << e.what();
    }
}

ServoRegistry::~ServoRegistry() {
    clear();
}

void ServoRegistry::registerServo(const std::string& id, const ServoDescriptor& descriptor,
                                  std::unique_ptr<PwmOutput> output) {
    auto it = entries_.find(id);
    if (it != entries_.end()) {
        close_quietly(id, it->second.output.get());
        it->second = Entry{descriptor, std::move(output), ServoState{}};
        return;
    }
    entries_.emplace(id, Entry{descriptor, std::move(output), ServoState{}});
}

void ServoRegistry::clear() {
    for (auto& [id, entry] : entries_) {
        close_quietly(id, entry.output.get());
    }
    entries_.clear();
}

std::optional<ServoDescriptor> ServoRegistry::get(const std::string& id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.descriptor;
}

ServoRegistry::Entry* ServoRegistry::find(const std::string& id) {
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : &it->second;
}

const ServoRegistry::Entry* ServoRegistry::find(const std::string& id) const {
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : &it->second;
}

std::vector<std::string> ServoRegistry::ids() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) out.push_back(kv.first);
    return out;
}
