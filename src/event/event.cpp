/// @file event.cpp
/// @brief Event implementation

#include <cortex/event/event.hpp>

#include <atomic>
#include <chrono>

namespace cortex_event {

namespace {

EventId allocate_event_id() {
    static std::atomic<std::uint64_t> s_next_id{1};
    return EventId(s_next_id.fetch_add(1, std::memory_order_relaxed));
}

std::uint64_t epoch_millis() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

} // anonymous namespace

const char* priority_name(Priority priority) noexcept {
    switch (priority) {
        case Priority::Critical: return "critical";
        case Priority::High: return "high";
        case Priority::Normal: return "normal";
        case Priority::Low: return "low";
        default: return "unknown";
    }
}

Event::Event(std::string name, EventData data)
    : m_id(allocate_event_id())
    , m_name(std::move(name))
    , m_data(std::move(data))
    , m_timestamp(epoch_millis()) {
}

const RuntimeValue* Event::get_data(const std::string& key) const {
    auto it = m_data.find(key);
    return it != m_data.end() ? &it->second : nullptr;
}

void Event::set_data(std::string key, RuntimeValue value) {
    m_data.insert_or_assign(std::move(key), std::move(value));
}

} // namespace cortex_event
