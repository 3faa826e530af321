#include <mapkit/log.hpp>

#include <atomic>
#include <iostream>
#include <mutex>

namespace mapkit::log {

namespace {
class log_impl {
   public:
    void set_sink(sink_t f) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sink = std::move(f);
    }

    void write(level lvl, std::string line) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_sink) {
            m_sink(lvl, std::move(line));
        } else {
            std::cerr << fmt::format("{}: {}\n", to_string(lvl), line);
        }
    }

    std::atomic<level> m_min_level{level::warning};

   private:
    std::mutex m_mutex;
    sink_t m_sink = nullptr;
};

log_impl the_instance;
}  // namespace

void set_sink(sink_t f) {
    the_instance.set_sink(std::move(f));
}

void reset_sink() {
    the_instance.set_sink(nullptr);
}

void set_level(level lvl) {
    the_instance.m_min_level.store(lvl, std::memory_order_relaxed);
}

bool enabled(level lvl) {
    return static_cast<int>(lvl) >= static_cast<int>(the_instance.m_min_level.load(std::memory_order_relaxed));
}

void write(level lvl, std::string line) {
    if (!enabled(lvl)) {
        return;
    }
    the_instance.write(lvl, std::move(line));
}

std::string_view to_string(level lvl) {
    switch (lvl) {
        case level::debug:
            return "DEBUG";
        case level::warning:
            return "WARNING";
        case level::error:
            return "ERROR";
    }
    return "UNKNOWN";
}

}  // namespace mapkit::log
