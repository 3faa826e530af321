#pragma once

#include <fmt/format.h>

#include <functional>
#include <string>
#include <string_view>

namespace mapkit::log {

enum class level { debug, warning, error };

using sink_t = std::function<void(level, std::string)>;

// replaces the process-wide writer. sink is called under a lock, so it does not
// need to be thread-safe itself.
void set_sink(sink_t f);
void reset_sink();

// lines below this level are dropped before formatting reaches the sink.
void set_level(level lvl);
bool enabled(level lvl);

void write(level lvl, std::string line);

std::string_view to_string(level lvl);

template <class... Args>
void debug(std::string_view fmt_str, Args&&... args) {
    if (enabled(level::debug)) {
        write(level::debug, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
    }
}

template <class... Args>
void warning(std::string_view fmt_str, Args&&... args) {
    if (enabled(level::warning)) {
        write(level::warning, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
    }
}

template <class... Args>
void error(std::string_view fmt_str, Args&&... args) {
    if (enabled(level::error)) {
        write(level::error, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
    }
}

}  // namespace mapkit::log
