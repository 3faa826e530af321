#include <mapkit/mapkit.hpp>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <fmt/format.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std::chrono_literals;

template <typename Callback>
void async_sleep(asio::io_context& ctx, std::chrono::steady_clock::duration t, Callback&& cb) {
    auto timer = std::make_shared<asio::steady_timer>(ctx, t);
    timer->async_wait([timer, cb = std::forward<Callback>(cb)](std::error_code ec) mutable { cb(ec); });
}

// pretend remote lookup, slower for small ids.
auto slow_lookup(asio::io_context& ctx) {
    return [&ctx](int id, mapkit::cancel_token token, mapkit::done_callback<std::string> done) {
        async_sleep(ctx, std::chrono::milliseconds((10 - id % 10) * 20), [id, token, done](std::error_code ec) {
            if (token.cancelled()) {
                done(make_error_code(mapkit::errors::map_err::cancelled), std::string());
                return;
            }
            done(ec, fmt::format("user-{:03}", id));
        });
    };
}

void read_stream(mapkit::ordered_stream<std::string>& stream) {
    stream.async_next([&stream](std::error_code ec, std::optional<std::string> v) {
        if (ec) {
            fmt::print("stream stopped: {}\n", ec.message());
            return;
        }
        if (!v) {
            const auto stats = stream.stats();
            fmt::print("stream done, launched {} delivered {} peak undelivered {}\n", stats.launched, stats.delivered,
                       stats.peak_undelivered);
            return;
        }
        fmt::print("  {}\n", *v);
        read_stream(stream);
    });
}

int main(int argc, char** argv) {
    const int concurrency = argc > 1 ? std::atoi(argv[1]) : 4;

    if (argc > 2 && std::string(argv[2]) == "debug") {
        mapkit::log::set_level(mapkit::log::level::debug);
    }

    asio::io_context ctx;

    mapkit::map_opts opts;
    opts.max_concurrency = concurrency;

    try {
        mapkit::validate(opts);
    } catch (const std::invalid_argument& e) {
        fmt::print("usage: {} [concurrency > 0] [debug]: {}\n", argv[0], e.what());
        return 1;
    }

    fmt::print("eager, {} at a time:\n", concurrency);
    std::vector<int> ids{1, 2, 3, 4, 5, 6, 7, 8};
    mapkit::async_map_ordered(ctx, mapkit::from_container(ids), slow_lookup(ctx), opts,
                              [](std::error_code ec, std::vector<std::string> names) {
                                  if (ec) {
                                      fmt::print("eager failed: {}\n", ec.message());
                                      return;
                                  }
                                  for (auto& n : names) {
                                      fmt::print("  {}\n", n);
                                  }
                              });
    ctx.run();

    fmt::print("streaming an endless id generator, cut off after 1s:\n");
    mapkit::cancel_source deadline;
    deadline.cancel_after(ctx, 1s);
    opts.cancel = deadline.token();
    opts.buffer_multiplier = 2;

    int next_id = 100;
    auto stream = mapkit::map_ordered_stream<std::string>(
        ctx, mapkit::from_generator([&next_id]() -> std::optional<int> { return next_id++; }), slow_lookup(ctx),
        opts);
    read_stream(stream);

    ctx.restart();
    ctx.run();
}
