#include <mapkit/map_ordered.hpp>

#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using namespace mapkit;
using testing::ElementsAre;
using testing::IsEmpty;

namespace {
template <typename Callback>
void async_sleep(asio::io_context& ctx, std::chrono::steady_clock::duration t, Callback&& cb) {
    auto timer = std::make_shared<asio::steady_timer>(ctx, t);
    timer->async_wait([timer, cb = std::forward<Callback>(cb)](std::error_code) mutable { cb(); });
}

std::vector<int> make_items(int n) {
    std::vector<int> res;
    for (int i = 0; i < n; ++i) {
        res.push_back(i);
    }
    return res;
}

void update_max(std::atomic<int>& max, int value) {
    int prev = max.load();
    while (prev < value && !max.compare_exchange_weak(prev, value)) {
    }
}

map_opts with_concurrency(int n) {
    map_opts opts;
    opts.max_concurrency = n;
    return opts;
}
}  // namespace

struct test_sample {
    int limit_num;
    int items_num;
    int expected_running_num;
};

std::ostream& operator<<(std::ostream& os, const test_sample& s) {
    os << "test_sample(limit_num: " << s.limit_num << ", items_num: " << s.items_num
       << ", expected_running_num: " << s.expected_running_num << ")";
    return os;
}

class map_ordered_p : public ::testing::TestWithParam<test_sample> {};

TEST_P(map_ordered_p, results_ordered_and_limit_respected) {
    test_sample sample = GetParam();

    asio::io_context ctx;
    std::atomic<int> n_running{0};
    std::atomic<int> n_running_max{0};
    std::optional<std::vector<std::string>> result;

    async_map_ordered(
        ctx, from_container(make_items(sample.items_num)),
        [&](int item, cancel_token, done_callback<std::string> done) {
            update_max(n_running_max, ++n_running);
            // later items finish first.
            auto delay = std::chrono::milliseconds(((sample.items_num - item) % 7 + 1) * 10);
            async_sleep(ctx, delay, [&n_running, item, done = std::move(done)] {
                n_running--;
                done(std::error_code(), std::to_string(item * 2));
            });
        },
        with_concurrency(sample.limit_num),
        [&](std::error_code ec, std::vector<std::string> values) {
            EXPECT_FALSE(ec);
            result = std::move(values);
        });

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] { ctx.run(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(n_running_max.load(), sample.expected_running_num);
    ASSERT_TRUE(result);
    ASSERT_EQ(result->size(), static_cast<std::size_t>(sample.items_num));
    for (int i = 0; i < sample.items_num; ++i) {
        EXPECT_EQ((*result)[i], std::to_string(i * 2));
    }
}

INSTANTIATE_TEST_SUITE_P(sequence_size_and_limit_combinations,
                         map_ordered_p,
                         ::testing::Values(test_sample{14, 100, 14},
                                           test_sample{1, 10, 1},
                                           test_sample{10, 5, 5},
                                           test_sample{3, 3, 3}));

TEST(map_ordered, squares_with_inverse_delays) {
    asio::io_context ctx;
    std::vector<int> result;
    bool done_called = false;

    async_map_ordered(
        ctx, from_container(std::vector<int>{1, 2, 3, 4, 5}),
        [&](int x, cancel_token, done_callback<int> done) {
            async_sleep(ctx, std::chrono::milliseconds((6 - x) * 10), [x, done] { done(std::error_code(), x * x); });
        },
        with_concurrency(5),
        [&](std::error_code ec, std::vector<int> values) {
            EXPECT_FALSE(ec);
            result = std::move(values);
            done_called = true;
        });
    ctx.run();

    EXPECT_TRUE(done_called);
    EXPECT_THAT(result, ElementsAre(1, 4, 9, 16, 25));
}

TEST(map_ordered, nothing_runs_before_ctx_runs) {
    asio::io_context ctx;
    int started = 0;
    bool done_called = false;

    async_map_ordered(
        ctx, from_container(std::vector<int>{1, 2, 3}),
        [&](int x, cancel_token, done_callback<int> done) {
            started++;
            done(std::error_code(), x);
        },
        with_concurrency(2), [&](std::error_code, std::vector<int>) { done_called = true; });

    EXPECT_EQ(started, 0);
    EXPECT_FALSE(done_called);
    ctx.run();
    EXPECT_EQ(started, 3);
    EXPECT_TRUE(done_called);
}

TEST(map_ordered, empty_input) {
    asio::io_context ctx;
    int calls = 0;
    std::optional<std::vector<int>> result;

    async_map_ordered(
        ctx, from_container(std::vector<int>{}),
        [&](int x, cancel_token, done_callback<int> done) {
            calls++;
            done(std::error_code(), x);
        },
        with_concurrency(4),
        [&](std::error_code ec, std::vector<int> values) {
            EXPECT_FALSE(ec);
            result = std::move(values);
        });
    ctx.run();

    EXPECT_EQ(calls, 0);
    ASSERT_TRUE(result);
    EXPECT_THAT(*result, IsEmpty());
}

TEST(map_ordered, synchronous_transform) {
    asio::io_context ctx;
    std::vector<int> result;

    async_map_ordered(
        ctx, from_container(make_items(50)),
        [](int x, cancel_token, done_callback<int> done) { done(std::error_code(), x + 1); }, with_concurrency(3),
        [&](std::error_code ec, std::vector<int> values) {
            EXPECT_FALSE(ec);
            result = std::move(values);
        });
    ctx.run();

    ASSERT_EQ(result.size(), 50u);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(result[i], i + 1);
    }
}

TEST(map_ordered, explicit_out_with_generic_done) {
    asio::io_context ctx;
    std::vector<double> result;

    async_map_ordered<double>(
        ctx, from_container(std::vector<int>{1, 2}),
        [](int x, cancel_token, auto done) { done(std::error_code(), x / 2.0); }, with_concurrency(1),
        [&](std::error_code, auto values) { result = std::move(values); });
    ctx.run();

    EXPECT_THAT(result, ElementsAre(0.5, 1.0));
}

TEST(map_ordered, ignore_cancellation_adapter) {
    asio::io_context ctx;
    std::vector<int> result;

    async_map_ordered(
        ctx, from_container(std::vector<int>{1, 2, 3}),
        ignore_cancellation([](int x, done_callback<int> done) { done(std::error_code(), -x); }),
        with_concurrency(2), [&](std::error_code ec, std::vector<int> values) {
            EXPECT_FALSE(ec);
            result = std::move(values);
        });
    ctx.run();

    EXPECT_THAT(result, ElementsAre(-1, -2, -3));
}

TEST(map_ordered, first_error_stops_admission) {
    for (int limit = 1; limit < 6; ++limit) {
        SCOPED_TRACE("limit: " + std::to_string(limit));
        asio::io_context ctx;

        std::vector<int> started;
        bool finish_called = false;

        async_map_ordered(
            ctx, from_container(make_items(20)),
            [&](int item, cancel_token, done_callback<int> done) {
                EXPECT_FALSE(finish_called);
                started.push_back(item);
                if (item == 2) {
                    done(make_error_code(std::errc::io_error), 0);
                    return;
                }
                async_sleep(ctx, 50ms, [item, done] { done(std::error_code(), item); });
            },
            with_concurrency(limit),
            [&](std::error_code ec, std::vector<int> values) {
                EXPECT_EQ(ec, std::errc::io_error);
                EXPECT_THAT(values, IsEmpty());
                finish_called = true;
            });
        ctx.run();

        EXPECT_TRUE(finish_called);
        if (limit >= 3) {
            // failing item is in the first window, nothing after it gets admitted.
            EXPECT_EQ(started.size(), static_cast<std::size_t>(limit));
        } else {
            EXPECT_LE(started.size(), 4u);
        }
    }
}

TEST(map_ordered, first_error_wins_and_running_items_joined) {
    asio::io_context ctx;

    int finished_items = 0;
    bool finish_called = false;

    async_map_ordered(
        ctx, from_container(make_items(5)),
        [&](int item, cancel_token, done_callback<int> done) {
            if (item == 2) {
                done(make_error_code(std::errc::operation_not_permitted), 0);
                return;
            }
            async_sleep(ctx, 100ms, [&finished_items, done] {
                finished_items++;
                done(make_error_code(std::errc::io_error), 0);
            });
        },
        with_concurrency(3),
        [&](std::error_code ec, std::vector<int>) {
            EXPECT_EQ(ec, std::errc::operation_not_permitted);
            // items 0 and 1 were running and got waited for.
            EXPECT_EQ(finished_items, 2);
            finish_called = true;
        });
    ctx.run();

    EXPECT_TRUE(finish_called);
}

TEST(map_ordered, external_cancel_after_third_admission) {
    asio::io_context ctx;
    cancel_source source;
    auto opts = with_concurrency(2);
    opts.cancel = source.token();

    int started = 0;
    std::optional<std::error_code> result_ec;

    async_map_ordered(
        ctx, from_container(make_items(1000)),
        [&](int item, cancel_token, done_callback<int> done) {
            if (++started == 3) {
                source.cancel();
            }
            async_sleep(ctx, std::chrono::milliseconds(10 * (item + 1)), [item, done] { done(std::error_code(), item); });
        },
        opts,
        [&](std::error_code ec, std::vector<int> values) {
            EXPECT_THAT(values, IsEmpty());
            result_ec = ec;
        });
    ctx.run();

    EXPECT_EQ(started, 3);
    ASSERT_TRUE(result_ec);
    EXPECT_EQ(*result_ec, errors::map_err::cancelled);
    EXPECT_EQ(*result_ec, std::errc::operation_canceled);
}

TEST(map_ordered, cancelled_before_start) {
    asio::io_context ctx;
    cancel_source source;
    source.cancel();
    auto opts = with_concurrency(4);
    opts.cancel = source.token();

    int started = 0;
    std::optional<std::error_code> result_ec;

    async_map_ordered(
        ctx, from_container(make_items(10)),
        [&](int item, cancel_token, done_callback<int> done) {
            started++;
            done(std::error_code(), item);
        },
        opts, [&](std::error_code ec, std::vector<int>) { result_ec = ec; });
    ctx.run();

    EXPECT_EQ(started, 0);
    EXPECT_EQ(result_ec, errors::map_err::cancelled);
}

TEST(map_ordered, transform_observes_signal) {
    asio::io_context ctx;
    cancel_source source;
    source.cancel_after(ctx, 20ms);
    auto opts = with_concurrency(2);
    opts.cancel = source.token();

    std::optional<std::error_code> result_ec;
    const auto start = std::chrono::steady_clock::now();

    async_map_ordered(
        ctx, from_container(make_items(10)),
        [&](int, cancel_token token, done_callback<int> done) {
            auto timer = std::make_shared<asio::steady_timer>(ctx, 10s);
            auto sub = std::make_shared<cancel_subscription>();
            *sub = cancel_subscription(token, [&ctx, timer] { asio::post(ctx, [timer] { timer->cancel(); }); });
            timer->async_wait([timer, sub, done](std::error_code ec) { done(ec, 0); });
        },
        opts, [&](std::error_code ec, std::vector<int>) { result_ec = ec; });
    ctx.run();

    ASSERT_TRUE(result_ec);
    EXPECT_EQ(*result_ec, std::errc::operation_canceled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(map_ordered, transform_throws) {
    asio::io_context ctx;
    std::optional<std::error_code> result_ec;

    async_map_ordered(
        ctx, from_container(make_items(5)),
        [](int item, cancel_token, done_callback<int> done) {
            if (item == 1) {
                throw std::runtime_error("boom");
            }
            done(std::error_code(), item);
        },
        with_concurrency(1), [&](std::error_code ec, std::vector<int>) { result_ec = ec; });
    ctx.run();

    EXPECT_EQ(result_ec, errors::map_err::transform_threw);
}

TEST(map_ordered, transform_throws_system_error) {
    asio::io_context ctx;
    std::optional<std::error_code> result_ec;

    async_map_ordered(
        ctx, from_container(make_items(5)),
        [](int item, cancel_token, done_callback<int> done) {
            if (item == 3) {
                throw std::system_error(make_error_code(std::errc::no_space_on_device));
            }
            done(std::error_code(), item);
        },
        with_concurrency(2), [&](std::error_code ec, std::vector<int>) { result_ec = ec; });
    ctx.run();

    EXPECT_EQ(result_ec, std::errc::no_space_on_device);
}

TEST(map_ordered, transform_drops_callback) {
    asio::io_context ctx;
    std::optional<std::error_code> result_ec;

    async_map_ordered(
        ctx, from_container(make_items(5)),
        [](int item, cancel_token, done_callback<int> done) {
            if (item == 0) {
                // done goes out of scope uncalled.
                return;
            }
            done(std::error_code(), item);
        },
        with_concurrency(2), [&](std::error_code ec, std::vector<int>) { result_ec = ec; });
    ctx.run();

    EXPECT_EQ(result_ec, errors::map_err::not_called);
}

TEST(map_ordered, input_sequence_throws) {
    asio::io_context ctx;
    int pulled = 0;
    std::optional<std::error_code> result_ec;

    async_map_ordered(
        ctx, from_generator([&]() -> std::optional<int> {
            if (pulled == 3) {
                throw std::runtime_error("source broke");
            }
            return pulled++;
        }),
        [](int item, cancel_token, done_callback<int> done) { done(std::error_code(), item); }, with_concurrency(2),
        [&](std::error_code ec, std::vector<int>) { result_ec = ec; });
    ctx.run();

    EXPECT_EQ(result_ec, errors::map_err::source_failed);
}

TEST(map_ordered, unbounded_generator_with_take) {
    asio::io_context ctx;
    int next = 0;
    std::vector<int> result;

    async_map_ordered(
        ctx, take(from_generator([&]() -> std::optional<int> { return next++; }), 4),
        [](int item, cancel_token, done_callback<int> done) { done(std::error_code(), item * 10); },
        with_concurrency(8), [&](std::error_code ec, std::vector<int> values) {
            EXPECT_FALSE(ec);
            result = std::move(values);
        });
    ctx.run();

    EXPECT_THAT(result, ElementsAre(0, 10, 20, 30));
}

TEST(map_ordered, invalid_arguments_throw_before_scheduling) {
    asio::io_context ctx;
    auto transform = [](int item, cancel_token, done_callback<int> done) { done(std::error_code(), item); };
    bool done_called = false;
    auto done = [&](std::error_code, std::vector<int>) { done_called = true; };

    EXPECT_THROW(async_map_ordered(ctx, from_container(make_items(3)), transform, with_concurrency(0), done),
                 std::invalid_argument);
    EXPECT_THROW(async_map_ordered(ctx, from_container(make_items(3)), transform, with_concurrency(-2), done),
                 std::invalid_argument);

    std::function<void(int, cancel_token, done_callback<int>)> null_transform;
    EXPECT_THROW(async_map_ordered(ctx, from_container(make_items(3)), null_transform, with_concurrency(2), done),
                 std::invalid_argument);

    std::function<std::optional<int>()> null_input;
    EXPECT_THROW(async_map_ordered(ctx, null_input, transform, with_concurrency(2), done), std::invalid_argument);

    ctx.run();
    EXPECT_FALSE(done_called);
}

TEST(map_ordered, basic_randomized_test) {
    auto seed = time(nullptr);
    srand(seed);

    for (int run_n = 0; run_n < 5; run_n++) {
        asio::io_context ctx;

        int n_running = 0;
        int n_running_max = 0;
        auto limit_n = rand() % 10 + 1;
        auto items = make_items(rand() % 30 + 1);
        std::vector<int> result;

        async_map_ordered(
            ctx, from_range(items.begin(), items.end()),
            [&](int item, cancel_token, done_callback<int> done) {
                n_running++;
                n_running_max = std::max(n_running_max, n_running);
                async_sleep(ctx, std::chrono::milliseconds(rand() % 50 + 5), [&n_running, item, done] {
                    n_running--;
                    done(std::error_code(), item);
                });
            },
            with_concurrency(limit_n), [&](std::error_code ec, std::vector<int> values) {
                EXPECT_FALSE(ec);
                result = std::move(values);
            });
        ctx.run();

        EXPECT_EQ(n_running_max, std::min(limit_n, static_cast<int>(items.size()))) << "seed was: " << seed;
        EXPECT_EQ(result, items) << "seed was: " << seed;
    }
}
