#pragma once

#include <asio/io_context.hpp>
#include <asio/strand.hpp>

namespace mapkit {

// every piece of per-invocation engine state lives on one of these.
using strand_t = asio::strand<asio::io_context::executor_type>;

inline strand_t make_strand(asio::io_context& ctx) {
    return asio::make_strand(ctx.get_executor());
}

}  // namespace mapkit
