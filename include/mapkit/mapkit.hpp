#pragma once

#include <mapkit/admission_gate.hpp>
#include <mapkit/async_callback.hpp>
#include <mapkit/cancellation.hpp>
#include <mapkit/errors.hpp>
#include <mapkit/log.hpp>
#include <mapkit/map_opts.hpp>
#include <mapkit/map_ordered.hpp>
#include <mapkit/map_ordered_stream.hpp>
#include <mapkit/ordered_channel.hpp>
#include <mapkit/sequence.hpp>
#include <mapkit/strand.hpp>
#include <mapkit/work.hpp>
