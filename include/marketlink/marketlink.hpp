#pragma once

/// @file marketlink.hpp
/// @brief Main include file for the marketlink exchange client

#include "marketlink/clock.hpp"
#include "marketlink/config.hpp"
#include "marketlink/error.hpp"
#include "marketlink/http_client.hpp"
#include "marketlink/rate_limit.hpp"
#include "marketlink/request_pipeline.hpp"
#include "marketlink/retry.hpp"
#include "marketlink/signer.hpp"
#include "marketlink/stream_manager.hpp"
#include "marketlink/stream_transport.hpp"
#include "marketlink/subscription.hpp"

namespace marketlink {

/// Library version
constexpr const char* VERSION = "0.1.0";

} // namespace marketlink
