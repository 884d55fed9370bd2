#pragma once

/**
 * @file muxbus.hpp
 * @brief MuxBus public API - single include for the entire library
 *
 * @example
 * @code
 * #include <muxbus/muxbus.hpp>
 *
 * auto [error, client] = muxbus::Client::Create({.port = 4000});
 * client->Send("scores", muxbus::MakePacket("42"));
 * @endcode
 */

#include "muxbus/detail/config.hpp"
#include "muxbus/frame.hpp"
#include "muxbus/log.hpp"
#include "muxbus/scheduler.hpp"
#include "muxbus/encoder.hpp"
#include "muxbus/adapter.hpp"
#include "muxbus/channel.hpp"
#include "muxbus/client.hpp"
#include "muxbus/encoders/binary_encoder.hpp"
#include "muxbus/adapters/inproc_adapter.hpp"
