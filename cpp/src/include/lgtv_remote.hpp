#pragma once
/**
 * @file lgtv_remote.hpp
 * @brief Remote-control umbrella header: session, discovery and pointer input.
 */
#include "lgtv_service.hpp"

#include "remote/discovery.hpp"
#include "remote/endpoint.hpp"
#include "remote/errors.hpp"
#include "remote/handshake.hpp"
#include "remote/pointer_input.hpp"
#include "remote/remote_session.hpp"
#include "remote/request_correlator.hpp"
#include "remote/subscription_registry.hpp"
#include "remote/transport.hpp"
#include "remote/websocket_transport.hpp"
#include "remote/wire.hpp"
