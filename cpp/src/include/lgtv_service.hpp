#pragma once
/**
 * @file lgtv_service.hpp
 * @brief Service umbrella header: base utilities plus lifecycle and logging.
 */
#include "lgtv_base.hpp"

#include "utils/bounded_channel.hpp"
#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
