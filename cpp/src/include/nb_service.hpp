#pragma once
/**
 * @file nb_service.hpp
 * @brief Layer 2: Service modules built on nb_base.
 *
 * Provides lifecycle management, the asynchronous logger and the callback dispatcher.
 * Include this when you need the application lifecycle or Logger.
 */
#include "nb_base.hpp"

#include "utils/callback_dispatcher.hpp"
#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
