#pragma once

/// @file agw.hpp
/// @brief Umbrella header for the gateway routing core.

#include "agw/version.hpp"
#include "agw/core/result.hpp"
#include "agw/foundation/config_manager.hpp"
#include "agw/foundation/gateway_logger.hpp"
#include "agw/service/access_log.hpp"
#include "agw/service/exchange_context.hpp"
#include "agw/service/gateway_config.hpp"
#include "agw/service/response_writer.hpp"
#include "agw/service/router.hpp"
#include "agw/service/rule_loader.hpp"
#include "agw/service/upstream_client.hpp"
