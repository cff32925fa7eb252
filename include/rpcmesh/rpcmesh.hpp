// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "common/i_lifecycle_managed.hpp"
#include "config.hpp"
#include "core/clock.hpp"
#include "core/config_loader.hpp"
#include "core/event_bus.hpp"
#include "core/json.hpp"
#include "core/logger.hpp"
#include "core/random.hpp"
#include "core/thread_pool.hpp"
#include "core/timer.hpp"
#include "network/http_client.hpp"
#include "network/websocket_client.hpp"
#include "orchestrator.hpp"
#include "pool/connection_health.hpp"
#include "pool/connection_pool.hpp"
#include "pool/load_balancer.hpp"
#include "rpc/dispatch_queue.hpp"
#include "rpc/errors.hpp"
#include "rpc/events.hpp"
#include "rpc/health_monitor.hpp"
#include "rpc/health_tracker.hpp"
#include "rpc/provider_registry.hpp"
#include "rpc/provider_selector.hpp"
#include "rpc/request_executor.hpp"
#include "rpc/response_cache.hpp"
#include "rpc/stream_manager.hpp"
#include "rpc/transport.hpp"
#include "rpc/types.hpp"

#define RPCMESH_DEFAULT_CONFIG_FILE_PATH "/etc/rpcmesh.conf.d/rpcmesh.toml"
