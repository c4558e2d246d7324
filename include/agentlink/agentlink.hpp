#pragma once

// agentlink: framed JSON RPC between agents over unix, tcp and mem transports.

#include "agentlink/codec.hpp"
#include "agentlink/config.hpp"
#include "agentlink/errors.hpp"
#include "agentlink/local_agent.hpp"
#include "agentlink/logging.hpp"
#include "agentlink/periodic_task.hpp"
#include "agentlink/registry.hpp"
#include "agentlink/remote_agent.hpp"
#include "agentlink/transport.hpp"
#include "agentlink/types.hpp"
#include "agentlink/uri.hpp"
