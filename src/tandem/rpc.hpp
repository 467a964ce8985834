#pragma once

#include "rpc/call-context.hpp"
#include "rpc/client.hpp"
#include "rpc/connection.hpp"
#include "rpc/error-object.hpp"
#include "rpc/message.hpp"
#include "rpc/method-registry.hpp"
#include "rpc/server.hpp"
#include "rpc/status.hpp"
#include "rpc/subscription-sink.hpp"
