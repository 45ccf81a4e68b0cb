#pragma once

#include "di/service_collection.hpp"
#include "di/service_key.hpp"
#include "di/service_provider.hpp"
#include "mediator/cancellation.hpp"
#include "mediator/errors.hpp"
#include "mediator/future.hpp"
#include "mediator/handler_registry.hpp"
#include "mediator/mediator.hpp"
#include "mediator/options.hpp"
#include "mediator/request.hpp"
#include "mediator/request_handler.hpp"
#include "mediator/unit.hpp"
