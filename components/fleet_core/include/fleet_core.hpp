#pragma once

#include "fleet_core/address_range.hpp"
#include "fleet_core/batch_dispatcher.hpp"
#include "fleet_core/config.hpp"
#include "fleet_core/device_filter.hpp"
#include "fleet_core/device_ops.hpp"
#include "fleet_core/err.hpp"
#include "fleet_core/identity_resolver.hpp"
#include "fleet_core/log.hpp"
#include "fleet_core/prober.hpp"
#include "fleet_core/registry.hpp"
#include "fleet_core/types.hpp"
