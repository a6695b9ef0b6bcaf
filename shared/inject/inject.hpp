#pragma once

#include "type_key.hpp"
#include "injection_failure.hpp"
#include "resolution_sink.hpp"
#include "type_catalog.hpp"
#include "container_config.hpp"
#include "container.hpp"
