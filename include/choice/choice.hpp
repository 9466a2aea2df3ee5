#pragma once

// Everything needed to define and use choice types.

#include "choice/bridge/decode.hpp"
#include "choice/bridge/encode.hpp"
#include "choice/bridge/fields.hpp"
#include "choice/bridge/yaml_convert.hpp"
#include "choice/common/diagnostic.hpp"
#include "choice/common/internal_error.hpp"
#include "choice/registry/registry.hpp"
#include "choice/registry/root_catalog.hpp"
