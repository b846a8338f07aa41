#pragma once

#include "config/config.pb.h"
#include "taskvault/v1/audit.pb.h"

namespace taskvault::v1 {
using RuntimeConfig = ::taskvault::runtime::config::RuntimeConfig;
}
