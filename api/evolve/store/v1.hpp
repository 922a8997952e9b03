#pragma once

#include "evolve/store/v1/program.pb.h"

namespace evolve::store::v1 {

// Convenience umbrella header.

} // namespace evolve::store::v1
