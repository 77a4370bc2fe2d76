#pragma once

#include <Eigen/Dense>

namespace dockpipe {
using Vector3 = Eigen::Vector3d;
} // namespace dockpipe
