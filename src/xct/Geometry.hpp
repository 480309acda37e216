#pragma once

#include "xct/core/geometry/AngleScaling.hpp"

#include "xct/geometry/ParallelGeometry.hpp"
#include "xct/geometry/Project.hpp"
#include "xct/projector/Projector.hpp"
