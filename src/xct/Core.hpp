#pragma once

#include "xct/core/Config.hpp"
#include "xct/core/Enums.hpp"
#include "xct/core/Error.hpp"
#include "xct/core/Logger.hpp"
#include "xct/core/Session.hpp"
#include "xct/core/Traits.hpp"

#include "xct/core/geometry/AngleScaling.hpp"

#include "xct/core/types/Field.hpp"
#include "xct/core/types/Grid.hpp"
#include "xct/core/types/Vec.hpp"

#include "xct/core/utils/Strings.hpp"
#include "xct/core/utils/Threadpool.hpp"
