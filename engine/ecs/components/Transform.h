// World pose component: position plus unit facing.
#pragma once

#include "../../math/Vec3.h"

namespace Bulwark::ECS {

struct Transform {
    Vec3 position{};
    Vec3 forward{Vec3::forward()};
};

}  // namespace Bulwark::ECS
