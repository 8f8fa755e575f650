#pragma once

#include <fmt/core.h>

namespace arisen::compat {
    using fmt::format;
}
