#pragma once

#include "config.hpp"

namespace b64stream {

/// dup(2) that throws system_error instead of returning -1.
int duplicate_descriptor(int fd);

}
