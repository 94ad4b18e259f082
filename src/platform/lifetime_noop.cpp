#include "dotenv/platform.hpp"

namespace dotenv {

// No parent-death signal on this platform
Result<void> configure_child_lifetime(int /* launcher_pid */) {
    return Result<void>::ok();
}

} // namespace dotenv
