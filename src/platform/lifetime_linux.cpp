#include "dotenv/platform.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <sys/prctl.h>
#include <unistd.h>

namespace dotenv {

Result<void> configure_child_lifetime(int launcher_pid) {
    if (prctl(PR_SET_PDEATHSIG, SIGTERM, 0, 0, 0) != 0) {
        return Result<void>::err(
            Error(ErrorCode::IO_ERROR, std::string("prctl failed: ") + std::strerror(errno)));
    }

    // The launcher may have exited before the signal was armed
    if (getppid() != static_cast<pid_t>(launcher_pid)) {
        return Result<void>::err(
            Error(ErrorCode::IO_ERROR, "launcher exited before the command started"));
    }

    return Result<void>::ok();
}

} // namespace dotenv
