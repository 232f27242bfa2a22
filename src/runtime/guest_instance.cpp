#include "runtime/guest_instance.hpp"

namespace enclave::runtime {

WaitResult GuestInstance::kill(std::unique_ptr<GuestInstance> instance) {
    if (!instance) {
        WaitResult result;
        result.status = Status::error(ErrorKind::IO, "no guest instance to kill");
        return result;
    }
    return instance->do_kill();
}

} // namespace enclave::runtime
