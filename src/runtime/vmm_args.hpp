#pragma once
#include <string>
#include <vector>
#include "runtime/params.hpp"

namespace enclave::runtime {

// Guest monitor command line (without argv[0]). The console and data sockets
// are referenced by the descriptor numbers the child inherits.
std::vector<std::string> build_vmm_args(const Params& params, int console_fd, int data_fd);

// Shell-style rendering for logs
std::string format_command(const std::string& program, const std::vector<std::string>& args);

} // namespace enclave::runtime
