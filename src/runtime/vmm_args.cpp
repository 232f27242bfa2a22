#include "runtime/vmm_args.hpp"

namespace enclave::runtime {

std::vector<std::string> build_vmm_args(const Params& params, int console_fd, int data_fd) {
    std::vector<std::string> args;

    args.push_back("-enable-kvm");
    // Log guest errors and other interesting events to stderr.
    args.insert(args.end(), {"-d", "int,unimp,guest_errors"});
    // RDRAND is needed for remote attestation.
    args.insert(args.end(), {"-cpu", "IvyBridge-IBRS"});
    if (params.memory_size) {
        args.insert(args.end(), {"-m", *params.memory_size});
    }
    args.push_back("-nodefaults");
    args.push_back("-nographic");
    // A restart is never expected; treat it as a failure.
    args.push_back("-no-reboot");
    args.insert(args.end(), {"-machine", "microvm,acpi=on"});

    // First serial port goes to the console socket.
    args.insert(args.end(), {"-chardev", "socket,id=consock,fd=" + std::to_string(console_fd)});
    args.insert(args.end(), {"-serial", "chardev:consock"});

    // Data channel over virtio-serial.
    args.insert(args.end(), {"-chardev", "socket,id=commsock,fd=" + std::to_string(data_fd)});
    args.insert(args.end(), {"-device", "virtio-serial-device,max_ports=1"});
    args.insert(args.end(), {"-device", "virtconsole,chardev=commsock"});

    if (params.pci_passthrough) {
        args.insert(args.end(), {"-device", "vfio-pci,host=" + *params.pci_passthrough});
    }

    args.insert(args.end(), {"-bios", params.bios_binary.string()});
    args.insert(args.end(), {"-kernel", params.kernel.string()});

    if (params.gdb) {
        // Wait for the debugger before booting.
        args.insert(args.end(), {"-gdb", "tcp::" + std::to_string(*params.gdb)});
        args.push_back("-S");
    }

    args.insert(args.end(), {"-initrd", params.initrd.string()});
    return args;
}

std::string format_command(const std::string& program, const std::vector<std::string>& args) {
    std::string out = program;
    for (const auto& arg : args) {
        out += ' ';
        if (arg.find_first_of(" \t\"'") != std::string::npos) {
            out += '"' + arg + '"';
        } else {
            out += arg;
        }
    }
    return out;
}

} // namespace enclave::runtime
