#pragma once
#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include "runtime/params.hpp"

namespace enclave::test_support {

// Scratch directory removed on destruction
class ScratchDir {
public:
    ScratchDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
            ("enclave-test-" + std::to_string(getpid()) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write(const std::string& name, const std::string& contents) const {
        auto file = path_ / name;
        std::ofstream out(file, std::ios::binary);
        out << contents;
        return file;
    }

private:
    std::filesystem::path path_;
};

// Params whose file references all exist inside `dir`
inline runtime::Params make_params(const ScratchDir& dir, const std::string& vmm_binary) {
    runtime::Params params;
    params.vmm_binary = vmm_binary;
    params.kernel = dir.write("kernel.bin", "kernel");
    params.bios_binary = dir.write("bios.bin", "bios");
    params.initrd = dir.write("initrd.img", "initrd");
    return params;
}

} // namespace enclave::test_support
