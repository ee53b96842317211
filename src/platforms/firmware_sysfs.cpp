// Firmware services as seen from a running Linux kernel.
// /sys/firmware/memmap/<n>/{start,end,type} is the kernel's copy of the
// E820 map it was handed at boot; CPUID is executed natively.

#include "../firmware.hpp"
#include "platform.hpp"

#if defined(DEVTIER_HAS_FIRMWARE_TABLES)

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace {

namespace fs = std::filesystem;

static const char* kMemmapDir = "/sys/firmware/memmap";

static std::string read_line(const fs::path& p) {
    std::ifstream f(p);
    std::string s;
    std::getline(f, s);
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
}

static uint32_t e820_type_from_name(const std::string& name) {
    if (name == "System RAM") return kE820UsableRam;
    if (name == "ACPI Tables") return 3;
    if (name == "ACPI Non-volatile Storage") return 4;
    return 2; // Reserved, and anything the kernel names that we do not know
}

class SysfsFirmware : public Firmware {
public:
    SysfsFirmware() {
        std::error_code ec;
        for (const auto& de : fs::directory_iterator(kMemmapDir, ec)) {
            const std::string name = de.path().filename().string();
            if (name.empty() || !std::all_of(name.begin(), name.end(), [](char c) { return c >= '0' && c <= '9'; }))
                continue;
            try {
                indices_.push_back(std::stoul(name));
            } catch (const std::exception&) {
                spdlog::debug("skipping memmap entry '{}'", name);
            }
        }
        if (ec) spdlog::debug("{}: {}", kMemmapDir, ec.message());
        std::sort(indices_.begin(), indices_.end());
    }

    FirmwareStatus memory_map_next(uint32_t& continuation, E820Entry& entry) override {
        if (indices_.empty()) return FirmwareStatus::Unsupported;
        if (continuation >= indices_.size()) return FirmwareStatus::Error;

        const fs::path dir = fs::path(kMemmapDir) / std::to_string(indices_[continuation]);
        const std::string start = read_line(dir / "start");
        const std::string end = read_line(dir / "end");
        if (start.empty() || end.empty()) return FirmwareStatus::Error;

        uint64_t first = 0;
        uint64_t last = 0;
        try {
            first = std::stoull(start, nullptr, 16);
            last = std::stoull(end, nullptr, 16);
        } catch (const std::exception&) {
            spdlog::warn("unparseable memmap range {} .. {} in {}", start, end, dir.string());
            return FirmwareStatus::Error;
        }
        if (last < first) return FirmwareStatus::Error;

        entry.base = first;
        entry.length = last - first + 1;
        entry.type = e820_type_from_name(read_line(dir / "type"));

        ++continuation;
        if (continuation >= indices_.size()) continuation = 0;
        return FirmwareStatus::Ok;
    }

    // The kernel keeps no copy of the E801 answer.
    FirmwareStatus extended_memory(uint16_t&, uint16_t&) override { return FirmwareStatus::Unsupported; }

    bool cpuid_supported() override {
        CpuidRegs r;
        return native_cpuid(0, r);
    }

    FirmwareStatus cpuid(uint32_t leaf, CpuidRegs& out) override {
        return native_cpuid(leaf, out) ? FirmwareStatus::Ok : FirmwareStatus::Unsupported;
    }

private:
    std::vector<unsigned long> indices_;
};

} // namespace

std::unique_ptr<Firmware> make_host_firmware() {
    return std::make_unique<SysfsFirmware>();
}

#endif
