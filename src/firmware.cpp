#include "firmware.hpp"

#include "platforms/platform.hpp"

#include <spdlog/spdlog.h>

#include <limits>

const char* memory_source_name(MemorySource s) {
    switch (s) {
        case MemorySource::E820: return "E820";
        case MemorySource::E820Partial: return "E820 (partial)";
        case MemorySource::E801: return "E801";
        case MemorySource::None: return "none";
    }
    return "none";
}

static const char* status_name(FirmwareStatus s) {
    switch (s) {
        case FirmwareStatus::Ok: return "ok";
        case FirmwareStatus::Busy: return "busy";
        case FirmwareStatus::Unsupported: return "unsupported";
        case FirmwareStatus::Error: return "error";
    }
    return "error";
}

FirmwareProbe::FirmwareProbe(Firmware& firmware, int retry_limit)
    : fw_(firmware), retry_limit_(retry_limit > 0 ? retry_limit : 1) {}

// Repeats a call only while it reports Busy, at most retry_limit_ times.
template <typename Call>
FirmwareStatus FirmwareProbe::with_retry(const char* what, Call&& call) {
    FirmwareStatus st = FirmwareStatus::Error;
    for (int attempt = 1; attempt <= retry_limit_; ++attempt) {
        ++calls_;
        st = call();
        if (st != FirmwareStatus::Busy) break;
        spdlog::debug("{}: firmware busy (attempt {}/{})", what, attempt, retry_limit_);
    }
    if (st != FirmwareStatus::Ok) {
        spdlog::debug("{}: {}", what, status_name(st));
    }
    return st;
}

uint64_t FirmwareProbe::read_memory() {
    // E820: bounded polling walk over the memory map.
    uint32_t continuation = 0;
    uint64_t usable = 0;
    int entries = 0;
    bool failed = false;

    do {
        E820Entry entry{};
        const uint32_t resume = continuation;
        FirmwareStatus st = with_retry("E820", [&]() {
            uint32_t c = resume;
            FirmwareStatus s = fw_.memory_map_next(c, entry);
            if (s == FirmwareStatus::Ok) continuation = c;
            return s;
        });
        if (st != FirmwareStatus::Ok) {
            failed = true;
            break;
        }

        ++entries;
        spdlog::debug("E820 #{}: base=0x{:x} length=0x{:x} type={}", entries, entry.base, entry.length, entry.type);
        if (entry.type == kE820UsableRam) {
            const uint64_t room = std::numeric_limits<uint64_t>::max() - usable;
            usable += entry.length < room ? entry.length : room;
        }
    } while (continuation != 0 && entries < kMaxMemoryMapEntries);

    memory_incomplete_ = false;
    const bool truncated = !failed && continuation != 0;
    if (truncated) {
        spdlog::warn("E820 map longer than {} entries; using the entries read so far", kMaxMemoryMapEntries);
    }
    if (!failed && usable > 0) {
        memory_source_ = truncated ? MemorySource::E820Partial : MemorySource::E820;
        return usable;
    }

    spdlog::warn("E820 memory map unavailable after {} entries; trying E801", entries);

    uint16_t kib_low = 0;
    uint16_t blocks_high = 0;
    FirmwareStatus st = with_retry("E801", [&]() { return fw_.extended_memory(kib_low, blocks_high); });
    if (st == FirmwareStatus::Ok) {
        memory_source_ = MemorySource::E801;
        // Both registers saturate just under 4 GiB; anything above is invisible.
        memory_incomplete_ = blocks_high == 0xFFFF;
        return MiB(1) + KiB(kib_low) + KiB(64) * blocks_high;
    }

    if (usable > 0) {
        spdlog::warn("E801 unavailable; keeping partial E820 total of {} bytes", usable);
        memory_source_ = MemorySource::E820Partial;
        return usable;
    }

    spdlog::warn("no firmware memory service answered");
    memory_source_ = MemorySource::None;
    return 0;
}

void FirmwareProbe::read_cpu(HwFacts& hw) {
    if (!fw_.cpuid_supported()) {
        // 8086/286 class: no CPUID, no SMP.
        hw.arch = Architecture::X86_16;
        hw.logical_cores = 1;
        return;
    }

    hw.arch = Architecture::X86_32;

    CpuidRegs leaf0;
    if (with_retry("CPUID 0", [&]() { return fw_.cpuid(0, leaf0); }) != FirmwareStatus::Ok) return;
    hw.cpu_vendor = cpuid_vendor_string(leaf0);
    const uint32_t max_leaf = leaf0.eax;

    CpuidRegs leaf1;
    if (max_leaf >= 1 && with_retry("CPUID 1", [&]() { return fw_.cpuid(1, leaf1); }) == FirmwareStatus::Ok) {
        const bool htt = (leaf1.edx >> 28) & 1u;
        const uint32_t count = (leaf1.ebx >> 16) & 0xFFu;
        hw.logical_cores = (htt && count > 0) ? count : 1;
    }

    CpuidRegs leaf16;
    if (max_leaf >= 0x16 && with_retry("CPUID 16h", [&]() { return fw_.cpuid(0x16, leaf16); }) == FirmwareStatus::Ok) {
        hw.cpu_clock_mhz = leaf16.eax & 0xFFFFu;
    }

    CpuidRegs ext;
    if (with_retry("CPUID 80000000h", [&]() { return fw_.cpuid(0x80000000u, ext); }) == FirmwareStatus::Ok &&
        ext.eax >= 0x80000001u) {
        CpuidRegs ext1;
        if (with_retry("CPUID 80000001h", [&]() { return fw_.cpuid(0x80000001u, ext1); }) == FirmwareStatus::Ok &&
            ((ext1.edx >> 29) & 1u)) {
            hw.arch = Architecture::X86_64;
        }
    }
}

HwFacts FirmwareProbe::read_facts() {
    HwFacts hw{};
    hw.host = HostEnvironment::PreOsFirmware;

    hw.ram_bytes = read_memory();
    // A partial map is a lower bound, not a measurement.
    hw.ram_estimated = memory_source_ == MemorySource::E820Partial || memory_incomplete_;
    read_cpu(hw);

    spdlog::debug("firmware probe: memory from {}, {} firmware calls", memory_source_name(memory_source_), calls_);
    return hw;
}

#if !defined(DEVTIER_HAS_FIRMWARE_TABLES)
std::unique_ptr<Firmware> make_host_firmware() {
    return nullptr;
}
#endif
