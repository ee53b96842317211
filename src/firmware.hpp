#pragma once

#include "platforms/cpuid.hpp"
#include "probe.hpp"

#include <cstdint>
#include <memory>
#include <string>

enum class FirmwareStatus {
    Ok,
    Busy,        // transient; the same call may succeed if repeated
    Unsupported, // the service does not exist on this machine
    Error
};

// One INT 15h, EAX=E820h record.
struct E820Entry {
    uint64_t base = 0;
    uint64_t length = 0;
    uint32_t type = 0;
};

constexpr uint32_t kE820UsableRam = 1;

// Firmware services available before an OS is loaded, shaped after the PC
// BIOS calls a loader stage would issue. Calls are synchronous; there is no
// OS to wait on.
class Firmware {
public:
    virtual ~Firmware() = default;

    // One step of the memory-map walk. Pass continuation = 0 to start; on
    // return continuation == 0 means this was the last entry.
    virtual FirmwareStatus memory_map_next(uint32_t& continuation, E820Entry& entry) = 0;

    // INT 15h, AX=E801h: KiB between 1 MiB and 16 MiB, 64 KiB blocks above 16 MiB.
    virtual FirmwareStatus extended_memory(uint16_t& kib_1m_to_16m, uint16_t& blocks_above_16m) = 0;

    virtual bool cpuid_supported() = 0;
    virtual FirmwareStatus cpuid(uint32_t leaf, CpuidRegs& out) = 0;
};

constexpr int kFirmwareRetryLimit = 3;
constexpr int kMaxMemoryMapEntries = 128;

enum class MemorySource {
    E820,
    E820Partial,
    E801,
    None
};

const char* memory_source_name(MemorySource s);

// Fact probe over firmware services. Never fails: whatever cannot be read is
// left for normalize_facts(). Memory from a partial E820 walk or a saturated
// E801 answer is a lower bound and is marked ram_estimated.
class FirmwareProbe : public FactProbe {
public:
    explicit FirmwareProbe(Firmware& firmware, int retry_limit = kFirmwareRetryLimit);

    HostEnvironment environment() const override { return HostEnvironment::PreOsFirmware; }
    HwFacts read_facts() override;

    MemorySource memory_source() const { return memory_source_; }
    int firmware_calls() const { return calls_; }

private:
    template <typename Call>
    FirmwareStatus with_retry(const char* what, Call&& call);

    uint64_t read_memory();
    void read_cpu(HwFacts& hw);

    Firmware& fw_;
    int retry_limit_;
    int calls_ = 0;
    MemorySource memory_source_ = MemorySource::None;
    bool memory_incomplete_ = false;
};

// Kernel-exported copy of the boot firmware's memory map plus native CPUID,
// or nullptr when the host does not expose one (only Linux on x86 does).
std::unique_ptr<Firmware> make_host_firmware();
