#include "devtier.hpp"
#include "probe.hpp"
#include "profile_json.hpp"

#include <pybind11/pybind11.h>

#include <stdexcept>

namespace py = pybind11;

PYBIND11_MODULE(_devtier, m) {
    m.doc() = "Device tier classification (native extension)";

    m.def("detect_tier_word", &detect_tier_word,
        "Return the device tier as a single string (e.g., 'Desktop', 'Server').");

    m.def("detect_profile_json", []() {
        auto profile = detect_profile(default_tier_table());
        if (!profile) throw std::runtime_error("unsupported environment");
        return encode_profile(*profile);
    }, "Return the detected hardware profile in its JSON encoding.");

    m.def("classify", [](uint64_t memory_bytes, uint32_t cores) {
        HwFacts hw{};
        hw.ram_bytes = memory_bytes;
        hw.logical_cores = cores;
        TierResult r = classify_tier(hw);
        return py::make_tuple(std::string(tier_name(r.tier)), std::string(optimization_name(r.optimization)),
                              r.os_hint, r.reason);
    }, py::arg("memory_bytes"), py::arg("cores"),
        "Classify the given memory size and core count; returns (tier, optimization, os_hint, reason).");

    m.def("detect_hw_facts", []() {
        auto hw = detect_hw_facts();
        if (!hw) throw std::runtime_error("unsupported environment");
        py::dict d;
        d["ram_bytes"] = py::int_(hw->ram_bytes);
        d["logical_cores"] = py::int_(hw->logical_cores);
        d["cpu_vendor"] = hw->cpu_vendor;
        d["cpu_clock_mhz"] = py::int_(hw->cpu_clock_mhz);
        d["architecture"] = std::string(architecture_name(hw->arch));
        d["host"] = std::string(host_environment_name(hw->host));
        d["os_release"] = hw->os_release;
        d["ram_estimated"] = py::bool_(hw->ram_estimated);
        d["cores_estimated"] = py::bool_(hw->cores_estimated);
        d["arch_estimated"] = py::bool_(hw->arch_estimated);
        return d;
    }, "Return a dictionary containing normalized hardware facts detected on the system.");

#ifdef DEVTIER_VERSION
    m.attr("__version__") = DEVTIER_VERSION;
#else
    m.attr("__version__") = "0.0.0";
#endif
}
