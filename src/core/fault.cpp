/// @file fault.cpp
/// @brief Fault policy implementation

#include <simcore/core/fault.hpp>

namespace sim_core {

const char* fault_mode_name(FaultMode mode) {
    switch (mode) {
        case FaultMode::Tolerant: return "tolerant";
        case FaultMode::Strict: return "strict";
    }
    return "unknown";
}

Fault::Fault(Error error)
    : std::runtime_error(build_error_chain(error))
    , m_error(std::move(error)) {}

void FaultPolicy::raise(const Error& error, spdlog::logger& logger) const {
    debug::record_error(error);
    logger.error("{}", build_error_chain(error));

    if (m_mode == FaultMode::Strict) {
        throw Fault(error);
    }
    ++m_tolerated;
}

} // namespace sim_core
