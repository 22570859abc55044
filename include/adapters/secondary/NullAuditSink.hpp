#pragma once

#include "ports/output/IAuditSink.hpp"

namespace settlement::adapters::secondary {

/**
 * @brief Приёмник аудита, который ничего не записывает (SETTLEMENT_AUDIT_SINK=none)
 */
class NullAuditSink : public ports::output::IAuditSink {
public:
    void record(const domain::CalculationPerformedEvent&) override {}
};

} // namespace settlement::adapters::secondary
