#pragma once

#include "ports/output/IAuditSink.hpp"
#include <gmock/gmock.h>
#include <vector>

namespace settlement::tests {

/**
 * @brief Mock реализация IAuditSink: запоминает все события
 */
class MockAuditSink : public ports::output::IAuditSink {
public:
    const std::vector<domain::CalculationPerformedEvent>& getRecordedEvents() const {
        return events_;
    }

    int recordCallCount() const { return static_cast<int>(events_.size()); }

    void clearEvents() { events_.clear(); }

    // IAuditSink implementation
    void record(const domain::CalculationPerformedEvent& event) override {
        events_.push_back(event);
    }

private:
    std::vector<domain::CalculationPerformedEvent> events_;
};

/**
 * @brief gmock-приёмник для сценариев со сбоем записи
 */
class StrictMockAuditSink : public ports::output::IAuditSink {
public:
    MOCK_METHOD(void, record, (const domain::CalculationPerformedEvent& event), (override));
};

} // namespace settlement::tests
