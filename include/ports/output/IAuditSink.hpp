#pragma once

#include "domain/events/CalculationPerformedEvent.hpp"

namespace settlement::ports::output {

/**
 * @brief Интерфейс приёмника событий аудита
 *
 * Реализуется ConsoleAuditSink и NullAuditSink. Хранилище аудита
 * находится вне движка; запись best-effort: исключение из record()
 * не влияет на итог расчёта.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    virtual void record(const domain::CalculationPerformedEvent& event) = 0;
};

} // namespace settlement::ports::output
