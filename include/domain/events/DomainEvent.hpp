#pragma once

#include "domain/Timestamp.hpp"
#include <string>

namespace settlement::domain {

/**
 * @brief Базовый класс событий, уходящих во внешние приёмники
 */
struct DomainEvent {
    std::string eventId;        ///< UUID события
    std::string eventType;      ///< Тип события (calculation_performed)
    Timestamp timestamp;        ///< Время создания события

    DomainEvent() : timestamp(Timestamp::now()) {}

    explicit DomainEvent(const std::string& type)
        : eventType(type), timestamp(Timestamp::now()) {}

    virtual ~DomainEvent() = default;

    /**
     * @brief Сериализовать в JSON
     */
    virtual std::string toJson() const = 0;
};

} // namespace settlement::domain
