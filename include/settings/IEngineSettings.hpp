#pragma once

#include <cstdint>
#include <string>

namespace settlement::settings {

/**
 * @brief Интерфейс настроек движка расчёта
 */
class IEngineSettings {
public:
    virtual ~IEngineSettings() = default;

    /// Код валюты результата (один на вызов)
    virtual std::string getCurrency() const = 0;

    /// Рабочая точность, значащих цифр
    virtual uint32_t getDecimalPrecision() const = 0;

    /// "console" или "none"
    virtual std::string getAuditSink() const = 0;
};

} // namespace settlement::settings
