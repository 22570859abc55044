#pragma once

#include "domain/CalculationInputs.hpp"
#include "domain/CalculationOutcome.hpp"
#include "domain/CalculationResult.hpp"
#include "domain/ValidationReport.hpp"
#include "domain/VerificationOutcome.hpp"

namespace settlement::ports::input {

/**
 * @brief Интерфейс движка расчёта итогов
 */
class ICalculationService {
public:
    virtual ~ICalculationService() = default;

    /**
     * @brief Рассчитать итоги счёта
     *
     * Возвращает либо полный CalculationResult, либо первую ошибку
     * компонента без изменений. Повторов нет.
     */
    virtual domain::CalculationOutcome compute(const domain::CalculationInputs& inputs) = 0;

    /**
     * @brief Независимо перепроверить ранее рассчитанный или сохранённый результат
     */
    virtual domain::VerificationOutcome verify(const domain::CalculationResult& result) const = 0;

    /**
     * @brief Собрать все ошибки входных данных без расчёта
     */
    virtual domain::ValidationReport validate(const domain::CalculationInputs& inputs) const = 0;
};

} // namespace settlement::ports::input
