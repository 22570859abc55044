#pragma once

#include "ports/input/ICalculationService.hpp"
#include <istream>
#include <memory>
#include <ostream>
#include <string>

namespace settlement::adapters::primary {

/**
 * @brief Обработчик команд CLI: compute | verify | validate
 *
 * Читает JSON из входного потока и пишет JSON-ответ в выходной.
 * Коды возврата повторяют классы HTTP-статусов:
 * - 0: успех
 * - 2: ошибка входных данных (4xx), включая неверный JSON
 * - 3: VERIFICATION_FAILED или неточный результат (5xx)
 * - 1: неожиданная ошибка
 *
 * compute:  CalculationInputs  -> CalculationResult | {"error","message"}
 * verify:   CalculationResult  -> {"accurate","error","checksum_matches"}
 * validate: CalculationInputs  -> {"valid","errors"}
 */
class CalculationCommandHandler {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_INTERNAL_ERROR = 1;
    static constexpr int EXIT_INPUT_ERROR = 2;
    static constexpr int EXIT_VERIFICATION_FAILED = 3;

    explicit CalculationCommandHandler(std::shared_ptr<ports::input::ICalculationService> calculationService);

    int handle(const std::string& command, std::istream& in, std::ostream& out);

private:
    std::shared_ptr<ports::input::ICalculationService> calculationService_;

    int handleCompute(const std::string& body, std::ostream& out);
    int handleVerify(const std::string& body, std::ostream& out);
    int handleValidate(const std::string& body, std::ostream& out);

    static int sendError(std::ostream& out, int code, const std::string& error, const std::string& message);
};

} // namespace settlement::adapters::primary
