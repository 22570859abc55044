#include "adapters/primary/CalculationCommandHandler.hpp"
#include "adapters/primary/CalculationJsonMapper.hpp"
#include "application/ChecksumGenerator.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <iterator>
#include <stdexcept>

using json = nlohmann::json;

namespace settlement::adapters::primary {

CalculationCommandHandler::CalculationCommandHandler(
    std::shared_ptr<ports::input::ICalculationService> calculationService)
    : calculationService_(std::move(calculationService))
{
    std::clog << "[CalculationCommandHandler] Created" << std::endl;
}

int CalculationCommandHandler::handle(const std::string& command, std::istream& in, std::ostream& out)
{
    const std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    try {
        if (command == "compute") {
            return handleCompute(body, out);
        }
        if (command == "verify") {
            return handleVerify(body, out);
        }
        if (command == "validate") {
            return handleValidate(body, out);
        }
        return sendError(out, EXIT_INPUT_ERROR, "Unknown command", command);
    }
    catch (const json::exception& e) {
        return sendError(out, EXIT_INPUT_ERROR, "Invalid JSON", e.what());
    }
    catch (const std::invalid_argument& e) {
        return sendError(out, EXIT_INPUT_ERROR, "Invalid inputs", e.what());
    }
    catch (const std::exception& e) {
        std::cerr << "[CalculationCommandHandler] Error: " << e.what() << std::endl;
        return sendError(out, EXIT_INTERNAL_ERROR, "Internal error", e.what());
    }
}

int CalculationCommandHandler::handleCompute(const std::string& body, std::ostream& out)
{
    auto inputs = CalculationJsonMapper::parseInputs(json::parse(body));
    auto outcome = calculationService_->compute(inputs);

    if (outcome.succeeded()) {
        out << CalculationJsonMapper::toJson(*outcome.result).dump(2) << std::endl;
        return EXIT_OK;
    }

    const auto& error = *outcome.error;
    out << CalculationJsonMapper::toJson(error).dump(2) << std::endl;
    return domain::isInputError(error.kind) ? EXIT_INPUT_ERROR : EXIT_VERIFICATION_FAILED;
}

int CalculationCommandHandler::handleVerify(const std::string& body, std::ostream& out)
{
    auto result = CalculationJsonMapper::parseResult(json::parse(body));
    auto outcome = calculationService_->verify(result);

    json response = CalculationJsonMapper::toJson(outcome);

    // Отпечаток сверяется, только если он сохранён вместе с результатом
    bool checksumMatches = true;
    if (!result.checksum.empty()) {
        checksumMatches = application::ChecksumGenerator().generate(result) == result.checksum;
        response["checksum_matches"] = checksumMatches;
    }

    out << response.dump(2) << std::endl;
    return (outcome.accurate && checksumMatches) ? EXIT_OK : EXIT_VERIFICATION_FAILED;
}

int CalculationCommandHandler::handleValidate(const std::string& body, std::ostream& out)
{
    auto inputs = CalculationJsonMapper::parseInputs(json::parse(body));
    auto report = calculationService_->validate(inputs);

    out << CalculationJsonMapper::toJson(report).dump(2) << std::endl;
    return report.valid() ? EXIT_OK : EXIT_INPUT_ERROR;
}

int CalculationCommandHandler::sendError(
    std::ostream& out, int code, const std::string& error, const std::string& message)
{
    json response;
    response["error"] = error;
    response["message"] = message;
    out << response.dump(2) << std::endl;
    return code;
}

} // namespace settlement::adapters::primary
