#pragma once

#include <optional>
#include <string>

namespace settlement::domain {

/**
 * @brief Результат независимой проверки итогов
 */
class VerificationOutcome {
public:
    bool accurate = false;
    std::optional<std::string> error;

    static VerificationOutcome ok() {
        VerificationOutcome outcome;
        outcome.accurate = true;
        return outcome;
    }

    static VerificationOutcome failed(const std::string& message) {
        VerificationOutcome outcome;
        outcome.accurate = false;
        outcome.error = message;
        return outcome;
    }
};

} // namespace settlement::domain
