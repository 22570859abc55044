#pragma once

#include <string>
#include <vector>

namespace settlement::domain {

/**
 * @brief Полный список проблем входных данных
 */
class ValidationReport {
public:
    std::vector<std::string> errors;

    bool valid() const { return errors.empty(); }

    void add(const std::string& message) { errors.push_back(message); }
};

} // namespace settlement::domain
