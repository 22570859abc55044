#pragma once

#include "ports/output/IAuditSink.hpp"
#include <iostream>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>

namespace settlement::adapters::secondary {

/**
 * @brief Приёмник аудита: одна JSON-строка на событие в поток
 *
 * По умолчанию пишет в std::clog, чтобы не смешиваться с выводом CLI.
 */
class ConsoleAuditSink : public ports::output::IAuditSink {
public:
    explicit ConsoleAuditSink(std::ostream& out = std::clog)
        : out_(out)
    {
        std::clog << "[ConsoleAuditSink] Created" << std::endl;
    }

    void record(const domain::CalculationPerformedEvent& event) override {
        const std::string line = event.toJson();

        std::lock_guard<std::mutex> lock(mutex_);
        out_ << line << '\n';
        out_.flush();
        if (!out_) {
            throw std::runtime_error("audit stream is not writable");
        }
    }

private:
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace settlement::adapters::secondary
