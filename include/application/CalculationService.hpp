#pragma once

#include "ports/input/ICalculationService.hpp"
#include "ports/output/IAuditSink.hpp"
#include "settings/IEngineSettings.hpp"
#include "application/AccuracyVerifier.hpp"
#include "application/ChecksumGenerator.hpp"
#include "application/GrandTotalAggregator.hpp"
#include "application/InputValidator.hpp"
#include "application/PremiumCalculator.hpp"
#include "application/SubtotalCalculator.hpp"
#include "application/TaxCalculator.hpp"
#include "domain/CalculationException.hpp"
#include "domain/events/CalculationPerformedEvent.hpp"
#include "utils/UuidGenerator.hpp"
#include <chrono>
#include <iostream>
#include <memory>

namespace settlement::application {

/**
 * @brief Оркестратор расчёта итогов счёта
 *
 * Порядок: Subtotal → Premium → Tax → Grand Total → Verifier → Checksum.
 * Первая ошибка компонента возвращается без изменений, частичный
 * результат не возвращается никогда. Каждый вызов compute() публикует
 * одно событие calculation_performed; сбой приёмника аудита только
 * логируется.
 *
 * Сервис не хранит изменяемого состояния: вызовы compute() из разных
 * потоков независимы.
 */
class CalculationService : public ports::input::ICalculationService {
public:
    CalculationService(
        std::shared_ptr<settings::IEngineSettings> settings,
        std::shared_ptr<ports::output::IAuditSink> auditSink
    ) : context_(settings->getDecimalPrecision(), domain::RoundingMode::HALF_EVEN)
      , currency_(settings->getCurrency())
      , auditSink_(std::move(auditSink))
      , subtotalCalculator_(context_)
      , premiumCalculator_(context_)
      , taxCalculator_(context_)
      , grandTotalAggregator_(context_)
    {
        std::clog << "[CalculationService] Created (currency=" << currency_
                  << ", precision=" << context_.precision()
                  << ", rounding=" << domain::toString(context_.rounding()) << ")" << std::endl;
    }

    domain::CalculationOutcome compute(const domain::CalculationInputs& inputs) override {
        const auto started = std::chrono::steady_clock::now();

        domain::CalculationOutcome outcome;
        try {
            outcome = domain::CalculationOutcome::success(calculate(inputs));
        } catch (const domain::CalculationException& e) {
            std::cerr << "[CalculationService] Calculation failed: "
                      << domain::toString(e.kind()) << ": " << e.what() << std::endl;
            outcome = domain::CalculationOutcome::failure(e.toError());
        }

        const double durationMs = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started).count();
        publishAudit(inputs, outcome, durationMs);

        return outcome;
    }

    domain::VerificationOutcome verify(const domain::CalculationResult& result) const override {
        return verifier_.verify(result);
    }

    domain::ValidationReport validate(const domain::CalculationInputs& inputs) const override {
        return validator_.validate(inputs);
    }

private:
    domain::DecimalContext context_;
    std::string currency_;
    std::shared_ptr<ports::output::IAuditSink> auditSink_;

    SubtotalCalculator subtotalCalculator_;
    PremiumCalculator premiumCalculator_;
    TaxCalculator taxCalculator_;
    GrandTotalAggregator grandTotalAggregator_;
    AccuracyVerifier verifier_;
    ChecksumGenerator checksumGenerator_;
    InputValidator validator_;

    domain::CalculationResult calculate(const domain::CalculationInputs& inputs) const {
        if (inputs.items.empty()) {
            throw domain::CalculationException(
                domain::CalculationErrorKind::EMPTY_INPUT,
                "At least one item is required for calculation");
        }

        const domain::Decimal subtotal = subtotalCalculator_.calculate(inputs.items);
        const PremiumCalculation premium = premiumCalculator_.calculate(
            subtotal, inputs.buyersPremiumRate, inputs.premiumTiers);
        const TaxCalculation tax = taxCalculator_.calculate(
            subtotal, premium.amount, inputs.taxRate);
        const domain::Decimal grandTotal = grandTotalAggregator_.aggregate(
            subtotal, premium.amount, tax.amount);

        domain::CalculationResult result;
        result.subtotal = context_.quantize(subtotal, 2);
        result.buyersPremiumAmount = premium.amount;
        result.taxAmount = tax.amount;
        result.grandTotal = grandTotal;
        result.currency = currency_;

        result.breakdown.items.reserve(inputs.items.size());
        for (const auto& item : inputs.items) {
            domain::ItemBreakdown line;
            line.lotId = item.lotId;
            line.title = item.title;
            line.quantity = item.quantity;
            line.unitPrice = item.unitPrice;
            line.totalPrice = context_.quantize(subtotalCalculator_.lineTotal(item), 2);
            result.breakdown.items.push_back(std::move(line));
        }
        result.breakdown.buyersPremium.rate = premium.rate;
        result.breakdown.buyersPremium.amount = premium.amount;
        result.breakdown.buyersPremium.appliedTier = premium.appliedTier;
        result.breakdown.buyersPremium.fallback = premium.fallback;
        result.breakdown.tax.rate = tax.rate;
        result.breakdown.tax.taxableAmount = tax.taxableAmount;
        result.breakdown.tax.amount = tax.amount;

        const domain::VerificationOutcome verification = verifier_.verify(result);
        if (!verification.accurate) {
            throw domain::CalculationException(
                domain::CalculationErrorKind::VERIFICATION_FAILED,
                verification.error.value_or("Verification failed"));
        }

        result.checksum = checksumGenerator_.generate(result);
        return result;
    }

    void publishAudit(
        const domain::CalculationInputs& inputs,
        const domain::CalculationOutcome& outcome,
        double durationMs)
    {
        try {
            domain::CalculationPerformedEvent event;
            event.eventId = utils::UuidGenerator::generate();
            event.correlationId = utils::UuidGenerator::generate();
            event.durationMs = durationMs;
            event.itemCount = inputs.items.size();
            event.buyersPremiumRate = inputs.buyersPremiumRate;
            event.taxRate = inputs.taxRate;
            event.tiersUsed = inputs.usesTiers();
            event.tierCount = inputs.premiumTiers.size();
            event.status = outcome.status();
            event.result = outcome.result;
            event.error = outcome.error;

            auditSink_->record(event);

        } catch (const std::exception& e) {
            std::cerr << "[CalculationService] WARN: failed to record audit event: "
                      << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[CalculationService] WARN: failed to record audit event: unknown error"
                      << std::endl;
        }
    }
};

} // namespace settlement::application
