#pragma once

#include "ports/input/ILoanService.hpp"
#include "ports/input/IOwnerSettingsService.hpp"
#include "ports/output/ILoanRepository.hpp"
#include "application/LedgerPosting.hpp"
#include "domain/LedgerError.hpp"
#include "utils/UuidGenerator.hpp"
#include <OwnerLockRegistry.hpp>
#include <iostream>
#include <memory>

namespace budget::application {

/**
 * @brief Займы между счетами владельца
 *
 * Выдача и погашение проводятся переводами. Начисление процентов
 * увеличивает остаток долга; проводки по процентам зависят от
 * политики учёта в настройках владельца.
 */
class LoanService : public ports::input::ILoanService {
public:
    LoanService(
        std::shared_ptr<LedgerPosting> posting,
        std::shared_ptr<ports::output::ILoanRepository> loanRepository,
        std::shared_ptr<ports::input::IOwnerSettingsService> settingsService,
        std::shared_ptr<OwnerLockRegistry> locks
    ) : posting_(std::move(posting))
      , loanRepository_(std::move(loanRepository))
      , settingsService_(std::move(settingsService))
      , locks_(std::move(locks))
    {
        std::cout << "[LoanService] Created" << std::endl;
    }

    domain::Loan disburse(const std::string& ownerId, const domain::LoanRequest& request) override {
        if (!request.principal.isPositive()) {
            throw domain::InvalidAmount("Loan principal must be positive");
        }
        if (request.ratePerPeriod && request.ratePerPeriod->isNegative()) {
            throw domain::InvalidAmount("Interest rate must not be negative");
        }
        if (request.lenderAccountId == request.borrowerAccountId) {
            throw domain::SameAccount(request.lenderAccountId);
        }

        auto lock = locks_->lockExclusive(ownerId);

        domain::Rate rate = request.ratePerPeriod
            ? *request.ratePerPeriod
            : settingsService_->getSettings(ownerId).defaultInterestRate;

        domain::TransferRequest transfer;
        transfer.sourceAccountId = request.lenderAccountId;
        transfer.destinationAccountId = request.borrowerAccountId;
        transfer.periodId = request.periodId;
        transfer.amount = request.principal;
        transfer.kind = domain::TransactionKind::LOAN_DISBURSEMENT;
        transfer.description = request.description.empty() ? "Loan disbursement" : request.description;

        domain::Loan loan(
            utils::UuidGenerator::generate(), ownerId, request.lenderAccountId,
            request.borrowerAccountId, request.principal, rate, request.periodId);
        loan.description = request.description;

        posting_->transfer(ownerId, transfer, [&](const std::vector<domain::Transaction>&) {
            loanRepository_->save(loan);
        });

        std::cout << "[LoanService] Disbursed loan " << loan.id << ": " << loan.principal.toString()
                  << " at " << loan.ratePerPeriod.toString() << " per period" << std::endl;
        return loan;
    }

    domain::Loan accrueInterest(
        const std::string& ownerId, const std::string& loanId, const std::string& periodId) override {
        auto lock = locks_->lockExclusive(ownerId);

        auto loan = requireLoan(ownerId, loanId);
        accrue(loan, periodId, settingsService_->getSettings(ownerId).interestBookkeeping);
        return loan;
    }

    domain::AccrualSummary accrueAll(const std::string& ownerId, const std::string& periodId) override {
        auto lock = locks_->lockExclusive(ownerId);

        posting_->requirePeriod(ownerId, periodId);
        auto policy = settingsService_->getSettings(ownerId).interestBookkeeping;

        domain::AccrualSummary summary;
        for (auto loan : loanRepository_->findByOwner(ownerId)) {
            if (!loan.isActive() || loan.accruedIn(periodId)) {
                continue;
            }
            try {
                domain::Money before = loan.totalInterest;
                accrue(loan, periodId, policy);
                summary.totalInterest += loan.totalInterest - before;
                summary.accrued.push_back(loan);
            } catch (const domain::LedgerException& e) {
                std::cerr << "[LoanService] Accrual failed for loan " << loan.id << ": " << e.what() << std::endl;
                summary.errors.push_back("Loan " + loan.id + ": " + e.what());
            }
        }

        std::cout << "[LoanService] Accrued interest on " << summary.accrued.size()
                  << " loan(s), total " << summary.totalInterest.toString() << std::endl;
        return summary;
    }

    domain::LoanPayment repay(
        const std::string& ownerId,
        const std::string& loanId,
        const domain::Money& amount,
        const std::string& periodId,
        const std::string& notes
    ) override {
        auto lock = locks_->lockExclusive(ownerId);

        auto loan = requireLoan(ownerId, loanId);
        return repayLocked(loan, amount, periodId, notes);
    }

    domain::AutoRepaySummary autoRepay(const std::string& ownerId, const std::string& periodId) override {
        auto lock = locks_->lockExclusive(ownerId);

        domain::AutoRepaySummary summary;
        auto settings = settingsService_->getSettings(ownerId);
        if (!settings.autoRepay) {
            return summary;
        }

        for (auto loan : loanRepository_->findByOwner(ownerId)) {
            if (!loan.isActive()) {
                continue;
            }
            try {
                auto borrower = posting_->requireAccount(ownerId, loan.borrowerAccountId);
                if (!borrower.currentBalance.isPositive()) {
                    continue;
                }
                domain::Money amount = domain::min(
                    borrower.currentBalance.times(settings.autoRepayShare).roundedToCents(),
                    loan.outstanding);
                if (!amount.isPositive() || amount < settings.autoRepayThreshold) {
                    continue;
                }

                auto payment = repayLocked(loan, amount, periodId, "Automatic repayment");
                summary.totalRepaid += payment.amount;
                summary.payments.push_back(payment);
            } catch (const domain::LedgerException& e) {
                std::cerr << "[LoanService] Auto-repay failed for loan " << loan.id << ": " << e.what() << std::endl;
                summary.errors.push_back("Loan " + loan.id + ": " + e.what());
            }
        }

        std::cout << "[LoanService] Auto-repay made " << summary.payments.size()
                  << " payment(s), total " << summary.totalRepaid.toString() << std::endl;
        return summary;
    }

    std::optional<domain::Loan> getLoan(const std::string& ownerId, const std::string& loanId) override {
        auto lock = locks_->lockShared(ownerId);

        auto loan = loanRepository_->findById(loanId);
        if (!loan || loan->ownerId != ownerId) {
            return std::nullopt;
        }
        return loan;
    }

    std::vector<domain::Loan> listLoans(const std::string& ownerId, bool activeOnly) override {
        auto lock = locks_->lockShared(ownerId);

        std::vector<domain::Loan> result;
        for (const auto& loan : loanRepository_->findByOwner(ownerId)) {
            if (!activeOnly || loan.isActive()) {
                result.push_back(loan);
            }
        }
        return result;
    }

    std::vector<domain::LoanPayment> getPayments(const std::string& ownerId, const std::string& loanId) override {
        auto lock = locks_->lockShared(ownerId);

        requireLoan(ownerId, loanId);
        return loanRepository_->findPayments(loanId);
    }

private:
    std::shared_ptr<LedgerPosting> posting_;
    std::shared_ptr<ports::output::ILoanRepository> loanRepository_;
    std::shared_ptr<ports::input::IOwnerSettingsService> settingsService_;
    std::shared_ptr<OwnerLockRegistry> locks_;

    domain::Loan requireLoan(const std::string& ownerId, const std::string& loanId) {
        auto loan = loanRepository_->findById(loanId);
        if (!loan || loan->ownerId != ownerId) {
            throw domain::UnknownLoan(loanId);
        }
        return *loan;
    }

    /**
     * @brief Начислить проценты за период и сохранить займ
     *
     * Период отмечается начисленным и при нулевых процентах.
     */
    void accrue(domain::Loan& loan, const std::string& periodId, domain::InterestBookkeeping policy) {
        if (!loan.isActive() || loan.accruedIn(periodId)) {
            return;
        }
        posting_->requirePeriod(loan.ownerId, periodId);

        domain::Money interest = loan.outstanding.times(loan.ratePerPeriod).roundedToCents();
        domain::Loan updated = loan;
        if (interest.isPositive()) {
            updated.outstanding += interest;
            updated.totalInterest += interest;
        }
        updated.accruedPeriods.insert(periodId);

        LedgerPosting::RecordHook record = [&](const std::vector<domain::Transaction>&) {
            loanRepository_->save(updated);
        };
        if (interest.isPositive()) {
            postInterest(loan, interest, periodId, policy, record);
        } else {
            record({});
        }
        loan = updated;

        std::cout << "[LoanService] Loan " << loan.id << ": interest " << interest.toString()
                  << " (" << domain::toString(policy) << "), outstanding "
                  << loan.outstanding.toString() << std::endl;
    }

    void postInterest(const domain::Loan& loan, const domain::Money& interest,
                      const std::string& periodId, domain::InterestBookkeeping policy,
                      const LedgerPosting::RecordHook& record) {
        std::string description = "Interest on loan " + loan.id;
        switch (policy) {
            case domain::InterestBookkeeping::LOAN_ONLY:
                record({});
                break;
            case domain::InterestBookkeeping::CREDIT_LENDER: {
                domain::PostingRequest posting;
                posting.accountId = loan.lenderAccountId;
                posting.periodId = periodId;
                posting.amount = interest;
                posting.kind = domain::TransactionKind::INTEREST_ACCRUAL;
                posting.description = description;
                posting_->post(loan.ownerId, posting, record);
                break;
            }
            case domain::InterestBookkeeping::TRANSFER_FROM_BORROWER: {
                domain::TransferRequest transfer;
                transfer.sourceAccountId = loan.borrowerAccountId;
                transfer.destinationAccountId = loan.lenderAccountId;
                transfer.periodId = periodId;
                transfer.amount = interest;
                transfer.kind = domain::TransactionKind::INTEREST_ACCRUAL;
                transfer.description = description;
                posting_->transfer(loan.ownerId, transfer, record);
                break;
            }
        }
    }

    domain::LoanPayment repayLocked(domain::Loan& loan, const domain::Money& amount,
                                    const std::string& periodId, const std::string& notes) {
        if (!amount.isPositive()) {
            throw domain::InvalidAmount("Repayment amount must be positive");
        }
        if (!loan.isActive()) {
            throw domain::OverpaymentError("Loan " + loan.id + " is already paid");
        }
        if (amount > loan.outstanding) {
            throw domain::OverpaymentError("Repayment " + amount.toString()
                + " exceeds outstanding " + loan.outstanding.toString());
        }

        domain::TransferRequest transfer;
        transfer.sourceAccountId = loan.borrowerAccountId;
        transfer.destinationAccountId = loan.lenderAccountId;
        transfer.periodId = periodId;
        transfer.amount = amount;
        transfer.kind = domain::TransactionKind::LOAN_REPAYMENT;
        transfer.description = notes.empty() ? "Repayment of loan " + loan.id : notes;

        domain::Loan updated = loan;
        updated.outstanding -= amount;
        if (updated.outstanding.isZero()) {
            updated.status = domain::LoanStatus::PAID;
            updated.paidAt = domain::Timestamp::now();
        }
        domain::LoanPayment payment(
            utils::UuidGenerator::generate(), loan.id, periodId, amount, updated.outstanding, notes);

        posting_->transfer(loan.ownerId, transfer, [&](const std::vector<domain::Transaction>&) {
            loanRepository_->save(updated);
            try {
                loanRepository_->savePayment(payment);
            } catch (...) {
                loanRepository_->save(loan);
                throw;
            }
        });
        loan = updated;

        std::cout << "[LoanService] Repaid " << amount.toString() << " on loan " << loan.id
                  << ", outstanding " << loan.outstanding.toString()
                  << (loan.isActive() ? "" : " (paid)") << std::endl;
        return payment;
    }
};

} // namespace budget::application
