#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    DUPLICATE_TICKER,
    ALLOCATION_SUM,
    INVALID_WEIGHT,
    DUPLICATE_HOLDING,
    NEGATIVE_SHARES,
    NEGATIVE_PRICE,
    NEGATIVE_CASH,
    MISSING_PRICE,
    INVALID_THRESHOLD,
    INVALID_TICKER,
    INVALID_NUMBER
};

// Name of the error class for a kind, e.g. "MissingPriceError"
std::string error_kind_name(ErrorKind kind);

class RebalanceError : public std::runtime_error {
public:
    RebalanceError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Allocation construction
class DuplicateTickerError : public RebalanceError {
public:
    explicit DuplicateTickerError(const std::string& message)
        : RebalanceError(ErrorKind::DUPLICATE_TICKER, message) {}
};

class AllocationSumError : public RebalanceError {
public:
    explicit AllocationSumError(const std::string& message)
        : RebalanceError(ErrorKind::ALLOCATION_SUM, message) {}
};

class InvalidWeightError : public RebalanceError {
public:
    explicit InvalidWeightError(const std::string& message)
        : RebalanceError(ErrorKind::INVALID_WEIGHT, message) {}
};

// Portfolio construction
class DuplicateHoldingError : public RebalanceError {
public:
    explicit DuplicateHoldingError(const std::string& message)
        : RebalanceError(ErrorKind::DUPLICATE_HOLDING, message) {}
};

class NegativeSharesError : public RebalanceError {
public:
    explicit NegativeSharesError(const std::string& message)
        : RebalanceError(ErrorKind::NEGATIVE_SHARES, message) {}
};

class NegativePriceError : public RebalanceError {
public:
    explicit NegativePriceError(const std::string& message)
        : RebalanceError(ErrorKind::NEGATIVE_PRICE, message) {}
};

class NegativeCashError : public RebalanceError {
public:
    explicit NegativeCashError(const std::string& message)
        : RebalanceError(ErrorKind::NEGATIVE_CASH, message) {}
};

// Rebalance time
class MissingPriceError : public RebalanceError {
public:
    explicit MissingPriceError(const std::string& message)
        : RebalanceError(ErrorKind::MISSING_PRICE, message) {}
};

class InvalidThresholdError : public RebalanceError {
public:
    explicit InvalidThresholdError(const std::string& message)
        : RebalanceError(ErrorKind::INVALID_THRESHOLD, message) {}
};

// Input boundary
class InvalidTickerError : public RebalanceError {
public:
    explicit InvalidTickerError(const std::string& message)
        : RebalanceError(ErrorKind::INVALID_TICKER, message) {}
};

class InvalidNumberError : public RebalanceError {
public:
    explicit InvalidNumberError(const std::string& message)
        : RebalanceError(ErrorKind::INVALID_NUMBER, message) {}
};
