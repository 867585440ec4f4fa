#include "errors.hpp"

std::string error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DUPLICATE_TICKER: return "DuplicateTickerError";
        case ErrorKind::ALLOCATION_SUM: return "AllocationSumError";
        case ErrorKind::INVALID_WEIGHT: return "InvalidWeightError";
        case ErrorKind::DUPLICATE_HOLDING: return "DuplicateHoldingError";
        case ErrorKind::NEGATIVE_SHARES: return "NegativeSharesError";
        case ErrorKind::NEGATIVE_PRICE: return "NegativePriceError";
        case ErrorKind::NEGATIVE_CASH: return "NegativeCashError";
        case ErrorKind::MISSING_PRICE: return "MissingPriceError";
        case ErrorKind::INVALID_THRESHOLD: return "InvalidThresholdError";
        case ErrorKind::INVALID_TICKER: return "InvalidTickerError";
        case ErrorKind::INVALID_NUMBER: return "InvalidNumberError";
    }
    return "RebalanceError";
}
