#include "cli.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "types.hpp"
#include "errors.hpp"
#include "allocation.hpp"
#include "portfolio.hpp"
#include "safety_check.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

int report_error(std::ostream& out, const std::string& kind, const std::string& message) {
    json error_output = {
        {"status", "error"},
        {"kind", kind},
        {"message", message}
    };
    out << error_output.dump(4) << std::endl;
    return 1;
}

unsigned read_share_decimals(const json& value) {
    if (!value.is_number_integer()) {
        throw InvalidNumberError("share_decimals must be an integer, got " + value.dump());
    }
    std::int64_t decimals = value.get<std::int64_t>();
    if (decimals < 0 || decimals > static_cast<std::int64_t>(RebalanceOptions::kMaxShareDecimals)) {
        throw InvalidNumberError("share_decimals must be between 0 and " +
                                 std::to_string(RebalanceOptions::kMaxShareDecimals) +
                                 ", got " + std::to_string(decimals));
    }
    return static_cast<unsigned>(decimals);
}

} // namespace

int Cli::run(std::istream& in, std::ostream& out, std::ostream& err) {
    // 1. Read Input
    json input;
    try {
        in >> input;
    } catch (const std::exception& e) {
        err << "Error parsing JSON input: " << e.what() << std::endl;
        return report_error(out, "InvalidInput", e.what());
    }

    // 2. Parse Holdings, Allocation, Cash and Options
    std::vector<Holding> holdings;
    std::vector<std::pair<std::string, Decimal>> weights;
    Decimal cash;
    MarketData market_data;
    RebalanceOptions options;

    try {
        if (input.contains("holdings")) {
            holdings = input["holdings"].get<std::vector<Holding>>();
        }
        for (const auto& entry : input.at("allocation").items()) {
            weights.emplace_back(entry.key(), entry.value().get<Decimal>());
        }
        if (input.contains("cash")) {
            cash = input["cash"].get<Decimal>();
        }
        if (input.contains("prices")) {
            market_data.prices = input["prices"].get<std::map<std::string, Decimal>>();
        }
        if (input.contains("threshold")) {
            options.threshold = input["threshold"].get<Decimal>();
        }
        if (input.contains("share_decimals")) {
            options.share_decimals = read_share_decimals(input["share_decimals"]);
        }
    } catch (const RebalanceError& e) {
        err << "Error extracting data from JSON: " << e.what() << std::endl;
        return report_error(out, error_kind_name(e.kind()), e.what());
    } catch (const std::exception& e) {
        err << "Error extracting data from JSON: " << e.what() << std::endl;
        return report_error(out, "InvalidInput", e.what());
    }

    // 3. Build the Portfolio and Rebalance
    RebalanceResult result;
    try {
        Portfolio portfolio(std::move(holdings), Allocation(weights), cash, market_data);
        result = portfolio.rebalance(options);
    } catch (const RebalanceError& e) {
        err << error_kind_name(e.kind()) << ": " << e.what() << std::endl;
        return report_error(out, error_kind_name(e.kind()), e.what());
    }

    for (const auto& warning : result.warnings()) {
        err << "Warning: " << warning << std::endl;
    }

    // 4. Run Safety Check
    auto safety_result = SafetyCheck::validate(result.trades());
    if (!safety_result.valid) {
        err << "Safety Check Failed: " << safety_result.reason << std::endl;
        return report_error(out, "SafetyCheckFailed", safety_result.reason);
    }

    // 5. Output Result
    json output = result;
    out << output.dump(4) << std::endl;

    return 0;
}
