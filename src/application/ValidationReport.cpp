/**
 * @file ValidationReport.cpp
 * @brief Implementation of ValidationReport.
 */

#include "application/ValidationReport.hpp"

namespace solverify::application {

nlohmann::json ValidationReport::Build(const std::vector<domain::CheckedContract>& contracts,
                                       const std::vector<std::string>& ignored,
                                       const std::vector<std::string>* unused) {
    nlohmann::json report = {
        {"contracts", nlohmann::json::array()},
        {"ignored", ignored}
    };
    for (const auto& contract : contracts) {
        report["contracts"].push_back(contract.toJson());
    }
    if (unused) {
        report["unused"] = *unused;
    }
    return report;
}

nlohmann::json ValidationReport::Failure(const std::string& error, const std::vector<std::string>& ignored) {
    return {{"error", error}, {"ignored", ignored}};
}

std::string ValidationReport::Render(const nlohmann::json& report) {
    return report.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace solverify::application
