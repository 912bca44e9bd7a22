#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "application/ValidationReport.hpp"
#include "application/ValidationService.hpp"
#include "test/TestSupport.hpp"

using namespace solverify;

int main() {
    std::cout << "[Test] Starting ValidationReport Test..." << std::endl;

    const std::string token = "contract Token {}\n";
    const nlohmann::json metadata = test::MakeMetadata("Token.sol", "Token",
        {{"Token.sol", test::SourceEntry(test::Keccak(token))}});

    // Latin-1 names, as produced by old zip tools and non-UTF-8 filesystems.
    const std::string latinSource = "caf\xE9.sol";
    const std::string latinMetadata = "meta\xFF.json";
    const std::string latinIgnored = "/uploads/ign\xE9";

    test::ScratchDir staging("report_staging");
    application::ValidationConfig config;
    config.stagingRoot = staging.path();
    application::ValidationService service(config);

    std::vector<std::string> unused;
    auto contracts = service.checkFiles({
        {latinMetadata, metadata.dump()},
        {"Token.sol", token},
        {latinSource, "contract Cafe {}"}
    }, &unused);
    assert(contracts.size() == 1 && contracts[0].isValid());
    assert((unused == std::vector<std::string>{latinSource}));

    auto report = application::ValidationReport::Build(contracts, {latinIgnored}, &unused);
    const std::string rendered = application::ValidationReport::Render(report);
    assert(rendered.find("\xEF\xBF\xBD") != std::string::npos);

    auto reparsed = nlohmann::json::parse(rendered);
    assert(reparsed["contracts"].size() == 1);
    assert(reparsed["contracts"][0]["name"] == "Token");
    assert(reparsed["contracts"][0]["metadataFile"] == "meta\xEF\xBF\xBD.json");
    assert(reparsed["unused"][0] == "caf\xEF\xBF\xBD.sol");
    assert(reparsed["ignored"][0] == "/uploads/ign\xEF\xBF\xBD");
    std::cout << "[PASS] Names that are not UTF-8 are rendered with replacement characters." << std::endl;

    auto failure = nlohmann::json::parse(application::ValidationReport::Render(
        application::ValidationReport::Failure("Malformed settings.compilationTarget in: " + latinMetadata, {})));
    assert(failure["error"] == "Malformed settings.compilationTarget in: meta\xEF\xBF\xBD.json");
    assert(failure["ignored"].empty());
    assert(!application::ValidationReport::Build(contracts, {}).contains("unused"));
    std::cout << "[PASS] Failure report." << std::endl;

    std::cout << "[PASS] ValidationReport Test." << std::endl;
    return 0;
}
