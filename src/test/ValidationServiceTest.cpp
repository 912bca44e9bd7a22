#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "application/ValidationService.hpp"
#include "domain/ValidationError.hpp"
#include "test/TestSupport.hpp"

using namespace solverify;

namespace {

const std::string kToken = "pragma solidity ^0.8.0;\n\nimport \"./Lib.sol\";\n\ncontract Token {}\n";
const std::string kLib = "pragma solidity ^0.8.0;\n\nlibrary Lib {}\n";

nlohmann::json TokenMetadata() {
    return test::MakeMetadata("contracts/Token.sol", "Token", {
        {"contracts/Token.sol", test::SourceEntry(test::Keccak(kToken))},
        {"contracts/Lib.sol", test::SourceEntry(test::Keccak(kLib))}
    });
}

std::vector<domain::PathBuffer> DirectUpload() {
    return {
        {"metadata.json", TokenMetadata().dump(2)},
        {"contracts/Token.sol", kToken},
        {"contracts/Lib.sol", kLib}
    };
}

} // namespace

int main() {
    std::cout << "[Test] Starting ValidationService Test..." << std::endl;

    test::ScratchDir scratch("service");
    application::ValidationConfig config;
    config.stagingRoot = scratch.path() / "staging";
    std::vector<std::string> errors;
    config.logger = [&errors](application::LogLevel level, const std::string& msg) {
        if (level == application::LogLevel::Error) errors.push_back(msg);
    };
    application::ValidationService service(config);

    // Direct upload
    auto direct = service.checkFiles(DirectUpload());
    assert(direct.size() == 1);
    assert(direct[0].isValid());
    assert(direct[0].getName() == "Token");
    assert(direct[0].getCompiledPath() == "contracts/Token.sol");
    assert(direct[0].getSolidity().at("contracts/Lib.sol") == kLib);
    assert(errors.empty());
    std::cout << "[PASS] Direct upload verified." << std::endl;

    // The same files inside a zip give the same result.
    const std::string zip = test::BuildZip({
        {"metadata.json", TokenMetadata().dump(2), true},
        {"contracts/Token.sol", kToken, true},
        {"contracts/Lib.sol", kLib}
    });
    auto zipped = service.checkFiles({{"upload.zip", zip}});
    assert(zipped == direct);
    std::cout << "[PASS] Zipped upload equals direct upload." << std::endl;

    // No metadata anywhere.
    bool threw = false;
    try {
        service.checkFiles({{"contracts/Token.sol", kToken}});
    } catch (const domain::ValidationError& e) {
        threw = std::string(e.what()).find("Metadata file not found") != std::string::npos;
    }
    assert(threw);
    std::cout << "[PASS] No metadata aborts." << std::endl;

    // A malformed compilation target aborts even alongside valid metadata.
    threw = false;
    try {
        auto files = DirectUpload();
        files.push_back({"bad.json", test::MakeMetadata(nlohmann::json::object(), nlohmann::json::object()).dump()});
        service.checkFiles(files);
    } catch (const domain::ValidationError& e) {
        threw = std::string(e.what()).find("bad.json") != std::string::npos;
    }
    assert(threw);
    std::cout << "[PASS] Malformed compilation target aborts." << std::endl;

    // Incomplete contracts are returned and logged; other contracts are unaffected.
    const nlohmann::json orphan = test::MakeMetadata("contracts/Orphan.sol", "Orphan",
        {{"contracts/Orphan.sol", test::SourceEntry(test::Keccak("contract Orphan {}"), std::nullopt, {"dweb:/ipfs/QmOrphan"})}});
    errors.clear();
    auto files = DirectUpload();
    files.push_back({"orphan.json", orphan.dump()});
    files.push_back({"README.md", "# unrelated"});
    std::vector<std::string> unused;
    auto mixed = service.checkFiles(files, &unused);
    assert(mixed.size() == 2);
    assert(mixed[0].isValid());
    assert(!mixed[1].isValid());
    assert(mixed[1].getMissing().at("contracts/Orphan.sol").urls.front() == "dweb:/ipfs/QmOrphan");
    assert(errors.size() == 1 && errors[0].find("Orphan") != std::string::npos);
    assert((unused == std::vector<std::string>{"README.md"}));
    assert(mixed[1].isValid(true));
    assert(mixed[0].getInfo() == "Token (contracts/Token.sol):\n  Found all 2 sources");
    const auto report = mixed[1].toJson();
    assert(report["name"] == "Orphan" && report["valid"] == false);
    assert(report["compilerVersion"] == "0.8.7+commit.e28d00a7");
    assert(report["metadataFile"] == "orphan.json");
    assert(report["missing"].contains("contracts/Orphan.sol"));
    std::cout << "[PASS] Incomplete contract reported alongside valid ones; unused files listed." << std::endl;

    // Idempotent, and parallel resolution matches serial resolution.
    assert(service.checkFiles(files) == mixed);
    application::ValidationConfig parallelConfig = config;
    parallelConfig.parallelResolution = true;
    assert(application::ValidationService(parallelConfig).checkFiles(files) == mixed);
    std::cout << "[PASS] Idempotent and order-stable in parallel." << std::endl;

    // Widening keeps verified sources and adds every uploaded source.
    auto uploads = DirectUpload();
    uploads.push_back({"contracts/Token.sol", "// a different upload under the verified key\n"});
    uploads.push_back({"", "contract Unnamed {}"});
    uploads.push_back({"extra/Notes.sol", "contract Notes {}"});
    auto widened = service.useAllSources(direct[0], uploads);
    assert(widened.getSolidity().at("contracts/Token.sol") == kToken);
    assert(widened.getSolidity().at("extra/Notes.sol") == "contract Notes {}");
    assert(widened.getSolidity().at("path-3") == "contract Unnamed {}");
    assert(widened.getMissing() == direct[0].getMissing());
    assert(widened.getMetadata() == direct[0].getMetadata());
    assert(service.useAllSources(widened, uploads) == widened);

    // Widening never requires metadata in the supplied files.
    auto sourcesOnly = service.useAllSources(direct[0], {{"x/Y.sol", "contract Y {}"}});
    assert(sourcesOnly.getSolidity().size() == 3);
    std::cout << "[PASS] Widening law." << std::endl;

    // Paths on disk, with an ignore list.
    scratch.write("project/metadata.json", TokenMetadata().dump());
    scratch.write("project/contracts/Token.sol", kToken);
    scratch.write("project/contracts/Lib.sol", kLib);
    std::vector<std::string> ignoring;
    const std::string missingPath =
        std::filesystem::absolute(scratch.path() / "does-not-exist").lexically_normal().string();
    auto fromDisk = service.checkPaths({(scratch.path() / "project").string(), missingPath}, &ignoring);
    assert(fromDisk.size() == 1 && fromDisk[0].isValid());
    assert((ignoring == std::vector<std::string>{missingPath}));

    threw = false;
    try {
        service.checkPaths({missingPath});
    } catch (const domain::ValidationError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] checkPaths." << std::endl;

    // No staging directories survive.
    assert(!std::filesystem::exists(config.stagingRoot) || std::filesystem::is_empty(config.stagingRoot));

    std::cout << "[PASS] ValidationService Test." << std::endl;
    return 0;
}
