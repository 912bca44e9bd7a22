#include <cassert>
#include <cctype>
#include <iostream>
#include <string>

#include "application/SourceResolver.hpp"
#include "test/TestSupport.hpp"

using namespace solverify;

namespace {

domain::CompilerMetadata Parse(const nlohmann::json& doc) {
    auto result = domain::MetadataParseResult::FromJson(doc);
    assert(result.ok());
    return *result.metadata;
}

void AssertPartition(const domain::CompilerMetadata& metadata, const application::SourceResolution& r) {
    assert(r.found.size() + r.missing.size() + r.invalid.size() == metadata.getSources().size());
    for (const auto& [path, source] : metadata.getSources()) {
        const size_t hits = r.found.count(path) + r.missing.count(path) + r.invalid.count(path);
        assert(hits == 1);
    }
}

} // namespace

int main() {
    std::cout << "[Test] Starting SourceResolver Test..." << std::endl;

    const std::string source = "pragma solidity ^0.8.0;\n\ncontract Token {}\n";
    const auto emptyIndex = application::VariationHashIndex::Build({});
    application::SourceResolver emptyResolver(emptyIndex);

    // Inline content matching the declared hash.
    {
        auto metadata = Parse(test::MakeMetadata("Token.sol", "Token",
            {{"Token.sol", test::SourceEntry(test::Keccak(source), source)}}));
        auto r = emptyResolver.resolve(metadata);
        assert(r.found.size() == 1 && r.found.at("Token.sol") == source);
        assert(r.missing.empty() && r.invalid.empty());
        assert(r.metadataToProvided.empty());
        AssertPartition(metadata, r);
        std::cout << "[PASS] Inline content accepted." << std::endl;
    }

    // Inline content whose hash disagrees; the index is not consulted.
    {
        const std::string declared = test::Keccak(source);
        const std::string tampered = source + "// tampered\n";
        const auto index = application::VariationHashIndex::Build({{"Token.sol", source}});
        application::SourceResolver resolver(index);

        auto metadata = Parse(test::MakeMetadata("Token.sol", "Token",
            {{"Token.sol", test::SourceEntry(declared, tampered)}}));
        auto r = resolver.resolve(metadata);
        assert(r.found.empty() && r.missing.empty());
        assert(r.invalid.size() == 1);
        assert(r.invalid.at("Token.sol").expectedHash == declared);
        assert(r.invalid.at("Token.sol").calculatedHash == test::Keccak(tampered));
        assert(!r.invalid.at("Token.sol").msg.empty());
        AssertPartition(metadata, r);
        std::cout << "[PASS] Inline mismatch is invalid." << std::endl;
    }

    // No inline content; the CRLF form of an uploaded file matches.
    {
        const std::string crlf = "pragma solidity ^0.8.0;\r\n\r\ncontract Token {}\r\n";
        const auto index = application::VariationHashIndex::Build({{"/uploads/src/MyToken.sol", source}});
        application::SourceResolver resolver(index);

        auto metadata = Parse(test::MakeMetadata("contracts/Token.sol", "Token",
            {{"contracts/Token.sol", test::SourceEntry(test::Keccak(crlf))}}));
        auto r = resolver.resolve(metadata);
        assert(r.found.size() == 1 && r.found.at("contracts/Token.sol") == crlf);
        assert(r.metadataToProvided.at("contracts/Token.sol") == "/uploads/src/MyToken.sol");
        AssertPartition(metadata, r);
        std::cout << "[PASS] CRLF variant resolved via index." << std::endl;
    }

    // Declared source absent from every input.
    {
        const std::string hash = test::Keccak("library Missing {}");
        const std::vector<std::string> urls = {"bzz-raw://abc", "dweb:/ipfs/Qm123"};
        auto metadata = Parse(test::MakeMetadata("Token.sol", "Token", {
            {"Token.sol", test::SourceEntry(test::Keccak(source), source)},
            {"lib/Missing.sol", test::SourceEntry(hash, std::nullopt, urls)}
        }));
        auto r = emptyResolver.resolve(metadata);
        assert(r.found.size() == 1);
        assert(r.missing.size() == 1);
        assert(r.missing.at("lib/Missing.sol").keccak256 == hash);
        assert(r.missing.at("lib/Missing.sol").urls == urls);
        AssertPartition(metadata, r);
        std::cout << "[PASS] Missing source carries hash and urls." << std::endl;
    }

    // Declared hashes are compared case-insensitively; empty inline content counts as absent.
    {
        std::string upper = test::Keccak(source);
        for (size_t i = 2; i < upper.size(); ++i) upper[i] = static_cast<char>(std::toupper(upper[i]));
        const auto index = application::VariationHashIndex::Build({{"Token.sol", source}});
        application::SourceResolver resolver(index);
        auto metadata = Parse(test::MakeMetadata("Token.sol", "Token",
            {{"Token.sol", test::SourceEntry(upper, std::string())}}));
        auto r = resolver.resolve(metadata);
        assert(r.found.size() == 1 && r.metadataToProvided.at("Token.sol") == "Token.sol");
        std::cout << "[PASS] Hash case and empty inline content." << std::endl;
    }

    std::cout << "[PASS] SourceResolver Test." << std::endl;
    return 0;
}
