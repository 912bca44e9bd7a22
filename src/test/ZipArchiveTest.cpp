#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "infrastructure/ZipArchive.hpp"
#include "test/TestSupport.hpp"

using namespace solverify;
using infrastructure::ZipArchive;
using infrastructure::ZipError;

int main() {
    std::cout << "[Test] Starting ZipArchive Test..." << std::endl;

    const std::string token = "pragma solidity ^0.8.0;\n\ncontract Token {}\n";
    const std::string big(4096, 'x');
    const std::string zip = test::BuildZip({
        {"contracts/", ""},
        {"contracts/Token.sol", token, true},
        {"big.txt", big, false}
    });

    // Listing and reading
    assert(ZipArchive::IsArchive(zip));
    ZipArchive archive = ZipArchive::Open(zip);
    assert(archive.getEntries().size() == 3);
    assert(archive.getEntries()[0].isDirectory());
    assert(archive.read(archive.getEntries()[1]) == token);
    assert(archive.read(archive.getEntries()[2]) == big);
    std::cout << "[PASS] Stored and deflated members." << std::endl;

    // Not archives
    assert(!ZipArchive::IsArchive(""));
    assert(!ZipArchive::IsArchive(token));
    assert(!ZipArchive::IsArchive(zip.substr(0, zip.size() - 10)));
    assert(ZipArchive::IsArchive(test::BuildZip({})));
    std::cout << "[PASS] Non-archives rejected." << std::endl;

    // Corrupt payload: listable, but reading fails the CRC check.
    std::string corrupt = test::BuildZip({{"a.sol", "contract A {}"}});
    corrupt[30 + 5] = 'X'; // first byte of data after the 30 byte header and "a.sol"
    ZipArchive corruptArchive = ZipArchive::Open(corrupt);
    bool threw = false;
    try {
        corruptArchive.read(corruptArchive.getEntries()[0]);
    } catch (const ZipError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] CRC mismatch detected." << std::endl;

    // Declared sizes are checked against the decoded data, not trusted for allocation.
    auto readFails = [](const std::string& buffer) {
        ZipArchive lying = ZipArchive::Open(buffer);
        try {
            lying.read(lying.getEntries()[0]);
        } catch (const ZipError&) {
            return true;
        }
        return false;
    };
    assert(readFails(test::BuildZip({{"huge.sol", "", true, 0xFFFFFFF0u}})));
    assert(readFails(test::BuildZip({{"short.sol", "contract A {}", true, 0xFFFFFFF0u}})));
    assert(readFails(test::BuildZip({{"long.sol", "contract A {}", true, 4u}})));
    assert(readFails(test::BuildZip({{"stored.sol", "contract A {}", false, 0xFFFFFFF0u}})));
    std::cout << "[PASS] Over- and under-declared member sizes rejected." << std::endl;

    // Extraction keeps relative paths and skips names escaping the root.
    test::ScratchDir scratch("zip_extract");
    const std::string evil = test::BuildZip({
        {"../evil.sol", "contract Evil {}"},
        {"/abs.sol", "contract Abs {}"},
        {"ok/Fine.sol", "contract Fine {}", true}
    });
    std::set<std::string> skipped;
    size_t written = ZipArchive::Open(evil).extractTo(scratch.path(), [&](const std::string& name) {
        skipped.insert(name);
    });
    assert(written == 1);
    assert(skipped == (std::set<std::string>{"../evil.sol", "/abs.sol"}));
    assert(std::filesystem::exists(scratch.path() / "ok" / "Fine.sol"));
    assert(!std::filesystem::exists(scratch.path().parent_path() / "evil.sol"));
    std::cout << "[PASS] Unsafe member names skipped." << std::endl;

    std::cout << "[PASS] ZipArchive Test." << std::endl;
    return 0;
}
