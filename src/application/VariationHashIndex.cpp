/**
 * @file VariationHashIndex.cpp
 * @brief Implementation of VariationHashIndex.
 */

#include "application/VariationHashIndex.hpp"
#include "infrastructure/Keccak256.hpp"
#include <functional>

namespace solverify::application {

namespace {

using Variator = std::function<std::string(const std::string&)>;

std::string ToCrlf(const std::string& content) {
    std::string out;
    out.reserve(content.size() + content.size() / 32);
    for (size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\r' && i + 1 < content.size() && content[i + 1] == '\n') {
            out += "\r\n";
            ++i;
        } else if (content[i] == '\n') {
            out += "\r\n";
        } else {
            out.push_back(content[i]);
        }
    }
    return out;
}

std::string ToLf(const std::string& content) {
    std::string out;
    out.reserve(content.size());
    for (size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\r' && i + 1 < content.size() && content[i + 1] == '\n') {
            continue;
        }
        out.push_back(content[i]);
    }
    return out;
}

const std::vector<Variator>& LineEndingVariators() {
    static const std::vector<Variator> variators = {
        [](const std::string& c) { return c; },
        ToCrlf,
        ToLf
    };
    return variators;
}

const std::vector<Variator>& TrailingVariators() {
    static const std::vector<Variator> variators = {
        [](const std::string& c) { return c; },
        [](const std::string& c) { return VariationHashIndex::TrimEnd(c); },
        [](const std::string& c) { return VariationHashIndex::TrimEnd(c) + "\n"; },
        [](const std::string& c) { return VariationHashIndex::TrimEnd(c) + "\r\n"; },
        [](const std::string& c) { return c + "\n"; },
        [](const std::string& c) { return c + "\r\n"; }
    };
    return variators;
}

// UTF-8 encodings of the non-ASCII code points JavaScript's trimEnd() removes.
const std::vector<std::string>& UnicodeSpaces() {
    static const std::vector<std::string> spaces = {
        "\xC2\xA0",                                                     // U+00A0
        "\xE1\x9A\x80",                                                 // U+1680
        "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", "\xE2\x80\x83", // U+2000..
        "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86", "\xE2\x80\x87",
        "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A",                 // ..U+200A
        "\xE2\x80\xA8", "\xE2\x80\xA9",                                 // line/paragraph separator
        "\xE2\x80\xAF", "\xE2\x81\x9F", "\xE3\x80\x80",
        "\xEF\xBB\xBF"                                                  // U+FEFF
    };
    return spaces;
}

bool EndsWith(const std::string& text, size_t end, const std::string& suffix) {
    return end >= suffix.size() && text.compare(end - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::string VariationHashIndex::TrimEnd(const std::string& content) {
    size_t end = content.size();
    while (end > 0) {
        char c = content[end - 1];
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f') {
            --end;
            continue;
        }
        bool trimmed = false;
        for (const auto& space : UnicodeSpaces()) {
            if (EndsWith(content, end, space)) {
                end -= space.size();
                trimmed = true;
                break;
            }
        }
        if (!trimmed) break;
    }
    return content.substr(0, end);
}

std::vector<std::string> VariationHashIndex::GenerateVariations(const std::string& content) {
    std::vector<std::string> variations;
    variations.reserve(kVariationsPerFile);
    for (const auto& lineEnding : LineEndingVariators()) {
        const std::string normalized = lineEnding(content);
        for (const auto& trailing : TrailingVariators()) {
            variations.push_back(trailing(normalized));
        }
    }
    return variations;
}

void VariationHashIndex::add(const domain::PathContent& source) {
    for (auto& variation : GenerateVariations(source.content)) {
        std::string hash = infrastructure::Keccak256::HexHash(variation);
        m_byHash[hash] = domain::PathContent{source.path, std::move(variation)};
    }
}

VariationHashIndex VariationHashIndex::Build(const std::vector<domain::PathContent>& sources) {
    VariationHashIndex index;
    for (const auto& source : sources) {
        index.add(source);
    }
    return index;
}

const domain::PathContent* VariationHashIndex::find(const std::string& keccak256) const {
    auto it = m_byHash.find(keccak256);
    return it == m_byHash.end() ? nullptr : &it->second;
}

} // namespace solverify::application
