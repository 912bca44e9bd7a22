/**
 * @file CompilerMetadata.cpp
 * @brief Implementation of metadata parsing and validation.
 */

#include "domain/CompilerMetadata.hpp"
#include <algorithm>
#include <cctype>

namespace solverify::domain {

namespace {

bool IsTruthy(const nlohmann::json& value) {
    if (value.is_null()) return false;
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_string()) return !value.get_ref<const std::string&>().empty();
    if (value.is_number()) return value.get<double>() != 0.0;
    return true; // objects and arrays, even empty ones
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c){ return std::tolower(c); });
    return text;
}

MetadataSource ParseSource(const nlohmann::json& entry) {
    MetadataSource source;
    if (!entry.is_object()) return source;

    auto content = entry.find("content");
    if (content != entry.end() && content->is_string() && !content->get_ref<const std::string&>().empty()) {
        source.content = content->get<std::string>();
    }

    auto hash = entry.find("keccak256");
    if (hash != entry.end() && hash->is_string()) {
        source.keccak256 = ToLower(hash->get<std::string>());
    }

    auto urls = entry.find("urls");
    if (urls != entry.end() && urls->is_array()) {
        for (const auto& url : *urls) {
            if (url.is_string()) source.urls.push_back(url.get<std::string>());
        }
    }
    return source;
}

} // namespace

MetadataParseResult MetadataParseResult::FromJson(const nlohmann::json& doc) {
    MetadataParseResult result;

    if (!doc.is_object()) {
        result.reason = "not a JSON object";
        return result;
    }
    auto language = doc.find("language");
    if (language == doc.end() || !language->is_string() || language->get<std::string>() != "Solidity") {
        result.reason = "language is not Solidity";
        return result;
    }
    auto compiler = doc.find("compiler");
    if (compiler == doc.end() || !IsTruthy(*compiler)) {
        result.reason = "missing compiler section";
        return result;
    }

    const nlohmann::json* target = nullptr;
    auto settings = doc.find("settings");
    if (settings != doc.end() && settings->is_object()) {
        auto it = settings->find("compilationTarget");
        if (it != settings->end()) target = &*it;
    }
    if (!target || !target->is_object()) {
        result.status = Status::MalformedCompilationTarget;
        result.reason = "settings.compilationTarget is missing";
        return result;
    }
    if (target->size() != 1) {
        result.status = Status::MalformedCompilationTarget;
        result.reason = "settings.compilationTarget has " + std::to_string(target->size()) +
                        " entries, expected 1";
        return result;
    }

    CompilerMetadata metadata;
    metadata.m_language = "Solidity";
    if (compiler->is_object()) {
        auto version = compiler->find("version");
        if (version != compiler->end() && version->is_string()) {
            metadata.m_compilerVersion = version->get<std::string>();
        }
    }

    auto targetEntry = target->begin();
    metadata.m_targetPath = targetEntry.key();
    metadata.m_targetName = targetEntry.value().is_string() ? targetEntry.value().get<std::string>()
                                                            : targetEntry.value().dump();

    auto sources = doc.find("sources");
    if (sources != doc.end() && sources->is_object()) {
        for (auto it = sources->begin(); it != sources->end(); ++it) {
            metadata.m_sources[it.key()] = ParseSource(it.value());
        }
    }

    metadata.m_raw = doc;
    result.status = Status::Ok;
    result.metadata = std::move(metadata);
    return result;
}

MetadataParseResult MetadataParseResult::FromText(const std::string& text) {
    nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        MetadataParseResult result;
        result.reason = "not valid JSON";
        return result;
    }

    // Truffle and friends store the metadata as a JSON string inside JSON.
    if (doc.is_string()) {
        doc = nlohmann::json::parse(doc.get<std::string>(), nullptr, false);
        if (doc.is_discarded()) {
            MetadataParseResult result;
            result.reason = "encoded string is not valid JSON";
            return result;
        }
    }

    return FromJson(doc);
}

} // namespace solverify::domain
