/**
 * @file DocumentClassifier.cpp
 * @brief Implementation of DocumentClassifier.
 */

#include "application/DocumentClassifier.hpp"
#include "domain/ValidationError.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace solverify::application {

namespace {

const std::string kBuildInfoMarker = "\"hh-sol-build-info-1\"";

// Bounds of the pattern "{\"compiler\":{\"version\" ... },\"version\":1}" as
// it appears when metadata is embedded as a JSON string value.
const std::string kNestedPrefix = R"("{\"compiler\":{\"version\")";
const std::string kNestedSuffix = R"(},\"version\":1}")";

std::string JoinLabels(const std::vector<std::string>& labels) {
    std::string joined;
    for (const auto& label : labels) {
        if (!joined.empty()) joined += ", ";
        joined += label;
    }
    return joined;
}

} // namespace

DocumentClassifier::DocumentClassifier(ValidationConfig config) : m_config(std::move(config)) {}

bool DocumentClassifier::IsBuildInfo(const std::string& text) {
    return text.find(kBuildInfoMarker) != std::string::npos;
}

std::optional<std::string> DocumentClassifier::FindNestedMetadata(const std::string& text) {
    size_t start = text.find(kNestedPrefix);
    while (start != std::string::npos) {
        const size_t bodyStart = start + kNestedPrefix.size();
        const size_t end = text.find(kNestedSuffix, bodyStart);
        if (end == std::string::npos) {
            return std::nullopt;
        }
        // The match must stay on one line.
        const size_t lineBreak = text.find_first_of("\r\n", bodyStart);
        if (lineBreak == std::string::npos || end < lineBreak) {
            return text.substr(start, end + kNestedSuffix.size() - start);
        }
        start = text.find(kNestedPrefix, start + 1);
    }
    return std::nullopt;
}

ClassifiedFiles DocumentClassifier::classify(const std::vector<domain::PathContent>& files) const {
    ClassifiedFiles out;

    for (const auto& file : files) {
        if (IsBuildInfo(file.content) && extractBuildInfo(file, out)) {
            continue;
        }

        auto parsed = domain::MetadataParseResult::FromText(file.content);
        if (parsed.status == domain::MetadataParseResult::Status::NotMetadata) {
            if (auto nested = FindNestedMetadata(file.content)) {
                parsed = domain::MetadataParseResult::FromText(*nested);
            }
        }

        switch (parsed.status) {
            case domain::MetadataParseResult::Status::Ok:
                parsed.metadata->setOrigin(file.path);
                out.metadataFiles.push_back(std::move(*parsed.metadata));
                break;
            case domain::MetadataParseResult::Status::MalformedCompilationTarget:
                m_config.log(LogLevel::Warning, "[DocumentClassifier] " + file.path + ": " + parsed.reason);
                out.malformedMetadataFiles.push_back(file.path);
                break;
            case domain::MetadataParseResult::Status::NotMetadata:
                out.sourceFiles.push_back(file);
                break;
        }
    }

    return out;
}

bool DocumentClassifier::extractBuildInfo(const domain::PathContent& file, ClassifiedFiles& out) const {
    nlohmann::json buildInfo = nlohmann::json::parse(file.content, nullptr, false);
    if (buildInfo.is_discarded() || !buildInfo.is_object()) {
        m_config.log(LogLevel::Warning, "[DocumentClassifier] " + file.path +
                                        " carries the build-info marker but is not valid JSON");
        return false;
    }

    const nlohmann::json* sources = nullptr;
    if (buildInfo.contains("input") && buildInfo["input"].is_object() &&
        buildInfo["input"].contains("sources") && buildInfo["input"]["sources"].is_object()) {
        sources = &buildInfo["input"]["sources"];
    }
    if (sources) {
        for (auto it = sources->begin(); it != sources->end(); ++it) {
            const auto& entry = it.value();
            if (entry.is_object() && entry.contains("content") && entry["content"].is_string() &&
                !entry["content"].get_ref<const std::string&>().empty()) {
                out.sourceFiles.push_back({it.key(), entry["content"].get<std::string>()});
            }
        }
    }

    const nlohmann::json* contracts = nullptr;
    if (buildInfo.contains("output") && buildInfo["output"].is_object() &&
        buildInfo["output"].contains("contracts") && buildInfo["output"]["contracts"].is_object()) {
        contracts = &buildInfo["output"]["contracts"];
    }
    if (!contracts) {
        return true;
    }

    for (auto fileIt = contracts->begin(); fileIt != contracts->end(); ++fileIt) {
        if (!fileIt.value().is_object()) continue;
        for (auto contractIt = fileIt.value().begin(); contractIt != fileIt.value().end(); ++contractIt) {
            const auto& contract = contractIt.value();
            if (!contract.is_object() || !contract.contains("metadata")) continue;

            const auto& embedded = contract["metadata"];
            domain::MetadataParseResult parsed;
            if (embedded.is_string()) {
                if (embedded.get_ref<const std::string&>().empty()) continue;
                parsed = domain::MetadataParseResult::FromText(embedded.get<std::string>());
            } else {
                parsed = domain::MetadataParseResult::FromJson(embedded);
            }

            const std::string label = file.path + " (" + fileIt.key() + ":" + contractIt.key() + ")";
            switch (parsed.status) {
                case domain::MetadataParseResult::Status::Ok:
                    parsed.metadata->setOrigin(file.path);
                    out.metadataFiles.push_back(std::move(*parsed.metadata));
                    break;
                case domain::MetadataParseResult::Status::MalformedCompilationTarget:
                    m_config.log(LogLevel::Warning, "[DocumentClassifier] " + label + ": " + parsed.reason);
                    out.malformedMetadataFiles.push_back(label);
                    break;
                case domain::MetadataParseResult::Status::NotMetadata:
                    m_config.log(LogLevel::Warning, "[DocumentClassifier] Ignoring unusable metadata in " +
                                                    label + ": " + parsed.reason);
                    break;
            }
        }
    }

    return true;
}

void DocumentClassifier::requireMetadata(const ClassifiedFiles& classified) const {
    std::string msg;
    const auto& malformed = classified.malformedMetadataFiles;

    if (!malformed.empty()) {
        bool allLabelled = std::all_of(malformed.begin(), malformed.end(),
                                       [](const std::string& label) { return !label.empty(); });
        msg = "Malformed settings.compilationTarget in: " +
              (allLabelled ? JoinLabels(malformed) : std::to_string(malformed.size()) + " metadata files");
    } else if (classified.metadataFiles.empty()) {
        msg = "Metadata file not found. Did you include \"metadata.json\"?";
    }

    if (!msg.empty()) {
        m_config.log(LogLevel::Error, "[DocumentClassifier] " + msg);
        throw domain::ValidationError(msg);
    }
}

} // namespace solverify::application
