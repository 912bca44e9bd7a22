/**
 * @file ValidationService.cpp
 * @brief Implementation of ValidationService.
 */

#include "application/ValidationService.hpp"
#include "application/ArchiveExpander.hpp"
#include "application/DocumentClassifier.hpp"
#include "application/SourceResolver.hpp"
#include "application/VariationHashIndex.hpp"
#include "infrastructure/FileCollector.hpp"
#include <future>
#include <unordered_set>

namespace solverify::application {

ValidationService::ValidationService(ValidationConfig config) : m_config(std::move(config)) {}

std::vector<domain::CheckedContract> ValidationService::checkPaths(const std::vector<std::string>& paths,
                                                                   std::vector<std::string>* ignoring,
                                                                   std::vector<std::string>* unused) const {
    auto files = infrastructure::FileCollector::Collect(paths, ignoring,
        [this](const std::string& path, const std::string& reason) {
            m_config.log(LogLevel::Warning, "[ValidationService] Ignoring " + path + ": " + reason);
        });
    return checkFiles(files, unused);
}

std::vector<domain::PathContent> ValidationService::expandToText(const std::vector<domain::PathBuffer>& files) const {
    ArchiveExpander expander(m_config);
    std::vector<domain::PathContent> text;
    for (auto& file : expander.expand(files)) {
        text.push_back({std::move(file.path), std::move(file.buffer)});
    }
    return text;
}

std::vector<domain::CheckedContract> ValidationService::checkFiles(const std::vector<domain::PathBuffer>& files,
                                                                   std::vector<std::string>* unused) const {
    const auto expanded = expandToText(files);

    DocumentClassifier classifier(m_config);
    ClassifiedFiles classified = classifier.classify(expanded);
    classifier.requireMetadata(classified);

    m_config.log(LogLevel::Info, "[ValidationService] " + std::to_string(expanded.size()) + " files, " +
                                 std::to_string(classified.metadataFiles.size()) + " metadata, " +
                                 std::to_string(classified.sourceFiles.size()) + " sources");

    // Built completely before any lookup; read-only from here on.
    const VariationHashIndex index = VariationHashIndex::Build(classified.sourceFiles);
    const SourceResolver resolver(index);

    std::vector<SourceResolution> resolutions;
    resolutions.reserve(classified.metadataFiles.size());
    if (m_config.parallelResolution && classified.metadataFiles.size() > 1) {
        std::vector<std::future<SourceResolution>> pending;
        for (const auto& metadata : classified.metadataFiles) {
            pending.push_back(std::async(std::launch::async, [&resolver, &metadata]() {
                return resolver.resolve(metadata);
            }));
        }
        for (auto& future : pending) {
            resolutions.push_back(future.get());
        }
    } else {
        for (const auto& metadata : classified.metadataFiles) {
            resolutions.push_back(resolver.resolve(metadata));
        }
    }

    std::vector<domain::CheckedContract> checkedContracts;
    std::unordered_set<std::string> usedFiles;
    std::string errorMsgMaterial;

    for (size_t i = 0; i < resolutions.size(); ++i) {
        auto& resolution = resolutions[i];
        for (const auto& [declared, provided] : resolution.metadataToProvided) {
            usedFiles.insert(provided);
        }

        checkedContracts.emplace_back(std::move(classified.metadataFiles[i]),
                                      std::move(resolution.found),
                                      std::move(resolution.missing),
                                      std::move(resolution.invalid));

        const auto& contract = checkedContracts.back();
        if (!contract.isValid()) {
            if (!errorMsgMaterial.empty()) errorMsgMaterial += "\n";
            errorMsgMaterial += contract.getInfo();
        }
    }

    if (!errorMsgMaterial.empty()) {
        m_config.log(LogLevel::Error, "[ValidationService] " + errorMsgMaterial);
    }

    if (unused) {
        for (const auto& source : classified.sourceFiles) {
            if (usedFiles.find(source.path) == usedFiles.end()) {
                unused->push_back(source.path);
            }
        }
    }

    return checkedContracts;
}

domain::CheckedContract ValidationService::useAllSources(const domain::CheckedContract& contract,
                                                         const std::vector<domain::PathBuffer>& files) const {
    DocumentClassifier classifier(m_config);
    ClassifiedFiles classified = classifier.classify(expandToText(files));

    domain::StringMap allSources;
    for (size_t i = 0; i < classified.sourceFiles.size(); ++i) {
        const auto& source = classified.sourceFiles[i];
        const std::string key = source.path.empty() ? "path-" + std::to_string(i) : source.path;
        allSources[key] = source.content;
    }

    // Hash-verified sources take precedence over the raw uploads.
    for (const auto& [path, content] : contract.getSolidity()) {
        allSources[path] = content;
    }

    return domain::CheckedContract(contract.getMetadata(), std::move(allSources),
                                   contract.getMissing(), contract.getInvalid());
}

} // namespace solverify::application
