/**
 * @file ArchiveExpander.cpp
 * @brief Implementation of ArchiveExpander.
 */

#include "application/ArchiveExpander.hpp"
#include "infrastructure/FileCollector.hpp"
#include "infrastructure/FileSystemWalker.hpp"
#include "infrastructure/StagingDirectory.hpp"
#include "infrastructure/ZipArchive.hpp"
#include <deque>
#include <optional>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace solverify::application {

ArchiveExpander::ArchiveExpander(ValidationConfig config) : m_config(std::move(config)) {}

std::vector<domain::PathBuffer> ArchiveExpander::expand(const std::vector<domain::PathBuffer>& files) const {
    struct Pending {
        domain::PathBuffer file;
        size_t depth;
    };
    std::deque<Pending> pending;
    for (const auto& file : files) {
        pending.push_back({file, 0});
    }
    std::vector<domain::PathBuffer> expanded;

    while (!pending.empty()) {
        Pending next = std::move(pending.front());
        pending.pop_front();

        if (next.depth >= kMaxNestingDepth) {
            if (infrastructure::ZipArchive::IsArchive(next.file.buffer)) {
                m_config.log(LogLevel::Warning, "[ArchiveExpander] Not expanding " + next.file.path +
                                                ": archives nested deeper than " +
                                                std::to_string(kMaxNestingDepth) + " levels");
            }
            expanded.push_back(std::move(next.file));
            continue;
        }

        std::vector<domain::PathBuffer> members;
        if (tryExtract(next.file, members)) {
            for (auto& member : members) {
                pending.push_back({std::move(member), next.depth + 1});
            }
        } else {
            expanded.push_back(std::move(next.file));
        }
    }

    return expanded;
}

bool ArchiveExpander::tryExtract(const domain::PathBuffer& file, std::vector<domain::PathBuffer>& members) const {
    std::optional<infrastructure::ZipArchive> archive;
    try {
        archive = infrastructure::ZipArchive::Open(file.buffer);
    } catch (const infrastructure::ZipError&) {
        return false;
    }

    try {
        infrastructure::StagingDirectory staging(m_config.resolvedStagingRoot());

        archive->extractTo(staging.path(), [&](const std::string& name) {
            m_config.log(LogLevel::Warning,
                         "[ArchiveExpander] Skipping unsafe member '" + name + "' in " + file.path);
        });

        infrastructure::FileSystemWalker::Visitor visitor;
        visitor.onFile = [&](const fs::path& extracted) {
            // Members are labelled relative to the staging directory, as if submitted directly.
            members.push_back({extracted.lexically_relative(staging.path()).generic_string(),
                               infrastructure::FileCollector::ReadBinary(extracted)});
        };
        infrastructure::FileSystemWalker::Walk(staging.path(), visitor);
    } catch (const std::runtime_error& e) {
        members.clear();
        m_config.log(LogLevel::Warning,
                     "[ArchiveExpander] Could not extract " + (file.path.empty() ? std::string("archive") : file.path) +
                     ", treating it as a regular file: " + e.what());
        return false;
    }

    m_config.log(LogLevel::Info, "[ArchiveExpander] Extracted " + std::to_string(members.size()) +
                                 " files from " + file.path);
    return true;
}

} // namespace solverify::application
