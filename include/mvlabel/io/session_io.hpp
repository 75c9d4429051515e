#pragma once

#include <mvlabel/annotation/label_session.hpp>
#include <mvlabel/config.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace mvlabel::io {

void EnsureDir(const std::filesystem::path& p);

// Writes the full annotation state through cv::FileStorage. The format follows
// the file suffix (.yml, .yml.gz, .json, .xml). Returns false if the file cannot
// be opened for writing.
bool SaveSession(const std::filesystem::path& path, const annotation::LabelSession& session);

// Returns nullptr if the file cannot be opened. Malformed contents throw.
// n_animals stored in the file overrides cfg.num_animals. Files without
// data_2D are rebuilt from data_3D, handLabeled2D and status.
std::unique_ptr<annotation::LabelSession> LoadSession(const std::filesystem::path& path,
                                                      const SessionConfig& cfg = SessionConfig());

// Concatenates the frames of several sessions that share cameras and skeleton.
// Throws if a file is missing or the sessions are not compatible.
std::unique_ptr<annotation::LabelSession> LoadMergedSessions(
    const std::vector<std::filesystem::path>& paths, const SessionConfig& cfg = SessionConfig());

}  // namespace mvlabel::io
