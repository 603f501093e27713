// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <yaml-cpp/yaml.h>

namespace rgbd_recorder::util
{

    // ─────────────────────────────────────────────────────────────────────────────
    // Tiny JSON/YAML wrapper (uses nlohmann::json and yaml-cpp directly)
    // ─────────────────────────────────────────────────────────────────────────────

    /// Load a JSON file into a nlohmann::json
    bool readJson(const std::string &path, nlohmann::json &out);

    /// Write a nlohmann::json to disk (pretty-printed, 2-space indent).
    /// Throws nlohmann::json::type_error when @p j holds strings that are not valid UTF-8.
    bool writeJson(const std::string &path, const nlohmann::json &j);

    /// Load a YAML file into a YAML::Node
    bool readYaml(const std::string &path, YAML::Node &out);

    /// Write a YAML::Node to disk
    bool writeYaml(const std::string &path, const YAML::Node &node);

    // ─────────────────────────────────────────────────────────────────────────────
    // NumPy .npy (format version 1.0), CV_16UC1 only
    // ─────────────────────────────────────────────────────────────────────────────

    /// Write a 2-D CV_16UC1 matrix as a little-endian '<u2' array of shape (rows, cols).
    bool writeNpy(const std::string &path, const cv::Mat &depth);

    /// Read a '<u2' 2-D array written by writeNpy. Returns an empty Mat on failure.
    cv::Mat readNpy(const std::string &path);

    // ─────────────────────────────────────────────────────────────────────────────
    // Paths and time formatting
    // ─────────────────────────────────────────────────────────────────────────────

    /// Write to "<path>.tmp" through @p writer, then rename over @p path.
    template <typename Writer>
    bool writeAtomically(const std::filesystem::path &path, Writer &&writer)
    {
        std::filesystem::path tmp = path;
        tmp += ".tmp";
        if (!writer(tmp))
        {
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            return false;
        }
        std::error_code ec;
        std::filesystem::rename(tmp, path, ec);
        if (ec)
        {
            std::error_code rm_ec;
            std::filesystem::remove(tmp, rm_ec);
            return false;
        }
        return true;
    }

    /// Expand a leading '~' using $HOME
    std::filesystem::path expandUser(const std::string &path);

    /// Zero-padded integer to string, width >= 1
    std::string indexString(std::size_t idx, int width);

    /// Local time as YYYYMMDD_HHMMSS
    std::string timeStringDateTime(std::chrono::system_clock::time_point t);

    /// UTC time as ISO-8601 with offset, e.g. 2025-11-10T01:54:30.123456+00:00.
    /// The fraction is omitted when the microseconds are zero.
    std::string isoTimestampUtc(std::chrono::system_clock::time_point t);

} // namespace rgbd_recorder::util
