// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#include "rgbd_recorder/util.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <regex>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace rgbd_recorder::util
{

    // ─────────────────────────────────────────────────────────────────────────────
    // Tiny JSON/YAML wrapper (nlohmann::json + yaml-cpp)
    // ─────────────────────────────────────────────────────────────────────────────

    bool readJson(const std::string &path, nlohmann::json &out)
    {
        try
        {
            std::ifstream ifs(path);
            if (!ifs.is_open())
                return false;
            ifs >> out; // throws on parse error
            return true;
        }
        catch (const nlohmann::json::exception &)
        {
            return false;
        }
    }

    bool writeJson(const std::string &path, const nlohmann::json &j)
    {
        const std::string text = j.dump(2); // type_error on invalid UTF-8 goes to the caller
        std::ofstream ofs(path, std::ios::out | std::ios::trunc);
        if (!ofs.is_open())
            return false;
        ofs << text << '\n';
        ofs.flush();
        return static_cast<bool>(ofs);
    }

    bool readYaml(const std::string &path, YAML::Node &out)
    {
        try
        {
            out = YAML::LoadFile(path); // throws on I/O/parse error
            return true;
        }
        catch (const YAML::Exception &)
        {
            return false;
        }
    }

    bool writeYaml(const std::string &path, const YAML::Node &node)
    {
        try
        {
            YAML::Emitter emitter;
            emitter << node;
            std::ofstream ofs(path);
            if (!ofs.is_open())
                return false;
            ofs << emitter.c_str() << '\n';
            return static_cast<bool>(ofs);
        }
        catch (const YAML::Exception &)
        {
            return false;
        }
    }

    // ─────────────────────────────────────────────────────────────────────────────
    // NumPy .npy
    // ─────────────────────────────────────────────────────────────────────────────

    namespace
    {
        constexpr char kNpyMagic[] = "\x93NUMPY";
        constexpr std::size_t kNpyMagicLen = 6;
        constexpr std::size_t kNpyPreambleLen = kNpyMagicLen + 2 + 2; // magic, version, header length
        constexpr std::size_t kNpyAlignment = 64;
    } // namespace

    bool writeNpy(const std::string &path, const cv::Mat &depth)
    {
        if (depth.empty() || depth.dims != 2 || depth.type() != CV_16UC1)
            return false;

        std::ostringstream dict;
        dict << "{'descr': '<u2', 'fortran_order': False, 'shape': ("
             << depth.rows << ", " << depth.cols << "), }";
        std::string header = dict.str();

        // Pad with spaces so the data starts on an aligned offset; header ends in '\n'.
        const std::size_t unpadded = kNpyPreambleLen + header.size() + 1;
        const std::size_t padding = (kNpyAlignment - unpadded % kNpyAlignment) % kNpyAlignment;
        header.append(padding, ' ');
        header.push_back('\n');

        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open())
            return false;

        const uint16_t header_len = static_cast<uint16_t>(header.size());
        const char preamble[4] = {1, 0,
                                  static_cast<char>(header_len & 0xff),
                                  static_cast<char>(header_len >> 8)};
        ofs.write(kNpyMagic, kNpyMagicLen);
        ofs.write(preamble, sizeof(preamble));
        ofs.write(header.data(), static_cast<std::streamsize>(header.size()));

        std::vector<char> row(static_cast<std::size_t>(depth.cols) * 2);
        for (int r = 0; r < depth.rows; ++r)
        {
            const uint16_t *src = depth.ptr<uint16_t>(r);
            for (int c = 0; c < depth.cols; ++c)
            {
                row[2 * c] = static_cast<char>(src[c] & 0xff);
                row[2 * c + 1] = static_cast<char>(src[c] >> 8);
            }
            ofs.write(row.data(), static_cast<std::streamsize>(row.size()));
        }
        ofs.flush();
        return static_cast<bool>(ofs);
    }

    cv::Mat readNpy(const std::string &path)
    {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs.is_open())
            return cv::Mat();

        char preamble[kNpyPreambleLen];
        if (!ifs.read(preamble, sizeof(preamble)))
            return cv::Mat();
        if (std::string(preamble, kNpyMagicLen) != std::string(kNpyMagic, kNpyMagicLen) || preamble[6] != 1)
            return cv::Mat();

        const std::size_t header_len = static_cast<unsigned char>(preamble[8]) |
                                       (static_cast<std::size_t>(static_cast<unsigned char>(preamble[9])) << 8);
        std::string header(header_len, '\0');
        if (!ifs.read(&header[0], static_cast<std::streamsize>(header_len)))
            return cv::Mat();

        static const std::regex descr_re(R"('descr':\s*'<u2')");
        static const std::regex order_re(R"('fortran_order':\s*False)");
        static const std::regex shape_re(R"('shape':\s*\((\d+),\s*(\d+),?\s*\))");
        std::smatch shape;
        if (!std::regex_search(header, descr_re) || !std::regex_search(header, order_re) ||
            !std::regex_search(header, shape, shape_re))
            return cv::Mat();

        const int rows = std::stoi(shape[1].str());
        const int cols = std::stoi(shape[2].str());
        cv::Mat out(rows, cols, CV_16UC1);

        std::vector<unsigned char> row(static_cast<std::size_t>(cols) * 2);
        for (int r = 0; r < rows; ++r)
        {
            if (!ifs.read(reinterpret_cast<char *>(row.data()), static_cast<std::streamsize>(row.size())))
                return cv::Mat();
            uint16_t *dst = out.ptr<uint16_t>(r);
            for (int c = 0; c < cols; ++c)
                dst[c] = static_cast<uint16_t>(row[2 * c] | (row[2 * c + 1] << 8));
        }
        return out;
    }

    // ─────────────────────────────────────────────────────────────────────────────
    // Paths and time formatting
    // ─────────────────────────────────────────────────────────────────────────────

    fs::path expandUser(const std::string &path)
    {
        if (!path.empty() && path[0] == '~')
        {
            const char *home = std::getenv("HOME");
            if (home)
                return fs::path(std::string(home) + path.substr(1));
        }
        return fs::path(path);
    }

    std::string indexString(std::size_t idx, int width)
    {
        std::ostringstream oss;
        oss << std::setw(width) << std::setfill('0') << idx;
        return oss.str();
    }

    std::string timeStringDateTime(std::chrono::system_clock::time_point t)
    {
        std::time_t tt = std::chrono::system_clock::to_time_t(t);
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &tt);
#else
        localtime_r(&tt, &tm);
#endif
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d%02d%02d_%02d%02d%02d",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec);
        return std::string(buf);
    }

    std::string isoTimestampUtc(std::chrono::system_clock::time_point t)
    {
        using namespace std::chrono;
        const auto since_epoch = duration_cast<microseconds>(t.time_since_epoch());
        auto secs = duration_cast<seconds>(since_epoch);
        auto micros = since_epoch - secs;
        if (micros.count() < 0)
        {
            secs -= seconds(1);
            micros += seconds(1);
        }
        std::time_t tt = static_cast<std::time_t>(secs.count());
        std::tm tm{};
#ifdef _WIN32
        gmtime_s(&tm, &tt);
#else
        gmtime_r(&tt, &tm);
#endif
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
        // fraction only when non-zero
        if (micros.count() != 0)
            oss << '.' << std::setw(6) << std::setfill('0') << micros.count();
        oss << "+00:00";
        return oss.str();
    }

} // namespace rgbd_recorder::util
