// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#include "rgbd_recorder/session_recorder.hpp"
#include "rgbd_recorder/util.hpp"

#include <filesystem>
#include <fstream>
#include <utility>
#include <vector>

#include <opencv2/imgcodecs.hpp>
#include <rclcpp/logging.hpp>

namespace fs = std::filesystem;

namespace rgbd_recorder::session_recorder
{

    namespace
    {
        nlohmann::json intrinsicsJson(const StreamIntrinsics &intr)
        {
            return {{"width", intr.width},
                    {"height", intr.height},
                    {"fx", intr.fx},
                    {"fy", intr.fy},
                    {"ppx", intr.ppx},
                    {"ppy", intr.ppy}};
        }

        std::string describe(const cv::Mat &m)
        {
            return std::to_string(m.rows) + "x" + std::to_string(m.cols) + "x" +
                   std::to_string(m.channels()) + " (dims " + std::to_string(m.dims) +
                   ", depth " + std::to_string(m.depth()) + ")";
        }
    } // namespace

    nlohmann::json SessionMetadata::toJson() const
    {
        nlohmann::json root;
        root["session_start"] = session_start;
        root["session_end"] = session_end;
        root["device_index"] = device_index;

        nlohmann::json cam = nlohmann::json::object();
        if (camera_info)
        {
            cam["name"] = camera_info->name;
            cam["serial"] = camera_info->serial;
            cam["firmware"] = camera_info->firmware;
            cam["product_id"] = camera_info->product_id;
        }
        root["camera_info"] = std::move(cam);

        if (intrinsics)
        {
            root["intrinsics"] = {{"color", intrinsicsJson(intrinsics->color)},
                                  {"depth", intrinsicsJson(intrinsics->depth)}};
        }
        root["stream_config"] = {
            {"color", {{"width", stream_config.color_width}, {"height", stream_config.color_height}, {"fps", stream_config.color_fps}, {"format", "bgr8"}}},
            {"depth", {{"width", stream_config.depth_width}, {"height", stream_config.depth_height}, {"fps", stream_config.depth_fps}, {"format", "z16"}}}};

        root["log_level"] = log_level;
        root["preview_enabled"] = preview_enabled;
        root["frame_count"] = frame_count;
        if (depth_scale)
            root["depth_scale"] = *depth_scale;
        return root;
    }

    SessionRecorder::SessionRecorder(rclcpp::Logger logger, cv::Size color_size)
        : logger_(std::move(logger)), color_size_(color_size)
    {
        RCLCPP_INFO(logger_, "SessionRecorder initialized");
    }

    Status SessionRecorder::createSessionDirectory(const std::string &base_dir, std::string &session_dir)
    {
        return createSessionDirectory(base_dir, std::chrono::system_clock::now(), session_dir);
    }

    Status SessionRecorder::createSessionDirectory(const std::string &base_dir,
                                                   std::chrono::system_clock::time_point now,
                                                   std::string &session_dir)
    {
        const fs::path root = util::expandUser(base_dir);
        std::error_code ec;
        fs::create_directories(root, ec);
        if (ec)
        {
            RCLCPP_ERROR(logger_, "Failed to create output root '%s': %s", root.string().c_str(), ec.message().c_str());
            return Status::Error(ErrorKind::Io, "Failed to create output root '" + root.string() + "': " + ec.message());
        }

        const fs::path dir = root / ("session_" + util::timeStringDateTime(now));
        for (const fs::path &sub : {dir / kRgbDir, dir / kDepthDir})
        {
            fs::create_directories(sub, ec);
            if (ec)
            {
                RCLCPP_ERROR(logger_, "Failed to create '%s': %s", sub.string().c_str(), ec.message().c_str());
                return Status::Error(ErrorKind::Io, "Failed to create '" + sub.string() + "': " + ec.message());
            }
        }

        session_dir = dir.string();
        RCLCPP_INFO(logger_, "Created session directory: %s", session_dir.c_str());
        return Status::Ok();
    }

    std::string SessionRecorder::rgbFileName(uint64_t index)
    {
        return "frame_" + util::indexString(index, 6) + "_rgb.png";
    }

    std::string SessionRecorder::depthFileName(uint64_t index)
    {
        return "frame_" + util::indexString(index, 6) + "_depth.npy";
    }

    Status SessionRecorder::saveFramePair(uint64_t index, const cv::Mat &color, const cv::Mat &depth,
                                          const std::string &session_dir, FilePaths &out_paths)
    {
        if (color.empty() || color.dims != 2 || color.type() != CV_8UC3 || color.size() != color_size_)
        {
            return Status::Error(ErrorKind::Validation,
                                 "color image must be " + std::to_string(color_size_.height) + "x" +
                                     std::to_string(color_size_.width) + "x3 uint8, got " + describe(color));
        }
        if (depth.empty() || depth.dims != 2 || depth.type() != CV_16UC1)
        {
            return Status::Error(ErrorKind::Validation,
                                 "depth image must be HxW uint16, got " + describe(depth));
        }

        const fs::path root(session_dir);
        const fs::path rgb_path = root / kRgbDir / rgbFileName(index);
        const fs::path depth_path = root / kDepthDir / depthFileName(index);

        std::vector<uchar> png;
        try
        {
            const std::vector<int> params = {cv::IMWRITE_PNG_COMPRESSION, 1};
            if (!cv::imencode(".png", color, png, params))
                return Status::Error(ErrorKind::Io, "Failed to encode RGB frame " + std::to_string(index));
        }
        catch (const cv::Exception &e)
        {
            return Status::Error(ErrorKind::Io, "Failed to encode RGB frame " + std::to_string(index) + ": " + e.what());
        }

        const bool rgb_ok = util::writeAtomically(rgb_path, [&png](const fs::path &tmp)
                                                  {
            std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
            if (!ofs.is_open())
                return false;
            ofs.write(reinterpret_cast<const char *>(png.data()), static_cast<std::streamsize>(png.size()));
            ofs.flush();
            return static_cast<bool>(ofs); });
        if (!rgb_ok)
        {
            RCLCPP_ERROR(logger_, "Failed to write RGB frame to %s", rgb_path.string().c_str());
            return Status::Error(ErrorKind::Io, "Failed to write RGB frame to " + rgb_path.string());
        }

        const bool depth_ok = util::writeAtomically(depth_path, [&depth](const fs::path &tmp)
                                                    { return util::writeNpy(tmp.string(), depth); });
        if (!depth_ok)
        {
            // a pair lands whole or not at all
            std::error_code ec;
            fs::remove(rgb_path, ec);
            RCLCPP_ERROR(logger_, "Failed to write depth frame to %s", depth_path.string().c_str());
            return Status::Error(ErrorKind::Io, "Failed to write depth frame to " + depth_path.string());
        }

        out_paths.rgb = rgb_path.string();
        out_paths.depth = depth_path.string();
        RCLCPP_DEBUG(logger_, "Saved frame %llu: RGB=%s, Depth=%s", static_cast<unsigned long long>(index),
                     rgb_path.filename().string().c_str(), depth_path.filename().string().c_str());
        return Status::Ok();
    }

    Status SessionRecorder::saveMetadata(const std::string &session_dir, const nlohmann::json &metadata)
    {
        const fs::path path = fs::path(session_dir) / kMetadataFile;
        bool ok = false;
        try
        {
            ok = util::writeAtomically(path, [&metadata](const fs::path &tmp)
                                       { return util::writeJson(tmp.string(), metadata); });
        }
        catch (const nlohmann::json::type_error &e)
        {
            RCLCPP_ERROR(logger_, "Failed to serialize session metadata: %s", e.what());
            return Status::Error(ErrorKind::Validation, std::string("metadata is not serializable: ") + e.what());
        }

        if (!ok)
        {
            RCLCPP_ERROR(logger_, "Failed to write metadata to %s", path.string().c_str());
            return Status::Error(ErrorKind::Io, "Failed to write metadata to " + path.string());
        }
        RCLCPP_INFO(logger_, "Saved metadata to %s", path.string().c_str());
        return Status::Ok();
    }

    Status SessionRecorder::saveCalibration(const std::string &session_dir, const CameraIntrinsics &intrinsics)
    {
        const fs::path root(session_dir);
        const std::string f_color = (root / "color_intrinsics.yaml").string();
        const std::string f_depth = (root / "depth_intrinsics.yaml").string();

        const bool ok_color = writeCalibrationYaml(intrinsics.color, "color", f_color);
        const bool ok_depth = writeCalibrationYaml(intrinsics.depth, "depth", f_depth);
        if (!ok_color)
            RCLCPP_ERROR(logger_, "Failed to write %s", f_color.c_str());
        if (!ok_depth)
            RCLCPP_ERROR(logger_, "Failed to write %s", f_depth.c_str());
        if (!ok_color || !ok_depth)
            return Status::Error(ErrorKind::Io, "Failed to write calibration files in " + session_dir);

        RCLCPP_INFO(logger_, "Wrote intrinsics YAMLs to %s", session_dir.c_str());
        return Status::Ok();
    }

    bool SessionRecorder::writeCalibrationYaml(const StreamIntrinsics &intr, const std::string &camera_name,
                                               const std::string &path)
    {
        YAML::Node node;
        node["image_width"] = intr.width;
        node["image_height"] = intr.height;
        node["camera_name"] = camera_name;

        auto makeMat = [](int rows, int cols, const auto &vec)
        {
            YAML::Node m;
            // OpenCV matrix header fields
            m["rows"] = rows;
            m["cols"] = cols;
            m["dt"] = "d"; // double
            YAML::Node data(YAML::NodeType::Sequence);
            for (const auto &v : vec)
                data.push_back(v);
            m["data"] = data;
            m.SetTag("opencv-matrix");
            return m;
        };

        const Eigen::Matrix3d K = intr.cameraMatrix();
        std::vector<double> k_row_major;
        std::vector<double> p_row_major;
        for (int r = 0; r < 3; ++r)
        {
            for (int c = 0; c < 3; ++c)
            {
                k_row_major.push_back(K(r, c));
                p_row_major.push_back(K(r, c));
            }
            p_row_major.push_back(0.0);
        }
        const Eigen::Matrix3d R = Eigen::Matrix3d::Identity();
        std::vector<double> r_row_major;
        for (int r = 0; r < 3; ++r)
            for (int c = 0; c < 3; ++c)
                r_row_major.push_back(R(r, c));

        node["camera_matrix"] = makeMat(3, 3, k_row_major);
        node["distortion_model"] = intr.distortion_model;
        node["distortion_coefficients"] = makeMat(1, static_cast<int>(intr.distortion.size()), intr.distortion);
        node["rectification_matrix"] = makeMat(3, 3, r_row_major);
        node["projection_matrix"] = makeMat(3, 4, p_row_major);

        return util::writeYaml(path, node);
    }

} // namespace rgbd_recorder::session_recorder
