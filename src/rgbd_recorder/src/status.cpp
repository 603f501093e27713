// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#include "rgbd_recorder/status.hpp"

#include <utility>

namespace rgbd_recorder
{

    const char *toString(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::None:
            return "ok";
        case ErrorKind::Connection:
            return "connection";
        case ErrorKind::Configuration:
            return "configuration";
        case ErrorKind::Capture:
            return "capture";
        case ErrorKind::Validation:
            return "validation";
        case ErrorKind::Io:
            return "io";
        }
        return "unknown";
    }

    Status::Status(ErrorKind kind, std::string message, ErrorKind cause)
        : kind_(kind), cause_(cause), message_(std::move(message))
    {
    }

    Status Status::Error(ErrorKind kind, std::string message)
    {
        return Status(kind, std::move(message), ErrorKind::None);
    }

    Status Status::Wrap(ErrorKind kind, const std::string &prefix, const Status &cause)
    {
        if (cause.ok())
            return Status(kind, prefix, ErrorKind::None);
        return Status(kind, prefix + ": " + cause.message(), cause.kind());
    }

    bool Status::isCameraError() const
    {
        return kind_ == ErrorKind::Connection ||
               kind_ == ErrorKind::Configuration ||
               kind_ == ErrorKind::Capture;
    }

    std::string Status::toString() const
    {
        if (ok())
            return "ok";
        return std::string(rgbd_recorder::toString(kind_)) + " error: " + message_;
    }

} // namespace rgbd_recorder
