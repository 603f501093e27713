// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#pragma once

#include <string>

namespace rgbd_recorder
{

    enum class ErrorKind
    {
        None,
        Connection,    // device absent, bad index, negotiation/start failure
        Configuration, // stream parameters rejected by the device
        Capture,       // timeout, missing aligned frame, SDK failure mid-stream
        Validation,    // malformed image or metadata handed to persistence
        Io             // filesystem write failure
    };

    const char *toString(ErrorKind kind);

    // Result of an operation that can fail with one of the closed error kinds.
    // A wrapped status keeps the kind of the failure that caused it.
    class Status
    {
    public:
        Status() = default;

        static Status Ok() { return Status(); }
        static Status Error(ErrorKind kind, std::string message);
        static Status Wrap(ErrorKind kind, const std::string &prefix, const Status &cause);

        bool ok() const { return kind_ == ErrorKind::None; }
        explicit operator bool() const { return ok(); }

        ErrorKind kind() const { return kind_; }
        ErrorKind causeKind() const { return cause_; }
        const std::string &message() const { return message_; }

        /// Connection, Configuration and Capture failures all come from the camera.
        bool isCameraError() const;

        std::string toString() const;

    private:
        Status(ErrorKind kind, std::string message, ErrorKind cause);

        ErrorKind kind_ = ErrorKind::None;
        ErrorKind cause_ = ErrorKind::None;
        std::string message_;
    };

} // namespace rgbd_recorder
