#pragma once

#include <aion_mcp/core/result.hpp>

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace aion_mcp {

// Upper bound for a single payload. Larger frames are skipped and reported.
constexpr std::size_t kDefaultMaxFrameBytes = 64u * 1024u * 1024u;

// ---------------------------------------------------------------------------
// FrameReader: extracts Content-Length framed payloads from a byte stream.
//
// Frame layout:
//   Content-Length: <n>\r\n
//   [Other-Header: value\r\n ...]
//   \r\n
//   <n bytes of payload>
//
// Header keys are case-insensitive and unknown keys are ignored. Bare LF line
// endings are accepted as well. ReadFrame() returns:
//   - Ok(Frame)        one complete payload
//   - Ok(EndOfStream)  the stream ended cleanly between frames
//   - Err(Framing)     a bad header block; the reader stays usable unless
//                      Finished() reports that the stream ended mid-frame
// ---------------------------------------------------------------------------
class FrameReader {
public:
    enum class Status {
        Frame,
        EndOfStream,
    };

    struct Outcome {
        Status status = Status::EndOfStream;
        std::string payload;
    };

    explicit FrameReader(std::istream& in,
                         std::size_t max_payload = kDefaultMaxFrameBytes);

    [[nodiscard]] Result<Outcome, Error> ReadFrame();

    // True once the underlying stream is exhausted (clean or truncated).
    [[nodiscard]] bool Finished() const noexcept { return finished_; }

private:
    Result<Outcome, Error> Truncated(const std::string& where);

    std::istream& in_;
    std::size_t max_payload_;
    bool finished_ = false;
};

// ---------------------------------------------------------------------------
// FrameWriter: writes one framed payload per call and flushes.
// A failed write (e.g. broken pipe) is an Io error; callers treat it as fatal.
// ---------------------------------------------------------------------------
class FrameWriter {
public:
    explicit FrameWriter(std::ostream& out);

    [[nodiscard]] Result<void, Error> WriteFrame(std::string_view payload);

private:
    std::ostream& out_;
};

/// Build the complete framed representation of a payload.
std::string EncodeFrame(std::string_view payload);

} // namespace aion_mcp
