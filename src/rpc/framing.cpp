#include <aion_mcp/rpc/framing.hpp>

#include <aion_mcp/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <optional>

namespace aion_mcp {

namespace {

constexpr const char* kContentLength = "content-length";

Error MakeFramingError(const std::string& message) {
    return Error{"ReadFrame", "stdin", std::nullopt, message, std::nullopt,
                 ErrorCategory::Framing};
}

std::string_view Trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

bool IEquals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

// Parse a Content-Length value. Only plain decimal digits are accepted, so a
// sign, whitespace inside the number or a hex prefix are all rejected.
std::optional<std::size_t> ParseLength(std::string_view text) {
    if (text.empty() || text.size() > 19) {
        return std::nullopt;
    }
    std::size_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::size_t>(c - '0');
    }
    return value;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// FrameReader
// ---------------------------------------------------------------------------
FrameReader::FrameReader(std::istream& in, std::size_t max_payload)
    : in_(in), max_payload_(max_payload) {}

Result<FrameReader::Outcome, Error> FrameReader::Truncated(
    const std::string& where) {
    finished_ = true;
    return Result<Outcome, Error>::Err(
        MakeFramingError("Stream ended inside a frame " + where));
}

Result<FrameReader::Outcome, Error> FrameReader::ReadFrame() {
    if (finished_) {
        return Result<Outcome, Error>::Ok(Outcome{Status::EndOfStream, {}});
    }

    bool started = false;
    std::optional<std::size_t> content_length;
    std::optional<std::string> header_error;

    std::string line;
    while (true) {
        if (!std::getline(in_, line)) {
            if (!started) {
                finished_ = true;
                return Result<Outcome, Error>::Ok(Outcome{Status::EndOfStream, {}});
            }
            return Truncated("(inside the header block)");
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (in_.eof()) {
            // Last line had no terminating newline.
            if (!started && line.empty()) {
                finished_ = true;
                return Result<Outcome, Error>::Ok(Outcome{Status::EndOfStream, {}});
            }
            return Truncated("(unterminated header line)");
        }

        if (line.empty()) {
            if (!started) {
                // Stray separator between frames.
                continue;
            }
            break;
        }
        started = true;

        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            if (!header_error) {
                header_error = "Malformed header line: '" + line + "'";
            }
            continue;
        }

        const auto key = Trim(std::string_view(line).substr(0, colon));
        const auto value = Trim(std::string_view(line).substr(colon + 1));
        if (!IEquals(key, kContentLength)) {
            LogDebug("framing", "ignoring header " + std::string(key));
            continue;
        }

        auto parsed = ParseLength(value);
        if (!parsed) {
            if (!header_error) {
                header_error = "Invalid Content-Length value: '" +
                               std::string(value) + "'";
            }
            continue;
        }
        if (content_length && *content_length != *parsed) {
            if (!header_error) {
                header_error = "Conflicting Content-Length headers";
            }
            continue;
        }
        content_length = parsed;
    }

    if (header_error) {
        return Result<Outcome, Error>::Err(MakeFramingError(*header_error));
    }
    if (!content_length) {
        return Result<Outcome, Error>::Err(
            MakeFramingError("Missing Content-Length header"));
    }

    if (*content_length > max_payload_) {
        // Skip the declared payload so the next frame can still be read.
        in_.ignore(static_cast<std::streamsize>(*content_length));
        if (static_cast<std::size_t>(in_.gcount()) < *content_length) {
            return Truncated("(oversized payload)");
        }
        return Result<Outcome, Error>::Err(MakeFramingError(
            "Frame of " + std::to_string(*content_length) +
            " bytes exceeds the maximum of " + std::to_string(max_payload_)));
    }

    std::string payload(*content_length, '\0');
    if (*content_length > 0) {
        in_.read(&payload[0], static_cast<std::streamsize>(*content_length));
        if (static_cast<std::size_t>(in_.gcount()) < *content_length) {
            return Truncated("(payload shorter than Content-Length)");
        }
    }

    return Result<Outcome, Error>::Ok(Outcome{Status::Frame, std::move(payload)});
}

// ---------------------------------------------------------------------------
// FrameWriter
// ---------------------------------------------------------------------------
FrameWriter::FrameWriter(std::ostream& out) : out_(out) {}

Result<void, Error> FrameWriter::WriteFrame(std::string_view payload) {
    const auto frame = EncodeFrame(payload);
    out_.write(frame.data(), static_cast<std::streamsize>(frame.size()));
    out_.flush();
    if (!out_) {
        return Result<void, Error>::Err(Error{
            "WriteFrame", "stdout", std::nullopt,
            "Failed to write frame to output stream", std::nullopt,
            ErrorCategory::Io});
    }
    return Result<void, Error>::Ok();
}

std::string EncodeFrame(std::string_view payload) {
    std::string frame = "Content-Length: " + std::to_string(payload.size()) +
                        "\r\n\r\n";
    frame.append(payload.data(), payload.size());
    return frame;
}

} // namespace aion_mcp
