#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace fakehub {

constexpr size_t kDefaultStreamChunkBytes = 8192;

/// Bounded reader over [offset, offset + length) of a file.
///
/// The handle is opened in the constructor (IoError on failure) and released
/// with the object, whichever way the response ends. Reads never go past the
/// window even if the file has grown since it was sized.
class ByteWindowReader {
public:
    ByteWindowReader(const std::filesystem::path& path, uint64_t offset, uint64_t length);

    ByteWindowReader(const ByteWindowReader&) = delete;
    ByteWindowReader& operator=(const ByteWindowReader&) = delete;

    uint64_t offset() const { return offset_; }
    uint64_t length() const { return length_; }
    uint64_t remaining() const { return length_ - position_; }

    /// Read up to `max_bytes` starting at `window_offset` (relative to the
    /// window start). Returns the number of bytes read; 0 means the window is
    /// exhausted or the file could no longer be read (see failed()).
    size_t readAt(uint64_t window_offset, char* buffer, size_t max_bytes);

    /// Sequential variant of readAt() continuing after the last read.
    size_t read(char* buffer, size_t max_bytes) { return readAt(position_, buffer, max_bytes); }

    /// True once a read came back short of the window (file truncated or
    /// unreadable mid-stream).
    bool failed() const { return failed_; }

    /// Drain the remaining window in chunks. Throws IoError on a short read.
    std::string readAll(size_t chunk_bytes = kDefaultStreamChunkBytes);

private:
    std::ifstream file_;
    uint64_t offset_{0};
    uint64_t length_{0};
    uint64_t position_{0};
    bool failed_{false};
};

}  // namespace fakehub
