#include "hub/byte_window_reader.h"

#include <algorithm>
#include <vector>

#include "hub/hub_error.h"

namespace fakehub {

ByteWindowReader::ByteWindowReader(const std::filesystem::path& path, uint64_t offset, uint64_t length)
    : file_(path, std::ios::binary), offset_(offset), length_(length) {
    if (!file_.is_open()) {
        throw IoError("failed to open file: " + path.filename().string());
    }
    file_.seekg(static_cast<std::streamoff>(offset_));
    if (!file_) {
        throw IoError("failed to seek in file: " + path.filename().string());
    }
}

size_t ByteWindowReader::readAt(uint64_t window_offset, char* buffer, size_t max_bytes) {
    if (failed_ || window_offset >= length_ || max_bytes == 0) return 0;

    if (window_offset != position_) {
        file_.clear();
        file_.seekg(static_cast<std::streamoff>(offset_ + window_offset));
        if (!file_) {
            failed_ = true;
            return 0;
        }
        position_ = window_offset;
    }

    const auto want = static_cast<size_t>(std::min<uint64_t>(max_bytes, length_ - position_));
    file_.read(buffer, static_cast<std::streamsize>(want));
    const auto got = static_cast<size_t>(file_.gcount());
    position_ += got;
    if (got < want) {
        failed_ = true;
    }
    return got;
}

std::string ByteWindowReader::readAll(size_t chunk_bytes) {
    std::string out;
    out.reserve(static_cast<size_t>(remaining()));
    std::vector<char> buf(chunk_bytes == 0 ? kDefaultStreamChunkBytes : chunk_bytes);
    while (remaining() > 0) {
        const size_t n = read(buf.data(), buf.size());
        if (n == 0) break;
        out.append(buf.data(), n);
    }
    if (failed_ || remaining() > 0) {
        throw IoError("short read while streaming file window");
    }
    return out;
}

}  // namespace fakehub
