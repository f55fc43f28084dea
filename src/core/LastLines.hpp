#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "core/cancel.hpp"
#include "io/ByteSource.hpp"

namespace ListFile {

static constexpr size_t DEFAULT_CHUNK_SIZE = 8192;

// Splits text on "\r\n", "\n" and bare "\r". Blank lines are kept, a terminator
// at the very end does not produce an extra empty line.
std::vector<std::string> split_lines(std::string_view text);

// Returns up to line_count last lines of source, in file order, terminators stripped.
//
// Sources not larger than chunk_size are read in one go. Larger ones are read
// backwards in chunk_size windows, so memory stays bounded by chunk_size plus the
// longest line plus the returned lines. The result does not depend on chunk_size.
//
// Throws InvalidArgument for line_count <= 0 or chunk_size == 0, Cancelled when
// cancel fires between chunks, Unexpected on short reads.
std::vector<std::string> get_last_lines(ByteSource& source, int line_count, size_t chunk_size = DEFAULT_CHUNK_SIZE, const CancelToken& cancel = {});

} // namespace ListFile
