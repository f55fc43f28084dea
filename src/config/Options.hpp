#pragma once
#include <cstddef>
#include <filesystem>
#include <string>

#include "core/LastLines.hpp"

#define LISTFILE_CONFIG_FNAME   "appsettings.json"
#define LISTFILE_CONFIG_SECTION "FileLister"

namespace ListFile {

struct ListerOptions {
    int default_line_count = 10;        // used when no count is given
    int max_line_count = 1000;          // hard ceiling for a single request
    size_t buffer_size = DEFAULT_CHUNK_SIZE;
    bool show_line_numbers = false;

    // throws InvalidArgument on non-positive values or default > max
    void validate() const;

    // reads the "FileLister" section of a JSON settings file.
    // returns false if the file does not exist and required == false
    bool load_json_file(const std::filesystem::path& fname, bool required);
    void load_json_string(const std::string& text, const std::string& origin = "<string>");

    // FileLister__DefaultLineCount, FileLister__MaxLineCount, FileLister__BufferSize, FileLister__ShowLineNumbers
    void load_env();

    std::string to_string() const;
};

} // namespace ListFile
