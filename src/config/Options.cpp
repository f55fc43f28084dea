/**
 * @file Options.cpp
 * @brief Lister configuration: defaults, JSON settings file and environment.
 *
 * Settings live in the "FileLister" section of a JSON file, keys use the same
 * PascalCase names as the environment overrides (FileLister__<Key>). Numbers
 * may be given either as JSON numbers or as strings, the buffer size also
 * accepts human units ("8k", "1Mb", "0x2000").
 */

#include "Options.hpp"
#include "utils/common.hpp"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

namespace ListFile {

static int parse_count(const std::string& key, const std::string& value) {
    size_t pos = 0;
    int result = 0;
    try {
        result = std::stoi(value, &pos);
    } catch( const std::exception& ){
        pos = 0;
    }
    if( pos == 0 || pos != value.size() ){
        throw InvalidArgument(fmt::format("{}: invalid integer value \"{}\"", key, value));
    }
    return result;
}

static size_t parse_size(const std::string& key, const std::string& value) {
    try {
        return human2bytes(value);
    } catch( const std::exception& e ){
        throw InvalidArgument(fmt::format("{}: invalid size \"{}\": {}", key, value, e.what()));
    }
}

static bool parse_flag(const std::string& key, const std::string& value) {
    try {
        return parse_bool(value);
    } catch( const std::exception& ){
        throw InvalidArgument(fmt::format("{}: invalid boolean value \"{}\"", key, value));
    }
}

static std::string json_scalar(const nlohmann::json& j) {
    return j.is_string() ? j.get<std::string>() : j.dump();
}

void ListerOptions::validate() const {
    if( default_line_count <= 0 ){
        throw InvalidArgument(fmt::format("DefaultLineCount must be greater than zero, got {}", default_line_count));
    }
    if( max_line_count <= 0 ){
        throw InvalidArgument(fmt::format("MaxLineCount must be greater than zero, got {}", max_line_count));
    }
    if( default_line_count > max_line_count ){
        throw InvalidArgument(fmt::format("DefaultLineCount ({}) cannot exceed MaxLineCount ({})", default_line_count, max_line_count));
    }
    if( buffer_size == 0 ){
        throw InvalidArgument("BufferSize must be greater than zero");
    }
}

void ListerOptions::load_json_string(const std::string& text, const std::string& origin) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch( const nlohmann::json::parse_error& e ){
        throw InvalidArgument(fmt::format("{}: {}", origin, e.what()));
    }

    if( !root.is_object() || !root.contains(LISTFILE_CONFIG_SECTION) ){
        logger->debug("{}: no \"{}\" section", origin, LISTFILE_CONFIG_SECTION);
        return;
    }
    const auto& section = root[LISTFILE_CONFIG_SECTION];
    if( !section.is_object() ){
        throw InvalidArgument(fmt::format("{}: \"{}\" must be an object", origin, LISTFILE_CONFIG_SECTION));
    }

    for( const auto& [key, value] : section.items() ){
        if( key == "DefaultLineCount" ){
            default_line_count = parse_count(key, json_scalar(value));
        } else if( key == "MaxLineCount" ){
            max_line_count = parse_count(key, json_scalar(value));
        } else if( key == "BufferSize" ){
            buffer_size = parse_size(key, json_scalar(value));
        } else if( key == "ShowLineNumbers" ){
            show_line_numbers = value.is_boolean() ? value.get<bool>() : parse_flag(key, json_scalar(value));
        } else {
            logger->warn("{}: unknown setting {}.{}", origin, LISTFILE_CONFIG_SECTION, key);
        }
    }
}

bool ListerOptions::load_json_file(const std::filesystem::path& fname, bool required) {
    std::ifstream f(fname);
    if( !f.is_open() ){
        if( required ){
            throw NotFound(fmt::format("config file \"{}\" not found", fname.string()));
        }
        return false;
    }

    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    load_json_string(text, fname.string());
    logger->debug("loaded settings from {}", fname);
    return true;
}

void ListerOptions::load_env() {
    const char* value = nullptr;
    if( (value = getenv(LISTFILE_CONFIG_SECTION "__DefaultLineCount")) ){
        default_line_count = parse_count("DefaultLineCount", value);
    }
    if( (value = getenv(LISTFILE_CONFIG_SECTION "__MaxLineCount")) ){
        max_line_count = parse_count("MaxLineCount", value);
    }
    if( (value = getenv(LISTFILE_CONFIG_SECTION "__BufferSize")) ){
        buffer_size = parse_size("BufferSize", value);
    }
    if( (value = getenv(LISTFILE_CONFIG_SECTION "__ShowLineNumbers")) ){
        show_line_numbers = parse_flag("ShowLineNumbers", value);
    }
}

std::string ListerOptions::to_string() const {
    return fmt::format("DefaultLineCount={} MaxLineCount={} BufferSize={} ShowLineNumbers={}",
        default_line_count, max_line_count, bytes2human(buffer_size), show_line_numbers);
}

} // namespace ListFile
