/**
 * @file units.cpp
 * @brief Conversion between byte counts and human-readable sizes.
 */

#include "units.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>

/**
 * @brief Converts bytes to a short human-readable string.
 *
 * Picks the largest binary unit that keeps the numeric part below 4096 and
 * divides the size exactly; sizes that are not a whole number of units stay in bytes.
 *
 * @param size Size in bytes.
 * @param default_unit Unit suffix to use for raw bytes (e.g., " bytes", "").
 * @return Human-readable size string (e.g., "8Kb", "100 bytes").
 */
std::string bytes2human(uint64_t size, const char* default_unit){
    static const char* units[] = { "Kb", "Mb", "Gb", "Tb" };

    int unit = -1;
    while( unit < 3 && size >= 4096 && size % 1024 == 0 ){
        size /= 1024;
        unit++;
    }
    return std::to_string(size) + (unit < 0 ? default_unit : units[unit]);
}

/**
 * @brief Parses a size given in bytes, hex or with a binary unit suffix.
 *
 * @param size Human-readable size string, unit suffix is case-insensitive.
 * @return Size in bytes.
 * @throws std::runtime_error If the string is malformed, the unit is unknown or the value overflows.
 */
uint64_t human2bytes(const std::string& size) {
    static const std::map<std::string, uint64_t> units = {
        {"",   1},
        {"b",  1},
        {"kb", 1024ULL},
        {"mb", 1024ULL * 1024},
        {"gb", 1024ULL * 1024 * 1024},
        {"tb", 1024ULL * 1024 * 1024 * 1024},
    };

    if( size.length() > 2 && size[0] == '0' && (size[1]|0x20) == 'x' ){
        size_t pos = 0;
        uint64_t result = std::stoull(size, &pos, 16);
        if( pos != size.size() ){
            throw std::runtime_error("Invalid hex value: " + size);
        }
        return result;
    }

    size_t i = 0;
    while( i < size.length() && isdigit((unsigned char)size[i]) ){
        ++i;
    }
    if( i == 0 ){
        throw std::runtime_error("Invalid size: \"" + size + "\"");
    }

    std::string unit = size.substr(i);
    std::transform(unit.begin(), unit.end(), unit.begin(), ::tolower);
    if( unit.size() == 1 && unit != "b" ){
        unit += 'b';
    }

    auto it = units.find(unit);
    if( it == units.end() ){
        throw std::runtime_error("Unsupported unit: " + size.substr(i));
    }

    uint64_t number = std::stoull(size.substr(0, i));
    uint64_t result = number * it->second;
    if( it->second != 1 && result / it->second != number ){
        throw std::runtime_error("Resulting value out of range: " + size);
    }
    return result;
}
