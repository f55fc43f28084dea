#pragma once
#include <cstdint>
#include <string>

// 8192 -> "8Kb", 100 -> "100" + default_unit
std::string bytes2human(uint64_t size, const char* default_unit = "");

// "8192", "8k", "8Kb", "1M", "0x2000" -> bytes. throws std::runtime_error on bad input
uint64_t human2bytes(const std::string& size);
