#pragma once
#include <iosfwd>
#include <string>
#include <string_view>
#include <chrono>
namespace chrono = std::chrono;
using timepoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

std::string download(std::string_view url);

std::string cat(const std::string &path);
std::string cat(std::istream &stream);
