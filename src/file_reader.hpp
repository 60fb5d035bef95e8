#pragma once
/*
 * FileReader
 *
 * Purpose: split text into display lines (CRLF normalized) and read small files via mmap.
 * Usage: mmap_readlines(path, out_lines, msg); returns false with msg on failure.
 */
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

// A trailing '\n' does not produce an extra empty line; "" yields no lines.
void split_lines(std::string_view data, std::vector<std::string>& out_lines);

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg);
