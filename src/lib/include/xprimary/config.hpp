#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace config
{
struct markers
{
    std::string start = "Primary Monitor Start";
    std::string end = "Primary Monitor End";
};

// Line indices, both ends inclusive.
struct block
{
    size_t start;
    size_t end;
};

std::vector<std::string> split_lines(const std::string &text);

std::vector<block> find_blocks(const std::vector<std::string> &lines,
                               const markers &marks);

// First uncommented `output "<value>"` line of the block.
std::optional<std::string> find_declaration(
    const std::vector<std::string> &lines, const block &block);

std::optional<std::string> get_preference(const std::string &config_text,
                                          const markers &marks);

// Missing or unreadable files yield no preference.
std::optional<std::string> read_preference(const std::filesystem::path &path,
                                           const markers &marks);

} // namespace config
