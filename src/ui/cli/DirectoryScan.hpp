#ifndef COKACENC_UI_CLI_DIRECTORYSCAN_HPP
#define COKACENC_UI_CLI_DIRECTORYSCAN_HPP

#include <filesystem>
#include <vector>

namespace cokacenc::ui::cli
{

// Regular files directly inside `dir` that can be packed: not hidden, not already a chunk. Sorted by name.
// Throws std::filesystem::filesystem_error if the directory cannot be listed.
[[nodiscard]] std::vector<std::filesystem::path> packCandidates(const std::filesystem::path& dir);

// Every regular file directly inside `dir`, sorted by name. The chunk name codec decides what is a chunk.
[[nodiscard]] std::vector<std::filesystem::path> chunkCandidates(const std::filesystem::path& dir);

} // namespace cokacenc::ui::cli

#endif // COKACENC_UI_CLI_DIRECTORYSCAN_HPP
