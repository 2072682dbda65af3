#include "DirectoryScan.hpp"

#include "cokacenc/core/ChunkName.hpp"
#include <algorithm>
#include <string>

namespace cokacenc::ui::cli
{

namespace
{

[[nodiscard]] std::vector<std::filesystem::path> regularFiles(const std::filesystem::path& dir)
{
    std::vector<std::filesystem::path> out;
    for (const auto& entry : std::filesystem::directory_iterator{ dir })
    {
        if (entry.is_regular_file())
        {
            out.push_back(entry.path());
        }
    }
    std::sort(out.begin(), out.end(),
              [](const auto& a, const auto& b) { return a.filename().string() < b.filename().string(); });
    return out;
}

} // namespace

std::vector<std::filesystem::path> packCandidates(const std::filesystem::path& dir)
{
    auto files = regularFiles(dir);
    std::erase_if(files,
                  [](const std::filesystem::path& p)
                  {
                      const std::string name = p.filename().string();
                      return name.starts_with('.') || name.ends_with(cokacenc::core::g_chunkSuffix);
                  });
    return files;
}

std::vector<std::filesystem::path> chunkCandidates(const std::filesystem::path& dir)
{
    return regularFiles(dir);
}

} // namespace cokacenc::ui::cli
