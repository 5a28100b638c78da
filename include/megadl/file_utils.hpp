#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace megadl {

// Uniquely named folder under the system temp directory, removed with its
// contents when the guard goes out of scope.
class TempFolder {
public:
    TempFolder();
    explicit TempFolder(const std::filesystem::path& parent);
    ~TempFolder();

    TempFolder(const TempFolder&) = delete;
    TempFolder& operator=(const TempFolder&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

[[nodiscard]] bool folderExists(const std::filesystem::path& folder);

// Recursive search for a regular file called `file_name`.
[[nodiscard]] bool folderContainsFile(const std::filesystem::path& folder, const std::string& file_name);

// Dot-files and dot-folders hold the agent's unfinished transfers.
[[nodiscard]] bool isAgentTempName(const std::filesystem::path& path);

// Moves every regular file below `source` directly into `destination`,
// leaving agent temp entries behind. Returns the number of files moved.
// Throws Error when `source` cannot be listed or a file cannot be moved.
std::size_t moveFilesToDestination(const std::filesystem::path& source,
                                   const std::filesystem::path& destination);

// Deletes everything inside `folder`, keeping the folder itself.
void purgeFolderContents(const std::filesystem::path& folder);

std::string randomFolderName(std::size_t length = 20);

} // namespace megadl
