#pragma once

#include "http.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace transferkit {

// Places finished downloads inside one application-owned directory.
// An existing file with the same name is replaced ("latest download wins").
class DestinationResolver {
public:
    explicit DestinationResolver(std::filesystem::path directory);

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

    // Final path for `suggested_name`, reduced to a bare file name.
    [[nodiscard]] std::filesystem::path destinationFor(std::string_view suggested_name) const;

    // Moves `temporary` to its final path. The final path either keeps its previous
    // content or holds the complete new file. Throws TransferException(FileSystemFailure).
    std::filesystem::path place(const std::filesystem::path& temporary, std::string_view suggested_name) const;

    // Content-Disposition filename, else the URL's last path segment, else "download".
    [[nodiscard]] static std::string suggestedFilename(const Headers& headers, std::string_view url);

private:
    std::filesystem::path directory_;
};

} // namespace transferkit
