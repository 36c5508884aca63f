#pragma once

#include "linkchat/Types.hpp"
#include "linkchat/transfer/OutputSink.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace linkchat::storage {

class FileSink final : public transfer::OutputSink {
public:
    explicit FileSink(std::filesystem::path path);
    ~FileSink() override;

    [[nodiscard]] bool is_open() const { return stream_.is_open(); }
    const std::filesystem::path& path() const noexcept { return path_; }

    bool write(std::span<const std::uint8_t> data) override;
    bool close() override;

private:
    std::filesystem::path path_;
    std::ofstream stream_;
};

// Root under which received files and folders are created. Names coming off the wire
// are untrusted and are confined to the root.
class ReceiveDirectory {
public:
    explicit ReceiveDirectory(std::filesystem::path root);

    const std::filesystem::path& root() const noexcept { return root_; }

    std::optional<std::filesystem::path> resolve(std::string_view relative) const;
    bool create_folder(std::string_view relative) const;
    std::unique_ptr<FileSink> open_sink(std::string_view relative) const;

    transfer::SinkFactory sink_factory() const;

private:
    std::filesystem::path root_;
};

std::optional<std::string> sanitize_relative_path(std::string_view relative);
std::optional<ByteBuffer> read_file_bytes(const std::filesystem::path& path);

struct FolderEntry {
    enum class Kind {
        FolderStart,
        File,
        FolderEnd,
    };

    Kind kind{Kind::File};
    // Wire name, '/'-separated, starting with the walked folder's own name.
    std::string relative_path;
    std::filesystem::path source;
};

// Files of a folder come first in name order, then each sub-folder recursively.
std::vector<FolderEntry> walk_folder(const std::filesystem::path& folder);

}  // namespace linkchat::storage
