#include "linkchat/storage/ReceiveDirectory.hpp"

#include "linkchat/util/StructuredLogger.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace linkchat::storage {

namespace {

using util::StructuredLogger;

void walk_into(const std::filesystem::path& folder,
               const std::string& relative,
               std::vector<FolderEntry>& entries) {
    entries.push_back(FolderEntry{FolderEntry::Kind::FolderStart, relative, folder});

    std::vector<std::filesystem::path> files;
    std::vector<std::filesystem::path> folders;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code status_ec;
        if (it->is_directory(status_ec)) {
            folders.push_back(it->path());
        } else if (it->is_regular_file(status_ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        util::log_event(StructuredLogger::Level::Warning,
                        "storage.walk.unreadable",
                        {{"folder", folder.string()}, {"error", ec.message()}});
    }

    const auto by_name = [](const std::filesystem::path& lhs, const std::filesystem::path& rhs) {
        return lhs.filename().string() < rhs.filename().string();
    };
    std::sort(files.begin(), files.end(), by_name);
    std::sort(folders.begin(), folders.end(), by_name);

    for (const auto& file : files) {
        entries.push_back(FolderEntry{FolderEntry::Kind::File, relative + "/" + file.filename().string(), file});
    }
    for (const auto& child : folders) {
        walk_into(child, relative + "/" + child.filename().string(), entries);
    }

    entries.push_back(FolderEntry{FolderEntry::Kind::FolderEnd, relative, folder});
}

}  // namespace

FileSink::FileSink(std::filesystem::path path)
    : path_(std::move(path)), stream_(path_, std::ios::binary | std::ios::trunc) {}

FileSink::~FileSink() {
    if (stream_.is_open()) {
        stream_.close();
    }
}

bool FileSink::write(std::span<const std::uint8_t> data) {
    if (!stream_.is_open()) {
        return false;
    }
    stream_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(stream_);
}

bool FileSink::close() {
    if (!stream_.is_open()) {
        return true;
    }
    stream_.flush();
    const bool ok = static_cast<bool>(stream_);
    stream_.close();
    return ok && !stream_.fail();
}

std::optional<std::string> sanitize_relative_path(std::string_view relative) {
    std::string normalized(relative);
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    if (normalized.empty() || normalized.front() == '/') {
        return std::nullopt;
    }

    std::string result;
    std::size_t start = 0;
    while (start <= normalized.size()) {
        auto end = normalized.find('/', start);
        if (end == std::string::npos) {
            end = normalized.size();
        }
        const auto component = normalized.substr(start, end - start);
        if (component == "..") {
            return std::nullopt;
        }
        if (!component.empty() && component != ".") {
            if (component.find('\0') != std::string::npos) {
                return std::nullopt;
            }
            if (!result.empty()) {
                result.push_back('/');
            }
            result.append(component);
        }
        start = end + 1;
    }
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

ReceiveDirectory::ReceiveDirectory(std::filesystem::path root)
    : root_(std::move(root)) {}

std::optional<std::filesystem::path> ReceiveDirectory::resolve(std::string_view relative) const {
    const auto sanitized = sanitize_relative_path(relative);
    if (!sanitized.has_value()) {
        return std::nullopt;
    }
    return root_ / std::filesystem::path(*sanitized);
}

bool ReceiveDirectory::create_folder(std::string_view relative) const {
    const auto path = resolve(relative);
    if (!path.has_value()) {
        util::log_event(StructuredLogger::Level::Warning,
                        "storage.path.rejected",
                        {{"path", std::string(relative)}});
        return false;
    }
    std::error_code ec;
    std::filesystem::create_directories(*path, ec);
    if (ec) {
        util::log_event(StructuredLogger::Level::Error,
                        "storage.folder.create_failed",
                        {{"path", path->string()}, {"error", ec.message()}});
        return false;
    }
    return true;
}

std::unique_ptr<FileSink> ReceiveDirectory::open_sink(std::string_view relative) const {
    const auto path = resolve(relative);
    if (!path.has_value()) {
        util::log_event(StructuredLogger::Level::Warning,
                        "storage.path.rejected",
                        {{"path", std::string(relative)}});
        return nullptr;
    }
    std::error_code ec;
    std::filesystem::create_directories(path->parent_path(), ec);
    if (ec) {
        util::log_event(StructuredLogger::Level::Error,
                        "storage.folder.create_failed",
                        {{"path", path->parent_path().string()}, {"error", ec.message()}});
        return nullptr;
    }
    auto sink = std::make_unique<FileSink>(*path);
    if (!sink->is_open()) {
        util::log_event(StructuredLogger::Level::Error, "storage.file.open_failed", {{"path", path->string()}});
        return nullptr;
    }
    return sink;
}

transfer::SinkFactory ReceiveDirectory::sink_factory() const {
    return [directory = *this](const MacAddress&, const std::string& name) -> std::unique_ptr<transfer::OutputSink> {
        return directory.open_sink(name);
    };
}

std::optional<ByteBuffer> read_file_bytes(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::nullopt;
    }
    ByteBuffer bytes((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    if (stream.bad()) {
        return std::nullopt;
    }
    return bytes;
}

std::vector<FolderEntry> walk_folder(const std::filesystem::path& folder) {
    std::error_code ec;
    if (!std::filesystem::is_directory(folder, ec)) {
        throw std::runtime_error("Not a directory: " + folder.string());
    }
    auto root = folder;
    if (!root.has_filename()) {
        root = root.parent_path();
    }
    const auto absolute = std::filesystem::absolute(root, ec);
    auto name = (ec ? root : absolute).filename().string();
    if (name.empty() || name == "." || name == "..") {
        name = std::filesystem::weakly_canonical(root, ec).filename().string();
    }
    if (name.empty()) {
        throw std::runtime_error("Cannot derive a folder name for " + folder.string());
    }

    std::vector<FolderEntry> entries;
    walk_into(folder, name, entries);
    return entries;
}

}  // namespace linkchat::storage
