#include "syncmd/sync/indexer.hpp"
#include "syncmd/core/digest.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace syncmd::sync {
namespace {

const char* const kEligibleExtensions[] = {
    // markdown and plain text
    "md", "markdown", "mdown", "mkdn", "mkd", "mdwn", "mdtxt", "mdtext", "text",
    // images
    "jpg", "jpeg", "png", "gif", "svg", "webp", "bmp", "ico", "tiff", "tif",
    // code
    "rs", "py", "js", "ts", "jsx", "tsx", "html", "css", "scss", "json", "yaml", "yml", "toml", "xml",
    // configuration
    "ini", "cfg", "conf", "config", "env",
    // documents
    "txt", "rtf", "doc", "docx", "pdf",
    // data
    "csv", "tsv", "jsonl"};

const char* const kWellKnownFiles[] = {"README", "LICENSE", "Pipfile"};

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool has_parent_reference(const fs::path& path) {
    for (const auto& part : path) {
        if (part == "..") {
            return true;
        }
    }
    return false;
}

// Structural UTF-8 check: lead/continuation byte shapes, no overlongs or surrogates.
bool is_valid_utf8(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        std::uint32_t code = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code = lead & 0x07;
        } else {
            return false;
        }
        if (i + extra >= text.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code = (code << 6) | (next & 0x3F);
        }
        static const std::uint32_t kMinimum[] = {0, 0x80, 0x800, 0x10000};
        if (code < kMinimum[extra] || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace

std::time_t to_time_t(fs::file_time_type time) {
    using namespace std::chrono;
    // Rounded so that a time written through from_time_t reads back unchanged.
    const auto system_time = time_point_cast<system_clock::duration>(
        time - fs::file_time_type::clock::now() + system_clock::now());
    return system_clock::to_time_t(round<seconds>(system_time));
}

fs::file_time_type from_time_t(std::time_t time) {
    using namespace std::chrono;
    const auto offset = system_clock::from_time_t(time) - system_clock::now();
    return fs::file_time_type::clock::now() + duration_cast<fs::file_time_type::duration>(offset);
}

SnapshotIndexer::SnapshotIndexer(std::string device_id, fs::path root)
    : device_id_(std::move(device_id)), root_(std::move(root)) {}

bool SnapshotIndexer::is_hidden(const fs::path& relative_path) {
    for (const auto& part : relative_path) {
        const auto name = part.string();
        if (!name.empty() && name != "." && name != ".." && name.front() == '.') {
            return true;
        }
    }
    return false;
}

bool SnapshotIndexer::is_eligible(const fs::path& relative_path) {
    if (relative_path.empty() || is_hidden(relative_path)) {
        return false;
    }

    const auto extension = relative_path.extension().string();
    if (extension.empty()) {
        const auto name = relative_path.filename().string();
        return std::find_if(std::begin(kWellKnownFiles), std::end(kWellKnownFiles),
                            [&](const char* known) { return name == known; }) != std::end(kWellKnownFiles);
    }

    const auto normalized = lowercase(extension.substr(1));
    return std::find_if(std::begin(kEligibleExtensions), std::end(kEligibleExtensions),
                        [&](const char* allowed) { return normalized == allowed; }) != std::end(kEligibleExtensions);
}

Result<fs::path> SnapshotIndexer::resolve(const std::string& relative_path) const {
    const fs::path relative(relative_path);
    if (relative_path.empty() || relative.is_absolute() || relative.has_root_name() ||
        has_parent_reference(relative)) {
        return Err<fs::path>(ErrorKind::PathResolution,
                             "Path is not relative to the sync root: " + relative_path);
    }
    return Ok(root_ / relative);
}

Result<Snapshot> SnapshotIndexer::index() const {
    std::error_code ec;
    if (root_.empty() || !fs::is_directory(root_, ec)) {
        return Err<Snapshot>(ErrorKind::Io, "Sync root is not a directory: " + root_.string());
    }

    Snapshot snapshot;
    snapshot.device_id = device_id_;
    snapshot.root = root_;

    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Err<Snapshot>(ErrorKind::Io, "Failed to walk " + root_.string() + ": " + ec.message());
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
        const auto& entry = *it;
        const auto relative = entry.path().lexically_relative(root_);

        if (is_hidden(relative)) {
            if (entry.is_directory(ec)) {
                it.disable_recursion_pending();
            }
        } else if (!is_valid_utf8(relative.generic_string())) {
            // Names travel inside JSON envelopes, which only carry UTF-8.
            spdlog::warn("Skipping {}: name is not valid UTF-8", relative.generic_string());
            if (entry.is_directory(ec)) {
                it.disable_recursion_pending();
            }
        } else if (entry.is_regular_file(ec) && is_eligible(relative)) {
            auto record = build_record(relative.generic_string());
            if (record.is_ok()) {
                snapshot.files.emplace(record.value().path, std::move(record.value()));
            } else {
                spdlog::warn("Skipping {}: {}", relative.generic_string(), record.error().message);
            }
        }

        it.increment(ec);
        if (ec) {
            return Err<Snapshot>(ErrorKind::Io, "Directory walk failed under " + root_.string() + ": " +
                                                    ec.message());
        }
    }

    spdlog::debug("Indexed {} files under {}", snapshot.size(), root_.string());
    return Ok(std::move(snapshot));
}

Result<FileRecord> SnapshotIndexer::build_record(const std::string& relative_path) const {
    auto absolute = resolve(relative_path);
    if (absolute.is_error()) {
        return Err<FileRecord>(absolute.error());
    }

    std::error_code ec;
    const auto size = fs::file_size(absolute.value(), ec);
    if (ec) {
        return Err<FileRecord>(ErrorKind::Io, "Failed to stat " + relative_path + ": " + ec.message());
    }
    const auto write_time = fs::last_write_time(absolute.value(), ec);
    if (ec) {
        return Err<FileRecord>(ErrorKind::Io, "Failed to stat " + relative_path + ": " + ec.message());
    }

    auto digest = sha256_file(absolute.value());
    if (digest.is_error()) {
        return Err<FileRecord>(digest.error());
    }

    FileRecord record;
    record.path = fs::path(relative_path).generic_string();
    record.digest = std::move(digest.value());
    record.size = size;
    record.modified_time = to_time_t(write_time);
    record.created_time = record.modified_time;
    record.version = static_cast<std::uint64_t>(std::max<std::time_t>(record.modified_time, 0));
    record.device_id = device_id_;
    return Ok(std::move(record));
}

Result<std::vector<std::uint8_t>> SnapshotIndexer::read_content(const std::string& relative_path) const {
    auto absolute = resolve(relative_path);
    if (absolute.is_error()) {
        return Err<std::vector<std::uint8_t>>(absolute.error());
    }
    std::ifstream input(absolute.value(), std::ios::binary);
    if (!input) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::Io, "Failed to open " + relative_path);
    }
    std::vector<std::uint8_t> content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    return Ok(std::move(content));
}

Result<void> SnapshotIndexer::write_content(const std::string& relative_path,
                                            const std::vector<std::uint8_t>& content) const {
    auto absolute = resolve(relative_path);
    if (absolute.is_error()) {
        return Err<void>(absolute.error());
    }
    std::error_code ec;
    fs::create_directories(absolute.value().parent_path(), ec);
    if (ec) {
        return Err<void>(ErrorKind::Io, "Failed to create directory for " + relative_path + ": " + ec.message());
    }
    std::ofstream output(absolute.value(), std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<void>(ErrorKind::Io, "Failed to open " + relative_path + " for writing");
    }
    output.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    if (!output) {
        return Err<void>(ErrorKind::Io, "Failed to write " + relative_path);
    }
    return Ok();
}

Result<void> SnapshotIndexer::delete_file(const std::string& relative_path) const {
    auto absolute = resolve(relative_path);
    if (absolute.is_error()) {
        return Err<void>(absolute.error());
    }
    std::error_code ec;
    fs::remove(absolute.value(), ec);
    if (ec) {
        return Err<void>(ErrorKind::Io, "Failed to delete " + relative_path + ": " + ec.message());
    }
    return Ok();
}

std::vector<SyncOperation> diff(const Snapshot& previous, const Snapshot& next) {
    std::vector<SyncOperation> operations;

    for (const auto& [path, record] : next.files) {
        const auto it = previous.files.find(path);
        if (it == previous.files.end()) {
            operations.emplace_back(AddOp{record});
        } else if (it->second.digest != record.digest) {
            operations.emplace_back(UpdateOp{record});
        }
    }

    for (const auto& [path, _] : previous.files) {
        if (!next.contains(path)) {
            operations.emplace_back(DeleteOp{path});
        }
    }

    return operations;
}

} // namespace syncmd::sync
