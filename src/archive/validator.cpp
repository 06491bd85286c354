#include "archive/validator.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <fcntl.h>
#include <glog/logging.h>
#include <unistd.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <memory>
#include <optional>
#include <regex>
#include "common/defer.hpp"
#include "common/io_utils.hpp"

namespace arena {
using namespace std;
namespace fs = std::filesystem;

const char *to_string(validation_status status) {
    switch (status) {
        case validation_status::ACCEPTED: return "ACCEPTED";
        case validation_status::MALFORMED_ARCHIVE: return "MALFORMED_ARCHIVE";
        case validation_status::TOO_LARGE: return "TOO_LARGE";
        case validation_status::TOO_MANY_ENTRIES: return "TOO_MANY_ENTRIES";
        case validation_status::PATH_TRAVERSAL: return "PATH_TRAVERSAL";
        case validation_status::UNSAFE_LINK: return "UNSAFE_LINK";
        case validation_status::UNSUPPORTED_ENTRY: return "UNSUPPORTED_ENTRY";
        case validation_status::MISSING_ENTRYPOINT: return "MISSING_ENTRYPOINT";
        case validation_status::AMBIGUOUS_ENTRYPOINT: return "AMBIGUOUS_ENTRYPOINT";
        case validation_status::ENTRYPOINT_NOT_AT_ROOT: return "ENTRYPOINT_NOT_AT_ROOT";
    }
    return "UNKNOWN";
}

bool validation_result::accepted() const {
    return status == validation_status::ACCEPTED;
}

static validation_result reject(validation_status status, const string &reason) {
    validation_result result;
    result.status = status;
    result.reason = reason;
    return result;
}

using archive_reader = unique_ptr<struct archive, decltype(&archive_read_free)>;

static archive_reader open_zip(const string &bytes) {
    archive_reader reader(archive_read_new(), archive_read_free);
    archive_read_support_format_zip(reader.get());
    if (archive_read_open_memory(reader.get(), bytes.data(), bytes.size()) != ARCHIVE_OK) {
        DLOG(INFO) << "Archive: unable to open zip, " << archive_error_string(reader.get());
        return archive_reader(nullptr, archive_read_free);
    }
    return reader;
}

static string error_of(struct archive *reader) {
    const char *message = archive_error_string(reader);
    return message ? message : "unknown error";
}

/**
 * @brief 只由 "." 和 "/" 组成的条目表示解压根目录本身，直接跳过
 */
static bool is_root_entry(const string &path) {
    return !path.empty() && path.find_first_not_of("./") == string::npos && path.find("..") == string::npos;
}

/**
 * @brief 检查单个条目是否安全
 * @param normalized 成功时保存规范化后的路径
 * @return 条目不安全时返回拒绝的结果
 */
static optional<validation_result> check_entry(struct archive_entry *entry, string &normalized) {
    const char *pathname = archive_entry_pathname(entry);
    if (!pathname)
        return reject(validation_status::MALFORMED_ARCHIVE, "entry without a name");

    auto path = normalize_entry_path(pathname);
    if (!path)
        return reject(validation_status::PATH_TRAVERSAL, fmt::format("entry '{}' escapes the archive root", pathname));
    normalized = *path;

    if (const char *hardlink = archive_entry_hardlink(entry)) {
        if (!normalize_entry_path(hardlink))
            return reject(validation_status::UNSAFE_LINK, fmt::format("hard link '{}' points outside the archive", pathname));
        return nullopt;
    }

    switch (archive_entry_filetype(entry)) {
        case AE_IFREG:
        case AE_IFDIR:
            return nullopt;
        case AE_IFLNK: {
            const char *target = archive_entry_symlink(entry);
            if (!target || link_escapes_root(normalized, target))
                return reject(validation_status::UNSAFE_LINK,
                              fmt::format("symbolic link '{}' points outside the archive", pathname));
            return nullopt;
        }
        default:
            return reject(validation_status::UNSUPPORTED_ENTRY,
                          fmt::format("entry '{}' is not a regular file, directory or link", pathname));
    }
}

archive_validator::archive_validator(const archive_config &config)
    : config(config) {}

bool archive_validator::is_entrypoint_name(const string &filename) const {
    static const regex stem("^(agent|[A-Za-z0-9][A-Za-z0-9_-]*_agent)$");
    for (auto &ext : config.entrypoint_extensions) {
        if (filename.size() <= ext.size()) continue;
        if (filename.compare(filename.size() - ext.size(), ext.size(), ext) != 0) continue;
        if (regex_match(filename.substr(0, filename.size() - ext.size()), stem)) return true;
    }
    return false;
}

validation_result archive_validator::validate(const string &bytes) const {
    if (bytes.size() > config.max_archive_bytes)
        return reject(validation_status::TOO_LARGE,
                      fmt::format("archive is {} bytes, the limit is {}", bytes.size(), config.max_archive_bytes));

    archive_reader reader = open_zip(bytes);
    if (!reader)
        return reject(validation_status::MALFORMED_ARCHIVE, "not a zip archive");

    validation_result result;
    optional<validation_result> unsafe;  // 第一个不安全的条目，要等大小检查全部完成后才报告
    vector<string> root_entrypoints, nested_entrypoints;
    size_t count = 0;

    struct archive_entry *entry;
    while (true) {
        int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN)
            return reject(validation_status::MALFORMED_ARCHIVE, error_of(reader.get()));

        if (++count > config.max_entries)
            return reject(validation_status::TOO_MANY_ENTRIES,
                          fmt::format("archive has more than {} entries", config.max_entries));

        if (archive_entry_size_is_set(entry) && archive_entry_size(entry) > 0)
            result.extracted_bytes += archive_entry_size(entry);
        if (result.extracted_bytes > config.max_extracted_bytes)
            return reject(validation_status::TOO_LARGE,
                          fmt::format("archive expands to more than {} bytes", config.max_extracted_bytes));

        const char *pathname = archive_entry_pathname(entry);
        if (pathname && is_root_entry(pathname)) {
            archive_read_data_skip(reader.get());
            continue;
        }

        string normalized;
        if (!unsafe) unsafe = check_entry(entry, normalized);
        if (!unsafe) {
            bool directory = archive_entry_filetype(entry) == AE_IFDIR;
            result.entries.push_back(directory ? normalized + "/" : normalized);

            if (archive_entry_filetype(entry) == AE_IFREG) {
                bool at_root = normalized.find('/') == string::npos;
                string filename = fs::path(normalized).filename().string();
                if (is_entrypoint_name(filename))
                    (at_root ? root_entrypoints : nested_entrypoints).push_back(normalized);
                if (at_root && normalized == config.manifest_name)
                    result.has_manifest = true;
            }
        }

        if (archive_read_data_skip(reader.get()) != ARCHIVE_OK)
            return reject(validation_status::MALFORMED_ARCHIVE, error_of(reader.get()));
    }

    if (unsafe) return *unsafe;

    if (root_entrypoints.size() > 1) {
        sort(root_entrypoints.begin(), root_entrypoints.end());
        return reject(validation_status::AMBIGUOUS_ENTRYPOINT,
                      fmt::format("found {} entrypoints at the archive root: {}",
                                  root_entrypoints.size(), fmt::join(root_entrypoints, ", ")));
    }
    if (root_entrypoints.empty()) {
        if (!nested_entrypoints.empty())
            return reject(validation_status::ENTRYPOINT_NOT_AT_ROOT,
                          fmt::format("entrypoint '{}' must be placed at the archive root", nested_entrypoints.front()));
        return reject(validation_status::MISSING_ENTRYPOINT,
                      "no entrypoint found, expected agent.py or <name>_agent.py at the archive root");
    }

    result.entrypoint = root_entrypoints.front();
    return result;
}

/**
 * @brief 确保 dir 以及它的所有祖先（直到 root）都是真实的文件夹而不是符号链接
 */
static bool create_parents(const fs::path &root, const string &relative) {
    fs::path current = root;
    fs::path parent = fs::path(relative).parent_path();
    for (auto &segment : parent) {
        current /= segment;
        auto status = fs::symlink_status(current);
        if (fs::is_symlink(status)) return false;
        if (!fs::exists(status))
            fs::create_directory(current);
        else if (!fs::is_directory(status))
            return false;
    }
    return true;
}

validation_result archive_validator::extract(const string &bytes, const fs::path &root) const {
    validation_result result = validate(bytes);
    if (!result.accepted()) return result;

    archive_reader reader = open_zip(bytes);
    if (!reader)
        return reject(validation_status::MALFORMED_ARCHIVE, "not a zip archive");

    uintmax_t written = 0;
    struct archive_entry *entry;
    while (true) {
        int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN)
            return reject(validation_status::MALFORMED_ARCHIVE, error_of(reader.get()));

        const char *pathname = archive_entry_pathname(entry);
        if (pathname && is_root_entry(pathname)) continue;

        string normalized;
        if (auto unsafe = check_entry(entry, normalized)) return *unsafe;
        if (!create_parents(root, normalized))
            return reject(validation_status::UNSAFE_LINK, fmt::format("entry '{}' is written through a link", normalized));

        fs::path target = root / normalized;
        if (fs::exists(fs::symlink_status(target)) && !fs::is_directory(fs::symlink_status(target)))
            return reject(validation_status::PATH_TRAVERSAL, fmt::format("duplicated entry '{}'", normalized));

        if (const char *hardlink = archive_entry_hardlink(entry)) {
            error_code ec;
            fs::create_hard_link(root / *normalize_entry_path(hardlink), target, ec);
            if (ec) return reject(validation_status::UNSAFE_LINK, fmt::format("unable to link '{}': {}", normalized, ec.message()));
            continue;
        }

        switch (archive_entry_filetype(entry)) {
            case AE_IFDIR:
                if (fs::is_symlink(fs::symlink_status(target)))
                    return reject(validation_status::UNSAFE_LINK, fmt::format("entry '{}' is written through a link", normalized));
                fs::create_directories(target);
                break;
            case AE_IFLNK:
                fs::create_symlink(archive_entry_symlink(entry), target);
                break;
            case AE_IFREG: {
                mode_t mode = (archive_entry_perm(entry) & 0111) ? 0755 : 0644;
                int fd = open(target.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, mode);
                if (fd < 0)
                    throw system_error(errno, system_category(), "unable to create " + target.string());
                defer { close(fd); };

                const void *buffer;
                size_t size;
                la_int64_t offset;
                while ((r = archive_read_data_block(reader.get(), &buffer, &size, &offset)) == ARCHIVE_OK) {
                    written += size;
                    if (written > config.max_extracted_bytes)
                        return reject(validation_status::TOO_LARGE,
                                      fmt::format("archive expands to more than {} bytes", config.max_extracted_bytes));
                    if (pwrite(fd, buffer, size, offset) != (ssize_t)size)
                        throw system_error(errno, system_category(), "unable to write " + target.string());
                }
                if (r != ARCHIVE_EOF)
                    return reject(validation_status::MALFORMED_ARCHIVE, error_of(reader.get()));
                break;
            }
            default:
                return reject(validation_status::UNSUPPORTED_ENTRY, fmt::format("unsupported entry '{}'", normalized));
        }
    }

    result.extracted_bytes = written;
    return result;
}

}  // namespace arena
