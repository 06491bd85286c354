#include "build/context.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <openssl/evp.h>
#include <algorithm>
#include <fstream>
#include <memory>
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include "common/exceptions.hpp"

namespace arena {
using namespace std;
namespace fs = std::filesystem;

build_context_files collect_context(const fs::path &root, const ignore_rules &rules) {
    build_context_files context;
    for (auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator(); ++it) {
        string rel = fs::relative(it->path(), root).generic_string();
        auto status = it->symlink_status();
        if (rules.excluded(rel)) continue;

        context_entry entry;
        entry.path = rel;
        entry.type = status.type();
        if (fs::is_symlink(status)) {
            entry.link_target = fs::read_symlink(it->path()).string();
        } else if (fs::is_regular_file(status)) {
            entry.size = fs::file_size(it->path());
            entry.executable = (status.permissions() & fs::perms::owner_exec) != fs::perms::none;
            context.bytes += entry.size;
        } else if (!fs::is_directory(status)) {
            continue;
        }
        context.entries.push_back(move(entry));
    }
    sort(context.entries.begin(), context.entries.end(),
         [](const context_entry &a, const context_entry &b) { return a.path < b.path; });
    return context;
}

struct evp_md_ctx_deleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

string content_sha256(const fs::path &root, const build_context_files &context) {
    unique_ptr<EVP_MD_CTX, evp_md_ctx_deleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        BOOST_THROW_EXCEPTION(internal_error("EVP_DigestInit_ex failed"));

    auto update = [&](const char *data, size_t size) {
        if (EVP_DigestUpdate(ctx.get(), data, size) != 1)
            BOOST_THROW_EXCEPTION(internal_error("EVP_DigestUpdate failed"));
    };

    vector<char> buffer(1 << 16);
    for (auto &entry : context.entries) {
        if (entry.type == fs::file_type::directory) continue;
        update(entry.path.c_str(), entry.path.size() + 1);  // 包括结尾的 \0，作为分隔
        if (entry.type == fs::file_type::symlink) {
            update(entry.link_target.c_str(), entry.link_target.size() + 1);
            continue;
        }
        ifstream fin(root / entry.path, ios::binary);
        if (!fin) throw system_error(errno, system_category(), "unable to read " + entry.path);
        while (fin.read(buffer.data(), buffer.size()) || fin.gcount() > 0)
            update(buffer.data(), (size_t)fin.gcount());
        update("", 1);
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1)
        BOOST_THROW_EXCEPTION(internal_error("EVP_DigestFinal_ex failed"));

    static const char hex[] = "0123456789abcdef";
    string result;
    for (unsigned int i = 0; i < length; ++i) {
        result += hex[digest[i] >> 4];
        result += hex[digest[i] & 15];
    }
    return result;
}

static la_ssize_t append_to_string(struct archive *, void *client_data, const void *buffer, size_t length) {
    static_cast<string *>(client_data)->append(static_cast<const char *>(buffer), length);
    return (la_ssize_t)length;
}

using archive_writer = unique_ptr<struct archive, decltype(&archive_write_free)>;
using archive_entry_ptr = unique_ptr<struct archive_entry, decltype(&archive_entry_free)>;

string pack_context(const fs::path &root, const build_context_files &context) {
    string tar;
    archive_writer writer(archive_write_new(), archive_write_free);
    archive_write_set_format_pax_restricted(writer.get());
    archive_write_set_bytes_in_last_block(writer.get(), 1);
    if (archive_write_open(writer.get(), &tar, nullptr, append_to_string, nullptr) != ARCHIVE_OK)
        BOOST_THROW_EXCEPTION(internal_error(string("unable to create tar: ") + archive_error_string(writer.get())));

    vector<char> buffer(1 << 16);
    for (auto &item : context.entries) {
        archive_entry_ptr entry(archive_entry_new(), archive_entry_free);
        archive_entry_set_pathname(entry.get(), item.path.c_str());
        archive_entry_set_mtime(entry.get(), 0, 0);
        archive_entry_set_uid(entry.get(), 0);
        archive_entry_set_gid(entry.get(), 0);
        switch (item.type) {
            case fs::file_type::directory:
                archive_entry_set_filetype(entry.get(), AE_IFDIR);
                archive_entry_set_perm(entry.get(), 0755);
                break;
            case fs::file_type::symlink:
                archive_entry_set_filetype(entry.get(), AE_IFLNK);
                archive_entry_set_perm(entry.get(), 0777);
                archive_entry_set_symlink(entry.get(), item.link_target.c_str());
                break;
            default:
                archive_entry_set_filetype(entry.get(), AE_IFREG);
                archive_entry_set_perm(entry.get(), item.executable ? 0755 : 0644);
                archive_entry_set_size(entry.get(), (la_int64_t)item.size);
                break;
        }

        if (archive_write_header(writer.get(), entry.get()) != ARCHIVE_OK)
            BOOST_THROW_EXCEPTION(internal_error(string("unable to write tar header: ") + archive_error_string(writer.get())));

        if (item.type == fs::file_type::regular) {
            ifstream fin(root / item.path, ios::binary);
            if (!fin) throw system_error(errno, system_category(), "unable to read " + item.path);
            while (fin.read(buffer.data(), buffer.size()) || fin.gcount() > 0)
                if (archive_write_data(writer.get(), buffer.data(), (size_t)fin.gcount()) < 0)
                    BOOST_THROW_EXCEPTION(internal_error(string("unable to write tar data: ") + archive_error_string(writer.get())));
        }
    }

    if (archive_write_close(writer.get()) != ARCHIVE_OK)
        BOOST_THROW_EXCEPTION(internal_error(string("unable to finish tar: ") + archive_error_string(writer.get())));
    return tar;
}

}  // namespace arena
