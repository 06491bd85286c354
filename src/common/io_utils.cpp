#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <fstream>
#include <system_error>
#include <vector>
#include "common/utils.hpp"

namespace arena {
using namespace std;
namespace fs = std::filesystem;
namespace ip = boost::interprocess;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const fs::path &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout) throw system_error(errno, system_category(), "unable to open " + path.string());
    fout << content;
    fout.flush();
    if (!fout) throw system_error(errno, system_category(), "unable to write " + path.string());
}

/**
 * @brief 把 base 目录下的相对路径 rel 逐段压入 segments
 * @return 是否跳出了根目录
 */
static bool push_segments(vector<string> &segments, const string &rel) {
    vector<string> parts;
    boost::split(parts, rel, boost::is_any_of("/"));
    for (auto &part : parts) {
        if (part.empty() || part == ".") continue;
        if (part == "..") {
            if (segments.empty()) return true;
            segments.pop_back();
        } else {
            segments.push_back(part);
        }
    }
    return false;
}

optional<string> normalize_entry_path(const string &entry) {
    if (entry.empty() || entry.front() == '/') return nullopt;
    if (entry.find('\\') != string::npos) return nullopt;
    if (entry.find('\0') != string::npos) return nullopt;
    if (entry.size() >= 2 && entry[1] == ':') return nullopt;  // C:foo

    vector<string> segments;
    if (push_segments(segments, entry)) return nullopt;
    if (segments.empty()) return nullopt;
    return boost::algorithm::join(segments, "/");
}

bool link_escapes_root(const string &entry, const string &target) {
    if (target.empty() || target.front() == '/' || target.find('\\') != string::npos)
        return true;

    auto normalized = normalize_entry_path(entry);
    if (!normalized) return true;

    // 符号链接的目标相对于链接所在的文件夹计算
    vector<string> segments;
    push_segments(segments, *normalized);
    segments.pop_back();
    return push_segments(segments, target);
}

uintmax_t directory_size(const fs::path &dir) {
    uintmax_t total = 0;
    for (auto &p : fs::recursive_directory_iterator(dir))
        if (fs::is_regular_file(fs::symlink_status(p.path())))
            total += fs::file_size(p.path());
    return total;
}

scoped_temp_directory::scoped_temp_directory(const fs::path &parent, const string &prefix) {
    fs::create_directories(parent);
    dir = parent / (prefix + random_uuid());
    fs::create_directory(dir);
}

scoped_temp_directory::~scoped_temp_directory() {
    if (keep_dir) return;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) LOG(WARNING) << "Unable to remove scratch directory " << dir << ": " << ec.message();
}

const fs::path &scoped_temp_directory::path() const {
    return dir;
}

void scoped_temp_directory::keep() {
    keep_dir = true;
}

ip::file_lock lock_file(const fs::path &dir, const string &name) {
    fs::create_directories(dir);
    fs::path lock_path = dir / name;
    if (fs::is_directory(lock_path))
        fs::remove_all(lock_path);
    ofstream create_lock_file(lock_path, ios::app);
    return ip::file_lock(lock_path.c_str());
}

}  // namespace arena
