#include "common/io_utils.hpp"
#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include "common/utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_atomically(const fs::path &path, const string &content) {
    fs::path tmp = path;
    tmp += "." + random_uuid() + ".tmp";
    {
        ofstream fout(tmp.string(), ios::binary | ios::trunc);
        if (!fout)
            throw system_error(errno, system_category(), "unable to create file " + tmp.string());
        fout << content;
        fout.flush();
        if (!fout) {
            error_code ec;
            fs::remove(tmp, ec);
            throw system_error(EIO, system_category(), "unable to write file " + tmp.string());
        }
    }
    error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        error_code ignored;
        fs::remove(tmp, ignored);
        throw system_error(ec, "unable to rename " + tmp.string() + " to " + path.string());
    }
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath[0] == '/')
        throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

}  // namespace grader
