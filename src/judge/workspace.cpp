#include "judge/workspace.hpp"
#include <glog/logging.h>
#include <fstream>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

workspace::workspace() : root(RUN_DIR / random_uuid()) {
    error_code ec;
    fs::create_directories(root, ec);
    if (ec)
        throw internal_error("unable to create workspace " + root.string() + ": " + ec.message());
}

workspace::~workspace() {
    if (DEBUG) {
        LOG(INFO) << "Keeping workspace " << root << " in debug mode";
        return;
    }
    error_code ec;
    fs::remove_all(root, ec);
    if (ec)
        LOG(WARNING) << "Unable to remove workspace " << root << ": " << ec.message();
}

const fs::path &workspace::path() const {
    return root;
}

fs::path workspace::subdirectory(const string &name) const {
    fs::path dir = root / assert_safe_path(name);
    error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
        throw internal_error("unable to create directory " + dir.string() + ": " + ec.message());
    return dir;
}

fs::path workspace::write_file(const fs::path &dir, const string &name, const string &content) const {
    fs::path file = dir / assert_safe_path(name);
    ofstream fout(file.string(), ios::binary | ios::trunc);
    if (!fout)
        throw internal_error("unable to create file " + file.string());
    fout << content;
    if (!fout.flush())
        throw internal_error("unable to write file " + file.string());
    return file;
}

}  // namespace grader
