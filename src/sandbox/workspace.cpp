#include "sandbox/workspace.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace runbox {
using namespace std;
namespace fs = std::filesystem;

workspace::workspace(const fs::path &workspace_root, const language_profile &profile, const string &code) {
    error_code ec;
    // 工作目录需要挂载进容器，容器运行时只接受绝对路径
    fs::path root = fs::absolute(workspace_root, ec);
    if (ec) throw workspace_error(fmt::format("Unable to resolve workspace root {}: {}", workspace_root, ec.message()));
    fs::create_directories(root, ec);
    if (ec) throw workspace_error(fmt::format("Unable to create workspace root {}: {}", root, ec.message()));

    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    fs::path newdir = root / ("run-" + uuid);
    if (!fs::create_directory(newdir, ec) || ec)
        throw workspace_error(fmt::format("Unable to create workspace {}: {}", newdir, ec ? ec.message() : "already exists"));
    dir = newdir;

    try {
        // 容器内的用户不一定是目录的所有者，需要确保其他用户也可以读取
        fs::permissions(dir, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec);
        source = dir / profile.filename;
        write_file_content(source, code);
    } catch (exception &ex) {
        destroy();
        throw workspace_error(fmt::format("Unable to write source code: {}", ex.what()));
    }

    DLOG(INFO) << "Created workspace " << dir;
}

workspace::workspace(workspace &&other) noexcept
    : dir(move(other.dir)), source(move(other.source)) {
    other.dir.clear();
    other.source.clear();
}

workspace::~workspace() {
    destroy();
}

const fs::path &workspace::directory() const {
    return dir;
}

const fs::path &workspace::source_file() const {
    return source;
}

bool workspace::destroy() noexcept {
    if (dir.empty()) return true;

    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        LOG(WARNING) << "Unable to remove workspace " << dir << ": " << ec.message();
        return false;
    }
    DLOG(INFO) << "Removed workspace " << dir;
    dir.clear();
    source.clear();
    return true;
}

}  // namespace runbox
