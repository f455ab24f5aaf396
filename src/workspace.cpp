#include "ojudge/workspace.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <system_error>
#include "ojudge/common/exceptions.hpp"

namespace ojudge {
using namespace std;
namespace fs = std::filesystem;

static string generate_uuid() {
    // random_generator 不是线程安全的，每个线程使用自己的生成器
    thread_local boost::uuids::random_generator generator;
    return boost::lexical_cast<string>(generator());
}

workspace::workspace(const fs::path &root) : uuid(generate_uuid()) {
    dir = root / ("ojudge-" + uuid);

    error_code ec;
    fs::create_directories(root, ec);
    if (ec)
        throw workspace_error("unable to create workspace root " + root.string() + ": " + ec.message());
    if (!fs::create_directory(dir, ec))
        throw workspace_error("unable to create workspace " + dir.string() + ": " + (ec ? ec.message() : "already exists"));
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);

    LOG(INFO) << "Created workspace " << dir;
}

workspace::~workspace() {
    release();
}

const string &workspace::id() const {
    return uuid;
}

const fs::path &workspace::path() const {
    return dir;
}

fs::path workspace::file(const string &name) const {
    return dir / name;
}

bool workspace::release() {
    if (released) return true;

    // 选手程序可能去掉了自己文件的写权限，删除前先恢复目录的权限
    error_code ec;
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::add, ec);
    for (auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        error_code perm_ec;
        if (it->is_directory(perm_ec))
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, perm_ec);
    }

    ec.clear();
    fs::remove_all(dir, ec);
    if (ec) {
        LOG(WARNING) << "Unable to remove workspace " << dir << ": " << ec.message();
        return false;
    }
    released = true;
    LOG(INFO) << "Removed workspace " << dir;
    return true;
}

}  // namespace ojudge
