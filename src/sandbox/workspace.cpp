#include "sandbox/workspace.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <cerrno>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

workspace_handle::workspace_handle() {}

workspace_handle::workspace_handle(const fs::path &dir) : dir(dir) {}

workspace_handle::workspace_handle(workspace_handle &&other) : dir(move(other.dir)) {
    other.dir.clear();
}

workspace_handle &workspace_handle::operator=(workspace_handle &&other) {
    if (this != &other) {
        release();
        dir = move(other.dir);
        other.dir.clear();
    }
    return *this;
}

workspace_handle::~workspace_handle() {
    release();
}

const fs::path &workspace_handle::path() const {
    return dir;
}

void workspace_handle::release() {
    if (dir.empty()) return;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec)
        LOG(ERROR) << "Unable to remove workspace " << dir << ": " << ec.message();
    dir.clear();
}

workspace_builder::workspace_builder(const fs::path &root, int owner_uid, int owner_gid)
    : root(root), owner_uid(owner_uid), owner_gid(owner_gid) {}

/**
 * @brief 把文件交给沙箱用户
 * @return 是否成功，非 root 运行时没有权限修改所有者
 */
static bool hand_over(const fs::path &path, int uid, int gid) {
    if (chown(path.c_str(), uid, gid) == 0) return true;
    if (errno == EPERM) return false;
    throw system_error(errno, system_category(), "unable to change owner of " + path.string());
}

workspace_handle workspace_builder::prepare(const execution &e, const execution_environment &env, const language_strategy &strategy) const {
    workspace_handle handle;
    try {
        fs::create_directories(root);
        fs::path dir = root / generate_uuid();
        fs::create_directory(dir);
        handle = workspace_handle(dir);

        vector<pair<fs::path, bool>> files;  // 文件路径，是否可执行
        auto write = [&](const string &name, const string &content, bool executable) {
            fs::path file = dir / assert_safe_path(name);
            if (file.has_parent_path() && file.parent_path() != dir)
                fs::create_directories(file.parent_path());
            write_file_content(file, content);
            files.emplace_back(file, executable);
        };

        for (auto &[name, content] : env.scaffold_files)
            write(name, content, false);
        write(env.source_file, e.source_code, false);
        write(".stdin", e.stdin_input, false);
        write("run.sh", strategy.entry_script(env), true);

        bool owned = hand_over(dir, owner_uid, owner_gid);
        for (auto &[file, executable] : files)
            owned = owned && hand_over(file, owner_uid, owner_gid);

        if (owned) {
            // 只有沙箱用户能访问工作区
            fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace);
            for (auto &[file, executable] : files)
                fs::permissions(file, executable ? fs::perms::owner_all : fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
        } else {
            // 无法修改所有者时，容器内的沙箱用户只能以 others 的身份访问工作区
            LOG_FIRST_N(WARNING, 1) << "Unable to hand workspace " << dir << " over to uid " << owner_uid << ", falling back to world-writable workspace";
            fs::permissions(dir, fs::perms::all, fs::perm_options::replace);
            auto readable = fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read;
            auto executable_perms = readable | fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
            for (auto &[file, executable] : files)
                fs::permissions(file, executable ? executable_perms : readable, fs::perm_options::replace);
        }
        return handle;
    } catch (fs::filesystem_error &ex) {
        throw workspace_error("Unable to prepare workspace for execution " + e.id + ": " + ex.what());
    } catch (system_error &ex) {
        throw workspace_error("Unable to prepare workspace for execution " + e.id + ": " + ex.what());
    } catch (invalid_argument &ex) {
        throw workspace_error("Unable to prepare workspace for execution " + e.id + ": " + ex.what());
    }
}

}  // namespace sandbox
