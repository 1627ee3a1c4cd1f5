/*
Git worktree manager tests against a scratch repository.
Skipped when git is not installed.
*/
#include "workspace/worktree_manager.hpp"
#include "runtime/subprocess.hpp"
#include "test_support.hpp"

#include <atomic>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

using namespace foreman;
using namespace foreman::workspace;
namespace fs = std::filesystem;

static bool git_in(const fs::path& dir, const std::vector<std::string>& args)
{
    std::vector<std::string> argv = {"git"};
    argv.insert(argv.end(), args.begin(), args.end());
    auto result = runtime::run_command(argv, dir);
    if (!result.ok()) {
        fprintf(stderr, "git failed in %s: %s\n", dir.c_str(), result.combined_output().c_str());
    }
    return result.ok();
}

static void write_file(const fs::path& path, const std::string& text)
{
    std::ofstream file(path, std::ios::trunc);
    file << text;
}

static std::string read_file(const fs::path& path)
{
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

static bool commit_file(const fs::path& dir, const std::string& name, const std::string& text)
{
    write_file(dir / name, text);
    return git_in(dir, {"add", name}) && git_in(dir, {"commit", "-q", "-m", "update " + name});
}

// Repository with one commit on main
static bool init_repo(const fs::path& dir)
{
    fs::create_directories(dir);
    return git_in(dir, {"init", "-q"}) &&
           git_in(dir, {"symbolic-ref", "HEAD", "refs/heads/main"}) &&
           git_in(dir, {"config", "user.email", "foreman@example.com"}) &&
           git_in(dir, {"config", "user.name", "Foreman Test"}) &&
           git_in(dir, {"config", "commit.gpgsign", "false"}) &&
           commit_file(dir, "shared.txt", "base\n");
}

static int test_create_merge_remove(void)
{
    test::TempDir tmp;
    fs::path repo = tmp.path() / "project";
    EXPECT(init_repo(repo), "scratch repository");

    GitWorktreeManager manager(repo);
    EXPECT(manager.worktrees_base_path().filename() == "project-worktrees", "sibling worktrees folder");

    manager.pull_latest();
    auto info = manager.create({"homer", "t1"});
    EXPECT(info.branch == "foreman/homer/t1", "branch named after worker and task");
    EXPECT(info.path == manager.worktree_path("homer", "t1"), "path under the worktrees folder");
    EXPECT(manager.exists("homer", "t1"), "worktree on disk");

    auto listed = manager.list();
    EXPECT(listed.size() == 1 && listed[0].task_id == "t1" && listed[0].worker_name == "homer",
           "worktree listed");
    EXPECT(manager.list(std::string("bart")).empty(), "worker filter applied");

    EXPECT(commit_file(info.path, "feature.txt", "done\n"), "agent commit");
    auto merged = manager.merge("homer", "t1");
    EXPECT(merged.success && !merged.had_conflicts, "clean merge");
    EXPECT(read_file(repo / "feature.txt") == "done\n", "work landed on the trunk");

    manager.remove("homer", "t1");
    EXPECT(!manager.exists("homer", "t1"), "worktree removed");
    EXPECT(manager.list().empty(), "nothing listed");

    manager.remove("homer", "t1");
    manager.prune();
    return 0;
}

static int test_conflict_and_abort(void)
{
    test::TempDir tmp;
    fs::path repo = tmp.path() / "project";
    EXPECT(init_repo(repo), "scratch repository");
    GitWorktreeManager manager(repo);

    auto first = manager.create({"homer", "t1"});
    auto second = manager.create({"bart", "t2"});
    EXPECT(commit_file(first.path, "shared.txt", "homer\n"), "first edit");
    EXPECT(commit_file(second.path, "shared.txt", "bart\n"), "second edit");

    EXPECT(manager.merge("homer", "t1").success, "first merge clean");

    auto result = manager.merge("bart", "t2");
    EXPECT(!result.success && result.had_conflicts, "second merge conflicts");
    EXPECT(manager.is_merge_in_progress(), "merge left in progress");
    EXPECT(manager.conflicting_files() == std::vector<std::string>{"shared.txt"}, "conflicting file listed");

    manager.abort_merge();
    EXPECT(!manager.is_merge_in_progress(), "merge aborted");
    EXPECT(read_file(repo / "shared.txt") == "homer\n", "trunk restored");
    return 0;
}

static int test_complete_merge(void)
{
    test::TempDir tmp;
    fs::path repo = tmp.path() / "project";
    EXPECT(init_repo(repo), "scratch repository");
    GitWorktreeManager manager(repo);

    auto first = manager.create({"homer", "t1"});
    auto second = manager.create({"bart", "t2"});
    EXPECT(commit_file(first.path, "shared.txt", "homer\n"), "first edit");
    EXPECT(commit_file(second.path, "shared.txt", "bart\n"), "second edit");
    EXPECT(manager.merge("homer", "t1").success, "first merge clean");
    EXPECT(manager.merge("bart", "t2").had_conflicts, "second merge conflicts");

    auto blocked = manager.complete_merge("bart", "t2");
    EXPECT(!blocked.success && blocked.had_conflicts, "unresolved conflicts block completion");

    write_file(repo / "shared.txt", "homer\nbart\n");
    EXPECT(git_in(repo, {"add", "shared.txt"}), "conflict resolved");
    auto completed = manager.complete_merge("bart", "t2");
    EXPECT(completed.success, "merge completed");
    EXPECT(!manager.is_merge_in_progress(), "no merge in progress");
    return 0;
}

static int test_create_twice_fails(void)
{
    test::TempDir tmp;
    fs::path repo = tmp.path() / "project";
    EXPECT(init_repo(repo), "scratch repository");
    GitWorktreeManager manager(repo);

    manager.create({"homer", "t1"});
    bool threw = false;
    try {
        manager.create({"homer", "t1"});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    EXPECT(threw, "existing branch rejected");
    return 0;
}

static int test_rejects_unsafe_names(void)
{
    test::TempDir tmp;
    fs::path repo = tmp.path() / "project";
    EXPECT(init_repo(repo), "scratch repository");
    GitWorktreeManager manager(repo);

    const std::vector<std::pair<std::string, std::string>> unsafe = {
        {"homer", "../x"},
        {"homer", "a/../../x"},
        {"homer", "/etc"},
        {"homer", ""},
        {"homer", "t1//t2"},
        {"homer/evil", "t1"},
        {"..", "t1"},
        {"", "t1"},
    };
    for (const auto& [worker, task] : unsafe) {
        bool create_threw = false;
        try {
            manager.create({worker, task});
        } catch (const std::invalid_argument&) {
            create_threw = true;
        }
        EXPECT(create_threw, "unsafe name rejected by create");

        bool merge_threw = false;
        try {
            manager.merge(worker, task);
        } catch (const std::invalid_argument&) {
            merge_threw = true;
        }
        EXPECT(merge_threw, "unsafe name rejected by merge");
        EXPECT(!manager.exists(worker, task), "unsafe name never exists");
    }

    EXPECT(!fs::exists(tmp.path() / "x"), "nothing escaped the worktrees folder");
    EXPECT(manager.list().empty(), "no worktree created");
    return 0;
}

static int test_trunk_lease(void)
{
    test::TempDir tmp;
    fs::path repo = tmp.path() / "project";
    EXPECT(init_repo(repo), "scratch repository");
    GitWorktreeManager manager(repo);

    auto info = manager.create({"homer", "t1"});
    EXPECT(commit_file(info.path, "feature.txt", "done\n"), "agent commit");

    auto lease = manager.lock_trunk();
    auto merged = manager.merge("homer", "t1");
    manager.pull_latest();

    std::atomic<bool> pulled{false};
    std::thread other([&manager, &pulled]() {
        manager.pull_latest();
        pulled = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    bool blocked = !pulled;
    lease.unlock();
    other.join();

    EXPECT(merged.success, "holder merges under its own lease");
    EXPECT(blocked, "other thread waits for the lease");
    EXPECT(pulled, "other thread proceeds after release");
    return 0;
}

int main(void)
{
    if (!runtime::run_command({"git", "--version"}).ok()) {
        fprintf(stderr, "git not available, skipping\n");
        return kSkipTest;
    }

    if (test_create_merge_remove() != 0) return 1;
    if (test_conflict_and_abort() != 0) return 1;
    if (test_complete_merge() != 0) return 1;
    if (test_create_twice_fails() != 0) return 1;
    if (test_rejects_unsafe_names() != 0) return 1;
    if (test_trunk_lease() != 0) return 1;
    return 0;
}
