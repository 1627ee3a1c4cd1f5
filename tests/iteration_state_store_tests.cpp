/*
File-backed iteration state store tests.
*/
#include "persistence/iteration_state_store.hpp"
#include "core/clock.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <fstream>

using namespace foreman;
using namespace foreman::persistence;
using json = nlohmann::json;

static PersistedIterationState make_state(const std::string& id)
{
    PersistedIterationState state;
    state.instance_id = id;
    state.status = "running";
    state.current_task_id = "t1";

    conversation::ConversationMessage message;
    message.role = "user";
    message.content = "implement the parser";
    message.timestamp = 100;
    state.conversation_context.messages.push_back(message);
    state.conversation_context.last_prompt = "implement the parser";
    state.conversation_context.timestamp = 100;
    return state;
}

static void write_raw(const std::filesystem::path& path, const std::string& text)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path);
    file << text;
}

static int test_save_and_load(void)
{
    test::TempDir dir;
    FileIterationStateStore store(dir.path());
    EXPECT(store.directory() == dir.path() / ".foreman" / "iterations", "stored under the workspace");
    EXPECT(!store.load("a").has_value(), "missing state loads as nothing");

    int64_t before = core::now_ms();
    PersistedIterationState state = make_state("a");
    state.saved_at = 1;
    state.version = 99;
    store.save(state);

    auto loaded = store.load("a");
    EXPECT(loaded.has_value(), "state loads back");
    EXPECT(loaded->saved_at >= before, "save stamps the time");
    EXPECT(loaded->version == kIterationStateVersion, "save stamps the version");
    EXPECT(loaded->status == "running", "status kept");
    EXPECT(loaded->current_task_id == std::optional<std::string>("t1"), "task kept");
    EXPECT(loaded->conversation_context.messages.size() == 1, "conversation kept");
    EXPECT(loaded->conversation_context.last_prompt == std::optional<std::string>("implement the parser"),
           "last prompt kept");
    EXPECT(store.has("a") && store.count() == 1, "one state stored");

    state.status = "paused";
    state.current_task_id.reset();
    store.save(state);
    loaded = store.load("a");
    EXPECT(loaded->status == "paused" && !loaded->current_task_id, "save overwrites");
    return 0;
}

static int test_rejects_bad_files(void)
{
    test::TempDir dir;
    FileIterationStateStore store(dir.path());

    write_raw(store.directory() / "garbage.json", "{not json");
    write_raw(store.directory() / "old.json",
              R"({"instanceId":"old","conversationContext":{"messages":[]},"version":0})");
    write_raw(store.directory() / "partial.json", R"({"version":1,"status":"running"})");
    write_raw(store.directory() / "notes.txt", "ignored");

    EXPECT(!store.load("garbage"), "malformed JSON loads as nothing");
    EXPECT(!store.load("old"), "unknown version loads as nothing");
    EXPECT(!store.load("partial"), "missing fields load as nothing");
    EXPECT(store.count() == 3, "only .json files counted");
    EXPECT(store.get_all().empty(), "get_all skips unreadable states");
    return 0;
}

static int test_invalid_ids(void)
{
    test::TempDir dir;
    FileIterationStateStore store(dir.path());

    bool threw = false;
    try {
        store.save(make_state("../escape"));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    EXPECT(threw, "path-like id rejected on save");
    EXPECT(!store.load(".."), "path-like id never loads");
    EXPECT(!store.erase(""), "empty id never erased");
    return 0;
}

static int test_erase_and_clear(void)
{
    test::TempDir dir;
    FileIterationStateStore store(dir.path());
    store.save(make_state("a"));
    store.save(make_state("b"));
    store.save(make_state("c"));

    EXPECT(store.erase("a"), "erase reports removal");
    EXPECT(!store.erase("a"), "second erase finds nothing");

    auto ids = store.get_all_instance_ids();
    std::sort(ids.begin(), ids.end());
    EXPECT((ids == std::vector<std::string>{"b", "c"}), "remaining ids listed");

    store.clear();
    EXPECT(store.count() == 0, "clear removes everything");
    return 0;
}

static int test_cleanup_stale(void)
{
    test::TempDir dir;
    FileIterationStateStore store(dir.path());
    store.save(make_state("fresh"));

    json stale = make_state("stale");
    stale["savedAt"] = core::now_ms() - 2 * kStaleStateThreshold.count();
    stale["version"] = kIterationStateVersion;
    write_raw(store.directory() / "stale.json", stale.dump());

    EXPECT(store.load("stale").has_value(), "stale state still readable");
    EXPECT(store.cleanup_stale() == 1, "one stale state removed");
    EXPECT(!store.has("stale"), "stale file gone");
    EXPECT(store.has("fresh"), "fresh state kept");

    FileIterationStateStore empty(dir.path() / "nowhere");
    EXPECT(empty.cleanup_stale() == 0, "missing directory is not an error");
    return 0;
}

int main(void)
{
    if (test_save_and_load() != 0) return 1;
    if (test_rejects_bad_files() != 0) return 1;
    if (test_invalid_ids() != 0) return 1;
    if (test_erase_and_clear() != 0) return 1;
    if (test_cleanup_stale() != 0) return 1;
    return 0;
}
