#include "TempDirTest.hpp"
#include "storage/Codec.hpp"
#include "storage/ProblemStore.hpp"
#include "storage/errors.hpp"

#include <stdexcept>
#include <thread>

using namespace compass::storage;
using namespace compass::types;
using json = nlohmann::json;

class ProblemStoreTest : public TempDirTest {
protected:
    std::unique_ptr<ProblemStore> store;

    void SetUp() override {
        TempDirTest::SetUp();
        store = std::make_unique<ProblemStore>(dir / "problems.json", dir / "solutions");
    }

    [[nodiscard]] std::filesystem::path container() const { return dir / "problems.json"; }
};

TEST_F(ProblemStoreTest, MissingContainerIsCreatedEmpty) {
    EXPECT_TRUE(store->loadAll().empty());
    EXPECT_EQ(readText(container()), "[]\n");
}

TEST_F(ProblemStoreTest, CreateAssignsIdAndTimestamps) {
    const auto p = store->create({{"title", "  Two Sum "}, {"tags", {"hash"}}, {"source", " LeetCode "}});
    EXPECT_FALSE(p.id.empty());
    EXPECT_EQ(p.title, "Two Sum");
    EXPECT_EQ(p.source, "LeetCode");
    EXPECT_FALSE(p.created_at.empty());
    EXPECT_EQ(p.created_at, p.updated_at);
    EXPECT_FALSE(p.has_solution);

    const auto all = store->loadAll();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].id, p.id);
    EXPECT_EQ(all[0].tags, std::vector<std::string>{"hash"});
}

TEST_F(ProblemStoreTest, CreateIgnoresCallerSuppliedIdentity) {
    const auto p = store->create({{"title", "x"}, {"id", "mine"}, {"created_at", "1999"}, {"has_solution", true}});
    EXPECT_NE(p.id, "mine");
    EXPECT_NE(p.created_at, "1999");
    EXPECT_FALSE(p.has_solution);
}

TEST_F(ProblemStoreTest, CreateRejectsBadInput) {
    EXPECT_THROW(store->create({{"tags", json::array()}}), std::invalid_argument);
    EXPECT_THROW(store->create({{"title", "   "}}), std::invalid_argument);
    EXPECT_THROW(store->create({{"title", "x"}, {"pass_count", -1}}), std::invalid_argument);
    EXPECT_THROW(store->create({{"title", "x"}, {"tags", {1, 2}}}), std::invalid_argument);
    EXPECT_THROW(store->create({{"title", "x"}, {"unsolved_stage", "later"}}), std::invalid_argument);
    EXPECT_THROW(store->create(json::array()), std::invalid_argument);
    EXPECT_TRUE(store->loadAll().empty());
}

TEST_F(ProblemStoreTest, CreateSolvedClearsUnsolvedFields) {
    const auto p = store->create({{"title", "x"}, {"solved", true}, {"unsolved_stage", "unseen"},
                                  {"unsolved_custom_label", "later"}});
    EXPECT_TRUE(p.solved);
    EXPECT_FALSE(p.unsolved_stage.has_value());
    EXPECT_FALSE(p.unsolved_custom_label.has_value());
}

TEST_F(ProblemStoreTest, UpdateMergesAndReappliesInvariant) {
    const auto created = store->create({{"title", "Flows"}, {"unsolved_stage", "seen_no_idea"}, {"pass_count", 3}});

    const auto updated = store->update(created.id, {{"solved", true}, {"notes", "used dinic"}});
    EXPECT_EQ(updated.id, created.id);
    EXPECT_EQ(updated.created_at, created.created_at);
    EXPECT_EQ(updated.title, "Flows");
    EXPECT_EQ(updated.pass_count, 3);
    EXPECT_EQ(updated.notes, "used dinic");
    EXPECT_TRUE(updated.solved);
    EXPECT_FALSE(updated.unsolved_stage.has_value());

    const auto reloaded = store->findById(created.id);
    EXPECT_TRUE(reloaded.solved);
    EXPECT_EQ(reloaded.notes, "used dinic");
}

TEST_F(ProblemStoreTest, UpdateCannotChangeIdentity) {
    const auto created = store->create({{"title", "x"}});
    const auto updated = store->update(created.id, {{"id", "other"}, {"created_at", "1999"}});
    EXPECT_EQ(updated.id, created.id);
    EXPECT_EQ(updated.created_at, created.created_at);
}

TEST_F(ProblemStoreTest, UnknownIdsThrowNotFound) {
    EXPECT_THROW(store->findById("nope"), NotFound);
    EXPECT_THROW(store->update("nope", {{"title", "x"}}), NotFound);
    EXPECT_THROW(store->remove("nope"), NotFound);
    EXPECT_THROW(store->putSolution("nope", "text"), NotFound);
    EXPECT_THROW(store->getSolution("nope"), NotFound);
}

TEST_F(ProblemStoreTest, RemoveDeletesRecordAndSideFile) {
    const auto p = store->create({{"title", "x"}});
    store->putSolution(p.id, "solution");
    ASSERT_TRUE(store->solutions().exists(p.id));

    store->remove(p.id);
    EXPECT_TRUE(store->loadAll().empty());
    EXPECT_FALSE(store->solutions().exists(p.id));
}

TEST_F(ProblemStoreTest, SolutionLifecycle) {
    const auto p = store->create({{"title", "x"}});

    const auto withSolution = store->putSolution(p.id, "line one\r\nline two\r\n");
    EXPECT_TRUE(withSolution.has_solution);
    EXPECT_EQ(store->getSolution(p.id), "line one\nline two\n");
    EXPECT_TRUE(store->findById(p.id).has_solution);

    const auto cleared = store->deleteSolution(p.id);
    EXPECT_FALSE(cleared.has_solution);
    EXPECT_FALSE(store->getSolution(p.id).has_value());
    EXPECT_FALSE(store->findById(p.id).has_solution);
}

TEST_F(ProblemStoreTest, WhitespaceSolutionLeavesNoSideFile) {
    const auto p = store->create({{"title", "x"}});
    const auto updated = store->putSolution(p.id, "  \n\t\n");
    EXPECT_FALSE(updated.has_solution);
    EXPECT_FALSE(std::filesystem::exists(dir / "solutions" / (p.id + ".md")));
    EXPECT_FALSE(store->findById(p.id).has_solution);
}

TEST_F(ProblemStoreTest, CorruptContainerIsBackedUpAndReset) {
    writeText(container(), "{not json at all");

    EXPECT_TRUE(store->loadAll().empty());
    EXPECT_EQ(readText(dir / "problems.backup.json"), "{not json at all");
    EXPECT_EQ(readText(container()), "[]\n");

    store->create({{"title", "after recovery"}});
    const auto all = store->loadAll();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].title, "after recovery");
}

TEST_F(ProblemStoreTest, LegacyRecordsMigrateOnceThenReloadIsByteIdentical) {
    writeText(container(), R"([
  {"id": "legacy-1", "title": "Old one", "status": "Done", "owner": "bob",
   "solution_markdown": "# Hi", "has_solution": false,
   "created_at": "2024-01-01T00:00:00Z", "updated_at": "2024-01-01T00:00:00Z"}
])");

    const auto first = store->loadAll();
    ASSERT_EQ(first.size(), 1u);
    EXPECT_TRUE(first[0].solved);
    EXPECT_EQ(first[0].assignee, "bob");
    EXPECT_TRUE(first[0].has_solution);
    EXPECT_EQ(readText(dir / "solutions" / "legacy-1.md"), "# Hi");

    const auto bytes = readText(container());
    EXPECT_EQ(bytes.find("solution_markdown"), std::string::npos);
    EXPECT_EQ(bytes.find("has_solution"), std::string::npos);
    EXPECT_EQ(bytes.find("owner"), std::string::npos);

    const auto second = store->loadAll();
    EXPECT_EQ(readText(container()), bytes);
    EXPECT_EQ(second, first);
}

TEST_F(ProblemStoreTest, MissingIdsAreAssignedAndNonObjectsDropped) {
    writeText(container(), R"([1, "text", {"title": "no id"}])");

    const auto all = store->loadAll();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_FALSE(all[0].id.empty());
    EXPECT_EQ(decodeContainer(readText(container())).size(), 1u);
    EXPECT_EQ(store->loadAll()[0].id, all[0].id);
}

TEST_F(ProblemStoreTest, ExportInlinesSolutions) {
    const auto p = store->create({{"title", "x"}});
    store->putSolution(p.id, "my solution");
    store->create({{"title", "y"}});

    const auto exported = store->exportAll();
    ASSERT_EQ(exported.size(), 2u);
    EXPECT_EQ(exported[0]["solution_markdown"], "my solution");
    EXPECT_FALSE(exported[0].contains("has_solution"));
    EXPECT_FALSE(exported[1].contains("solution_markdown"));
}

TEST_F(ProblemStoreTest, ImportReplacesCollectionAndKeepsBackup) {
    const auto a = store->create({{"title", "A"}});
    store->putSolution(a.id, "solution of A");
    const auto exported = store->exportAll();

    store->create({{"title", "B"}});
    EXPECT_EQ(store->importAll(exported), 1u);

    const auto all = store->loadAll();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].id, a.id);
    EXPECT_TRUE(all[0].has_solution);
    EXPECT_EQ(store->getSolution(a.id), "solution of A");

    const auto backup = readText(store->importBackupPath());
    EXPECT_NE(backup.find("\"B\""), std::string::npos);
    EXPECT_EQ(store->importBackupPath(), dir / "problems.bak.json");
}

TEST_F(ProblemStoreTest, ImportFillsMissingIdentity) {
    const json payload = json::array({{{"title", "fresh"}, {"solution", "inline"}}});
    EXPECT_EQ(store->importAll(payload), 1u);

    const auto all = store->loadAll();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_FALSE(all[0].id.empty());
    EXPECT_FALSE(all[0].created_at.empty());
    EXPECT_TRUE(all[0].has_solution);
}

TEST_F(ProblemStoreTest, ImportRejectsInvalidPayloadWithoutTouchingData) {
    store->create({{"title", "keep me"}});
    const auto before = readText(container());

    EXPECT_THROW(store->importAll(json::object()), std::invalid_argument);
    EXPECT_THROW(store->importAll(json::array({{{"notes", "no title"}}})), std::invalid_argument);
    EXPECT_EQ(readText(container()), before);
    EXPECT_FALSE(std::filesystem::exists(store->importBackupPath()));
}

TEST_F(ProblemStoreTest, ConcurrentCreatesAreNotLost) {
    constexpr int threads = 4, perThread = 10;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([this, t] {
            for (int i = 0; i < perThread; ++i)
                store->create({{"title", "t" + std::to_string(t) + "-" + std::to_string(i)}});
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(store->loadAll().size(), static_cast<size_t>(threads * perThread));
}

TEST_F(ProblemStoreTest, IdsWithPathCharactersLoadAndKeepSolutions) {
    writeText(container(), R"([{"id": "cf/1234A", "title": "x"}])");

    const auto all = store->loadAll();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].id, "cf/1234A");
    EXPECT_FALSE(all[0].has_solution);

    EXPECT_TRUE(store->putSolution("cf/1234A", "greedy").has_solution);
    EXPECT_TRUE(std::filesystem::exists(dir / "solutions" / "cf%2F1234A.md"));
    EXPECT_EQ(store->getSolution("cf/1234A"), "greedy");
    EXPECT_TRUE(store->findById("cf/1234A").has_solution);

    store->update("cf/1234A", {{"solved", true}});
    store->remove("cf/1234A");
    EXPECT_FALSE(std::filesystem::exists(dir / "solutions" / "cf%2F1234A.md"));
}

TEST_F(ProblemStoreTest, ImportedIdsWithDotsStayUsable) {
    ASSERT_EQ(store->importAll(json::array({{{"id", "a..b"}, {"title", "x"}, {"solution", "inline"}}})), 1u);

    const auto all = store->loadAll();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_TRUE(all[0].has_solution);
    EXPECT_EQ(store->getSolution("a..b"), "inline");
}

TEST_F(ProblemStoreTest, LowerPriorityLegacySolutionNeverOverwritesTheExtractedOne) {
    writeText(container(), R"([{"id": "p1", "title": "t", "solution_markdown": "A", "solution": "B"}])");

    store->loadAll();
    const auto afterFirst = readText(container());
    EXPECT_EQ(afterFirst.find("\"solution\""), std::string::npos);

    const auto all = store->loadAll();
    EXPECT_EQ(readText(container()), afterFirst);
    ASSERT_EQ(all.size(), 1u);
    EXPECT_TRUE(all[0].has_solution);
    EXPECT_EQ(store->solutions().read("p1"), "A");
}

TEST_F(ProblemStoreTest, UpdateTrimsOptionalText) {
    const auto created = store->create({{"title", "t"}, {"notes", "keep"}});
    const auto updated = store->update(created.id, {{"source", " AtCoder "}, {"notes", "  \n "}});
    EXPECT_EQ(updated.source, "AtCoder");
    EXPECT_FALSE(updated.notes.has_value());
    EXPECT_FALSE(store->findById(created.id).notes.has_value());
}
