/*
 * test_remediator.cpp — Per-entry actions, the report log and the pool.
 */
#include "test_harness.h"

#include <atomic>
#include <thread>

static Entry snapshot(int root_fd, const std::string& rel) {
    struct stat st{};
    if (fstatat(root_fd, rel.c_str(), &st, AT_SYMLINK_NOFOLLOW) != 0) return Entry{};
    return maat_entry_from_stat(rel, st);
}

static void test_mode_fix_and_scan() {
    PRINT_HEADER("Mode fix and conformant scan");

    TempTree tree;
    tree.dir("d", 0700);
    tree.file("d/f.txt", 0600);

    auto policy = make_test_policy(tree.root());
    unique_fd root_fd(open(tree.root().c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    Remediator remediator(*policy, root_fd.get());

    Entry file = snapshot(root_fd.get(), "./d/f.txt");
    test_check("mismatched file is not conformant", !remediator.scan_conformant(file, 0644));

    auto changed = remediator.normalize_mode(file, 0644);
    test_check("mode fix yields a record", changed.has_value());
    if (changed) {
        test_check("mode fix is Changed", changed->action == Action::Changed);
        test_checkf("mode fix reason", changed->reason == "mode changed to 644",
                    "%s", changed->reason.c_str());
    }
    test_check("file mode is now 644", mode_of(tree.path("d/f.txt")) == 0644);

    file = snapshot(root_fd.get(), "./d/f.txt");
    auto kept = remediator.scan_conformant(file, 0644);
    test_check("conformant file is Kept", kept && kept->action == Action::Kept);
    if (kept) {
        std::string expected = "already conforms (mode=644 owner=" + policy->target_user +
                               " group=" + policy->target_group + ")";
        test_checkf("conformant reason", kept->reason == expected, "%s", kept->reason.c_str());
    }

    Entry dir = snapshot(root_fd.get(), "./d");
    test_check("file phase ignores directories", !remediator.apply(Phase::FileModeFix, dir));
    test_check("directory fix applies to directory", remediator.apply(Phase::DirectoryModeFix, dir).has_value());
    test_check("directory mode is now 755", mode_of(tree.path("d")) == 0755);

    dir = snapshot(root_fd.get(), "./d");
    test_check("conformant directory is skipped by fix phase", !remediator.apply(Phase::DirectoryModeFix, dir));
    test_check("directory scan ignores files", !remediator.apply(Phase::DirectoryConformantScan, file));
}

static void test_ownership() {
    PRINT_HEADER("Ownership normalization");

    TempTree tree;
    tree.file("owned", 0644);

    auto policy = make_test_policy(tree.root());
    unique_fd root_fd(open(tree.root().c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));

    {
        Remediator remediator(*policy, root_fd.get());
        Entry entry = snapshot(root_fd.get(), "./owned");
        uint64_t calls = maat_metrics.chown_calls.load();
        test_check("successful chown is silent", !remediator.normalize_ownership(entry));
        test_check("chown was attempted", maat_metrics.chown_calls.load() == calls + 1);
    }

    auto unknown = std::make_shared<Policy>(*policy);
    unknown->target_user = "maat-no-such-user";
    maat_resolve_targets(*unknown);
    {
        Remediator remediator(*unknown, root_fd.get());
        Entry entry = snapshot(root_fd.get(), "./owned");
        auto failed = remediator.normalize_ownership(entry);
        test_check("unknown user is a failure", failed && failed->action == Action::Failed);
        if (failed) {
            test_checkf("unknown user reason",
                        failed->reason == "ownership change failed: unknown user 'maat-no-such-user'",
                        "%s", failed->reason.c_str());
        }
        test_check("unknown user never counts as conformant", !remediator.scan_conformant(entry, 0644));
    }
}

static void test_replaced_entry() {
    PRINT_HEADER("Entry replaced between walk and action");

    TempTree tree;
    TempTree outside("maat-outside");
    tree.file("swap", 0600);
    outside.file("target", 0600);

    auto policy = make_test_policy(tree.root());
    unique_fd root_fd(open(tree.root().c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    Remediator remediator(*policy, root_fd.get());

    Entry entry = snapshot(root_fd.get(), "./swap");
    unlink(tree.path("swap").c_str());
    tree.link("swap", outside.path("target"));

    uint64_t raced = maat_metrics.entries_raced.load();
    test_check("replaced entry yields no record", !remediator.normalize_mode(entry, 0644));
    test_check("race is counted", maat_metrics.entries_raced.load() == raced + 1);
    test_check("link target is untouched", mode_of(outside.path("target")) == 0600);
}

static void test_self_file() {
    PRINT_HEADER("Own program file");

    TempTree tree;
    tree.file("maat", 0755);

    auto policy = make_test_policy(tree.root());
    test_check("self path registered", maat_set_self_path(*policy, tree.path("maat")));
    test_check("self name is the basename", policy->self_name == "maat");

    unique_fd root_fd(open(tree.root().c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    Remediator remediator(*policy, root_fd.get());

    Entry self = snapshot(root_fd.get(), "./maat");
    test_check("self is recognized", policy->is_self(self));
    test_check("ownership phase skips self", !remediator.apply(Phase::Ownership, self));

    auto kept = remediator.apply(Phase::FileModeFix, self);
    test_check("mode fix reports self as Kept",
               kept && kept->action == Action::Kept && kept->reason == "own program file, skipped");
    test_check("self mode is unchanged", mode_of(tree.path("maat")) == 0755);
    test_check("mismatched self is not rescanned", !remediator.apply(Phase::FileConformantScan, self));

    chmod(tree.path("maat").c_str(), 0644);
    self = snapshot(root_fd.get(), "./maat");
    test_check("matching self is not fixed", !remediator.apply(Phase::FileModeFix, self));
    kept = remediator.apply(Phase::FileConformantScan, self);
    test_check("matching self is Kept by scan",
               kept && kept->reason == "own program file, skipped");
}

static void test_mode_failure() {
    PRINT_HEADER("Mode change failure");

    run_unprivileged("mode change failure", [] {
        // A root-owned file; the requested mode is its current one
        auto policy = make_test_policy("/");
        unique_fd root_fd(open("/", O_RDONLY | O_DIRECTORY | O_CLOEXEC));
        Entry entry = snapshot(root_fd.get(), "./etc/passwd");
        test_check("foreign file present",
                   entry.type == EntryType::RegularFile && entry.uid != geteuid());

        Remediator remediator(*policy, root_fd.get());
        auto failed = remediator.normalize_mode(entry, entry.mode);
        test_check("chmod of a foreign file fails", failed && failed->action == Action::Failed);
        if (failed) {
            std::string expected = "mode change to " + maat_format_mode(entry.mode) +
                                   " failed: " + strerror(EPERM);
            test_checkf("failure reason names the mode and the error", failed->reason == expected,
                        "%s", failed->reason.c_str());
        }
    });
}

static void test_ownership_denied() {
    PRINT_HEADER("Ownership change refused by the kernel");

    run_unprivileged("ownership change refused", [] {
        TempTree tree;
        tree.file("mine", 0644);

        // uid/gid 0 resolve through the numeric fallback on any system
        auto policy = make_test_policy(tree.root());
        policy->target_user = "0";
        policy->target_group = "0";
        maat_resolve_targets(*policy);
        test_check("numeric targets resolve", policy->target_uid && policy->target_gid);

        unique_fd root_fd(open(tree.root().c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
        Remediator remediator(*policy, root_fd.get());
        Entry entry = snapshot(root_fd.get(), "./mine");

        auto failed = remediator.normalize_ownership(entry);
        test_check("chown to a foreign uid fails", failed && failed->action == Action::Failed);
        if (failed) {
            test_checkf("failure reason carries the OS error",
                        failed->reason == "ownership change failed: Operation not permitted",
                        "%s", failed->reason.c_str());
        }
        test_check("owner unchanged", snapshot(root_fd.get(), "./mine").uid == geteuid());
    });
}

static void test_descriptor_chmod() {
    PRINT_HEADER("Mode change without /proc");

    TempTree tree;
    tree.file("plain", 0600);
    tree.file("sealed", 0000);
    TempTree outside("maat-outside");
    outside.file("target", 0600);
    tree.file("swap", 0600);

    auto policy = make_test_policy(tree.root());
    unique_fd root_fd(open(tree.root().c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    Remediator remediator(*policy, root_fd.get(), false);

    auto plain = remediator.normalize_mode(snapshot(root_fd.get(), "./plain"), 0644);
    test_check("readable file changed through its descriptor",
               plain && plain->action == Action::Changed && mode_of(tree.path("plain")) == 0644);

    auto sealed = remediator.normalize_mode(snapshot(root_fd.get(), "./sealed"), 0644);
    test_checkf("unreadable file changed by name", sealed && sealed->action == Action::Changed &&
                mode_of(tree.path("sealed")) == 0644,
                "%s", sealed ? sealed->reason.c_str() : "no record");

    Entry swapped = snapshot(root_fd.get(), "./swap");
    unlink(tree.path("swap").c_str());
    tree.link("swap", outside.path("target"));
    test_check("swapped-in link yields no record", !remediator.normalize_mode(swapped, 0644));
    test_check("link target untouched", mode_of(outside.path("target")) == 0600);
}

static void test_aggregator_concurrency() {
    PRINT_HEADER("Concurrent report appends");

    ReportAggregator aggregator;
    constexpr int threads = 8;
    constexpr int per_thread = 1000;

    std::vector<std::thread> writers;
    for (int t = 0; t < threads; ++t) {
        writers.emplace_back([&aggregator, t] {
            for (int i = 0; i < per_thread; ++i) {
                OutcomeRecord record;
                record.path = "./t" + std::to_string(t) + "/" + std::to_string(i);
                record.action = static_cast<Action>(i % 3);
                record.reason = "r";
                aggregator.append(std::move(record));
            }
        });
    }
    for (auto& w : writers) w.join();

    test_check("all records pending", aggregator.pending() == threads * per_thread);

    RunReport report = aggregator.finish();
    size_t total = report.modified_count + report.kept_count + report.failed_count;
    test_checkf("no record lost", total == threads * per_thread, "total=%zu", total);
    test_check("counts are log lengths",
               report.modified_count == report.changed.size() &&
               report.kept_count == report.kept.size() &&
               report.failed_count == report.failed.size());
    test_check("each record lands in its own log",
               report.changed.size() == 2672 && report.kept.size() == 2664 && report.failed.size() == 2664);

    bool sorted = true;
    for (size_t i = 1; i < report.changed.size(); ++i) {
        if (report.changed[i - 1].path > report.changed[i].path) sorted = false;
    }
    test_check("logs are sorted by path", sorted);
    test_check("aggregator is empty after finish", aggregator.pending() == 0);
}

static void test_worker_pool() {
    PRINT_HEADER("Worker pool barrier");

    MaatWorkerPool pool(3);
    test_check("pool size", pool.size() == 3);

    std::atomic<int> done{0};
    for (int i = 0; i < 500; ++i) {
        pool.enqueue([&done] {
            std::this_thread::yield();
            ++done;
        });
    }
    pool.wait_idle();
    test_check("barrier waits for every task", done.load() == 500);

    pool.enqueue([] { throw std::runtime_error("task failure"); });
    pool.wait_idle();
    test_check("throwing task does not stall the barrier", true);

    pool.stop();
    pool.enqueue([&done] { ++done; });
    test_check("stopped pool rejects work", done.load() == 500);
    test_check("stopped pool has no workers", pool.size() == 0);
}

int main() {
    maat_set_log_stderr(false);
    maat_metrics_reset();

    test_mode_fix_and_scan();
    test_ownership();
    test_replaced_entry();
    test_self_file();
    test_mode_failure();
    test_ownership_denied();
    test_descriptor_chmod();
    test_aggregator_concurrency();
    test_worker_pool();

    PRINT_SUMMARY();
    return TEST_EXIT_CODE();
}
