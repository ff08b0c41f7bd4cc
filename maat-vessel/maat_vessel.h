// -----------------------------------------------------------------------------
// Maat Vessel — Ownership and permission normalization
// Parallel tree sweep with whitelist pruning and per-entry reporting
// This file is a native tool (vessel), not a god
// -----------------------------------------------------------------------------
#ifndef MAAT_VESSEL_H
#define MAAT_VESSEL_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

// -----------------------------------------------------------------------------
// Maat Vessel — Fixed policy values and boundaries
// -----------------------------------------------------------------------------
namespace maat_constants {
    constexpr const char* TARGET_USER = "www";
    constexpr const char* TARGET_GROUP = "www";
    constexpr mode_t DIR_MODE = 0755;
    constexpr mode_t FILE_MODE = 0644;
    constexpr int DEFAULT_CONCURRENCY = 4;
    constexpr int MIN_CONCURRENCY = 1;
    constexpr int MAX_CONCURRENCY = 1024;
    constexpr const char* ROOT_PATH = ".";
    constexpr const char* WHITELIST_PATHS[] = {"./.git", "./.well-known", "./tabler-temp"};
    constexpr const char* WHITELIST_NAMES[] = {".user.ini"};
    constexpr size_t LOG_BUFFER_SIZE = 2048;
}

// -----------------------------------------------------------------------------
// Maat Vessel — Diagnostics (syslog, mirrored to stderr)
// stdout carries the sweep report; these never write to it. DEBUG lines are
// dropped unless maat_set_verbose(true). Tests turn the stderr mirror off.
// -----------------------------------------------------------------------------
void maat_log_output(const char* module, const char* level, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));
void maat_set_verbose(bool verbose) noexcept;
bool maat_is_verbose() noexcept;
void maat_set_log_stderr(bool enabled) noexcept;

#define MAAT_LOG_INFO(module, ...)   maat_log_output(module, "INFO",  __VA_ARGS__)
#define MAAT_LOG_ERROR(module, ...)  maat_log_output(module, "ERROR", __VA_ARGS__)
#define MAAT_LOG_WARN(module, ...)   maat_log_output(module, "WARN",  __VA_ARGS__)
#define MAAT_LOG_DEBUG(module, ...)  do {                           \
        if (maat_is_verbose()) maat_log_output(module, "DEBUG", __VA_ARGS__); \
    } while (0)

// -----------------------------------------------------------------------------
// Maat Vessel — Descriptor ownership
// Holds the walk root, each directory being enumerated and the O_PATH handle
// a worker re-opens before chown/chmod. Never copied or moved; a directory
// descriptor handed to fdopendir() is given up with release().
// -----------------------------------------------------------------------------
class unique_fd {
    int fd_;
public:
    explicit unique_fd(int fd = -1) noexcept : fd_(fd) {}
    ~unique_fd() { reset(); }

    unique_fd(const unique_fd&) = delete;
    unique_fd& operator=(const unique_fd&) = delete;

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

    int get() const noexcept { return fd_; }
    int release() noexcept { int t = fd_; fd_ = -1; return t; }
    explicit operator bool() const noexcept { return fd_ >= 0; }
};

// -----------------------------------------------------------------------------
// Maat Vessel — Diagnostic counters (never used for report totals)
// -----------------------------------------------------------------------------
struct Metrics {
    std::atomic<uint64_t> entries_scanned{0};
    std::atomic<uint64_t> subtrees_pruned{0};
    std::atomic<uint64_t> symlinks_skipped{0};
    std::atomic<uint64_t> scope_errors{0};
    std::atomic<uint64_t> tasks_dispatched{0};
    std::atomic<uint64_t> chown_calls{0};
    std::atomic<uint64_t> chmod_calls{0};
    std::atomic<uint64_t> entries_raced{0};
};

extern Metrics maat_metrics;
void maat_metrics_reset() noexcept;
int maat_get_metrics(char* buf, size_t sz) noexcept;

// -----------------------------------------------------------------------------
// Maat Vessel — Entries and outcomes
// -----------------------------------------------------------------------------
enum class EntryType { Directory, RegularFile, Symlink, Other };

struct Entry {
    std::string path;                 // "." for the root, "./a/b" below it
    EntryType type = EntryType::Other;
    mode_t mode = 0;                  // permission bits only (07777)
    uid_t uid = 0;
    gid_t gid = 0;
    dev_t dev = 0;
    ino_t ino = 0;
};

Entry maat_entry_from_stat(const std::string& path, const struct stat& st);
const char* maat_entry_type_name(EntryType type) noexcept;
std::string maat_describe_entry(const Entry& entry);
std::string maat_format_mode(mode_t mode);

enum class Action { Changed, Kept, Failed };

const char* maat_action_name(Action action) noexcept;

struct OutcomeRecord {
    std::string path;
    Action action = Action::Kept;
    std::string reason;

    // "<action>: <path> -- <reason>"
    std::string render() const;
};

// -----------------------------------------------------------------------------
// Maat Vessel — Run policy
// -----------------------------------------------------------------------------
struct Policy {
    std::string root = maat_constants::ROOT_PATH;
    std::string target_user = maat_constants::TARGET_USER;
    std::string target_group = maat_constants::TARGET_GROUP;
    mode_t dir_mode = maat_constants::DIR_MODE;
    mode_t file_mode = maat_constants::FILE_MODE;
    int concurrency = maat_constants::DEFAULT_CONCURRENCY;

    // Filled by maat_resolve_targets(); empty when the name does not exist
    std::optional<uid_t> target_uid;
    std::optional<gid_t> target_gid;

    // Identity of the running program's own file
    bool has_self = false;
    dev_t self_dev = 0;
    ino_t self_ino = 0;
    std::string self_name;

    std::vector<std::string> whitelist_paths;
    std::vector<std::string> whitelist_names;

    Policy();

    bool is_self(const Entry& entry) const noexcept {
        return has_self && entry.dev == self_dev && entry.ino == self_ino;
    }

    mode_t target_mode_for(EntryType type) const noexcept {
        return type == EntryType::Directory ? dir_mode : file_mode;
    }
};

int maat_detect_concurrency() noexcept;
int maat_parse_concurrency(const char* value, int fallback) noexcept;
void maat_resolve_targets(Policy& policy) noexcept;
bool maat_set_self_path(Policy& policy, const std::string& path);
bool maat_identify_self(Policy& policy, const char* argv0);
std::shared_ptr<const Policy> maat_load_policy(int argc, char* argv[]);

// -----------------------------------------------------------------------------
// Maat Vessel — Run-level failure
// -----------------------------------------------------------------------------
class MaatFatalWalkError : public std::runtime_error {
public:
    explicit MaatFatalWalkError(const std::string& what) : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// Maat Vessel — PathClassifier
// -----------------------------------------------------------------------------
enum class Scope { InScope, Whitelisted, Symlink, Error };

struct ScopeVerdict {
    Scope scope = Scope::Error;
    std::string reason;
    Entry entry;

    bool in_scope() const noexcept { return scope == Scope::InScope; }
};

class PathClassifier {
    const Policy& policy_;

public:
    explicit PathClassifier(const Policy& policy) noexcept : policy_(policy) {}

    // rel_path is root-relative ("./a/b"), name is its last component
    bool is_whitelisted(const std::string& rel_path, const char* name) const noexcept;

    // Stats name relative to dir_fd without following links
    ScopeVerdict classify(int dir_fd, const std::string& rel_path, const char* name) const;
};

// -----------------------------------------------------------------------------
// Maat Vessel — ReportAggregator
// -----------------------------------------------------------------------------
struct RunReport {
    std::vector<OutcomeRecord> changed;
    std::vector<OutcomeRecord> kept;
    std::vector<OutcomeRecord> failed;

    size_t modified_count = 0;
    size_t kept_count = 0;
    size_t failed_count = 0;
};

class ReportAggregator {
    mutable std::mutex mtx_;
    RunReport report_;

public:
    void append(OutcomeRecord record);

    // Sorts each log by path and computes the counts from the log lengths
    RunReport finish();

    size_t pending() const;
};

// -----------------------------------------------------------------------------
// Maat Vessel — Bounded worker pool with a phase barrier
// -----------------------------------------------------------------------------
class MaatWorkerPool {
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    size_t in_flight_ = 0;
    bool stop_ = false;

    void worker() noexcept;

public:
    explicit MaatWorkerPool(int threads);
    ~MaatWorkerPool();

    MaatWorkerPool(const MaatWorkerPool&) = delete;
    MaatWorkerPool& operator=(const MaatWorkerPool&) = delete;

    void enqueue(std::function<void()> task);
    void wait_idle();
    void stop() noexcept;
    int size() const noexcept;
};

// -----------------------------------------------------------------------------
// Maat Vessel — Remediator
// -----------------------------------------------------------------------------
enum class Phase {
    Ownership,
    DirectoryModeFix,
    DirectoryConformantScan,
    FileModeFix,
    FileConformantScan
};

const char* maat_phase_name(Phase phase) noexcept;

class Remediator {
    const Policy& policy_;
    int root_fd_;
    bool have_proc_;

    bool reopen(const Entry& entry, unique_fd& fd, struct stat& st) const noexcept;
    bool chmod_without_proc(const Entry& entry, mode_t target, bool& raced) const noexcept;

public:
    Remediator(const Policy& policy, int root_fd) noexcept;
    // use_proc_fd = false forces the descriptor path used when /proc is absent
    Remediator(const Policy& policy, int root_fd, bool use_proc_fd) noexcept;

    std::optional<OutcomeRecord> normalize_ownership(const Entry& entry) const;
    std::optional<OutcomeRecord> normalize_mode(const Entry& entry, mode_t target) const;
    std::optional<OutcomeRecord> scan_conformant(const Entry& entry, mode_t target) const;

    // Runs the single predicate/action pair of a phase against a fresh view
    std::optional<OutcomeRecord> apply(Phase phase, const Entry& entry) const;
};

// -----------------------------------------------------------------------------
// Maat Vessel — ConcurrentWalker
// -----------------------------------------------------------------------------
class ConcurrentWalker {
    const Policy& policy_;
    const PathClassifier& classifier_;
    MaatWorkerPool& pool_;

    void record_scope_error(ReportAggregator* errors, const std::string& path,
                            const std::string& reason) const;

public:
    using EntryHandler = std::function<void(const Entry&)>;

    ConcurrentWalker(const Policy& policy, const PathClassifier& classifier,
                     MaatWorkerPool& pool) noexcept
        : policy_(policy), classifier_(classifier), pool_(pool) {}

    // Pre-order walk from root_fd; handler runs on the pool. Returns after the
    // barrier. Scope errors go to `errors` when it is non-null.
    // With directories_first, directory entries are handled on the walking
    // thread and finish before the directory is opened for descent.
    void walk(int root_fd, const EntryHandler& handler, ReportAggregator* errors,
              bool directories_first = false);
};

// -----------------------------------------------------------------------------
// Maat Vessel — Orchestrator
// -----------------------------------------------------------------------------
class Orchestrator {
    std::shared_ptr<const Policy> policy_;
    FILE* out_;

    void print_banner() const;
    void preflight() const;
    void print_whitelist_notice(int root_fd) const;
    void run_phase(Phase phase, int root_fd, ConcurrentWalker& walker,
                   const Remediator& remediator, ReportAggregator& aggregator);

public:
    Orchestrator(std::shared_ptr<const Policy> policy, FILE* out) noexcept
        : policy_(std::move(policy)), out_(out) {}

    // Throws MaatFatalWalkError when the root cannot be enumerated
    RunReport run();
    void render(const RunReport& report) const;
};

#endif // MAAT_VESSEL_H
