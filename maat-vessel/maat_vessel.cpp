// -----------------------------------------------------------------------------
// Maat Vessel — Ownership and permission normalization
// Parallel tree sweep with whitelist pruning and per-entry reporting
// This file is a native tool (vessel), not a god
// -----------------------------------------------------------------------------
#include "maat_vessel.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <dirent.h>
#include <fcntl.h>
#include <grp.h>
#include <inttypes.h>
#include <pwd.h>
#include <syslog.h>
#include <utility>

#ifndef PATH_MAX
#define PATH_MAX 4096
#endif

#ifndef HAS_SYSTEMD
    #if defined(__linux__)
        #define HAS_SYSTEMD 1
    #else
        #define HAS_SYSTEMD 0
    #endif
#endif

#ifndef HAS_LIBCAP
    #if defined(__linux__)
        #define HAS_LIBCAP 1
    #else
        #define HAS_LIBCAP 0
    #endif
#endif

#if HAS_SYSTEMD
#include <systemd/sd-daemon.h>
#endif

#if HAS_LIBCAP
#include <sys/capability.h>
#endif

// -----------------------------------------------------------------------------
// Maat Vessel — Diagnostics (syslog, mirrored to stderr)
// -----------------------------------------------------------------------------
static std::mutex g_log_mutex;
static std::atomic<bool> g_verbose{false};
static std::atomic<bool> g_log_stderr{true};

static int maat_syslog_priority(const char* level) noexcept {
    static const std::pair<const char*, int> levels[] = {
        {"ERROR", LOG_ERR}, {"WARN", LOG_WARNING}, {"INFO", LOG_INFO}
    };
    for (const auto& [name, priority] : levels) {
        if (strcmp(level, name) == 0) return priority;
    }
    return LOG_DEBUG;
}

// Workers log concurrently; the mutex keeps each line whole on both sinks
void maat_log_output(const char* module, const char* level, const char* fmt, ...) {
    char message[maat_constants::LOG_BUFFER_SIZE];
    va_list args;
    va_start(args, fmt);
    int len = vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);
    if (len <= 0) return;

    std::lock_guard<std::mutex> lock(g_log_mutex);
    syslog(maat_syslog_priority(level), "[%s] [%s] %s", level, module, message);

    if (!g_log_stderr.load(std::memory_order_relaxed)) return;

    time_t now = time(nullptr);
    struct tm local{};
    localtime_r(&now, &local);
    char stamp[32];
    strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

    fprintf(stderr, "[%s][%s][%s] %s\n", level, stamp, module, message);
    fflush(stderr);
}

void maat_set_verbose(bool verbose) noexcept {
    g_verbose.store(verbose, std::memory_order_relaxed);
}

bool maat_is_verbose() noexcept {
    return g_verbose.load(std::memory_order_relaxed);
}

void maat_set_log_stderr(bool enabled) noexcept {
    g_log_stderr.store(enabled, std::memory_order_relaxed);
}

// -----------------------------------------------------------------------------
// Maat Vessel — Diagnostic counters
// -----------------------------------------------------------------------------
Metrics maat_metrics;

void maat_metrics_reset() noexcept {
    maat_metrics.entries_scanned.store(0);
    maat_metrics.subtrees_pruned.store(0);
    maat_metrics.symlinks_skipped.store(0);
    maat_metrics.scope_errors.store(0);
    maat_metrics.tasks_dispatched.store(0);
    maat_metrics.chown_calls.store(0);
    maat_metrics.chmod_calls.store(0);
    maat_metrics.entries_raced.store(0);
}

int maat_get_metrics(char* buf, size_t sz) noexcept {
    int n = snprintf(buf, sz,
        "entries_scanned %" PRIu64 "\n"
        "subtrees_pruned %" PRIu64 "\n"
        "symlinks_skipped %" PRIu64 "\n"
        "scope_errors %" PRIu64 "\n"
        "tasks_dispatched %" PRIu64 "\n"
        "chown_calls %" PRIu64 "\n"
        "chmod_calls %" PRIu64 "\n"
        "entries_raced %" PRIu64 "\n",
        maat_metrics.entries_scanned.load(),
        maat_metrics.subtrees_pruned.load(),
        maat_metrics.symlinks_skipped.load(),
        maat_metrics.scope_errors.load(),
        maat_metrics.tasks_dispatched.load(),
        maat_metrics.chown_calls.load(),
        maat_metrics.chmod_calls.load(),
        maat_metrics.entries_raced.load()
    );

    return (n < 0 || static_cast<size_t>(n) >= sz) ? -1 : n;
}

// -----------------------------------------------------------------------------
// Maat Vessel — Entries and outcomes
// -----------------------------------------------------------------------------
Entry maat_entry_from_stat(const std::string& path, const struct stat& st) {
    Entry entry;
    entry.path = path;
    if (S_ISDIR(st.st_mode)) entry.type = EntryType::Directory;
    else if (S_ISREG(st.st_mode)) entry.type = EntryType::RegularFile;
    else if (S_ISLNK(st.st_mode)) entry.type = EntryType::Symlink;
    else entry.type = EntryType::Other;
    entry.mode = st.st_mode & 07777;
    entry.uid = st.st_uid;
    entry.gid = st.st_gid;
    entry.dev = st.st_dev;
    entry.ino = st.st_ino;
    return entry;
}

const char* maat_entry_type_name(EntryType type) noexcept {
    switch (type) {
    case EntryType::Directory:   return "directory";
    case EntryType::RegularFile: return "file";
    case EntryType::Symlink:     return "symlink";
    case EntryType::Other:       return "other";
    }
    return "other";
}

static std::string maat_user_name(uid_t uid) {
    struct passwd pw{};
    struct passwd* result = nullptr;
    char buf[1024];
    if (getpwuid_r(uid, &pw, buf, sizeof(buf), &result) == 0 && result) {
        return result->pw_name;
    }
    return std::to_string(uid);
}

static std::string maat_group_name(gid_t gid) {
    struct group gr{};
    struct group* result = nullptr;
    char buf[1024];
    if (getgrgid_r(gid, &gr, buf, sizeof(buf), &result) == 0 && result) {
        return result->gr_name;
    }
    return std::to_string(gid);
}

std::string maat_describe_entry(const Entry& entry) {
    std::string out = entry.path;
    out += " (";
    out += maat_entry_type_name(entry.type);
    out += " mode=";
    out += maat_format_mode(entry.mode);
    out += " owner=";
    out += maat_user_name(entry.uid);
    out += " group=";
    out += maat_group_name(entry.gid);
    out += ")";
    return out;
}

std::string maat_format_mode(mode_t mode) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%03o", static_cast<unsigned>(mode & 07777));
    return buf;
}

const char* maat_action_name(Action action) noexcept {
    switch (action) {
    case Action::Changed: return "Changed";
    case Action::Kept:    return "Kept";
    case Action::Failed:  return "Failed";
    }
    return "Failed";
}

std::string OutcomeRecord::render() const {
    std::string line = maat_action_name(action);
    line += ": ";
    line += path;
    line += " -- ";
    line += reason;
    return line;
}

// -----------------------------------------------------------------------------
// Maat Vessel — Run policy from the command line
// -----------------------------------------------------------------------------
Policy::Policy() {
    for (const char* p : maat_constants::WHITELIST_PATHS) whitelist_paths.emplace_back(p);
    for (const char* n : maat_constants::WHITELIST_NAMES) whitelist_names.emplace_back(n);
}

int maat_detect_concurrency() noexcept {
    long n = sysconf(_SC_NPROCESSORS_ONLN);
    if (n < 1) return maat_constants::DEFAULT_CONCURRENCY;
    if (n > maat_constants::MAX_CONCURRENCY) return maat_constants::MAX_CONCURRENCY;
    return static_cast<int>(n);
}

int maat_parse_concurrency(const char* value, int fallback) noexcept {
    if (!value || !*value) return fallback;

    char* end = nullptr;
    errno = 0;
    long v = strtol(value, &end, 10);
    if (errno != 0 || end == value || *end != '\0') {
        MAAT_LOG_WARN("config", "Invalid concurrency '%s', using %d", value, fallback);
        return fallback;
    }

    // Clamping
    if (v < maat_constants::MIN_CONCURRENCY) return maat_constants::MIN_CONCURRENCY;
    if (v > maat_constants::MAX_CONCURRENCY) {
        MAAT_LOG_WARN("config", "Concurrency %ld exceeds limit, using %d",
                      v, maat_constants::MAX_CONCURRENCY);
        return maat_constants::MAX_CONCURRENCY;
    }
    return static_cast<int>(v);
}

static bool maat_parse_id(const std::string& s, unsigned long& out) noexcept {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    unsigned long v = strtoul(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || s[0] == '-') return false;
    out = v;
    return true;
}

void maat_resolve_targets(Policy& policy) noexcept {
    policy.target_uid.reset();
    policy.target_gid.reset();

    unsigned long numeric = 0;

    if (struct passwd* pw = getpwnam(policy.target_user.c_str())) {
        policy.target_uid = pw->pw_uid;
    } else if (maat_parse_id(policy.target_user, numeric)) {
        policy.target_uid = static_cast<uid_t>(numeric);
    }

    if (struct group* gr = getgrnam(policy.target_group.c_str())) {
        policy.target_gid = gr->gr_gid;
    } else if (maat_parse_id(policy.target_group, numeric)) {
        policy.target_gid = static_cast<gid_t>(numeric);
    }
}

bool maat_set_self_path(Policy& policy, const std::string& path) {
    struct stat st{};
    if (stat(path.c_str(), &st) != 0) {
        MAAT_LOG_DEBUG("config", "stat(%s) failed: %s", path.c_str(), strerror(errno));
        return false;
    }

    auto slash = path.rfind('/');
    policy.has_self = true;
    policy.self_dev = st.st_dev;
    policy.self_ino = st.st_ino;
    policy.self_name = slash == std::string::npos ? path : path.substr(slash + 1);
    return true;
}

bool maat_identify_self(Policy& policy, const char* argv0) {
    char buf[PATH_MAX];
    ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n > 0) {
        buf[n] = '\0';
        if (maat_set_self_path(policy, buf)) return true;
    }

    if (argv0 && *argv0 && realpath(argv0, buf)) {
        return maat_set_self_path(policy, buf);
    }

    return false;
}

std::shared_ptr<const Policy> maat_load_policy(int argc, char* argv[]) {
    auto policy = std::make_shared<Policy>();
    policy->concurrency = maat_detect_concurrency();

    const char* jobs = nullptr;

    // optind = 0 forces a full reset of glibc getopt state between calls
    optind = 0;
    opterr = 0;
    int opt;
    while ((opt = getopt(argc, argv, ":j:")) != -1) {
        switch (opt) {
        case 'j':
            jobs = optarg;
            break;
        case ':':
            MAAT_LOG_WARN("config", "Option -%c requires a value, ignoring", optopt);
            break;
        default:
            MAAT_LOG_DEBUG("config", "Ignoring unknown option -%c", optopt);
            break;
        }
    }

    if (jobs) {
        policy->concurrency = maat_parse_concurrency(jobs, policy->concurrency);
    }
    policy->concurrency = std::max(policy->concurrency, maat_constants::MIN_CONCURRENCY);

    maat_resolve_targets(*policy);

    if (!maat_identify_self(*policy, argc > 0 ? argv[0] : nullptr)) {
        MAAT_LOG_WARN("config", "Cannot identify own program file, self-protection disabled");
    }

    MAAT_LOG_DEBUG("config", "Policy: root=%s owner=%s:%s dir=%s file=%s jobs=%d",
                   policy->root.c_str(), policy->target_user.c_str(),
                   policy->target_group.c_str(),
                   maat_format_mode(policy->dir_mode).c_str(),
                   maat_format_mode(policy->file_mode).c_str(),
                   policy->concurrency);

    return policy;
}

// -----------------------------------------------------------------------------
// Maat Vessel — Integration with systemd for status notifications
// -----------------------------------------------------------------------------
#if HAS_SYSTEMD
class SystemdNotifier {
    std::atomic<bool> ready_{false};

public:
    void notify_ready() noexcept {
        if (ready_.exchange(true)) return;

        char buf[256];
        snprintf(buf, sizeof(buf),
                 "READY=1\n"
                 "STATUS=Maat sweep started\n"
                 "MAINPID=%lu",
                 (unsigned long)getpid());

        sd_notify(0, buf);
    }

    void update_status(const char* status) noexcept {
        char buf[256];
        snprintf(buf, sizeof(buf), "STATUS=%s", status);
        sd_notify(0, buf);
    }

    void notify_stopping() noexcept {
        sd_notify(0, "STOPPING=1\nSTATUS=Sweep finished");
    }
};

static SystemdNotifier g_systemd_notifier;
#endif

// -----------------------------------------------------------------------------
// Maat Vessel — Capability pre-flight
// -----------------------------------------------------------------------------
static std::vector<std::string> maat_missing_capabilities() {
    std::vector<std::string> missing;
#if HAS_LIBCAP
    cap_t caps = cap_get_proc();
    if (!caps) {
        MAAT_LOG_WARN("preflight", "cap_get_proc failed: %s", strerror(errno));
        return missing;
    }

    const std::pair<cap_value_t, const char*> wanted[] = {
        {CAP_CHOWN, "CAP_CHOWN"},
        {CAP_FOWNER, "CAP_FOWNER"}
    };

    for (const auto& [cap, name] : wanted) {
        cap_flag_value_t value = CAP_CLEAR;
        if (cap_get_flag(caps, cap, CAP_EFFECTIVE, &value) != 0 || value != CAP_SET) {
            missing.emplace_back(name);
        }
    }

    cap_free(caps);
#endif
    return missing;
}

// -----------------------------------------------------------------------------
// Maat Vessel — PathClassifier
// -----------------------------------------------------------------------------
bool PathClassifier::is_whitelisted(const std::string& rel_path, const char* name) const noexcept {
    for (const auto& w : policy_.whitelist_paths) {
        if (rel_path == w) return true;
        if (rel_path.size() > w.size() &&
            rel_path.compare(0, w.size(), w) == 0 &&
            rel_path[w.size()] == '/') {
            return true;
        }
    }

    if (name) {
        for (const auto& n : policy_.whitelist_names) {
            if (n == name) return true;
        }
    }

    return false;
}

ScopeVerdict PathClassifier::classify(int dir_fd, const std::string& rel_path, const char* name) const {
    ScopeVerdict verdict;

    // Path identity first: a whitelisted directory is never stat'ed or opened
    if (is_whitelisted(rel_path, name)) {
        verdict.scope = Scope::Whitelisted;
        verdict.reason = "whitelisted";
        return verdict;
    }

    struct stat st{};
    if (fstatat(dir_fd, name, &st, AT_SYMLINK_NOFOLLOW) != 0) {
        verdict.scope = Scope::Error;
        verdict.reason = std::string("stat failed: ") + strerror(errno);
        return verdict;
    }

    if (S_ISLNK(st.st_mode)) {
        verdict.scope = Scope::Symlink;
        verdict.reason = "symbolic link";
        return verdict;
    }

    verdict.scope = Scope::InScope;
    verdict.entry = maat_entry_from_stat(rel_path, st);
    return verdict;
}

// -----------------------------------------------------------------------------
// Maat Vessel — ReportAggregator
// -----------------------------------------------------------------------------
void ReportAggregator::append(OutcomeRecord record) {
    std::lock_guard<std::mutex> lk(mtx_);
    switch (record.action) {
    case Action::Changed: report_.changed.push_back(std::move(record)); break;
    case Action::Kept:    report_.kept.push_back(std::move(record));    break;
    case Action::Failed:  report_.failed.push_back(std::move(record));  break;
    }
}

RunReport ReportAggregator::finish() {
    RunReport out;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        out = std::move(report_);
        report_ = RunReport{};
    }

    auto by_path = [](const OutcomeRecord& a, const OutcomeRecord& b) {
        return a.path < b.path;
    };
    std::stable_sort(out.changed.begin(), out.changed.end(), by_path);
    std::stable_sort(out.kept.begin(), out.kept.end(), by_path);
    std::stable_sort(out.failed.begin(), out.failed.end(), by_path);

    out.modified_count = out.changed.size();
    out.kept_count = out.kept.size();
    out.failed_count = out.failed.size();
    return out;
}

size_t ReportAggregator::pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return report_.changed.size() + report_.kept.size() + report_.failed.size();
}

// -----------------------------------------------------------------------------
// Maat Vessel — Bounded worker pool with a phase barrier
// -----------------------------------------------------------------------------
MaatWorkerPool::MaatWorkerPool(int threads) {
    threads = std::max(threads, maat_constants::MIN_CONCURRENCY);

    std::lock_guard<std::mutex> lk(mtx_);
    for (int i = 0; i < threads; ++i) {
        workers_.emplace_back(&MaatWorkerPool::worker, this);
    }

    MAAT_LOG_DEBUG("pool", "Worker pool created with %d threads", threads);
}

MaatWorkerPool::~MaatWorkerPool() {
    stop();
}

void MaatWorkerPool::worker() noexcept {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [this] { return stop_ || !queue_.empty(); });
            // stop_ only ends the loop once the queue is drained
            if (queue_.empty()) return;
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            MAAT_LOG_ERROR("pool", "Task failed: %s", e.what());
        }

        std::lock_guard<std::mutex> lk(mtx_);
        if (--in_flight_ == 0) idle_cv_.notify_all();
    }
}

void MaatWorkerPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (stop_) {
            MAAT_LOG_WARN("pool", "Worker pool stopped, rejecting task");
            return;
        }
        queue_.push_back(std::move(task));
        ++in_flight_;
    }
    ++maat_metrics.tasks_dispatched;
    cv_.notify_one();
}

void MaatWorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lk(mtx_);
    idle_cv_.wait(lk, [this] { return in_flight_ == 0; });
}

void MaatWorkerPool::stop() noexcept {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stop_ = true;
        workers.swap(workers_);
    }
    cv_.notify_all();

    for (auto& t : workers) {
        if (t.joinable()) t.join();
    }
}

int MaatWorkerPool::size() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<int>(workers_.size());
}

// -----------------------------------------------------------------------------
// Maat Vessel — Remediator
// -----------------------------------------------------------------------------
const char* maat_phase_name(Phase phase) noexcept {
    switch (phase) {
    case Phase::Ownership:               return "ownership";
    case Phase::DirectoryModeFix:        return "directory-mode-fix";
    case Phase::DirectoryConformantScan: return "directory-conformant-scan";
    case Phase::FileModeFix:             return "file-mode-fix";
    case Phase::FileConformantScan:      return "file-conformant-scan";
    }
    return "unknown";
}

static OutcomeRecord maat_outcome(const Entry& entry, Action action, std::string reason) {
    OutcomeRecord record;
    record.path = entry.path;
    record.action = action;
    record.reason = std::move(reason);
    return record;
}

Remediator::Remediator(const Policy& policy, int root_fd) noexcept
    : Remediator(policy, root_fd, access("/proc/self/fd", X_OK) == 0) {
    if (!have_proc_) {
        MAAT_LOG_WARN("remediate", "/proc is not available, mode changes use regular descriptors");
    }
}

Remediator::Remediator(const Policy& policy, int root_fd, bool use_proc_fd) noexcept
    : policy_(policy), root_fd_(root_fd), have_proc_(use_proc_fd) {}

bool Remediator::reopen(const Entry& entry, unique_fd& fd, struct stat& st) const noexcept {
    // O_PATH | O_NOFOLLOW pins the inode without following a swapped-in link
    fd.reset(openat(root_fd_, entry.path.c_str(), O_PATH | O_NOFOLLOW | O_CLOEXEC));
    if (!fd) return false;
    return fstat(fd.get(), &st) == 0;
}

bool Remediator::chmod_without_proc(const Entry& entry, mode_t target, bool& raced) const noexcept {
    raced = false;

    unique_fd fd(openat(root_fd_, entry.path.c_str(),
                        O_RDONLY | O_NOFOLLOW | O_NONBLOCK | O_NOCTTY | O_CLOEXEC));
    if (fd) {
        struct stat st{};
        if (fstat(fd.get(), &st) != 0) return false;
        if (st.st_dev != entry.dev || st.st_ino != entry.ino) {
            raced = true;
            return false;
        }
        return fchmod(fd.get(), target) == 0;
    }

    if (errno != EACCES) return false;

    // Unreadable entry (mode 000 and the like): chmod by name, never through a link
    return fchmodat(root_fd_, entry.path.c_str(), target, AT_SYMLINK_NOFOLLOW) == 0;
}

std::optional<OutcomeRecord> Remediator::normalize_ownership(const Entry& entry) const {
    static const std::string prefix = "ownership change failed: ";

    if (!policy_.target_uid) {
        return maat_outcome(entry, Action::Failed,
                            prefix + "unknown user '" + policy_.target_user + "'");
    }
    if (!policy_.target_gid) {
        return maat_outcome(entry, Action::Failed,
                            prefix + "unknown group '" + policy_.target_group + "'");
    }

    unique_fd fd;
    struct stat st{};
    if (!reopen(entry, fd, st)) {
        return maat_outcome(entry, Action::Failed, prefix + strerror(errno));
    }

    if (S_ISLNK(st.st_mode) || st.st_dev != entry.dev || st.st_ino != entry.ino) {
        ++maat_metrics.entries_raced;
        MAAT_LOG_WARN("remediate", "Entry replaced during walk, skipping chown: %s", entry.path.c_str());
        return std::nullopt;
    }

    ++maat_metrics.chown_calls;
    if (fchownat(fd.get(), "", *policy_.target_uid, *policy_.target_gid, AT_EMPTY_PATH) != 0) {
        return maat_outcome(entry, Action::Failed, prefix + strerror(errno));
    }

    MAAT_LOG_DEBUG("remediate", "chown %s:%s %s", policy_.target_user.c_str(),
                   policy_.target_group.c_str(), entry.path.c_str());
    return std::nullopt;
}

std::optional<OutcomeRecord> Remediator::normalize_mode(const Entry& entry, mode_t target) const {
    const std::string mode_text = maat_format_mode(target);
    const std::string prefix = "mode change to " + mode_text + " failed: ";

    if (policy_.is_self(entry)) {
        return maat_outcome(entry, Action::Kept, "own program file, skipped");
    }

    unique_fd fd;
    struct stat st{};
    if (!reopen(entry, fd, st)) {
        return maat_outcome(entry, Action::Failed, prefix + strerror(errno));
    }

    if (S_ISLNK(st.st_mode) || st.st_dev != entry.dev || st.st_ino != entry.ino) {
        ++maat_metrics.entries_raced;
        MAAT_LOG_WARN("remediate", "Entry replaced during walk, skipping chmod: %s", entry.path.c_str());
        return std::nullopt;
    }

    ++maat_metrics.chmod_calls;
    bool ok;
    if (have_proc_) {
        // fchmod() does not accept O_PATH descriptors; the magic link does
        char fd_path[64];
        snprintf(fd_path, sizeof(fd_path), "/proc/self/fd/%d", fd.get());
        ok = chmod(fd_path, target) == 0;
    } else {
        bool raced = false;
        ok = chmod_without_proc(entry, target, raced);
        if (raced) {
            ++maat_metrics.entries_raced;
            MAAT_LOG_WARN("remediate", "Entry replaced during walk, skipping chmod: %s", entry.path.c_str());
            return std::nullopt;
        }
    }

    if (!ok) {
        return maat_outcome(entry, Action::Failed, prefix + strerror(errno));
    }

    MAAT_LOG_DEBUG("remediate", "chmod %s %s (was %s)", mode_text.c_str(),
                   entry.path.c_str(), maat_format_mode(entry.mode).c_str());
    return maat_outcome(entry, Action::Changed, "mode changed to " + mode_text);
}

std::optional<OutcomeRecord> Remediator::scan_conformant(const Entry& entry, mode_t target) const {
    if (policy_.is_self(entry)) {
        if (entry.mode != target) return std::nullopt;
        return maat_outcome(entry, Action::Kept, "own program file, skipped");
    }

    if (entry.mode != target) return std::nullopt;
    if (!policy_.target_uid || entry.uid != *policy_.target_uid) return std::nullopt;
    if (!policy_.target_gid || entry.gid != *policy_.target_gid) return std::nullopt;

    return maat_outcome(entry, Action::Kept,
                        "already conforms (mode=" + maat_format_mode(target) +
                        " owner=" + policy_.target_user +
                        " group=" + policy_.target_group + ")");
}

std::optional<OutcomeRecord> Remediator::apply(Phase phase, const Entry& entry) const {
    switch (phase) {
    case Phase::Ownership:
        if (policy_.is_self(entry)) {
            MAAT_LOG_DEBUG("remediate", "Own program file, leaving ownership: %s", entry.path.c_str());
            return std::nullopt;
        }
        return normalize_ownership(entry);

    case Phase::DirectoryModeFix:
        if (entry.type != EntryType::Directory || entry.mode == policy_.dir_mode) {
            return std::nullopt;
        }
        return normalize_mode(entry, policy_.dir_mode);

    case Phase::DirectoryConformantScan:
        if (entry.type != EntryType::Directory) return std::nullopt;
        return scan_conformant(entry, policy_.dir_mode);

    case Phase::FileModeFix:
        if (entry.type != EntryType::RegularFile || entry.mode == policy_.file_mode) {
            return std::nullopt;
        }
        return normalize_mode(entry, policy_.file_mode);

    case Phase::FileConformantScan:
        if (entry.type != EntryType::RegularFile) return std::nullopt;
        return scan_conformant(entry, policy_.file_mode);
    }

    return std::nullopt;
}

// -----------------------------------------------------------------------------
// Maat Vessel — ConcurrentWalker
// -----------------------------------------------------------------------------
void ConcurrentWalker::record_scope_error(ReportAggregator* errors, const std::string& path,
                                          const std::string& reason) const {
    ++maat_metrics.scope_errors;
    MAAT_LOG_WARN("walker", "%s: %s", path.c_str(), reason.c_str());
    if (errors) {
        OutcomeRecord record;
        record.path = path;
        record.action = Action::Failed;
        record.reason = reason;
        errors->append(std::move(record));
    }
}

void ConcurrentWalker::walk(int root_fd, const EntryHandler& handler, ReportAggregator* errors,
                            bool directories_first) {
    auto dispatch = [this, &handler, directories_first](Entry entry) {
        ++maat_metrics.entries_scanned;
        if (directories_first && entry.type == EntryType::Directory) {
            // A directory fixed here may be one the walk could not open before
            try {
                handler(entry);
            } catch (const std::exception& e) {
                MAAT_LOG_ERROR("walker", "Directory task failed for %s: %s", entry.path.c_str(), e.what());
            }
            return;
        }
        pool_.enqueue([&handler, entry = std::move(entry)] { handler(entry); });
    };

    auto fatal = [this](const std::string& what) {
        // Tasks already queued reference the caller's state; drain before unwinding
        pool_.wait_idle();
        throw MaatFatalWalkError(what);
    };

    struct stat root_st{};
    if (fstat(root_fd, &root_st) != 0) {
        int err = errno;
        fatal("cannot stat root '" + policy_.root + "': " + strerror(err));
    }
    dispatch(maat_entry_from_stat(".", root_st));

    std::vector<std::string> stack;
    stack.emplace_back(".");

    while (!stack.empty()) {
        std::string dir_path = std::move(stack.back());
        stack.pop_back();
        const bool is_root = dir_path == ".";

        unique_fd dir_fd(openat(root_fd, dir_path.c_str(),
                                O_RDONLY | O_DIRECTORY | O_CLOEXEC | (is_root ? 0 : O_NOFOLLOW)));
        if (!dir_fd) {
            int err = errno;
            if (is_root) fatal("cannot enumerate root '" + policy_.root + "': " + strerror(err));
            record_scope_error(errors, dir_path, std::string("cannot enumerate directory: ") + strerror(err));
            continue;
        }

        DIR* dir = fdopendir(dir_fd.get());
        if (!dir) {
            int err = errno;
            if (is_root) fatal("cannot enumerate root '" + policy_.root + "': " + strerror(err));
            record_scope_error(errors, dir_path, std::string("cannot enumerate directory: ") + strerror(err));
            continue;
        }
        dir_fd.release();

        std::vector<std::string> subdirs;
        struct dirent* de;
        errno = 0;

        while ((de = readdir(dir)) != nullptr) {
            if (de->d_name[0] == '.' &&
               (de->d_name[1] == '\0' ||
               (de->d_name[1] == '.' && de->d_name[2] == '\0'))) {
                errno = 0;
                continue;
            }

            std::string child = dir_path + '/' + de->d_name;

            if (child.size() >= PATH_MAX) {
                record_scope_error(errors, child, "path too long");
                errno = 0;
                continue;
            }

            ScopeVerdict verdict = classifier_.classify(dirfd(dir), child, de->d_name);
            switch (verdict.scope) {
            case Scope::Whitelisted:
                ++maat_metrics.subtrees_pruned;
                MAAT_LOG_DEBUG("walker", "Pruned whitelisted path: %s", child.c_str());
                break;
            case Scope::Symlink:
                ++maat_metrics.symlinks_skipped;
                MAAT_LOG_DEBUG("walker", "Skipped symlink: %s", child.c_str());
                break;
            case Scope::Error:
                record_scope_error(errors, child, verdict.reason);
                break;
            case Scope::InScope:
                if (verdict.entry.type == EntryType::Directory) {
                    subdirs.push_back(child);
                }
                dispatch(std::move(verdict.entry));
                break;
            }

            errno = 0;
        }

        int read_err = errno;
        closedir(dir);

        if (read_err != 0) {
            if (is_root) fatal("cannot enumerate root '" + policy_.root + "': " + strerror(read_err));
            record_scope_error(errors, dir_path,
                               std::string("cannot enumerate directory: ") + strerror(read_err));
        }

        // Reverse so the first listed subdirectory is walked first
        for (auto it = subdirs.rbegin(); it != subdirs.rend(); ++it) {
            stack.push_back(std::move(*it));
        }
    }

    pool_.wait_idle();
}

// -----------------------------------------------------------------------------
// Maat Vessel — Orchestrator
// -----------------------------------------------------------------------------
void Orchestrator::print_banner() const {
    const Policy& policy = *policy_;

    char cwd[PATH_MAX];
    const char* shown = realpath(policy.root.c_str(), cwd) ? cwd : policy.root.c_str();

    fprintf(out_, "=== Maat Vessel: permission normalization started ===\n");
    fprintf(out_, "Working directory: %s\n", shown);
    fprintf(out_, "Target owner:group: %s:%s\n", policy.target_user.c_str(), policy.target_group.c_str());
    fprintf(out_, "Directory mode: %s    File mode: %s\n",
            maat_format_mode(policy.dir_mode).c_str(), maat_format_mode(policy.file_mode).c_str());

    std::string whitelist;
    for (const auto& p : policy.whitelist_paths) whitelist += p + "/ ";
    for (const auto& n : policy.whitelist_names) whitelist += n + " ";
    if (policy.has_self) whitelist += "./" + policy.self_name + " ";
    fprintf(out_, "Whitelist: %s(and all symbolic links)\n", whitelist.c_str());
    fprintf(out_, "Concurrency: %d\n\n", policy.concurrency);
}

void Orchestrator::preflight() const {
    const Policy& policy = *policy_;

    if (!policy.target_uid) {
        fprintf(out_, "warning: user '%s' does not exist, chown may fail\n", policy.target_user.c_str());
        MAAT_LOG_WARN("preflight", "Target user '%s' not found", policy.target_user.c_str());
    }
    if (!policy.target_gid) {
        fprintf(out_, "warning: group '%s' does not exist, chown may fail\n", policy.target_group.c_str());
        MAAT_LOG_WARN("preflight", "Target group '%s' not found", policy.target_group.c_str());
    }

    for (const auto& cap : maat_missing_capabilities()) {
        fprintf(out_, "warning: process lacks %s, some changes may fail\n", cap.c_str());
        MAAT_LOG_WARN("preflight", "Missing capability %s", cap.c_str());
    }

    fprintf(out_, "\n");
}

void Orchestrator::print_whitelist_notice(int root_fd) const {
    const Policy& policy = *policy_;

    std::vector<std::string> names;
    for (const auto& p : policy.whitelist_paths) {
        names.push_back(p.compare(0, 2, "./") == 0 ? p.substr(2) : p);
    }
    for (const auto& n : policy.whitelist_names) names.push_back(n);

    for (const auto& name : names) {
        struct stat st{};
        if (fstatat(root_fd, name.c_str(), &st, AT_SYMLINK_NOFOLLOW) != 0) continue;
        fprintf(out_, "whitelist: ./%s (%s) -- skipped\n", name.c_str(),
                S_ISDIR(st.st_mode) ? "directory" : "file");
    }

    if (policy.has_self) {
        struct stat st{};
        if (fstatat(root_fd, policy.self_name.c_str(), &st, AT_SYMLINK_NOFOLLOW) == 0 &&
            st.st_dev == policy.self_dev && st.st_ino == policy.self_ino) {
            fprintf(out_, "whitelist: ./%s (own program file) -- skipped\n", policy.self_name.c_str());
        }
    }

    fprintf(out_, "\n");
}

void Orchestrator::run_phase(Phase phase, int root_fd, ConcurrentWalker& walker,
                             const Remediator& remediator, ReportAggregator& aggregator) {
    const Policy& policy = *policy_;

    switch (phase) {
    case Phase::Ownership:
        fprintf(out_, "> Normalizing ownership to %s:%s ...\n",
                policy.target_user.c_str(), policy.target_group.c_str());
        break;
    case Phase::DirectoryModeFix:
        fprintf(out_, "> Fixing directory modes to %s ...\n", maat_format_mode(policy.dir_mode).c_str());
        break;
    case Phase::DirectoryConformantScan:
        fprintf(out_, "> Marking conformant directories ...\n");
        break;
    case Phase::FileModeFix:
        fprintf(out_, "> Fixing file modes to %s ...\n", maat_format_mode(policy.file_mode).c_str());
        break;
    case Phase::FileConformantScan:
        fprintf(out_, "> Marking conformant files ...\n");
        break;
    }
    fflush(out_);

#if HAS_SYSTEMD
    char status[128];
    snprintf(status, sizeof(status), "Phase %s", maat_phase_name(phase));
    g_systemd_notifier.update_status(status);
#endif

    auto started = std::chrono::steady_clock::now();

    auto handler = [&remediator, &aggregator, phase](const Entry& entry) {
        auto record = remediator.apply(phase, entry);
        if (record) aggregator.append(std::move(*record));
    };

    // Only the ownership pass covers every entry, so scope errors are reported once
    walker.walk(root_fd, handler, phase == Phase::Ownership ? &aggregator : nullptr,
                phase == Phase::DirectoryModeFix);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    MAAT_LOG_DEBUG("maat", "Phase %s finished in %lld ms (%zu records so far)",
                   maat_phase_name(phase), static_cast<long long>(elapsed.count()),
                   aggregator.pending());
}

RunReport Orchestrator::run() {
    const Policy& policy = *policy_;

    unique_fd root_fd(open(policy.root.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!root_fd) {
        throw MaatFatalWalkError("cannot open root '" + policy.root + "': " + strerror(errno));
    }

    print_banner();
    preflight();
    print_whitelist_notice(root_fd.get());

#if HAS_SYSTEMD
    g_systemd_notifier.notify_ready();
#endif

    MAAT_LOG_INFO("maat", "Sweep started: root=%s owner=%s:%s jobs=%d",
                  policy.root.c_str(), policy.target_user.c_str(),
                  policy.target_group.c_str(), policy.concurrency);

    MaatWorkerPool pool(policy.concurrency);
    PathClassifier classifier(policy);
    ConcurrentWalker walker(policy, classifier, pool);
    Remediator remediator(policy, root_fd.get());
    ReportAggregator aggregator;

    const Phase phases[] = {
        Phase::Ownership,
        Phase::DirectoryModeFix,
        Phase::DirectoryConformantScan,
        Phase::FileModeFix,
        Phase::FileConformantScan
    };

    for (Phase phase : phases) {
        run_phase(phase, root_fd.get(), walker, remediator, aggregator);
    }

    pool.stop();

#if HAS_SYSTEMD
    g_systemd_notifier.notify_stopping();
#endif

    RunReport report = aggregator.finish();

    MAAT_LOG_INFO("maat", "Sweep finished: modified=%zu kept=%zu failed=%zu",
                  report.modified_count, report.kept_count, report.failed_count);

    if (maat_is_verbose()) {
        char buf[1024];
        if (maat_get_metrics(buf, sizeof(buf)) > 0) {
            MAAT_LOG_DEBUG("maat", "Metrics:\n%s", buf);
        }
    }

    return report;
}

static void maat_render_section(FILE* out, const char* title, const std::vector<OutcomeRecord>& log) {
    fprintf(out, "\n=== %s ===\n", title);
    if (log.empty()) {
        fprintf(out, "(none)\n");
        return;
    }
    for (const auto& record : log) {
        fprintf(out, "%s\n", record.render().c_str());
    }
}

void Orchestrator::render(const RunReport& report) const {
    maat_render_section(out_, "Details (changed)", report.changed);
    maat_render_section(out_, "Details (kept)", report.kept);
    maat_render_section(out_, "Details (failed, with reasons)", report.failed);

    fprintf(out_, "\n=== Done ===\n");
    fprintf(out_, "Summary: modified %zu; kept %zu; failed %zu\n",
            report.modified_count, report.kept_count, report.failed_count);
    fflush(out_);
}
