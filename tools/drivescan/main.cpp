#include "config/config.hpp"
#include "drive/categories.hpp"
#include "drive/resolve.hpp"
#include "drive_client.hpp"
#include "http/cancel.hpp"
#include "http/http_error.hpp"
#include "log/log.hpp"
#include "report/format.hpp"
#include "report/scan_report.hpp"
#include "report/stale_report.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <map>
#include <pthread.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

// Bad command line; main() prints usage and exits with status 2.
struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

using Args = std::vector<std::string>;

// ── Utility helpers ──────────────────────────────────────────────────────────

void print_usage(const char* prog) {
    fprintf(stderr,
        "Usage: %s [-v|--verbose] <command> [options]\n"
        "\n"
        "Commands:\n"
        "  ls    [path_or_id]                      List files in a directory\n"
        "  scan  [path_or_id] [options]            Find directories with many files\n"
        "        -n, --top <n>        Show top N directories (default 10, 0 = unlimited)\n"
        "        -t, --threshold <n>  Minimum file count threshold (default 100)\n"
        "        -a, --all            Show all directories (no filtering)\n"
        "        -s, --sort <key>     Sort by: size, files (default size)\n"
        "  stale [path_or_id] [options]            Find old files for retention review\n"
        "        -a, --age <age>      Minimum age, e.g. 2y, 6m, 90d (default 2y)\n"
        "        -n, --top <n>        Show top N files (default 20, 0 = unlimited)\n"
        "        -m, --min-size <b>   Minimum file size in bytes (default 0)\n"
        "  tag list                                List available categories\n"
        "  tag add <category> <path_or_id> [-r]    Add a category to a file/directory\n"
        "  tag rm  <category> <path_or_id> [-r]    Remove a category from a file/directory\n"
        "\n"
        "Configuration: ~/.config/drivescan/config.json, ~/.drivescan/config.json,\n"
        "./config.json, overridden by DRIVESCAN_API_TOKEN, DRIVESCAN_DRIVE_ID and\n"
        "DRIVESCAN_BASE_URL.\n",
        prog);
}

uint64_t parse_count(const std::string& flag, const std::string& value) {
    try {
        return report::parse_count(value);
    } catch (const std::invalid_argument& e) {
        throw UsageError(flag + ": " + e.what());
    }
}

// Parses "-x value" / "--long value" style options of one command.
// Positional arguments are collected in order.
class OptionParser {
public:
    explicit OptionParser(const Args& args) : args_(args) {}

    bool done() const { return i_ >= args_.size(); }

    // True (and advances) if the current token is one of the given flags.
    bool flag(const char* s, const char* l) {
        if (done() || (args_[i_] != s && args_[i_] != l)) return false;
        ++i_;
        return true;
    }

    // True (and stores the next token in `out`) for a flag with a value.
    bool option(const char* s, const char* l, std::string& out) {
        if (done() || (args_[i_] != s && args_[i_] != l)) return false;
        if (i_ + 1 >= args_.size())
            throw UsageError(args_[i_] + " requires a value");
        out = args_[i_ + 1];
        i_ += 2;
        return true;
    }

    void positional(Args& out) {
        if (args_[i_].size() > 1 && args_[i_][0] == '-')
            throw UsageError("unknown option: " + args_[i_]);
        out.push_back(args_[i_++]);
    }

private:
    const Args& args_;
    size_t      i_ = 0;
};

void print_progress(const std::string& dir_name, size_t count) {
    fprintf(stderr, "\r\033[KScanning: %s (%zu files found)",
            report::truncate_name(dir_name, 40).c_str(), count);
}

// Crawl with the progress line, always terminating the line on stderr.
std::vector<drive::Entry> crawl_with_progress(DriveClient& client, int64_t id,
                                              const std::string& name) {
    try {
        auto entries = client.list_recursive(id, name, print_progress);
        fprintf(stderr, "\n");
        return entries;
    } catch (...) {
        fprintf(stderr, "\n");
        throw;
    }
}

// Id or path to an id.
int64_t resolve_file_id(DriveClient& client, const std::string& id_or_path) {
    if (auto id = drive::parse_id(id_or_path)) return *id;
    return client.find_by_path(id_or_path).id;
}

// Start directory of a crawl: (1, "/") when no argument is given. A numeric
// id whose entry cannot be fetched keeps the id as its display name.
std::pair<int64_t, std::string> resolve_start(DriveClient& client, const std::string& arg) {
    if (arg.empty()) return {drive::ROOT_ID, "/"};

    if (auto id = drive::parse_id(arg)) {
        try {
            return {*id, client.get_file(*id).name};
        } catch (const Cancelled&) {
            throw;
        } catch (const std::exception& e) {
            spdlog::debug("cannot fetch start entry id={} err={}", *id, e.what());
            return {*id, arg};
        }
    }
    const auto entry = client.find_by_path(arg);
    return {entry.id, entry.name};
}

// Category name (case-insensitive) or id to (id, name).
std::pair<int64_t, std::string> resolve_category(DriveClient& client, const std::string& arg) {
    if (auto id = drive::parse_id(arg)) {
        try {
            for (const auto& c : client.list_categories())
                if (c.id == *id) return {c.id, c.name};
        } catch (const Cancelled&) {
            throw;
        } catch (const std::exception& e) {
            spdlog::debug("cannot list categories err={}", e.what());
        }
        return {*id, arg};
    }

    for (const auto& c : client.list_categories())
        if (drive::iequals(c.name, arg)) return {c.id, c.name};
    throw std::runtime_error("category '" + arg + "' not found");
}

// "#rrggbb" to an ANSI truecolor swatch; empty for anything else.
std::string hex_to_ansi(std::string hex) {
    if (!hex.empty() && hex[0] == '#') hex.erase(0, 1);
    if (hex.size() != 6) return "";
    unsigned rgb[3];
    for (int i = 0; i < 3; ++i) {
        char* end = nullptr;
        const std::string part = hex.substr(static_cast<size_t>(i) * 2, 2);
        rgb[i] = static_cast<unsigned>(strtoul(part.c_str(), &end, 16));
        if (!end || *end != '\0') return "";
    }
    char buf[48];
    snprintf(buf, sizeof(buf), "\033[48;2;%u;%u;%um  \033[0m", rgb[0], rgb[1], rgb[2]);
    return buf;
}

double percent(int64_t part, int64_t total) {
    return total > 0 ? static_cast<double>(part) / static_cast<double>(total) * 100.0 : 0.0;
}

// ── ls ───────────────────────────────────────────────────────────────────────

int cmd_ls(DriveClient& client, const Args& args) {
    OptionParser p(args);
    Args pos;
    while (!p.done()) p.positional(pos);
    if (pos.size() > 1) throw UsageError("ls takes at most one argument");

    const int64_t dir_id = pos.empty() ? drive::ROOT_ID : resolve_file_id(client, pos[0]);

    auto files = client.list_files(dir_id);
    std::sort(files.begin(), files.end(),
              [](const drive::Entry& a, const drive::Entry& b) { return a.name < b.name; });

    printf("%-6s %-18s %-12s %s\n", "TYPE", "MODIFIED", "ID", "NAME");
    for (const auto& f : files) {
        printf("%-6s %-18s %-12lld %s\n",
               f.type.c_str(),
               report::format_datetime(f.last_modified_at).c_str(),
               static_cast<long long>(f.id),
               f.name.c_str());
    }
    return 0;
}

// ── scan ─────────────────────────────────────────────────────────────────────

int cmd_scan(DriveClient& client, const Args& args) {
    report::ScanFilter filter;
    OptionParser p(args);
    Args pos;
    std::string v;
    while (!p.done()) {
        if      (p.option("-n", "--top", v))       filter.top       = parse_count("--top", v);
        else if (p.option("-t", "--threshold", v)) filter.threshold = parse_count("--threshold", v);
        else if (p.flag("-a", "--all"))            filter.all       = true;
        else if (p.option("-s", "--sort", v)) {
            if      (v == "size")  filter.sort = report::ScanSort::Size;
            else if (v == "files") filter.sort = report::ScanSort::Files;
            else throw UsageError("--sort: expected size or files, got '" + v + "'");
        } else {
            p.positional(pos);
        }
    }
    if (pos.size() > 1) throw UsageError("scan takes at most one path or id");

    const auto start = resolve_start(client, pos.empty() ? "" : pos[0]);
    spdlog::debug("starting scan startID={} startName={}", start.first, start.second);

    const auto files = crawl_with_progress(client, start.first, start.second);
    spdlog::debug("scan completed totalFiles={}", files.size());

    auto summary = report::summarize_dirs(files, start.first, start.second);
    const auto sel = report::select_dirs(std::move(summary.dirs), filter);

    if (sel.fell_back) {
        fprintf(stderr, "No directories with >= %zu files, showing top %zu:\n",
                filter.threshold, sel.rows.size());
    }
    if (sel.rows.empty()) {
        printf("No directories found\n");
        return 0;
    }

    printf("%-8s %-10s %-7s %-12s %s\n", "FILES", "SIZE", "%", "ID", "NAME");
    for (const auto& r : sel.rows) {
        printf("%-8zu %-10s %5.1f%%  %-12lld %s\n",
               r.file_count,
               report::format_size(r.size).c_str(),
               percent(r.size, summary.total_size),
               static_cast<long long>(r.id),
               r.name.c_str());
    }
    printf("\nTotal: %zu files, %zu directories, %s\n",
           summary.total_files, summary.total_dirs,
           report::format_size(summary.total_size).c_str());
    return 0;
}

// ── stale ────────────────────────────────────────────────────────────────────

int cmd_stale(DriveClient& client, const Args& args) {
    std::string age      = "2y";
    uint64_t    top      = 20;
    uint64_t    min_size = 0;

    OptionParser p(args);
    Args pos;
    std::string v;
    while (!p.done()) {
        if      (p.option("-a", "--age", v))      age      = v;
        else if (p.option("-n", "--top", v))      top      = parse_count("--top", v);
        else if (p.option("-m", "--min-size", v)) min_size = parse_count("--min-size", v);
        else p.positional(pos);
    }
    if (pos.size() > 1) throw UsageError("stale takes at most one path or id");

    int threshold_days = 0;
    try {
        threshold_days = report::parse_age(age);
    } catch (const std::invalid_argument& e) {
        throw UsageError(std::string("invalid age format: ") + e.what());
    }

    const auto start = resolve_start(client, pos.empty() ? "" : pos[0]);
    spdlog::debug("starting stale scan startID={} thresholdDays={}", start.first, threshold_days);

    const auto files = crawl_with_progress(client, start.first, start.second);

    const auto rep = report::build_stale_report(files, static_cast<int64_t>(std::time(nullptr)),
                                                threshold_days, static_cast<int64_t>(min_size));

    printf("Age distribution:\n\n");
    printf("%-13s %-8s %-7s %-10s %s\n", "BUCKET", "FILES", "%", "SIZE", "%");
    for (const auto& b : rep.buckets) {
        printf("%-13s %-8zu %5.1f%%  %-10s %5.1f%%\n",
               b.label.c_str(), b.count,
               percent(static_cast<int64_t>(b.count), static_cast<int64_t>(rep.total_files)),
               report::format_size(b.size).c_str(),
               percent(b.size, rep.total_size));
    }

    printf("\nFiles not modified for %s:\n\n", age.c_str());
    if (rep.stale.empty()) {
        printf("No files found\n");
        return 0;
    }

    const size_t shown = (top > 0 && rep.stale.size() > top) ? static_cast<size_t>(top)
                                                              : rep.stale.size();
    printf("%-8s %-10s %-11s %-12s %s\n", "AGE", "SIZE", "MODIFIED", "ID", "NAME");
    for (size_t i = 0; i < shown; ++i) {
        const auto& f = rep.stale[i];
        printf("%-8s %-10s %-11s %-12lld %s\n",
               report::format_age_days(f.age_days).c_str(),
               report::format_size(f.size).c_str(),
               report::format_date(f.modified_at).c_str(),
               static_cast<long long>(f.id),
               f.name.c_str());
    }
    if (rep.stale.size() > shown)
        printf("\n... and %zu more files\n", rep.stale.size() - shown);

    printf("\nTotal: %zu files, %s (out of %zu files, %s)\n",
           rep.stale.size(), report::format_size(rep.stale_size).c_str(),
           rep.total_files, report::format_size(rep.total_size).c_str());
    return 0;
}

// ── tag ──────────────────────────────────────────────────────────────────────

int cmd_tag_list(DriveClient& client) {
    for (const auto& c : client.list_categories()) {
        printf("%lld\t%s %s\t%s\n", static_cast<long long>(c.id),
               hex_to_ansi(c.color).c_str(), c.color.c_str(), c.name.c_str());
    }
    return 0;
}

int cmd_tag_apply(DriveClient& client, const Args& args, bool add) {
    bool recursive = false;
    OptionParser p(args);
    Args pos;
    while (!p.done()) {
        if (p.flag("-r", "--recursive")) recursive = true;
        else p.positional(pos);
    }
    if (pos.size() != 2)
        throw UsageError(std::string("tag ") + (add ? "add" : "rm") +
                         " requires <category> <path_or_id>");

    const auto category = resolve_category(client, pos[0]);
    const int64_t file_id = resolve_file_id(client, pos[1]);

    spdlog::debug("collecting files fileID={} recursive={}", file_id, recursive);
    const auto root = client.get_file(file_id);

    std::vector<int64_t>             ids{root.id};
    std::map<int64_t, std::string>   names{{root.id, root.name}};
    if (recursive) {
        for (const auto& e : crawl_with_progress(client, root.id, root.name)) {
            ids.push_back(e.id);
            names[e.id] = e.name;
        }
    }

    const char* verb = add ? "Adding" : "Removing";
    size_t ok = 0, skipped = 0, done = 0;

    for (size_t i = 0; i < ids.size(); i += drive::CATEGORY_BATCH_SIZE) {
        const size_t end = std::min(ids.size(), i + drive::CATEGORY_BATCH_SIZE);
        const std::vector<int64_t> batch(ids.begin() + static_cast<std::ptrdiff_t>(i),
                                         ids.begin() + static_cast<std::ptrdiff_t>(end));

        const auto results = add ? client.add_category(category.first, batch)
                                 : client.remove_category(category.first, batch);
        for (const auto& r : results) {
            ++done;
            if (r.result) ++ok; else ++skipped;
            fprintf(stderr, "\r\033[K%s [%s] %zu/%zu %s", verb, category.second.c_str(),
                    done, ids.size(), report::truncate_name(names[r.id], 30).c_str());
        }
    }

    fprintf(stderr, "\nDone: %zu %s, %zu skipped (%s)\n", ok,
            add ? "tagged" : "untagged", skipped,
            add ? "already tagged" : "not tagged");
    return 0;
}

int cmd_tag(DriveClient& client, const Args& args) {
    if (args.empty()) throw UsageError("tag requires a subcommand: list, add, rm");
    const Args rest(args.begin() + 1, args.end());
    if (args[0] == "list") {
        if (!rest.empty()) throw UsageError("tag list takes no arguments");
        return cmd_tag_list(client);
    }
    if (args[0] == "add") return cmd_tag_apply(client, rest, true);
    if (args[0] == "rm")  return cmd_tag_apply(client, rest, false);
    throw UsageError("unknown tag subcommand: " + args[0]);
}

// ── Signal handling ──────────────────────────────────────────────────────────

// Block SIGINT/SIGTERM in every thread and turn them into a cancellation on
// a dedicated waiter thread.
void install_signal_cancel(CancelToken cancel) {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &set, nullptr) != 0)
        throw std::runtime_error("pthread_sigmask failed");

    std::thread([set, cancel]() mutable {
        int sig = 0;
        if (sigwait(&set, &sig) == 0) {
            spdlog::debug("signal received, cancelling sig={}", sig);
            cancel.cancel();
        }
    }).detach();
}

}  // anonymous namespace

// ── Main ─────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    bool verbose = false;
    int  i = 1;
    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-v" || arg == "--verbose") verbose = true;
        else if (arg == "-h" || arg == "--help") { print_usage(argv[0]); return 0; }
        else break;
    }
    if (i >= argc) {
        print_usage(argv[0]);
        return 2;
    }
    const std::string command = argv[i];
    const Args args(argv + i + 1, argv + argc);

    logging::init(verbose);

    static const std::map<std::string, int (*)(DriveClient&, const Args&)> commands = {
        {"ls",    cmd_ls},
        {"scan",  cmd_scan},
        {"stale", cmd_stale},
        {"tag",   cmd_tag},
    };
    const auto it = commands.find(command);
    if (it == commands.end()) {
        fprintf(stderr, "unknown command: %s\n", command.c_str());
        print_usage(argv[0]);
        return 2;
    }

    try {
        CancelToken cancel;
        install_signal_cancel(cancel);

        Config cfg = load_config();
        cfg.validate();

        DriveClient client(cfg, cancel);
        spdlog::debug("starting command execution command={}", command);
        const int rc = it->second(client, args);
        spdlog::debug("command returned rc={}", rc);
        return rc;
    } catch (const UsageError& e) {
        fprintf(stderr, "error: %s\n", e.what());
        print_usage(argv[0]);
        return 2;
    } catch (const std::exception& e) {
        spdlog::debug("command failed err={}", e.what());
        fprintf(stderr, "error: %s\n", e.what());
        return 1;
    }
}
