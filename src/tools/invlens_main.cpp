// ================================
// invlens 命令行工具
// ================================

#include <algorithm>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <cxxopts.hpp>
#include "invlens/common/cancellation.h"
#include "invlens/common/logger.h"
#include "invlens/config/engine_config.h"
#include "invlens/query/inventory_query.h"

using namespace invlens;

namespace {

CancellationToken g_cancel;

void SignalHandler(int) {
    g_cancel.Cancel();
}

std::string FormatSize(uint64_t bytes) {
    static const char* kUnits[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f %s", value, kUnits[unit]);
    return buf;
}

using Row = std::vector<std::string>;

void PrintTable(const Row& header, const std::vector<Row>& rows) {
    std::vector<size_t> widths(header.size(), 0);
    for (size_t i = 0; i < header.size(); ++i) {
        widths[i] = header[i].size();
    }
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size() && i < widths.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    auto print_row = [&](const Row& row) {
        for (size_t i = 0; i < row.size(); ++i) {
            std::cout << row[i];
            if (i + 1 < row.size()) {
                std::cout << std::string(widths[i] - row[i].size() + 2, ' ');
            }
        }
        std::cout << "\n";
    };

    print_row(header);
    size_t total = 0;
    for (auto w : widths) total += w + 2;
    std::cout << std::string(total > 2 ? total - 2 : total, '-') << "\n";
    for (const auto& row : rows) {
        print_row(row);
    }
}

void PrintSummary(const query::ScanSummary& summary, bool complete) {
    std::cout << "\n" << summary.ToString()
              << ", read " << FormatSize(summary.bytes_read) << "\n";
    for (const auto& warning : summary.warnings) {
        std::cout << "warning: " << warning << "\n";
    }
    if (!complete) {
        std::cout << "Results are incomplete.\n";
    }
}

int Fail(const Status& status) {
    std::cerr << "Error: " << status.ToString() << "\n";
    return 1;
}

int Usage(const cxxopts::Options& options) {
    std::cerr << options.help() << "\n"
              << "Commands:\n"
              << "  manifests <destination-bucket> [--prefix P]\n"
              << "  search <bucket> <inventory-id> <query> [--mode substring|prefix|folder] [-i]"
                 " [--date D] [--limit N]\n"
              << "  size <bucket> <inventory-id> --depth N [--date D]\n"
              << "  refresh <bucket> <inventory-id>\n";
    return 1;
}

std::optional<std::string> DateArg(const cxxopts::ParseResult& args) {
    if (args.count("date")) {
        return args["date"].as<std::string>();
    }
    return std::nullopt;
}

// ================================
// 子命令
// ================================

int RunManifests(query::InventoryQuery& engine,
                 const std::vector<std::string>& params,
                 const cxxopts::ParseResult& args) {
    if (params.size() != 1) {
        std::cerr << "usage: invlens manifests <destination-bucket> [--prefix P]\n";
        return 1;
    }
    auto prefix = args.count("prefix") ? args["prefix"].as<std::string>() : std::string();
    auto found = engine.ListManifests(params[0], prefix);
    if (found.hasError()) {
        return Fail(found.error());
    }

    std::vector<Row> rows;
    for (const auto& loc : found.value()) {
        rows.push_back({loc.source_bucket, loc.inventory_id, loc.latest_date,
                        std::to_string(loc.manifest_count), loc.latest_manifest_key});
    }
    PrintTable({"Source Bucket", "Inventory", "Latest", "Manifests", "Manifest Key"}, rows);
    return 0;
}

int RunSearch(query::InventoryQuery& engine,
              const std::vector<std::string>& params,
              const cxxopts::ParseResult& args) {
    if (params.size() != 3) {
        std::cerr << "usage: invlens search <bucket> <inventory-id> <query> [--mode M] [-i]\n";
        return 1;
    }

    query::SearchOptions search;
    search.query = params[2];
    search.case_insensitive = args.count("ignore-case") > 0;
    auto mode = query::ParseMatchMode(args["mode"].as<std::string>());
    if (mode.hasError()) {
        return Fail(mode.error());
    }
    search.mode = mode.value();
    auto limit = args["limit"].as<uint64_t>();

    auto stream = engine.Search(params[0], params[1], search, DateArg(args), g_cancel);
    if (stream.hasError()) {
        return Fail(stream.error());
    }

    if (search.mode == query::MatchMode::kExactFolder) {
        auto folders = query::SummarizeFolders(*stream.value());
        if (folders.hasError()) {
            return Fail(folders.error());
        }
        std::vector<Row> rows;
        for (const auto& [path, bucket] : folders.value().folders) {
            rows.push_back({path, FormatSize(bucket.total_size), std::to_string(bucket.object_count)});
        }
        PrintTable({"Folder", "Size", "Objects"}, rows);
        PrintSummary(folders.value().summary, folders.value().complete);
        return 0;
    }

    std::vector<Row> rows;
    query::SearchMatch match;
    bool truncated = false;
    while (true) {
        auto more = stream.value()->Next(&match);
        if (more.hasError()) {
            return Fail(more.error());
        }
        if (!more.value()) {
            break;
        }
        const auto& r = match.record;
        rows.push_back({r.key, FormatSize(r.size), r.last_modified, r.storage_class});
        if (limit > 0 && rows.size() >= limit) {
            truncated = true;
            stream.value()->Cancel();
        }
    }

    PrintTable({"Key", "Size", "Last Modified", "Storage Class"}, rows);
    auto summary = stream.value()->Summary();
    if (truncated) {
        std::cout << "\nStopped after " << limit << " matches.";
    }
    PrintSummary(summary, !summary.cancelled && summary.files_failed == 0);
    return 0;
}

int RunSize(query::InventoryQuery& engine,
            const std::vector<std::string>& params,
            const cxxopts::ParseResult& args) {
    if (params.size() != 2 || !args.count("depth")) {
        std::cerr << "usage: invlens size <bucket> <inventory-id> --depth N [--date D]\n";
        return 1;
    }

    auto result = engine.AggregateByDepth(params[0], params[1], args["depth"].as<int>(),
                                          DateArg(args), g_cancel);
    if (result.hasError()) {
        return Fail(result.error());
    }

    std::vector<Row> rows;
    uint64_t total_size = 0;
    uint64_t total_count = 0;
    for (const auto& [path, bucket] : result.value().buckets) {
        rows.push_back({path.empty() ? "/" : path,
                        bucket.is_folder ? "folder" : "object",
                        FormatSize(bucket.total_size),
                        std::to_string(bucket.object_count)});
        total_size += bucket.total_size;
        total_count += bucket.object_count;
    }
    rows.push_back({"Total", "", FormatSize(total_size), std::to_string(total_count)});
    PrintTable({"Path", "Type", "Size", "Objects"}, rows);
    PrintSummary(result.value().summary, result.value().complete);
    return 0;
}

int RunRefresh(query::InventoryQuery& engine, const std::vector<std::string>& params) {
    if (params.size() != 2) {
        std::cerr << "usage: invlens refresh <bucket> <inventory-id>\n";
        return 1;
    }
    auto manifest = engine.Refresh(params[0], params[1]);
    if (manifest.hasError()) {
        return Fail(manifest.error());
    }
    const auto& m = manifest.value();
    std::cout << "Latest manifest: " << m.manifest_key << "\n"
              << "Date: " << m.date << ", format " << inventory::FileFormatName(m.format)
              << ", " << m.files.size() << " files, " << FormatSize(m.TotalBytes()) << "\n";
    return 0;
}

Status LoadConfig(const cxxopts::ParseResult& args, config::EngineConfig* config) {
    config::ApplyEnvironment(config);

    if (args.count("config")) {
        auto res = config::LoadConfigFile(args["config"].as<std::string>(), config);
        if (res.hasError()) {
            return res.error();
        }
    }

    if (args.count("set")) {
        for (const auto& kv : args["set"].as<std::vector<std::string>>()) {
            auto eq = kv.find('=');
            if (eq == std::string::npos) {
                return Status::InvalidArgument("--set expects key=value, got " + kv);
            }
            auto res = config->set(kv.substr(0, eq), kv.substr(eq + 1));
            if (res.hasError()) {
                return res.error();
            }
        }
    }

    auto valid = config->validate();
    return valid.hasError() ? valid.error() : Status::Ok();
}

int Run(const cxxopts::Options& options, const cxxopts::ParseResult& args) {
    if (args.count("help") || !args.count("command")) {
        return Usage(options);
    }

    config::EngineConfig config;
    auto status = LoadConfig(args, &config);
    if (!status.OK()) {
        return Fail(status);
    }
    Logger::Instance()->Init(config.log().file(), config.log().level());

    auto engine = query::InventoryQuery::Create(config);
    if (engine.hasError()) {
        return Fail(engine.error());
    }

    auto command = args["command"].as<std::string>();
    std::vector<std::string> params;
    if (args.count("params")) {
        params = args["params"].as<std::vector<std::string>>();
    }

    // 报告不在源 bucket 本身时需要显式指定位置
    if ((command == "search" || command == "size" || command == "refresh") && params.size() >= 2) {
        auto inv = inventory::InventoryConfig::Default(params[0], params[1]);
        if (args.count("dest-bucket")) {
            inv.destination_bucket = args["dest-bucket"].as<std::string>();
        }
        if (args.count("dest-prefix")) {
            inv.destination_prefix = args["dest-prefix"].as<std::string>();
        }
        engine.value()->RegisterInventory(inv);
    }

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    auto& query_engine = *engine.value();
    if (command == "manifests") return RunManifests(query_engine, params, args);
    if (command == "search") return RunSearch(query_engine, params, args);
    if (command == "size") return RunSize(query_engine, params, args);
    if (command == "refresh") return RunRefresh(query_engine, params);

    std::cerr << "Unknown command: " << command << "\n";
    return Usage(options);
}

} // namespace

int main(int argc, char** argv) {
    cxxopts::Options options("invlens", "Search and size S3 buckets through their S3 Inventory reports");
    options.add_options()
        ("c,config", "Config file (key = value)", cxxopts::value<std::string>())
        ("set", "Override a config item (key=value)", cxxopts::value<std::vector<std::string>>())
        ("dest-bucket", "Bucket holding the inventory reports", cxxopts::value<std::string>())
        ("dest-prefix", "Prefix of the inventory reports", cxxopts::value<std::string>())
        ("prefix", "Prefix to scan for manifests", cxxopts::value<std::string>())
        ("mode", "Match mode: substring, prefix or folder",
         cxxopts::value<std::string>()->default_value("substring"))
        ("i,ignore-case", "Case-insensitive search")
        ("date", "Inventory date (YYYY-MM-DD or YYYY-MM-DDTHH-MMZ)", cxxopts::value<std::string>())
        ("limit", "Stop after N matches (0 = no limit)",
         cxxopts::value<uint64_t>()->default_value("0"))
        ("depth", "Path depth to group by", cxxopts::value<int>())
        ("h,help", "Print usage")
        ("command", "Command", cxxopts::value<std::string>())
        ("params", "Command arguments", cxxopts::value<std::vector<std::string>>());
    options.parse_positional({"command", "params"});
    options.positional_help("<command> [args...]");

    try {
        auto args = options.parse(argc, argv);
        return Run(options, args);
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return Usage(options);
    }
}
