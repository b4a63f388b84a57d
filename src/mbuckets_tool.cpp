// mbuckets: command-line client for the buckets API.
//
// Usage: mbuckets [options] <subcommand> [args]
//
// Subcommands:
//   check                          Report whether the service supports buckets
//   mb <bucket>                    Create a bucket
//   hb <bucket>                    Show bucket headers
//   rb <bucket>                    Delete a bucket
//   ls [bucket]                    List buckets, or objects in a bucket
//   put <bucket> <object> <file>   Upload a file ("-" reads stdin)
//   get <bucket> <object> [file]   Download to a file (default stdout)
//   head <bucket> <object>         Show object headers
//   meta <bucket> <object>         Replace object metadata (-H m-key:value)
//   rm <bucket> <object>           Delete an object

#include "mbuckets/client.hpp"
#include "mbuckets/client_config.hpp"
#include "mbuckets/errors.hpp"
#include "mbuckets/log.hpp"

#include <chrono>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace {

void print_usage() {
    fprintf(stderr,
        "Usage: mbuckets [options] <subcommand> [args]\n"
        "\n"
        "Subcommands:\n"
        "  check                          Report whether the service supports buckets\n"
        "  mb <bucket>                    Create a bucket\n"
        "  hb <bucket>                    Show bucket headers\n"
        "  rb <bucket>                    Delete a bucket\n"
        "  ls [bucket]                    List buckets, or objects in a bucket\n"
        "  put <bucket> <object> <file>   Upload a file (\"-\" reads stdin)\n"
        "  get <bucket> <object> [file]   Download to a file (default stdout)\n"
        "  head <bucket> <object>         Show object headers\n"
        "  meta <bucket> <object>         Replace object metadata (-H m-key:value)\n"
        "  rm <bucket> <object>           Delete an object\n"
        "\n"
        "Options:\n"
        "  --config <path>                JSON config file\n"
        "  --url <url>                    Service URL (or MANTA_URL)\n"
        "  --account <name>               Account (or MANTA_USER)\n"
        "  --key-id <fingerprint>         Signing key fingerprint (or MANTA_KEY_ID)\n"
        "  --key-file <path>              Private key (or MANTA_KEY_FILE, default ~/.ssh/id_rsa)\n"
        "  --insecure                     Skip TLS certificate verification\n"
        "  -H <name:value>                Extra request header (repeatable)\n"
        "  --content-type <type>          Content type for put\n"
        "  --prefix <p>                   ls: only names starting with p\n"
        "  --delimiter <d>                ls: group names by d\n"
        "  --marker <name>                ls: start after name\n"
        "  --limit <N>                    ls: page size (1-1024)\n"
        "  --no-follow                    ls: stop after the first page\n"
        "  --metrics-file <path>          Prometheus .prom file for node_exporter textfile collector\n"
        "  --verbose                      Debug output on stderr\n"
        "  --help                         Show this help\n"
    );
}

void print_headers(const mbuckets::net::HttpHeaders& headers) {
    for (const auto& [name, value] : headers.all()) {
        printf("%s: %s\n", name.c_str(), value.c_str());
    }
}

void print_record(const mbuckets::ListingRecord& record) {
    switch (record.type) {
        case mbuckets::RecordType::Bucket:
            printf("%-24s  %s\n", record.mtime.c_str(), record.name.c_str());
            break;
        case mbuckets::RecordType::BucketObject:
            printf("%-24s  %12" PRIu64 "  %s\n", record.mtime.c_str(),
                   record.size.value_or(0), record.name.c_str());
            break;
        case mbuckets::RecordType::Group:
            printf("%-24s  %12s  %s\n", "", "PRE", record.name.c_str());
            break;
    }
}

bool need_args(const std::vector<std::string>& args, size_t count, const char* usage) {
    if (args.size() < count) {
        fprintf(stderr, "Usage: mbuckets %s\n", usage);
        return false;
    }
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    mbuckets::ClientConfig config;
    std::string config_file;
    std::string url, account, key_id, key_file, metrics_file;
    bool insecure = false;
    bool verbose = false;
    mbuckets::RequestOptions options;
    mbuckets::ListOptions list_options;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next_arg = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                fprintf(stderr, "%s requires argument\n", name);
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--config") {
            auto* v = next_arg("--config"); if (!v) return 1;
            config_file = v;
        } else if (arg == "--url") {
            auto* v = next_arg("--url"); if (!v) return 1;
            url = v;
        } else if (arg == "--account") {
            auto* v = next_arg("--account"); if (!v) return 1;
            account = v;
        } else if (arg == "--key-id") {
            auto* v = next_arg("--key-id"); if (!v) return 1;
            key_id = v;
        } else if (arg == "--key-file") {
            auto* v = next_arg("--key-file"); if (!v) return 1;
            key_file = v;
        } else if (arg == "--insecure") {
            insecure = true;
        } else if (arg == "-H") {
            auto* v = next_arg("-H"); if (!v) return 1;
            std::string header = v;
            size_t colon = header.find(':');
            if (colon == std::string::npos || colon == 0) {
                fprintf(stderr, "invalid header (expected name:value): %s\n", v);
                return 1;
            }
            std::string value = header.substr(colon + 1);
            size_t start = value.find_first_not_of(" \t");
            options.headers.set(header.substr(0, colon),
                                start == std::string::npos ? "" : value.substr(start));
        } else if (arg == "--content-type") {
            auto* v = next_arg("--content-type"); if (!v) return 1;
            options.content_type = v;
        } else if (arg == "--prefix") {
            auto* v = next_arg("--prefix"); if (!v) return 1;
            list_options.prefix = v;
        } else if (arg == "--delimiter") {
            auto* v = next_arg("--delimiter"); if (!v) return 1;
            list_options.delimiter = v;
        } else if (arg == "--marker") {
            auto* v = next_arg("--marker"); if (!v) return 1;
            list_options.marker = v;
        } else if (arg == "--limit") {
            auto* v = next_arg("--limit"); if (!v) return 1;
            list_options.limit = static_cast<uint32_t>(strtoul(v, nullptr, 10));
        } else if (arg == "--no-follow") {
            list_options.follow_pages = false;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg("--metrics-file"); if (!v) return 1;
            metrics_file = v;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "-" || arg[0] != '-') {
            positional.push_back(arg);
        } else {
            fprintf(stderr, "Unknown option: %s\n", arg.c_str());
            print_usage();
            return 1;
        }
    }

    if (positional.empty()) {
        print_usage();
        return 1;
    }

    // Defaults < config file < environment < command line
    if (!config_file.empty() && !config.load_json(config_file)) {
        return 1;
    }
    config.apply_env();
    if (!url.empty()) config.url = url;
    if (!account.empty()) config.account = account;
    if (!key_id.empty()) config.key_id = key_id;
    if (!key_file.empty()) config.key_file = key_file;
    if (!metrics_file.empty()) config.metrics_file = metrics_file;
    if (insecure) config.insecure = true;
    if (verbose) config.verbose = true;
    config.apply_defaults();

    mbuckets::set_verbose(config.verbose);

    auto err = config.validate();
    if (!err.empty()) {
        mbuckets::log_error("%s", err.c_str());
        return 1;
    }

    std::shared_ptr<mbuckets::ClientMetrics> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_shared<mbuckets::ClientMetrics>(
            std::map<std::string, std::string>{{"account", config.account}});
        metrics->start_writer(config.metrics_file,
                              std::chrono::seconds(config.metrics_interval_secs));
    }

    const std::string subcommand = positional[0];
    std::vector<std::string> args(positional.begin() + 1, positional.end());
    int rc = 0;

    try {
        mbuckets::BucketsClient client(config.make_transport(), config.account, metrics);

        if (subcommand == "check") {
            bool supported = client.is_buckets_supported();
            printf("%s\n", supported ? "buckets supported" : "buckets not supported");
            rc = supported ? 0 : 1;
        } else if (subcommand == "mb") {
            if (!need_args(args, 1, "mb <bucket>")) return 1;
            client.create_bucket(args[0], options);
        } else if (subcommand == "hb") {
            if (!need_args(args, 1, "hb <bucket>")) return 1;
            print_headers(client.head_bucket(args[0], options).headers);
        } else if (subcommand == "rb") {
            if (!need_args(args, 1, "rb <bucket>")) return 1;
            client.delete_bucket(args[0], options);
        } else if (subcommand == "ls") {
            auto stream = args.empty() ? client.list_buckets(list_options)
                                       : client.list_bucket_objects(args[0], list_options);
            while (auto record = stream->next()) {
                print_record(*record);
            }
        } else if (subcommand == "put") {
            if (!need_args(args, 3, "put <bucket> <object> <file>")) return 1;
            mbuckets::ResponseInfo info;
            if (args[2] == "-") {
                mbuckets::IstreamSource source(std::cin);
                info = client.create_bucket_object(args[0], args[1], source, options);
            } else {
                mbuckets::FileSource source(args[2]);
                auto sized = options;
                sized.content_length = source.size();
                info = client.create_bucket_object(args[0], args[1], source, sized);
            }
            if (auto etag = info.etag()) {
                printf("%s\n", etag->c_str());
            }
        } else if (subcommand == "get") {
            if (!need_args(args, 2, "get <bucket> <object> [file]")) return 1;
            auto reader = client.get_bucket_object(args[0], args[1], options);
            uint64_t bytes = 0;
            if (args.size() > 2) {
                std::ofstream ofs(args[2], std::ios::binary | std::ios::trunc);
                if (!ofs) {
                    mbuckets::log_error("cannot open %s", args[2].c_str());
                    return 1;
                }
                bytes = reader.write_to(ofs);
            } else {
                bytes = reader.write_to(std::cout);
                std::cout.flush();
            }
            mbuckets::log_debug("received %" PRIu64 " bytes", bytes);
            if (reader.content_md5() && !reader.matches_content_md5()) {
                mbuckets::log_error("MD5 mismatch: expected %s, computed %s",
                                    reader.content_md5()->c_str(),
                                    reader.computed_md5().value_or("").c_str());
                rc = 1;
            }
        } else if (subcommand == "head") {
            if (!need_args(args, 2, "head <bucket> <object>")) return 1;
            print_headers(client.head_bucket_object(args[0], args[1], options).headers);
        } else if (subcommand == "meta") {
            if (!need_args(args, 2, "meta <bucket> <object>")) return 1;
            client.put_bucket_object_metadata(args[0], args[1], {}, options);
        } else if (subcommand == "rm") {
            if (!need_args(args, 2, "rm <bucket> <object>")) return 1;
            client.delete_bucket_object(args[0], args[1], options);
        } else {
            fprintf(stderr, "Unknown subcommand: %s\n", subcommand.c_str());
            print_usage();
            return 1;
        }

        client.close();
    } catch (const mbuckets::BucketsError& e) {
        mbuckets::log_error("%s: %s", mbuckets::error_kind_name(e.kind()), e.what());
        rc = 1;
    } catch (const std::exception& e) {
        mbuckets::log_error("%s", e.what());
        rc = 1;
    }

    if (metrics) {
        metrics->stop_writer();
    }
    return rc;
}
