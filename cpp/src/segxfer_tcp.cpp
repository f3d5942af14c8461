#include "segxfer/config.hpp"
#include "segxfer/file_entry_registry.hpp"
#include "segxfer/file_store_manager.hpp"
#include "segxfer/file_store_service.hpp"
#include "segxfer/file_transfer_client.hpp"
#include "segxfer/logging.hpp"
#include "segxfer/tcp_transport.hpp"
#include "segxfer/wire.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

class Error : public std::runtime_error {
   public:
    explicit Error(const std::string &msg) : std::runtime_error(msg) {}
};

struct CommonOptions {
    std::optional<std::filesystem::path> config;
    std::optional<std::string> service_id;
    std::optional<std::string> log_level;
};

struct ServeOptions {
    CommonOptions common;
    std::optional<std::string> bind_address;
    std::optional<std::uint16_t> port;
    std::optional<std::filesystem::path> storage_dir;
    std::optional<std::filesystem::path> working_dir;
};

struct StoreFileOptions {
    CommonOptions common;
    std::string host;
    std::optional<std::uint16_t> port;
    std::filesystem::path file;
    std::string name;
    std::optional<std::size_t> segment_size;
    std::optional<std::uint64_t> timeout_ms;
};

std::uint64_t to_number(const std::string &option, const std::string &value, std::uint64_t max_value) {
    std::uint64_t parsed = 0;
    if (!segxfer::parse_uint64(value, parsed) || parsed > max_value) {
        throw Error("invalid value for " + option + ": " + value);
    }
    return parsed;
}

bool parse_common(const std::string &arg, int &i, int argc, char **argv, CommonOptions &opts) {
    if (arg == "--config" && i + 1 < argc) {
        opts.config = std::filesystem::path(argv[++i]);
    } else if (arg == "--service-id" && i + 1 < argc) {
        opts.service_id = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
        opts.log_level = argv[++i];
    } else {
        return false;
    }
    return true;
}

segxfer::AppConfig resolve_config(const CommonOptions &opts) {
    segxfer::AppConfig config;
    if (opts.config) {
        config = segxfer::load_config(*opts.config);
    }
    if (opts.service_id) {
        config.service.service_id = *opts.service_id;
    }
    if (opts.log_level && !segxfer::parse_log_level(*opts.log_level, config.log_level)) {
        throw Error("invalid log level: " + *opts.log_level);
    }
    segxfer::set_log_level(config.log_level);
    return config;
}

ServeOptions parse_serve(int argc, char **argv) {
    ServeOptions opts;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (parse_common(arg, i, argc, argv, opts.common)) {
            continue;
        }
        if (arg == "--bind" && i + 1 < argc) {
            opts.bind_address = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            opts.port = static_cast<std::uint16_t>(to_number(arg, argv[++i], 65535));
        } else if (arg == "--storage-dir" && i + 1 < argc) {
            opts.storage_dir = std::filesystem::path(argv[++i]);
        } else if (arg == "--working-dir" && i + 1 < argc) {
            opts.working_dir = std::filesystem::path(argv[++i]);
        } else {
            throw Error("unknown or incomplete option: " + arg);
        }
    }
    return opts;
}

StoreFileOptions parse_store(int argc, char **argv) {
    StoreFileOptions opts;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (parse_common(arg, i, argc, argv, opts.common)) {
            continue;
        }
        if (arg == "--host" && i + 1 < argc) {
            opts.host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            opts.port = static_cast<std::uint16_t>(to_number(arg, argv[++i], 65535));
        } else if (arg == "--file" && i + 1 < argc) {
            opts.file = argv[++i];
        } else if (arg == "--name" && i + 1 < argc) {
            opts.name = argv[++i];
        } else if (arg == "--segment-size" && i + 1 < argc) {
            opts.segment_size = static_cast<std::size_t>(to_number(arg, argv[++i], 1ull << 30));
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            opts.timeout_ms = to_number(arg, argv[++i], 24ull * 60 * 60 * 1000);
        } else {
            throw Error("unknown or incomplete option: " + arg);
        }
    }
    if (opts.host.empty() || opts.file.empty()) {
        throw Error("missing required store options");
    }
    if (opts.name.empty()) {
        opts.name = opts.file.filename().string();
    }
    return opts;
}

void run_serve(const ServeOptions &opts) {
    segxfer::AppConfig config = resolve_config(opts.common);
    if (opts.bind_address) {
        config.service.bind_address = *opts.bind_address;
    }
    if (opts.port) {
        config.service.port = *opts.port;
    }
    if (opts.storage_dir) {
        config.store.storage_dir = *opts.storage_dir;
    }
    if (opts.working_dir) {
        config.store.working_dir = *opts.working_dir;
    }
    if (config.store.storage_dir.empty()) {
        throw Error("missing --storage-dir option");
    }

    segxfer::FileEntryRegistry registry;
    segxfer::FileStoreManager manager(config.store, registry);
    segxfer::FileStoreService service(manager, config.service.service_id);
    segxfer::TcpServer server(config.service.bind_address, config.service.port, service.handler());
    std::cout << "PORT=" << server.port() << std::endl;
    std::cout << "TOPIC=" << service.topic() << std::endl;
    server.run();
}

void run_store(const StoreFileOptions &opts) {
    segxfer::AppConfig config = resolve_config(opts.common);
    if (opts.port) {
        config.service.port = *opts.port;
    }
    if (opts.segment_size) {
        if (*opts.segment_size == 0) {
            throw Error("segment size must be > 0");
        }
        config.client.max_segment_size = *opts.segment_size;
    }
    if (opts.timeout_ms) {
        config.client.response_timeout = std::chrono::milliseconds(static_cast<std::int64_t>(*opts.timeout_ms));
    }
    if (config.service.port == 0) {
        throw Error("missing --port option");
    }

    segxfer::TcpTransport transport(opts.host, config.service.port, config.client.response_timeout);
    segxfer::FileTransferClient client(transport, config.service.service_id);

    const auto start = std::chrono::steady_clock::now();
    auto result = client.store_file(
        opts.file, opts.name, config.client.max_segment_size, [](const segxfer::SegmentProgress &progress) {
            std::uint64_t percent = 100;
            if (progress.total_segments && *progress.total_segments != 0) {
                percent = progress.segments_received * 100 / *progress.total_segments;
            }
            std::cout << "\rPercent complete: " << percent << "%" << std::flush;
        });
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    std::cout << "\nfile_id=" << result.file_id << "\nsize=" << result.size << std::endl;
    for (const auto &hash : result.hashes) {
        std::cout << "hash_" << hash.first << "=" << hash.second << std::endl;
    }
    std::cout << "Elapsed time (ms): " << elapsed.count() << std::endl;
}

void print_usage() {
    std::cerr << "Usage:\n"
                 "  segxfer_tcp serve --storage-dir <path> [--working-dir <path>] [--bind <host>] "
                 "[--port <port>] [--service-id <id>] [--config <file>] [--log-level <level>]\n"
                 "  segxfer_tcp store --host <host> --port <port> --file <path> [--name <name>] "
                 "[--segment-size <bytes>] [--timeout-ms <ms>] [--service-id <id>] [--config <file>] "
                 "[--log-level <level>]\n";
}

}  // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        print_usage();
        return EXIT_FAILURE;
    }

    std::string mode = argv[1];
    try {
        if (mode == "serve") {
            run_serve(parse_serve(argc - 2, argv + 2));
        } else if (mode == "store") {
            run_store(parse_store(argc - 2, argv + 2));
        } else if (mode == "--help" || mode == "-h") {
            print_usage();
            return EXIT_SUCCESS;
        } else {
            throw Error("unknown mode: " + mode);
        }
    } catch (const Error &err) {
        std::cerr << "error: " << err.what() << std::endl;
        print_usage();
        return EXIT_FAILURE;
    } catch (const std::exception &err) {
        std::cerr << "\nerror: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
