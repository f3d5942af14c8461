#include "segxfer/checksum.hpp"
#include "segxfer/errors.hpp"
#include "segxfer/file_entry_registry.hpp"
#include "segxfer/file_store_manager.hpp"
#include "segxfer/file_store_service.hpp"
#include "segxfer/file_transfer_client.hpp"
#include "segxfer/logging.hpp"
#include "segxfer/tcp_transport.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

int main() {
    namespace fs = std::filesystem;
    segxfer::set_log_level(segxfer::LogLevel::error);
    auto root = fs::temp_directory_path() / "segxfer_tcp_test";
    fs::remove_all(root);

    segxfer::FileEntryRegistry registry;
    segxfer::FileStoreManager manager({root / "store", std::nullopt}, registry);
    segxfer::FileStoreService service(manager, "node-1");
    auto server = std::make_unique<segxfer::TcpServer>("127.0.0.1", 0, service.handler());
    const std::uint16_t port = server->port();
    assert(port != 0);
    std::thread server_thread([&server]() { server->run(); });

    {
        segxfer::TcpTransport transport("127.0.0.1", port, std::chrono::milliseconds(5000));
        segxfer::FileTransferClient client(transport, "node-1");

        std::string content(10000, '\0');
        for (std::size_t i = 0; i < content.size(); ++i) {
            content[i] = static_cast<char>(i % 256);
        }
        std::istringstream stream(content);
        std::size_t updates = 0;
        auto result = client.store_file_from_stream(stream, "over/tcp.bin", content.size(), 4096,
                                                    [&](const segxfer::SegmentProgress &) { ++updates; });
        assert(updates == 3);
        assert(result.size == content.size());
        assert(result.hashes.at("sha256") == segxfer::Checksum::sha256_hex(content));

        std::ifstream stored(manager.storage_dir() / "over/tcp.bin", std::ios::binary);
        std::string on_disk((std::istreambuf_iterator<char>(stored)), std::istreambuf_iterator<char>());
        assert(on_disk == content);

        // Service errors arrive typed and leave the connection usable.
        std::istringstream escape("x");
        try {
            client.store_file_from_stream(escape, "../escape.bin", 1, 16);
            assert(false);
        } catch (const segxfer::TransferError &err) {
            assert(err.kind() == segxfer::ErrorKind::validation);
        }

        segxfer::Request unknown;
        unknown.topic = "/not/served";
        auto response = transport.request(unknown);
        assert(response.error == segxfer::ErrorKind::validation);

        std::istringstream small("tiny");
        auto tiny = client.store_file_from_stream(small, "tiny.txt", 4, 16);
        assert(tiny.size == 4);
        assert(manager.active_transfers() == 0);
    }

    // Threads of closed connections do not pile up on a long-running server.
    segxfer::Request ping;
    ping.topic = "/not/served";
    for (int i = 0; i < 20; ++i) {
        segxfer::TcpTransport short_lived("127.0.0.1", port, std::chrono::milliseconds(5000));
        assert(short_lived.request(ping).error == segxfer::ErrorKind::validation);
    }
    bool reaped = false;
    for (int attempt = 0; attempt < 200 && !reaped; ++attempt) {
        {
            segxfer::TcpTransport next("127.0.0.1", port, std::chrono::milliseconds(5000));
            next.request(ping);
        }
        reaped = server->worker_count() <= 2;
        if (!reaped) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    assert(reaped);

    server->stop();
    server_thread.join();
    server.reset();

    bool refused = false;
    try {
        segxfer::TcpTransport closed("127.0.0.1", port, std::chrono::milliseconds(500));
    } catch (const segxfer::TransportError &) {
        refused = true;
    }
    assert(refused);

    fs::remove_all(root);
    return 0;
}
