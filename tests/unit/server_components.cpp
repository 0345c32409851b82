#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <iterator>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/local/connect_pair.hpp>
#include <asio/local/stream_protocol.hpp>

#include <nlohmann/json.hpp>

#include "minishare/channel.hpp"
#include "minishare/crypto.hpp"
#include "minishare/protocol.hpp"
#include "minishare/server/config.hpp"
#include "minishare/server/file_store.hpp"
#include "minishare/server/session.hpp"
#include "minishare/server/session_registry.hpp"
#include "minishare/transfer.hpp"

using namespace minishare;
using namespace minishare::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path fresh_directory(const std::string &name)
    {
        const auto path = std::filesystem::temp_directory_path() / name;
        cleanup_path(path);
        std::filesystem::create_directories(path);
        return path;
    }

    std::string patterned_content(std::size_t size)
    {
        std::string content(size, '\0');
        for (std::size_t i = 0; i < size; ++i)
        {
            content[i] = static_cast<char>((i * 31 + 7) % 251);
        }
        return content;
    }

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    template <typename Fn>
    std::optional<ErrorCode> error_code_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const Error &ex)
        {
            return ex.code();
        }
        return std::nullopt;
    }

    struct SocketPair
    {
        asio::io_context io_context;
        asio::local::stream_protocol::socket server_side{io_context};
        asio::local::stream_protocol::socket client_side{io_context};

        SocketPair() { asio::local::connect_pair(server_side, client_side); }
    };

    void test_server_config()
    {
        ServerConfig defaults;
        assert(defaults.port == 8080);
        assert(defaults.root == std::filesystem::path("shared_files"));
        assert(defaults.max_sessions == 10);
        assert(defaults.grace_period == std::chrono::seconds(5));
        assert(!defaults.read_timeout.has_value());

        ServerConfig config;
        from_json(nlohmann::json::parse(R"({"port": 9000, "root": "/tmp/share", "max_sessions": 3,
                                             "grace_period_ms": 250, "read_timeout_ms": 1000,
                                             "log_level": "debug"})"),
                  config);
        assert(config.port == 9000);
        assert(config.root == std::filesystem::path("/tmp/share"));
        assert(config.max_sessions == 3);
        assert(config.grace_period == std::chrono::milliseconds(250));
        assert(config.read_timeout == std::chrono::milliseconds(1000));
        assert(config.log_level == "debug");
        assert(config.address == "0.0.0.0");

        const auto dir = fresh_directory("minishare_config_test");
        const auto file = dir / "server.json";
        write_file(file, R"({"address": "127.0.0.1", "log_file": "server.log"})");
        const auto loaded = load_server_config(file);
        assert(loaded.address == "127.0.0.1");
        assert(loaded.log_file == std::filesystem::path("server.log"));
        assert(loaded.port == 8080);

        auto rejects = [&](const std::string &document)
        {
            write_file(file, document);
            try
            {
                (void)load_server_config(file);
            }
            catch (const std::invalid_argument &)
            {
                return true;
            }
            return false;
        };
        assert(rejects(R"({"max_sessions": 0})"));
        assert(rejects(R"({"read_timeout_ms": -5})"));
        assert(rejects(R"({"read_timeout_ms": 0})"));
        assert(rejects(R"({"read_timeout_ms": 3000000000})"));
        assert(rejects(R"({"grace_period_ms": -1})"));
        assert(!rejects(R"({"read_timeout_ms": 2147483647, "grace_period_ms": 0})"));
        assert(checked_read_timeout(1) == std::chrono::milliseconds(1));
        cleanup_path(dir);
    }

    void test_file_store()
    {
        const auto root = fresh_directory("minishare_store_test");
        FileStore store(root);
        assert(store.list().empty());

        {
            auto staged = store.stage("b.txt");
            write_file(staged.path(), "bravo");
            assert(store.list().empty());
            staged.commit();
        }
        {
            auto staged = store.stage("a.txt");
            write_file(staged.path(), "alpha!");
            staged.commit();
        }
        {
            auto abandoned = store.stage("c.txt");
            write_file(abandoned.path(), "never committed");
        }

        const auto entries = store.list();
        assert(entries.size() == 2);
        assert(entries[0].name == "a.txt" && entries[0].size == 6);
        assert(entries[1].name == "b.txt" && entries[1].size == 5);
        assert(!store.exists("c.txt"));

        assert(store.stat("b.txt").size == 5);
        assert(store.resolve("a.txt") == root / "a.txt");

        assert(error_code_of([&]
                             { (void)store.resolve("../escape"); }) == ErrorCode::InvalidName);
        assert(error_code_of([&]
                             { (void)store.stat("missing.txt"); }) == ErrorCode::NotFound);
        assert(error_code_of([&]
                             { (void)store.stage("a/b"); }) == ErrorCode::InvalidName);

        store.remove("a.txt");
        assert(!store.exists("a.txt"));
        bool not_found = false;
        try
        {
            store.remove("a.txt");
        }
        catch (const StoreError &ex)
        {
            not_found = ex.code() == ErrorCode::NotFound && std::string(ex.what()) == "not found: a.txt";
        }
        assert(not_found);

        cleanup_path(root);
    }

    void test_file_store_open_outlives_delete()
    {
        const auto root = fresh_directory("minishare_store_open_test");
        FileStore store(root);
        const auto content = patterned_content(2 * transfer::kChunkSize + 9);
        write_file(root / "kept.bin", content);

        auto opened = store.open("kept.bin");
        assert(opened.entry.name == "kept.bin");
        assert(opened.entry.size == content.size());
        store.remove("kept.bin");
        assert(!store.exists("kept.bin"));
        const std::string streamed(std::istreambuf_iterator<char>(opened.stream), std::istreambuf_iterator<char>{});
        assert(streamed == content);

        assert(error_code_of([&]
                             { (void)store.open("kept.bin"); }) == ErrorCode::NotFound);
        assert(error_code_of([&]
                             { (void)store.open("../kept.bin"); }) == ErrorCode::InvalidName);
        std::filesystem::create_directory(root / "folder");
        assert(error_code_of([&]
                             { (void)store.open("folder"); }) == ErrorCode::NotFound);
        cleanup_path(root);
    }

    void test_file_store_purges_stale_staging()
    {
        const auto root = fresh_directory("minishare_store_purge_test");
        {
            FileStore store(root);
            auto staged = store.stage("left_behind.bin");
            write_file(staged.path(), "partial");
            // Simulate a crash: the staging file outlives the process.
            std::filesystem::copy_file(staged.path(), staged.path().parent_path() / "crashed.bin.0.part");
        }

        FileStore reopened(root);
        assert(reopened.list().empty());
        std::size_t leftovers = 0;
        for (const auto &entry : std::filesystem::recursive_directory_iterator(root))
        {
            if (entry.is_regular_file())
            {
                ++leftovers;
            }
        }
        assert(leftovers == 0);
        cleanup_path(root);
    }

    void test_transfer_roundtrip()
    {
        const auto dir = fresh_directory("minishare_transfer_test");
        const auto source = dir / "source.bin";
        const auto destination = dir / "destination.bin";
        const auto content = patterned_content(3 * transfer::kChunkSize + 123);
        write_file(source, content);

        SocketPair sockets;
        FramedChannel sender(FramedChannel::Socket(std::move(sockets.client_side)));
        FramedChannel receiver(FramedChannel::Socket(std::move(sockets.server_side)));

        std::vector<transfer::TransferProgress> updates;
        auto sent = std::async(std::launch::async, [&]
                               { return transfer::send_file(sender, source, content.size()); });
        const auto received = transfer::receive_file(receiver, destination, content.size(),
                                                     [&](const transfer::TransferProgress &progress)
                                                     { updates.push_back(progress); });
        const auto sent_result = sent.get();

        assert(read_file(destination) == content);
        assert(received.bytes == content.size());
        assert(sent_result.bytes == content.size());
        assert(received.digest == sent_result.digest);
        assert(received.digest == crypto::hash_file(source));

        assert(updates.size() == 4);
        assert(std::is_sorted(updates.begin(), updates.end(), [](const auto &lhs, const auto &rhs)
                              { return lhs.bytes_transferred < rhs.bytes_transferred; }));
        assert(updates.back().complete());

        cleanup_path(dir);
    }

    void test_truncated_receive_leaves_nothing()
    {
        const auto dir = fresh_directory("minishare_truncated_test");
        const auto destination = dir / "partial.bin";

        SocketPair sockets;
        FramedChannel sender(FramedChannel::Socket(std::move(sockets.client_side)));
        FramedChannel receiver(FramedChannel::Socket(std::move(sockets.server_side)));

        const auto content = patterned_content(100);
        sender.write_bytes(std::as_bytes(std::span(content.data(), content.size())));
        sender.flush();
        sender.close();

        std::optional<ErrorCode> code;
        try
        {
            (void)transfer::receive_file(receiver, destination, 1000);
        }
        catch (const transfer::TransferError &ex)
        {
            code = ex.code();
        }
        assert(code == ErrorCode::StreamTruncated);
        assert(!std::filesystem::exists(destination));

        cleanup_path(dir);
    }

    void test_unwritable_destination_drains_payload()
    {
        const auto dir = fresh_directory("minishare_unwritable_test");
        const auto destination = dir / "missing_subdir" / "file.bin";

        SocketPair sockets;
        FramedChannel sender(FramedChannel::Socket(std::move(sockets.client_side)));
        FramedChannel receiver(FramedChannel::Socket(std::move(sockets.server_side)));

        const auto content = patterned_content(500);
        sender.write_bytes(std::as_bytes(std::span(content.data(), content.size())));
        sender.write_text("NEXT");
        sender.flush();

        std::optional<ErrorCode> code;
        try
        {
            (void)transfer::receive_file(receiver, destination, content.size());
        }
        catch (const transfer::TransferError &ex)
        {
            code = ex.code();
        }
        assert(code == ErrorCode::LocalIOError);
        assert(receiver.read_text() == "NEXT");

        cleanup_path(dir);
    }

    void test_send_missing_source()
    {
        SocketPair sockets;
        FramedChannel sender(FramedChannel::Socket(std::move(sockets.client_side)));
        const auto code = error_code_of([&]
                                        { (void)transfer::send_file(sender, "/nonexistent/minishare.bin", 10); });
        assert(code == ErrorCode::LocalIOError);
    }

    void test_session_registry()
    {
        SocketPair sockets;
        const auto root = fresh_directory("minishare_registry_test");
        FileStore store(root);
        auto session = std::make_shared<Session>(FramedChannel::Socket(std::move(sockets.server_side)), "test",
                                                 SessionServices{store, std::nullopt});

        SessionRegistry registry;
        assert(registry.try_register(session));
        assert(registry.size() == 1);
        assert(!registry.wait_until_empty(std::chrono::milliseconds(10)));

        registry.request_stop_all();
        assert(!registry.try_register(session));

        registry.unregister(session.get());
        assert(registry.size() == 0);
        assert(registry.wait_until_empty(std::chrono::milliseconds(0)));
        cleanup_path(root);
    }

    void test_session_command_loop()
    {
        const auto root = fresh_directory("minishare_session_test");
        FileStore store(root);

        SocketPair sockets;
        Session session(FramedChannel::Socket(std::move(sockets.server_side)), "local-peer",
                        SessionServices{store, std::nullopt});
        FramedChannel client(FramedChannel::Socket(std::move(sockets.client_side)));
        std::thread worker([&]
                           { session.run(); });

        using namespace minishare::protocol;

        write_command(client, Command::list());
        client.flush();
        assert(read_text_response(client).message == "No files available on the server.");

        write_command(client, Command{.kind = CommandKind::Unknown, .raw = "HELLO"});
        client.flush();
        const auto unknown = read_text_response(client);
        assert(!unknown.ok() && unknown.message == valid_commands_message());

        const std::string rejected = "12345";
        write_command(client, Command::upload("../evil.txt", rejected.size()));
        client.write_bytes(std::as_bytes(std::span(rejected.data(), rejected.size())));
        client.flush();
        const auto invalid = read_text_response(client);
        assert(!invalid.ok() && invalid.message == "Invalid filename");

        const std::string payload = "hello world";
        write_command(client, Command::upload("greeting.txt", payload.size()));
        client.write_bytes(std::as_bytes(std::span(payload.data(), payload.size())));
        client.flush();
        const auto uploaded = read_text_response(client);
        assert(uploaded.ok() && uploaded.message == "uploaded: greeting.txt");
        assert(read_file(root / "greeting.txt") == payload);

        write_command(client, Command::download("greeting.txt"));
        client.flush();
        const auto header = read_download_header(client);
        assert(header.kind == ResponseKind::OkWithPayload && header.size == payload.size());
        std::string echoed(header.size, '\0');
        client.read_exactly(std::as_writable_bytes(std::span(echoed.data(), echoed.size())));
        assert(echoed == payload);

        write_command(client, Command::download("absent.txt"));
        client.flush();
        const auto refused = read_download_header(client);
        assert(!refused.ok() && refused.message == "not found: absent.txt");

        write_command(client, Command::remove("greeting.txt"));
        client.flush();
        assert(read_text_response(client).message == "deleted: greeting.txt");

        write_command(client, Command::remove("greeting.txt"));
        client.flush();
        const auto gone = read_text_response(client);
        assert(!gone.ok() && gone.message == "not found: greeting.txt");

        write_command(client, Command::quit());
        client.flush();
        assert(read_text_response(client).message == "Goodbye! Connection closed.");

        worker.join();
        assert(session.state() == SessionState::Closed);
        cleanup_path(root);
    }

    void test_session_truncated_upload()
    {
        const auto root = fresh_directory("minishare_session_truncated_test");
        FileStore store(root);

        SocketPair sockets;
        Session session(FramedChannel::Socket(std::move(sockets.server_side)), "local-peer",
                        SessionServices{store, std::nullopt});
        FramedChannel client(FramedChannel::Socket(std::move(sockets.client_side)));
        std::thread worker([&]
                           { session.run(); });

        const std::string partial(64, 'x');
        protocol::write_command(client, protocol::Command::upload("big.bin", 4096));
        client.write_bytes(std::as_bytes(std::span(partial.data(), partial.size())));
        client.flush();
        client.close();

        worker.join();
        assert(session.state() == SessionState::Closed);
        assert(store.list().empty());
        std::size_t leftovers = 0;
        for (const auto &entry : std::filesystem::recursive_directory_iterator(root))
        {
            if (entry.is_regular_file())
            {
                ++leftovers;
            }
        }
        assert(leftovers == 0);
        cleanup_path(root);
    }

    void test_session_download_of_deleted_file()
    {
        const auto root = fresh_directory("minishare_session_deleted_test");
        FileStore store(root);
        write_file(root / "fleeting.txt", "here for a moment");

        SocketPair sockets;
        Session session(FramedChannel::Socket(std::move(sockets.server_side)), "local-peer",
                        SessionServices{store, std::nullopt});
        FramedChannel client(FramedChannel::Socket(std::move(sockets.client_side)));
        std::thread worker([&]
                           { session.run(); });

        using namespace minishare::protocol;

        write_command(client, Command::list());
        client.flush();
        assert(read_text_response(client).message.find("fleeting.txt") != std::string::npos);

        // Another client deletes the file after this one listed it.
        std::filesystem::remove(root / "fleeting.txt");
        write_command(client, Command::download("fleeting.txt"));
        client.flush();
        const auto refused = read_download_header(client);
        assert(refused.kind == ResponseKind::Error && refused.message == "not found: fleeting.txt");

        assert(session.state() == SessionState::Active);
        write_command(client, Command::list());
        client.flush();
        assert(read_text_response(client).message == "No files available on the server.");

        write_command(client, Command::quit());
        client.flush();
        assert(read_text_response(client).ok());
        worker.join();
        cleanup_path(root);
    }

    void test_session_download_source_truncated()
    {
        const auto root = fresh_directory("minishare_session_short_source_test");
        const auto downloads = fresh_directory("minishare_session_short_source_downloads");
        FileStore store(root);
        // Larger than everything the socket and channel buffers can hold.
        const auto content = patterned_content(4 * 1024 * 1024);
        write_file(root / "shrinking.bin", content);

        SocketPair sockets;
        Session session(FramedChannel::Socket(std::move(sockets.server_side)), "local-peer",
                        SessionServices{store, std::nullopt});
        FramedChannel client(FramedChannel::Socket(std::move(sockets.client_side)));
        std::thread worker([&]
                           { session.run(); });

        protocol::write_command(client, protocol::Command::download("shrinking.bin"));
        client.flush();
        const auto header = protocol::read_download_header(client);
        assert(header.kind == protocol::ResponseKind::OkWithPayload && header.size == content.size());

        std::filesystem::resize_file(root / "shrinking.bin", 0);

        const auto partial = downloads / "shrinking.bin.part";
        std::optional<ErrorCode> code;
        try
        {
            (void)transfer::receive_file(client, partial, header.size);
        }
        catch (const transfer::TransferError &ex)
        {
            code = ex.code();
        }
        assert(code == ErrorCode::StreamTruncated);
        assert(!std::filesystem::exists(partial));

        worker.join();
        assert(session.state() == SessionState::Closed);
        cleanup_path(root);
        cleanup_path(downloads);
    }

    void test_session_stop_wakes_idle()
    {
        const auto root = fresh_directory("minishare_session_stop_test");
        FileStore store(root);

        SocketPair sockets;
        Session session(FramedChannel::Socket(std::move(sockets.server_side)), "idle-peer",
                        SessionServices{store, std::nullopt});
        FramedChannel client(FramedChannel::Socket(std::move(sockets.client_side)));
        auto finished = std::async(std::launch::async, [&]
                                   { session.run(); });

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        assert(finished.wait_for(std::chrono::milliseconds(0)) == std::future_status::timeout);

        session.request_stop();
        assert(finished.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
        assert(session.state() == SessionState::Closed);

        bool closed = false;
        try
        {
            (void)client.read_text();
        }
        catch (const ChannelError &)
        {
            closed = true;
        }
        assert(closed);
        cleanup_path(root);
    }

} // namespace

void run_server_component_tests()
{
    test_server_config();
    test_file_store();
    test_file_store_open_outlives_delete();
    test_file_store_purges_stale_staging();
    test_transfer_roundtrip();
    test_truncated_receive_leaves_nothing();
    test_unwritable_destination_drains_payload();
    test_send_missing_source();
    test_session_registry();
    test_session_command_loop();
    test_session_truncated_upload();
    test_session_download_of_deleted_file();
    test_session_download_source_truncated();
    test_session_stop_wakes_idle();
}
