// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Elevation encoder reader
//
// Connects to the encoder controller over TCP and writes the raw record
// stream to rotating capture files under <base>/<YYYY>/<MM>/<DD>/, while
// decoding the latest encoder timestamp. With --records N it instead
// captures exactly N records into a single file without decoding.

#include "elenccxx/Errors.h"
#include "elenccxx/IngestLoop.h"
#include "elenccxx/LockFile.h"
#include "elenccxx/Numerology.h"
#include "elenccxx/PathNaming.h"
#include "elenccxx/ReaderConfig.h"
#include "elenccxx/RotationController.h"
#include "elenccxx/TcpClient.h"

#include <boost/program_options.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

const char VERSION[] = "1.0";

using namespace elenc;

struct Config
{
    ReaderConfig reader;
    uint64_t bulk_records = 0;      // 0: rotating capture
    std::string output;             // bulk capture file, dated path if empty
    bool quiet = false;

    static std::optional<Config> parse(int argc, char* argv[])
    {
        namespace po = boost::program_options;

        Config result;
        std::string base_dir;
        std::string lock_path;

        po::options_description desc("Program options");
        desc.add_options()
            ("help,h", "Print this help message and exit.")
            ("version,V", "Print the application version and exit.")
            ("ip,i", po::value<std::string>(&result.reader.peer_address)->default_value(default_peer_address),
                "encoder controller IP address")
            ("port,p", po::value<uint16_t>(&result.reader.peer_port)->default_value(default_peer_port),
                "encoder controller TCP port")
            ("chunk,c", po::value<size_t>(&result.reader.chunk_bytes)->default_value(default_chunk_bytes),
                "maximum bytes per read")
            ("file-length,n", po::value<uint64_t>(&result.reader.file_records)->default_value(default_file_records),
                "records per rotating file")
            ("base-dir,d", po::value<std::string>(&base_dir)->default_value(default_base_dir),
                "output base directory")
            ("lock,L", po::value<std::string>(&lock_path)->default_value(default_lock_path),
                "lock file preventing a second instance")
            ("settle", po::value<unsigned>(&result.reader.settle_ms)->default_value(default_settle_ms),
                "milliseconds to wait after connecting")
            ("records,N", po::value<uint64_t>(&result.bulk_records)->default_value(0),
                "capture exactly N records into one file, then exit")
            ("output,o", po::value<std::string>(&result.output),
                "output file for --records (default: dated path under base-dir)")
            ("verbose,v", po::bool_switch(&result.reader.verbose), "verbose output")
            ("debug,D", po::bool_switch(&result.reader.debug), "debug-level output")
            ("quiet,q", po::bool_switch(&result.quiet), "silence all output")
            ;

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help"))
        {
            std::cout << "Record the elevation encoder stream to rotating files\n"
                << desc << std::endl;
            return std::nullopt;
        }

        if (vm.count("version"))
        {
            std::cout << argv[0] << ": " << VERSION << std::endl;
            return std::nullopt;
        }

        try {
            po::notify(vm);
        } catch (std::exception& ex)
        {
            std::cerr << ex.what() << std::endl;
            std::cout << desc << std::endl;
            return std::nullopt;
        }

        if (result.reader.debug + result.reader.verbose + result.quiet > 1)
        {
            std::cerr << "Only one of quiet, verbose or debug may be chosen." << std::endl;
            return std::nullopt;
        }

        if (result.reader.debug) result.reader.verbose = true;

        if (!result.output.empty() && result.bulk_records == 0)
        {
            std::cerr << "--output requires --records." << std::endl;
            return std::nullopt;
        }

        result.reader.base_dir = base_dir;
        result.reader.lock_path = lock_path;

        return result;
    }
};

volatile sig_atomic_t running = 1;

void signal_handler(int)
{
    running = 0;
}

// No SA_RESTART: a blocked recv() must return EINTR so the loop sees the flag.
void install_signal_handlers()
{
    struct sigaction sa = {};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);
}

void print_banner(const Config& config)
{
    const auto& r = config.reader;
    std::cerr << "elenc-reader " << VERSION << "\n";
    std::cerr << "  Peer:      " << r.peer_address << ":" << r.peer_port << "\n";
    if (config.bulk_records)
    {
        std::cerr << "  Mode:      bulk, " << config.bulk_records << " records\n";
        std::cerr << "  Output:    " << (config.output.empty() ? r.base_dir.string() : config.output) << "\n";
    }
    else
    {
        std::cerr << "  Mode:      rotating, " << r.file_records << " records/file\n";
        std::cerr << "  Base dir:  " << r.base_dir.string() << "\n";
    }
    std::cerr << "  Chunk:     " << r.chunk_bytes << " bytes\n";
    std::cerr << "  Lock:      " << r.lock_path.string() << "\n\n";
}

void print_summary(StopReason reason, const RotationController& controller)
{
    const auto& stats = controller.stats();
    auto latest = controller.latest();

    std::cerr << "\nSummary (" << to_string(reason) << "):\n";
    std::cerr << "  ENC:      " << stats.encoder_records << " records\n";
    std::cerr << "  IRIG:     " << stats.irig_records << " records\n";
    std::cerr << "  Unknown:  " << stats.unknown_records << " records\n";
    std::cerr << "  Files:    " << stats.files_opened << "\n";
    std::cerr << "  Bytes:    " << stats.bytes_written << "\n";
    std::cerr << "  Latest:   ts=" << latest.timestamp
              << " state=0x" << std::hex << std::setw(8) << std::setfill('0') << latest.state
              << std::dec << std::setfill(' ') << std::endl;
}

int capture_bulk(const Config& config, TcpClient& client)
{
    const auto& r = config.reader;

    std::filesystem::path path = config.output.empty()
        ? make_dated_path(r.base_dir, std::chrono::system_clock::now())
        : std::filesystem::path(config.output);

    auto result = bulk_capture(client, path, config.bulk_records, r.chunk_bytes, running);

    if (!config.quiet)
    {
        std::cerr << "Wrote " << result.bytes / record_bytes << " of " << config.bulk_records
                  << " records to " << path.string() << " (" << to_string(result.reason) << ")" << std::endl;
    }

    return result.reason == StopReason::COMPLETE ? EXIT_SUCCESS : EXIT_FAILURE;
}

int capture_rotating(const Config& config, TcpClient& client)
{
    const auto& r = config.reader;
    RotationController controller(r);

    auto last_status = std::chrono::steady_clock::now();
    auto status = [&](const RotationController& c)
    {
        auto now = std::chrono::steady_clock::now();
        if (now - last_status < std::chrono::seconds(1)) return;
        last_status = now;
        auto latest = c.latest();
        std::cerr << "ts=" << latest.timestamp << " state=0x" << std::hex << latest.state << std::dec << "\r";
    };

    chunk_callback_t on_chunk;
    if (r.verbose) on_chunk = status;

    auto reason = run_rotating(client, controller, r.chunk_bytes, running, on_chunk);

    if (!config.quiet) print_summary(reason, controller);

    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    std::optional<Config> config;

    try
    {
        config = Config::parse(argc, argv);
    }
    catch (const std::exception& e)
    {
        std::cerr << e.what() << '\n';
        return EXIT_FAILURE;
    }

    if (!config) return EXIT_SUCCESS;

    install_signal_handlers();

    try
    {
        config->reader.validate();
        check_directory(config->reader.base_dir);

        if (!config->quiet) print_banner(*config);

        LockFile lock(config->reader.lock_path);

        TcpClient client(config->reader.peer_address, config->reader.peer_port, config->reader.verbose);
        client.connect(std::chrono::milliseconds(config->reader.settle_ms));

        return config->bulk_records
            ? capture_bulk(*config, client)
            : capture_rotating(*config, client);
    }
    catch (const Error& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
