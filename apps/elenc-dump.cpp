// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Print the header and records of an elevation encoder capture file.

#include "elenccxx/FileHeader.h"
#include "elenccxx/Numerology.h"
#include "elenccxx/RecordCodec.h"

#include <boost/program_options.hpp>

#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

const char VERSION[] = "1.0";

using namespace elenc;

struct Config
{
    std::string input;
    bool records = false;
    uint64_t limit = 0;

    static std::optional<Config> parse(int argc, char* argv[])
    {
        namespace po = boost::program_options;

        Config result;

        po::options_description desc("Program options");
        desc.add_options()
            ("help,h", "Print this help message and exit.")
            ("version,V", "Print the application version and exit.")
            ("input", po::value<std::string>(&result.input)->required(), "capture file (.dat)")
            ("records,r", po::bool_switch(&result.records), "print every record")
            ("limit,l", po::value<uint64_t>(&result.limit)->default_value(0),
                "stop after this many records (0: no limit)")
            ;

        po::positional_options_description pos;
        pos.add("input", 1);

        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), vm);

        if (vm.count("help"))
        {
            std::cout << "Usage: " << argv[0] << " [options] FILE\n" << desc << std::endl;
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

        return result;
    }
};

void dump_header(const FileHeaderInfo& info)
{
    std::time_t t = info.unix_seconds;
    std::tm utc{};
    gmtime_r(&t, &utc);
    char when[32];
    std::strftime(when, sizeof(when), "%Y-%m-%d %H:%M:%S", &utc);

    std::cout << "Header tag: " << (info.tag == file_header_tag ? "ok" : "BAD") << "\n";
    std::cout << "Version:    " << info.version << "\n";
    std::cout << "Start:      " << when << "." << std::setw(6) << std::setfill('0')
              << info.microseconds << std::setfill(' ') << " UTC\n";
    std::cout << "Text:\n" << info.text << "\n";
}

void dump_record(uint64_t index, const record_t& record)
{
    auto decoded = classify_and_decode(record);
    std::cout << std::setw(10) << index << " " << std::setw(7) << std::left
              << to_string(decoded.kind) << std::right;

    if (decoded.encoder)
    {
        const auto& enc = *decoded.encoder;
        std::cout << " ts=" << enc.timestamp
                  << " day=" << enc.day
                  << " " << std::setfill('0') << std::setw(2) << int(enc.hours)
                  << ":" << std::setw(2) << int(enc.minutes)
                  << ":" << std::setw(2) << int(enc.seconds) << std::setfill(' ');
    }
    else if (decoded.irig)
    {
        std::cout << " ts=" << record_timestamp(record) << " state=" << std::hex << std::setfill('0');
        for (auto b : decoded.irig->state) std::cout << std::setw(2) << int(b);
        std::cout << std::dec << std::setfill(' ');
    }
    else
    {
        std::cout << " " << std::hex << std::setfill('0');
        for (auto b : record) std::cout << std::setw(2) << int(b) << " ";
        std::cout << std::dec << std::setfill(' ');
    }
    std::cout << "\n";
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

    std::ifstream in(config->input, std::ios::binary);
    if (!in)
    {
        std::cerr << "Cannot open " << config->input << std::endl;
        return EXIT_FAILURE;
    }

    file_header_t header;
    if (!in.read(reinterpret_cast<char*>(header.data()), header.size()))
    {
        std::cerr << "File shorter than the " << file_header_bytes << "-byte header" << std::endl;
        return EXIT_FAILURE;
    }
    dump_header(parse_file_header(header));

    uint64_t counts[3] = {};
    uint64_t index = 0;
    record_t record;
    while (in.read(reinterpret_cast<char*>(record.data()), record.size()))
    {
        if (config->limit && index >= config->limit) break;
        counts[static_cast<int>(classify(record))]++;
        if (config->records) dump_record(index, record);
        index++;
    }

    auto trailing = in.gcount();
    if (trailing > 0 && trailing < static_cast<std::streamsize>(record_bytes))
        std::cout << "Trailing partial record: " << trailing << " bytes\n";

    std::cout << "Records:    " << index
              << " (ENC " << counts[static_cast<int>(RecordKind::ENCODER)]
              << ", IRIG " << counts[static_cast<int>(RecordKind::IRIG)]
              << ", unknown " << counts[static_cast<int>(RecordKind::UNKNOWN)] << ")" << std::endl;

    return EXIT_SUCCESS;
}
