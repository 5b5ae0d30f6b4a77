// Copyright 2020 Mobilinkd LLC.
// Copyright 2022-2026 Open Research Institute, Inc.
//
// Tribble decoder
//
// Pipeline: symbols → trits → carrier removal → 8-trit frames → tribbles → core digit pairs → bytes
//
// Reads a symbol stream (canonical symbols, LED glyphs or digit/arrow
// spellings) from the command line, a file or STDIN and writes the decoded
// bytes to STDOUT. Decoding stops at the first bad frame; nothing is
// written in that case.

#include "trcxx/CodecConfig.h"
#include "trcxx/Errors.h"
#include "trcxx/StreamAssembler.h"
#include "trcxx/SymbolDialect.h"

#include <boost/program_options.hpp>

#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>

#include <cstdlib>

const char VERSION[] = "1.0";

using namespace trcxx;

struct Config
{
    std::string stream;
    std::string input_file;
    std::string output_file;
    std::string carrier = CarrierPattern::DEFAULT_SPELLING;
    std::string alphabet = "-=+";
    int pad = 0;
    int frame = 0;
    bool no_carrier = false;
    bool per_frame = false;
    bool led = false;
    bool verify = false;
    bool verbose = false;
    bool debug = false;
    bool quiet = false;

    static std::optional<Config> parse(int argc, char* argv[])
    {
        namespace po = boost::program_options;

        Config result;

        po::options_description desc("Program options");
        desc.add_options()
            ("help,h", "Print this help message and exit.")
            ("version,V", "Print the application version and exit.")
            ("stream", po::value<std::string>(&result.stream),
                "symbol stream to decode (default: read STDIN).")
            ("in,i", po::value<std::string>(&result.input_file),
                "read the symbol stream from file.")
            ("out,o", po::value<std::string>(&result.output_file),
                "write decoded bytes to file instead of STDOUT.")
            ("carrier,c", po::value<std::string>(&result.carrier)->default_value(CarrierPattern::DEFAULT_SPELLING),
                "carrier pattern, in alphabet symbols.")
            ("no-carrier,n", po::bool_switch(&result.no_carrier),
                "stream carries no carrier overlay.")
            ("per-frame,f", po::bool_switch(&result.per_frame),
                "carrier restarts at every 8-trit frame.")
            ("alphabet,a", po::value<std::string>(&result.alphabet)->default_value("-=+"),
                "symbols for -1, 0 and +1.")
            ("pad", po::value<int>(&result.pad)->default_value(0),
                "tribble pad trit (-1, 0 or 1).")
            ("frame", po::value<int>(&result.frame)->default_value(0),
                "frame boundary trit (-1, 0 or 1).")
            ("led,l", po::bool_switch(&result.led), "show frames as LED glyphs (with -v)")
            ("verify", po::bool_switch(&result.verify), "re-encode the result and compare")
            ("verbose,v", po::bool_switch(&result.verbose), "verbose output")
            ("debug,d", po::bool_switch(&result.debug), "debug-level output")
            ("quiet,q", po::bool_switch(&result.quiet), "silence all output")
            ;

        po::positional_options_description pos;
        pos.add("stream", 1);

        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), vm);

        if (vm.count("help"))
        {
            std::cout << "Decode a balanced-ternary tribble stream to bytes on STDOUT\n"
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

        if (result.debug + result.verbose + result.quiet > 1)
        {
            std::cerr << "Only one of quiet, verbose or debug may be chosen." << std::endl;
            return std::nullopt;
        }

        if (vm.count("stream") && vm.count("in"))
        {
            std::cerr << "Give either a stream or --in, not both." << std::endl;
            return std::nullopt;
        }

        return result;
    }

    CodecConfig codec_config() const
    {
        CodecConfig cfg;
        cfg.alphabet = SymbolAlphabet::parse(alphabet);
        cfg.pad = make_trit(pad);
        cfg.frame = make_trit(frame);
        if (!no_carrier) cfg.carrier = CarrierPattern::parse(carrier, cfg.alphabet);
        cfg.carrier_mode = per_frame ? CarrierMode::PerFrame : CarrierMode::Continuous;
        return cfg;
    }
};

std::optional<Config> config;


std::string read_input()
{
    if (!config->stream.empty()) return config->stream;

    if (!config->input_file.empty())
    {
        std::ifstream in(config->input_file, std::ios::binary);
        if (!in)
        {
            throw std::runtime_error("cannot open " + config->input_file);
        }
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

void write_output(const bytes_t& data)
{
    if (config->output_file.empty())
    {
        std::cout.write(reinterpret_cast<const char*>(data.data()), data.size());
        std::cout.flush();
        return;
    }

    std::ofstream out(config->output_file, std::ios::binary);
    if (!out)
    {
        throw std::runtime_error("cannot open " + config->output_file);
    }
    out.write(reinterpret_cast<const char*>(data.data()), data.size());
}

/**
 * Forensic table: every frame as received, after carrier removal, and the
 * core value it carries (or why it was rejected).
 */
void dump_frames(const StreamAssembler& assembler, const std::string& symbols)
{
    const auto& alphabet = assembler.config().alphabet;

    std::cerr << std::left << std::setw(6) << "IDX" << std::setw(8) << "OFFSET"
        << std::setw(12) << "SIGNAL" << std::setw(12) << "CLEAN"
        << std::setw(8) << "STATUS" << "VALUE" << std::endl;

    for (const auto& record : assembler.inspect(symbols))
    {
        auto signal = config->led ? to_led(record.signal, alphabet) : record.signal;
        auto clean = config->led ? to_led(record.clean, alphabet) : record.clean;

        std::cerr << std::setw(6) << record.index << std::setw(8) << record.offset
            << std::setw(12) << signal << std::setw(12) << clean
            << std::setw(8) << status_name(record.status);
        if (record.status == FrameRecord::Status::OK) std::cerr << record.core_value;
        else if (config->debug) std::cerr << record.detail;
        std::cerr << std::endl;
    }
    std::cerr << std::right;
}


int main(int argc, char* argv[])
{
    try
    {
        config = Config::parse(argc, argv);
    }
    catch(const std::exception& e)
    {
        std::cerr << e.what() << '\n';
    }

    if (!config) return 0;

    try
    {
        StreamAssembler assembler(config->codec_config());

        auto raw = read_input();
        auto symbols = normalize_dialect(raw, assembler.config().alphabet);

        if (config->debug)
        {
            std::cerr << "Input: " << raw.size() << " byte(s), " << symbols.size()
                << " symbol(s) after normalization" << std::endl;
            std::cerr << "Stream: " << symbols << std::endl;
        }
        if (config->verbose || config->debug)
        {
            dump_frames(assembler, symbols);
        }

        auto data = assembler.decode(symbols);

        if (config->verify)
        {
            if (assembler.encode(data) != symbols)
            {
                std::cerr << "Verify FAILED: re-encoded stream differs from input" << std::endl;
                return EXIT_FAILURE;
            }
            if (!config->quiet) std::cerr << "Verified: stream re-encodes exactly" << std::endl;
        }

        write_output(data);

        if (config->verbose || config->debug)
        {
            std::cerr << "Decoded " << data.size() << " byte(s) from "
                << symbols.size() / frame_trits << " frame(s)" << std::endl;
        }
    }
    catch (const CodecError& ex)
    {
        std::cerr << "trc-demod: " << ex.what() << std::endl;
        if (ex.has_offset() && !config->quiet)
        {
            std::cerr << "trc-demod: failed in frame " << ex.offset() / frame_trits
                << " (position " << ex.offset() % frame_trits << ")" << std::endl;
        }
        return EXIT_FAILURE;
    }
    catch (const std::exception& ex)
    {
        std::cerr << "trc-demod: I/O error: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
