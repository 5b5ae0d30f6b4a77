// Copyright 2020 Mobilinkd LLC.
// Copyright 2022-2026 Open Research Institute, Inc.
//
// Tribble encoder
//
// Pipeline: bytes → core digit pairs (base 81) → tribbles → 8-trit frames → carrier → symbols

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
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <cstdlib>

const char VERSION[] = "1.0";

using namespace trcxx;

struct Config
{
    std::string message;
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
            ("message", po::value<std::string>(&result.message),
                "text to encode (default: read STDIN).")
            ("in,i", po::value<std::string>(&result.input_file),
                "read input bytes from file.")
            ("out,o", po::value<std::string>(&result.output_file),
                "write symbols to file instead of STDOUT.")
            ("carrier,c", po::value<std::string>(&result.carrier)->default_value(CarrierPattern::DEFAULT_SPELLING),
                "carrier pattern, in alphabet symbols.")
            ("no-carrier,n", po::bool_switch(&result.no_carrier),
                "do not overlay a carrier.")
            ("per-frame,f", po::bool_switch(&result.per_frame),
                "restart the carrier at every 8-trit frame.")
            ("alphabet,a", po::value<std::string>(&result.alphabet)->default_value("-=+"),
                "symbols for -1, 0 and +1.")
            ("pad", po::value<int>(&result.pad)->default_value(0),
                "tribble pad trit (-1, 0 or 1).")
            ("frame", po::value<int>(&result.frame)->default_value(0),
                "frame boundary trit (-1, 0 or 1).")
            ("led,l", po::bool_switch(&result.led), "render output as LED glyphs")
            ("verify", po::bool_switch(&result.verify), "decode the output and compare")
            ("verbose,v", po::bool_switch(&result.verbose), "verbose output")
            ("debug,d", po::bool_switch(&result.debug), "debug-level output")
            ("quiet,q", po::bool_switch(&result.quiet), "silence all output")
            ;

        po::positional_options_description pos;
        pos.add("message", 1);

        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), vm);

        if (vm.count("help"))
        {
            std::cout << "Encode bytes to a balanced-ternary tribble stream on STDOUT\n"
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

        if (vm.count("message") && vm.count("in"))
        {
            std::cerr << "Give either a message or --in, not both." << std::endl;
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


// =============================================================================
// INPUT / OUTPUT
// =============================================================================

bytes_t read_input()
{
    if (!config->message.empty())
    {
        return bytes_t(config->message.begin(), config->message.end());
    }

    if (!config->input_file.empty())
    {
        std::ifstream in(config->input_file, std::ios::binary);
        if (!in)
        {
            throw std::runtime_error("cannot open " + config->input_file);
        }
        return bytes_t(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    return bytes_t(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

void write_output(const std::string& text)
{
    if (config->output_file.empty())
    {
        std::cout << text << std::endl;
        return;
    }

    std::ofstream out(config->output_file, std::ios::binary);
    if (!out)
    {
        throw std::runtime_error("cannot open " + config->output_file);
    }
    out << text << '\n';
}


// =============================================================================
// DIAGNOSTICS
// =============================================================================

std::string label(uint8_t byte)
{
    if (byte == ' ') return "SPC";
    if (byte >= 0x21 && byte < 0x7F) return std::string(1, static_cast<char>(byte));

    std::ostringstream os;
    os << "0x" << std::hex << std::setw(2) << std::setfill('0') << int(byte);
    return os.str();
}

/**
 * One row per byte: the two digits, the clean frames and the frames as sent.
 */
void dump_frames(const StreamAssembler& assembler, const bytes_t& data, const std::string& wire)
{
    const auto& alphabet = assembler.config().alphabet;
    auto clean = to_string(assembler.encode_trits(data), alphabet);

    std::cerr << std::left << std::setw(6) << "IDX" << std::setw(6) << "BYTE"
        << std::setw(8) << "DIGITS" << std::setw(20) << "DATA" << "SIGNAL" << std::endl;

    for (size_t i = 0; i != data.size(); ++i)
    {
        auto digits = StreamAssembler::split_byte(data[i]);
        auto data_trits = clean.substr(i * trits_per_byte, trits_per_byte);
        auto signal_trits = wire.substr(i * trits_per_byte, trits_per_byte);
        if (config->led)
        {
            data_trits = to_led(data_trits, alphabet);
            signal_trits = to_led(signal_trits, alphabet);
        }

        std::cerr << std::left << std::setw(6) << i << std::setw(6) << label(data[i])
            << std::setw(8) << (std::to_string(digits.first) + "," + std::to_string(digits.second))
            << std::setw(20) << data_trits << signal_trits << std::endl;
    }
    std::cerr << std::right;
}

bool verify(const StreamAssembler& assembler, const bytes_t& data, const std::string& wire)
{
    auto decoded = assembler.decode(wire);
    if (decoded == data)
    {
        if (!config->quiet) std::cerr << "Verified: " << data.size() << " byte(s) round-trip" << std::endl;
        return true;
    }

    std::cerr << "Verify FAILED: decoded " << decoded.size() << " byte(s), expected "
        << data.size() << std::endl;
    return false;
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
        const auto& cfg = assembler.config();

        if (config->verbose || config->debug)
        {
            std::cerr << "Alphabet: " << cfg.alphabet.spelling()
                << "  pad: " << cfg.alphabet.to_symbol(cfg.pad)
                << "  frame: " << cfg.alphabet.to_symbol(cfg.frame) << std::endl;
            std::cerr << "Carrier: "
                << (cfg.carrier ? cfg.carrier->spelling(cfg.alphabet) : std::string("none"));
            if (cfg.carrier)
            {
                std::cerr << (cfg.carrier_mode == CarrierMode::PerFrame ? " (per frame)" : " (continuous)");
            }
            std::cerr << std::endl;
        }

        auto data = read_input();
        auto wire = assembler.encode(data);

        if (config->debug)
        {
            std::cerr << "Input: " << data.size() << " byte(s) → " << wire.size() << " trits" << std::endl;
        }
        if (config->verbose || config->debug)
        {
            dump_frames(assembler, data, wire);
        }

        write_output(config->led ? to_led(wire, cfg.alphabet) : wire);

        if (config->verify && !verify(assembler, data, wire))
        {
            return EXIT_FAILURE;
        }
    }
    catch (const CodecError& ex)
    {
        std::cerr << "trc-mod: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception& ex)
    {
        std::cerr << "trc-mod: I/O error: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
