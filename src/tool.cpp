#include <filesystem>
#include <iostream>
#include <iterator>

#include <boost/program_options.hpp>

#include <jsonease/api.hpp>
#include <jsonease/config.hpp>
#include <jsonease/core/logging.hpp>
#include <jsonease/fs/file_io.hpp>

using namespace jsonease;

namespace po = boost::program_options;

static void
show_version_info()
{
    std::cout << "jsonease " << JSONEASE_VERSION << "\n";
}

// Read the configuration file named on the command line, or jsonease.json in
// the working directory if there is one.
static tool_config
read_config(po::variables_map const& vm)
{
    optional<file_path> config_path;
    if (vm.count("config-file"))
        config_path = file_path(vm["config-file"].as<string>());
    else if (std::filesystem::exists("jsonease.json"))
        config_path = file_path("jsonease.json");

    tool_config config;
    if (config_path)
    {
        load_options options;
        options.tier = chain_tier::BASIC;
        from_dynamic(&config, load_file(*config_path, options));
    }
    return config;
}

static string
parse_line_ending(string const& name)
{
    if (name == "lf")
        return "\n";
    if (name == "crlf")
        return "\r\n";
    JSONEASE_THROW(
        invalid_enum_string() << enum_id_info("line_ending")
                              << enum_string_info(name));
}

static string
read_input(po::variables_map const& vm)
{
    if (vm.count("input-file"))
        return read_file_contents(file_path(vm["input-file"].as<string>()));
    return string(
        std::istreambuf_iterator<char>(std::cin),
        std::istreambuf_iterator<char>());
}

static string
process(string const& input, tool_config const& config, bool check)
{
    string encoding = config.encoding ? *config.encoding : default_json_encoding;
    chain_tier tier
        = config.tier ? parse_chain_tier(*config.tier) : chain_tier::CUSTOM;

    if (check)
    {
        load_options options;
        options.encoding = encoding;
        options.tier = tier;
        loads(input, options);
        return string();
    }

    string output;
    if (config.format && *config.format)
    {
        formatter_config formatting;
        if (config.indent)
            formatting.indent = *config.indent;
        if (config.align)
            formatting.align = *config.align;
        if (config.line_ending)
        {
            formatting.line_ending = parse_line_ending(*config.line_ending);
            formatting.item_separator = "," + formatting.line_ending;
        }
        output = jsonease::format(
            to_utf8(input, parse_text_encoding(encoding)), formatting);
    }
    else
    {
        load_options loading;
        loading.encoding = encoding;
        loading.tier = tier;
        dump_options dumping;
        dumping.encoding = encoding;
        dumping.tier = tier;
        output = dumps(loads(input, loading), dumping);
    }
    return from_utf8(output, parse_text_encoding(encoding));
}

int
main(int argc, char const* const* argv)
{
    po::options_description desc("Supported options");
    desc.add_options()
        ("help", "show help message")
        ("version", "show version information")
        ("config-file", po::value<string>(), "specify the configuration file to use")
        ("input-file", po::value<string>(), "the JSON file to read (defaults to stdin)")
        ("output", po::value<string>(), "write the result to this file instead of stdout")
        ("tier", po::value<string>(), "the chain tier to use (basic, advanced or custom)")
        ("encoding", po::value<string>(), "the encoding of the input and output")
        ("format", "pretty-print the input instead of re-encoding it")
        ("indent", po::value<unsigned>(), "spaces per level when pretty-printing")
        ("align", po::value<unsigned>(), "spaces before the top-level value when pretty-printing")
        ("line-ending", po::value<string>(), "line ending when pretty-printing (lf or crlf)")
        ("check", "only check that the input is valid")
        ("verbose", "log debugging information")
    ;

    po::positional_options_description positional;
    positional.add("input-file", 1);

    po::variables_map vm;
    try
    {
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)
                .positional(positional)
                .run(),
            vm);
        po::notify(vm);
    }
    catch (po::error& e)
    {
        std::cerr << e.what() << "\n" << desc;
        return 2;
    }

    if (vm.count("help"))
    {
        show_version_info();
        std::cout << desc;
        return 0;
    }

    if (vm.count("version"))
    {
        show_version_info();
        return 0;
    }

    auto logger = get_logger();
    if (vm.count("verbose"))
        logger->set_level(spdlog::level::debug);

    try
    {
        tool_config config = read_config(vm);
        if (vm.count("tier"))
            config.tier = vm["tier"].as<string>();
        if (vm.count("encoding"))
            config.encoding = vm["encoding"].as<string>();
        if (vm.count("format"))
            config.format = true;
        if (vm.count("indent"))
            config.indent = vm["indent"].as<unsigned>();
        if (vm.count("align"))
            config.align = vm["align"].as<unsigned>();
        if (vm.count("line-ending"))
            config.line_ending = vm["line-ending"].as<string>();
        JSONEASE_LOG_CALL(<< JSONEASE_LOG_ARG(config))

        bool check = vm.count("check") != 0;
        string output = process(read_input(vm), config, check);
        if (check)
        {
            logger->info("input is valid");
            return 0;
        }

        if (vm.count("output"))
            dump_string_to_file(file_path(vm["output"].as<string>()), output);
        else
            std::cout << output << "\n";
    }
    catch (std::exception& e)
    {
        logger->error("{}", e.what());
        return 1;
    }
    return 0;
}
