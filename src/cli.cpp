#include <iostream>
#include <sstream>

#include <boost/program_options.hpp>

#include <docpatch/diff/diff.h>
#include <docpatch/encodings/bson.h>
#include <docpatch/encodings/json.h>
#include <docpatch/encodings/msgpack.h>
#include <docpatch/fs/file_io.h>
#include <docpatch/utilities/logging.h>

using namespace docpatch;

static string
bytes_to_string(byte_vector const& bytes)
{
    return string(bytes.begin(), bytes.end());
}

static string
format_patch(patch const& p, string const& format)
{
    if (format == "info")
        return patch_info_to_json(p.info()) + "\n";
    if (format == "update")
        return value_to_json(to_dynamic(p), 2) + "\n";
    if (format == "summary")
    {
        std::ostringstream s;
        s << p << "\n";
        return s.str();
    }
    if (format == "msgpack")
        return bytes_to_string(patch_to_msgpack(p));
    if (format == "bson")
        return bytes_to_string(patch_to_bson(p));
    DOCPATCH_THROW(
        invalid_enum_string() << enum_id_info("output format")
                              << enum_string_info(format));
}

int
main(int argc, char const* const* argv)
{
    namespace po = boost::program_options;

    po::options_description desc("Supported options");
    desc.add_options()("help", "show help message")(
        "old", po::value<string>(), "the JSON file with the old document")(
        "new", po::value<string>(), "the JSON file with the new document")(
        "config-file",
        po::value<string>(),
        "a JSON file with the diff configuration")(
        "array-strategy",
        po::value<string>(),
        "how arrays are diffed: replace, smart, append or merge")(
        "zero-values",
        po::value<string>(),
        "how changes to zero values are recorded: unset, set or ignore")(
        "ignore",
        po::value<std::vector<string>>()->composing(),
        "a field to ignore (may be repeated)")(
        "format",
        po::value<string>()->default_value("info"),
        "the output format: info, update, summary, msgpack or bson")(
        "output",
        po::value<string>(),
        "write the output to this file rather than stdout")(
        "verbose", "log the details of the diff");

    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);
    }
    catch (po::error& e)
    {
        std::cerr << e.what() << "\n" << desc;
        return 1;
    }

    if (vm.count("help") || !vm.count("old") || !vm.count("new"))
    {
        std::cout << "usage: docpatch --old <file> --new <file> [options]\n"
                  << desc;
        return vm.count("help") ? 0 : 1;
    }

    initialize_logging(
        vm.count("verbose") ? spdlog::level::debug : spdlog::level::warn);

    try
    {
        diff_config config;
        if (vm.count("config-file"))
        {
            from_dynamic(
                &config,
                parse_json_value(
                    read_file_contents(vm["config-file"].as<string>())));
        }
        // Options on the command line override the config file.
        if (vm.count("array-strategy"))
        {
            config.arrays
                = parse_array_strategy(vm["array-strategy"].as<string>());
        }
        if (vm.count("zero-values"))
        {
            config.zero_values
                = parse_zero_value_handling(vm["zero-values"].as<string>());
        }
        if (vm.count("ignore"))
        {
            for (auto const& field : vm["ignore"].as<std::vector<string>>())
                config.ignore_fields.push_back(field);
        }

        auto old_document
            = parse_json_value(read_file_contents(vm["old"].as<string>()));
        auto new_document
            = parse_json_value(read_file_contents(vm["new"].as<string>()));

        get_logger()->debug(
            "diffing with configuration {}", value_to_json(to_dynamic(config)));

        auto p = compute_patch(old_document, new_document, config);
        auto output = format_patch(p, vm["format"].as<string>());

        if (vm.count("output"))
            dump_string_to_file(vm["output"].as<string>(), output);
        else
            std::cout << output;
    }
    catch (std::exception& e)
    {
        std::cerr << "docpatch: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
