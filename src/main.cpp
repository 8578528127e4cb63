#include "document.hpp"
#include "reader.hpp"
#include "serializer.hpp"
#include "validator.hpp"
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <argparse.hpp>

namespace mwtab {

// Everything the command line can configure.
struct Options
{
    bool verbose = false;
    bool validate = false;
    std::optional<Format> from_format;
    std::optional<Format> to_format;
};

Format infer_target_format(const std::string& filename) {
    return filename.ends_with(".json") ? Format::JSON : Format::MWTAB;
}

Document load(const std::string& filename, const Options& options) {
    std::string text = read_file(filename);
    return read(filename, text, options.from_format);
}

void print_report(const Document& doc) {
    Report report = validate(doc);
    std::cout << format_report(doc, report);
}

void convert(const std::string& from, const std::string& to, const Options& options) {
    Format target = options.to_format.value_or(infer_target_format(to));
    if (options.verbose) {
        std::cout << "Converting " << from << " -> " << to << " (" << to_string(target) << ")\n";
    }

    Document doc = load(from, options);
    if (options.validate) print_report(doc);

    std::ofstream outfile(to, std::ios::binary);
    if (!outfile.is_open()) {
        throw std::runtime_error("Could not open file: " + to);
    }
    outfile << serialize(doc, target);
    if (options.verbose) std::cout << "Conversion successful! Output written to " << to << "\n";
}

void validate_file(const std::string& from, const Options& options) {
    if (options.verbose) std::cout << "Validating " << from << "\n";
    print_report(load(from, options));
}

} // namespace mwtab

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("mwtab", std::string(mwtab::engine_version()), argparse::default_arguments::all);

    argparse::ArgumentParser convert_command("convert");
    convert_command.add_description("Convert between the mwTab text form and JSON");
    convert_command.add_argument("from").help("The file to read").required();
    convert_command.add_argument("to").help("The file to write").required();
    convert_command.add_argument("--from-format")
        .help("Input format, mwtab or json (default: detected from content)")
        .default_value(std::string(""));
    convert_command.add_argument("--to-format")
        .help("Output format, mwtab or json (default: json for a .json destination, otherwise mwtab)")
        .default_value(std::string(""));
    convert_command.add_argument("--validate")
        .help("Print a validation report for the input")
        .default_value(false)
        .implicit_value(true);
    convert_command.add_argument("--verbose")
        .help("Report progress on stdout")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser validate_command("validate");
    validate_command.add_description("Print a validation report for one file");
    validate_command.add_argument("from").help("The file to validate").required();
    validate_command.add_argument("--from-format")
        .help("Input format, mwtab or json (default: detected from content)")
        .default_value(std::string(""));
    validate_command.add_argument("--verbose")
        .help("Report progress on stdout")
        .default_value(false)
        .implicit_value(true);

    program.add_subparser(convert_command);
    program.add_subparser(validate_command);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    try {
        mwtab::Options options;
        if (program.is_subcommand_used(convert_command)) {
            options.verbose = convert_command.get<bool>("--verbose");
            options.validate = convert_command.get<bool>("--validate");
            if (auto from = convert_command.get<std::string>("--from-format"); !from.empty())
                options.from_format = mwtab::parse_format(from);
            if (auto to = convert_command.get<std::string>("--to-format"); !to.empty())
                options.to_format = mwtab::parse_format(to);

            mwtab::convert(convert_command.get<std::string>("from"), convert_command.get<std::string>("to"), options);
        } else if (program.is_subcommand_used(validate_command)) {
            options.verbose = validate_command.get<bool>("--verbose");
            if (auto from = validate_command.get<std::string>("--from-format"); !from.empty())
                options.from_format = mwtab::parse_format(from);

            mwtab::validate_file(validate_command.get<std::string>("from"), options);
        } else {
            std::cerr << program;
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
