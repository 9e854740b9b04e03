// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "printing.hpp"
#include "srcmap.hpp"
#include "utils/debug.hpp"

// Avoid affecting other headers by macros.
#include <CLI/CLI.hpp>

using std::string;
using std::vector;

using namespace srcmap;

// Distinguishes file-system failures (exit 64) from codec failures (exit 1).
struct IoError : std::runtime_error {
    explicit IoError(const string& what) : std::runtime_error(what) {}
};

static string read_file(const string& path) {
    std::ifstream in{path, std::ios::binary};
    if (!in) {
        throw IoError("cannot open " + path);
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

static void write_output(const string& path, const string& text) {
    if (path.empty() || path == "-") {
        std::cout << text << "\n";
        return;
    }
    std::ofstream out{path, std::ios::binary};
    if (!out) {
        throw IoError("cannot write " + path);
    }
    out << text << "\n";
}

int main(int argc, char** argv) {
    srcmap_options_t options;

    SrcmapEnableWarningMsg(false);

    // Parse command line arguments:

    CLI::App app{"srcmap reads, writes and composes source map v3 files."};
    app.require_subcommand(1);

    std::vector<string> log_tags;
    app.add_option("--log", log_tags, "Enable debug logging for TAGS (decode, encode, merge)")
        ->type_name("TAGS")
        ->delimiter(',')
        ->group("Verbosity");
    bool warnings = false;
    app.add_flag("-w", warnings, "Print warnings")->group("Verbosity");
    app.add_flag("--print-index", options.verbosity_opts.print_index, "Print the resulting index to stderr")
        ->group("Verbosity");

    app.add_flag("--allow-unmapped", options.decode_opts.allow_unmapped_segments,
                 "Skip segments holding only a generated column")
        ->group("Features");
    app.add_flag("--sort,!--no-sort", options.encode_opts.sort_segments,
                 "Sort the segments of each generated line by column. Default: sort")
        ->group("Features");

    CLI::App* decode_cmd = app.add_subcommand("decode", "Decode a source map and print its positions");
    string decode_path;
    decode_cmd->add_option("map", decode_path, "Source map to decode")->required()->check(CLI::ExistingFile);

    CLI::App* encode_cmd = app.add_subcommand("encode", "Decode a source map and write it back in canonical form");
    string encode_path;
    encode_cmd->add_option("map", encode_path, "Source map to re-encode")->required()->check(CLI::ExistingFile);
    string encode_output;
    encode_cmd->add_option("-o,--output", encode_output, "Write the result to FILE")->type_name("FILE");
    std::optional<string> encode_file;
    encode_cmd->add_option("--file", encode_file, "Generated file name")->type_name("NAME");
    std::optional<int> line_count;
    encode_cmd->add_option("--line-count", line_count, "Total number of generated lines")
        ->type_name("N")
        ->check(CLI::NonNegativeNumber);
    bool basename = false;
    auto* basename_opt = encode_cmd->add_flag("--basename", basename, "Keep only the file name of each source");
    string output_dir;
    auto* output_dir_opt = encode_cmd->add_option("--output-dir", output_dir, "Prefix sources with DIR")
                               ->type_name("DIR")
                               ->excludes(basename_opt);
    std::optional<string> source_map_path;
    encode_cmd->add_option("--source-map-path", source_map_path, "Prefix sources with PATH instead of DIR")
        ->type_name("PATH")
        ->needs(output_dir_opt);

    CLI::App* merge_cmd = app.add_subcommand("merge", "Compose two successive source maps");
    string first_path;
    merge_cmd->add_option("first", first_path, "Map from original sources to the intermediate file")
        ->required()
        ->check(CLI::ExistingFile);
    string second_path;
    merge_cmd->add_option("second", second_path, "Map from the intermediate file to the final file")
        ->required()
        ->check(CLI::ExistingFile);
    string merge_output;
    merge_cmd->add_option("-o,--output", merge_output, "Write the result to FILE")->type_name("FILE");
    std::optional<string> merge_file;
    merge_cmd->add_option("--file", merge_file, "Generated file name")->type_name("NAME");
    merge_cmd->add_flag("--print-dropped", options.verbosity_opts.print_dropped,
                        "List original positions with no counterpart in the second map");

    CLI11_PARSE(app, argc, argv);

    for (const string& tag : log_tags) {
        SrcmapEnableLog(tag);
    }
    SrcmapEnableWarningMsg(warnings);

    // Main program

    try {
        if (*decode_cmd) {
            const SourceMapDocument doc = parse_document(read_file(decode_path));
            std::cout << decode(doc, options.decode_opts);
            return 0;
        }

        if (*encode_cmd) {
            const SourceMapDocument doc = parse_document(read_file(encode_path));
            const PositionIndex index = decode(doc, options.decode_opts);
            if (options.verbosity_opts.print_index) {
                std::cerr << index;
            }
            encode_options_t& encode_opts = options.encode_opts;
            encode_opts.file = encode_file.value_or(doc.file);
            encode_opts.source_root = doc.source_root;
            encode_opts.line_count = line_count ? line_count : doc.line_count;
            if (basename) {
                encode_opts.relativize_path = basename_relativizer();
            } else if (*output_dir_opt) {
                RelativizeContext context{.output_dir = output_dir, .source_map_path = source_map_path, .relpaths = {}};
                for (const string& source : doc.sources) {
                    context.relpaths.emplace(source, source);
                }
                encode_opts.relativize_path = make_relativizer(std::move(context));
            }
            write_output(encode_output, dump(encode(index, encode_opts)));
            return 0;
        }

        if (*merge_cmd) {
            const SourceMapDocument first_doc = parse_document(read_file(first_path));
            const SourceMapDocument second_doc = parse_document(read_file(second_path));
            const PositionIndex first = decode(first_doc, options.decode_opts);
            const PositionIndex second = decode(second_doc, options.decode_opts);

            vector<DroppedPosition> dropped;
            const PositionIndex merged =
                merge(first, second, options.verbosity_opts.print_dropped ? &dropped : nullptr);
            if (options.verbosity_opts.print_index) {
                std::cerr << merged;
            }
            for (const DroppedPosition& position : dropped) {
                std::cerr << "dropped " << position << "\n";
            }

            encode_options_t& encode_opts = options.encode_opts;
            encode_opts.file = merge_file.value_or(second_doc.file);
            encode_opts.source_root = first_doc.source_root;
            encode_opts.line_count = second_doc.line_count;
            write_output(merge_output, dump(encode(merged, encode_opts)));
            return 0;
        }
    } catch (const IoError& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 64;
    } catch (const SourceMapError& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
    return 64;
}
