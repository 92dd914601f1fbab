// gangpack.cpp
// MIT License (c) 2026 Pedro

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <fcntl.h>
#include <io.h>
#include <stdio.h>
#ifndef _O_BINARY
#define _O_BINARY 0x8000
#endif
#ifndef _fileno
#define _fileno fileno
#endif
#ifndef _setmode
#define _setmode setmode
#endif
#endif
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/bundle.h"
#include "core/cli_parse.h"
#include "core/errors.h"
#include "core/layout_parser.h"
#include "core/pdf_writer.h"
#include "core/render.h"

using namespace gang::core;

namespace {

constexpr int k_exit_invalid_input = 1;
constexpr int k_exit_internal_error = 2;

enum class OutputFormat { Pdf, Png };
enum class ArchiveMode { Auto, None, Zip, Tar };

int report_error(const Error& error) {
    std::cerr << "Error: " << error.message << "\n";
    if (is_internal_error(error.code)) {
        std::cerr << "Internal failure (" << error_code_name(error.code) << "); please report it\n";
        return k_exit_internal_error;
    }
    return k_exit_invalid_input;
}

void print_usage() {
    std::cout << "Usage: gangpack [OPTIONS]\n"
              << "\n"
              << "Read a layout produced by ganglayout and write the printable sheets.\n"
              << "\n"
              << "Options:\n"
              << "  --input PATH          Layout file (default: stdin); relative design\n"
              << "                        paths resolve against its directory\n"
              << "  --output PATH         Output file (default: stdout)\n"
              << "  --format FORMAT       pdf or png (default: pdf)\n"
              << "  --archive MODE        auto, none, zip or tar (default: auto)\n"
              << "  --preview-dpi N       Resolution of PNG previews (default: 50)\n"
              << "  --frame-lines         Outline every tile in PNG previews\n"
              << "  --threads N           Worker threads (default: hardware concurrency)\n"
              << "  --verbose             Report progress on stderr\n"
              << "  --help, -h            Show this help message\n";
}

bool parse_archive_mode(const std::string& value, ArchiveMode& out) {
    const std::string lowered = to_lower_copy(trim_copy(value));
    if (lowered == "auto") {
        out = ArchiveMode::Auto;
        return true;
    }
    if (lowered == "none") {
        out = ArchiveMode::None;
        return true;
    }
    ArchiveFormat format = ArchiveFormat::Zip;
    if (!parse_archive_format(lowered, format)) {
        return false;
    }
    out = format == ArchiveFormat::Zip ? ArchiveMode::Zip : ArchiveMode::Tar;
    return true;
}

bool write_output(const std::string& output_path, const char* data, size_t size, Error& error) {
    if (output_path.empty()) {
#ifdef _WIN32
        if (_setmode(_fileno(stdout), _O_BINARY) == -1) {
            return fail(error, ErrorCode::Io, "Failed to set stdout to binary mode");
        }
#endif
        std::cout.write(data, static_cast<std::streamsize>(size));
        std::cout.flush();
        if (!std::cout) {
            return fail(error, ErrorCode::Io, "Failed to write output to stdout");
        }
        return true;
    }
    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return fail(error, ErrorCode::Io, "Failed to open output file: " + output_path);
    }
    out.write(data, static_cast<std::streamsize>(size));
    if (!out) {
        return fail(error, ErrorCode::Io, "Failed to write output file: " + output_path);
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::string input_path;
    std::string output_path;
    OutputFormat format = OutputFormat::Pdf;
    ArchiveMode archive_mode = ArchiveMode::Auto;
    PreviewOptions preview;
    unsigned int thread_limit = 0;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--input" && i + 1 < argc) {
            input_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            std::string value = to_lower_copy(argv[++i]);
            if (value == "pdf") {
                format = OutputFormat::Pdf;
            } else if (value == "png") {
                format = OutputFormat::Png;
            } else {
                std::cerr << "Invalid format: " << value << "\n";
                return k_exit_invalid_input;
            }
        } else if (arg == "--archive" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!parse_archive_mode(value, archive_mode)) {
                std::cerr << "Invalid archive mode: " << value << "\n";
                return k_exit_invalid_input;
            }
        } else if (arg == "--preview-dpi" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!parse_positive_double(value, preview.dpi)) {
                std::cerr << "Invalid preview dpi: " << value << "\n";
                return k_exit_invalid_input;
            }
        } else if (arg == "--frame-lines") {
            preview.frame_lines = true;
        } else if (arg == "--threads" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!parse_positive_uint(value, thread_limit)) {
                std::cerr << "Invalid thread count: " << value << "\n";
                return k_exit_invalid_input;
            }
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            return k_exit_invalid_input;
        }
    }

    LayoutDocument document;
    Error error;
    if (input_path.empty()) {
        if (!parse_layout(std::cin, document, error)) {
            return report_error(error);
        }
    } else {
        std::ifstream in(input_path);
        if (!in) {
            std::cerr << "Error: Failed to open layout file: " << input_path << "\n";
            return k_exit_invalid_input;
        }
        if (!parse_layout(in, document, error)) {
            return report_error(error);
        }
    }
    if (document.sheets.empty()) {
        std::cerr << "Error: Layout contains no sheets\n";
        return k_exit_invalid_input;
    }

    const size_t sheet_count = document.sheets.size();
    bool use_archive = false;
    if (archive_mode == ArchiveMode::Zip || archive_mode == ArchiveMode::Tar) {
        use_archive = true;
    } else if (format == OutputFormat::Png && sheet_count > 1) {
        if (archive_mode == ArchiveMode::None) {
            std::cerr << "Error: " << sheet_count
                      << " PNG sheets need an archive; use --archive zip or --archive tar\n";
            return k_exit_invalid_input;
        }
        use_archive = true;
    }
    const ArchiveFormat archive_format = archive_mode == ArchiveMode::Tar ? ArchiveFormat::Tar : ArchiveFormat::Zip;

    // Relative design paths are relative to the layout file.
    const std::filesystem::path base_dir =
        input_path.empty() ? std::filesystem::path() : std::filesystem::path(input_path).parent_path();
    std::vector<DesignSource> sources;
    if (!load_design_sources(document.designs, base_dir, sources, error)) {
        return report_error(error);
    }

    PdfOptions pdf_options;

    if (format == OutputFormat::Pdf && !use_archive) {
        std::vector<const Sheet*> pages;
        pages.reserve(sheet_count);
        for (const SheetReport& report : document.sheets) {
            pages.push_back(&report.sheet);
        }
        std::string pdf;
        if (!write_pdf_document(pages, document.designs, sources, pdf_options, pdf, error)) {
            return report_error(error);
        }
        if (verbose) {
            std::cerr << "Wrote " << sheet_count << " page(s), " << pdf.size() << " bytes\n";
        }
        if (!write_output(output_path, pdf.data(), pdf.size(), error)) {
            return report_error(error);
        }
        return 0;
    }

    const std::vector<std::string> names =
        sheet_file_names(document.sheets, format == OutputFormat::Pdf ? "pdf" : "png");
    std::vector<ArchiveEntry> entries(sheet_count);

    auto render_sheet = [&](size_t idx, Error& sheet_error) {
        const Sheet& sheet = document.sheets[idx].sheet;
        ArchiveEntry& entry = entries[idx];
        entry.name = names[idx];
        if (format == OutputFormat::Pdf) {
            std::vector<const Sheet*> pages = {&sheet};
            return write_pdf_document(pages, document.designs, sources, pdf_options, entry.data, sheet_error);
        }
        return render_sheet_png(sheet, document.designs, sources, preview, entry.data, sheet_error);
    };

    unsigned int worker_count = thread_limit > 0 ? thread_limit : std::thread::hardware_concurrency();
    if (worker_count == 0) {
        worker_count = 1;
    }
    worker_count = std::min<unsigned int>(worker_count, static_cast<unsigned int>(sheet_count));

    if (worker_count <= 1) {
        for (size_t idx = 0; idx < sheet_count; ++idx) {
            if (!render_sheet(idx, error)) {
                return report_error(error);
            }
        }
    } else {
        std::atomic<size_t> next_index{0};
        std::atomic<bool> failed{false};
        std::mutex error_mutex;
        Error first_error;
        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (unsigned int i = 0; i < worker_count; ++i) {
            workers.emplace_back([&]() {
                while (!failed.load(std::memory_order_relaxed)) {
                    size_t idx = next_index.fetch_add(1, std::memory_order_relaxed);
                    if (idx >= sheet_count) {
                        break;
                    }
                    Error sheet_error;
                    if (!render_sheet(idx, sheet_error)) {
                        {
                            std::scoped_lock lock(error_mutex);
                            if (first_error.code == ErrorCode::None) {
                                first_error = std::move(sheet_error);
                            }
                        }
                        failed.store(true, std::memory_order_relaxed);
                        break;
                    }
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
        if (failed.load(std::memory_order_relaxed)) {
            if (first_error.code == ErrorCode::None) {
                first_error = Error{ErrorCode::Render, "Failed to render sheet"};
            }
            return report_error(first_error);
        }
    }

    if (verbose) {
        for (const ArchiveEntry& entry : entries) {
            std::cerr << "Rendered " << entry.name << " (" << entry.data.size() << " bytes)\n";
        }
    }

    if (!use_archive) {
        const std::string& data = entries.front().data;
        if (!write_output(output_path, data.data(), data.size(), error)) {
            return report_error(error);
        }
        return 0;
    }

    std::vector<char> archive_bytes;
    if (!write_archive(entries, archive_format, archive_bytes, error)) {
        return report_error(error);
    }
    if (verbose) {
        std::cerr << "Bundled " << entries.size() << " file(s) into " << archive_extension(archive_format)
                  << " archive, " << archive_bytes.size() << " bytes\n";
    }
    if (!write_output(output_path, archive_bytes.data(), archive_bytes.size(), error)) {
        return report_error(error);
    }
    return 0;
}
