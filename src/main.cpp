#include "xlstext/XlsText.hpp"
#include "xlstext/utils/ModuleLoggers.hpp"

#include <unistd.h>

#include <cstdio>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace xlstext;

namespace {

enum class Mode { Text, CSV, Cells, Sniff };

int printUsage()
{
    printf("Usage: xls2txt [-h] [-t|-c|-l|-m] [-n bytes] [-s sheet] [-e encoding] [-o file] [-v] [-L logfile] <file.xls>\n");
    printf("\t-h:          Shows this help message\n");
    printf("\t-t:          Extracts the text of all sheets (default)\n");
    printf("\t-c:          Exports one sheet as CSV\n");
    printf("\t-l:          Lists the non-empty cells, one per line\n");
    printf("\t-m:          Only checks the file signature\n");
    printf("\t-n bytes:    Maximum number of bytes of text to write\n");
    printf("\t-s sheet:    Sheet index used by -c: default 0\n");
    printf("\t-e encoding: Output charset: default UTF-8\n");
    printf("\t-o file:     Defines the output file: default stdout\n");
    printf("\t-v:          Verbose logging\n");
    printf("\t-L logfile:  Also writes the log to this file\n");
    return 1;
}

int64_t parseBytes(const std::string& value)
{
    try {
        size_t pos = 0;
        const long long n = std::stoll(value, &pos);
        if (pos == value.size()) {
            return static_cast<int64_t>(n);
        }
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    XLSTEXT_THROW_PARAM("Invalid byte count: " + value, "-n");
}

int parseSheetIndex(const std::string& value)
{
    try {
        size_t pos = 0;
        const int n = std::stoi(value, &pos);
        if (pos == value.size()) {
            return n;
        }
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    XLSTEXT_THROW_PARAM("Invalid sheet index: " + value, "-s");
}

void writeAll(core::IOutputSink& sink, const std::string& data)
{
    size_t written = 0;
    core::Error err = sink.write(data.data(), data.size(), written);
    if (err) {
        core::throwError(err);
    }
}

int run(Mode mode, const std::string& input, const char* output, const core::ConvertOptions& options)
{
    if (mode == Mode::Sniff) {
        const bool is_xls = core::isFileXLSPath(input).valueOrThrow();
        std::cout << (is_xls ? "xls" : "not xls") << std::endl;
        return is_xls ? 0 : 2;
    }

    std::unique_ptr<core::IOutputSink> sink;
    std::unique_ptr<core::FileSink> file_sink;
    if (output) {
        file_sink = std::make_unique<core::FileSink>(core::FileSink::create(output).valueOrThrow());
    } else {
        sink = std::make_unique<core::StreamSink>(std::cout);
    }
    core::IOutputSink& out = file_sink ? static_cast<core::IOutputSink&>(*file_sink) : *sink;

    core::SheetConverter converter(options);
    switch (mode) {
        case Mode::Text: {
            core::TextExtractResult result =
                converter.extractTextFromFile(input, out, options.max_bytes).valueOrThrow();
            if (result.error) {
                core::throwError(result.error);
            }
            APP_DEBUG("Wrote {} bytes of text", result.written);
            break;
        }
        case Mode::CSV: {
            std::string csv = converter.extractCSVFromFile(input, options.sheet_index).valueOrThrow();
            writeAll(out, csv);
            if (!csv.empty()) {
                writeAll(out, "\n");
            }
            break;
        }
        case Mode::Cells: {
            const std::vector<std::string> cells = converter.extractCellsFromFile(input).valueOrThrow();
            for (const auto& cell : cells) {
                writeAll(out, cell);
                writeAll(out, "\n");
            }
            APP_DEBUG("Listed {} cells", cells.size());
            break;
        }
        case Mode::Sniff:
            break;
    }

    if (file_sink && !file_sink->flush()) {
        XLSTEXT_THROW_FILE("Failed to flush output", output, core::ErrorCode::FileWriteError);
    }
    std::cout.flush();
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    bool printHelp = false;
    bool verbose = false;
    Mode mode = Mode::Text;
    char const* output = nullptr;
    std::string log_file;
    std::string bytes_arg;
    std::string sheet_arg;
    core::ConvertOptions options;

    int ch;
    while ((ch = getopt(argc, argv, "htclmn:s:e:o:vL:")) != -1) {
        switch (ch) {
        case 't':
            mode = Mode::Text;
            break;
        case 'c':
            mode = Mode::CSV;
            break;
        case 'l':
            mode = Mode::Cells;
            break;
        case 'm':
            mode = Mode::Sniff;
            break;
        case 'n':
            bytes_arg = optarg;
            break;
        case 's':
            sheet_arg = optarg;
            break;
        case 'e':
            options.encoding = optarg;
            break;
        case 'o':
            output = optarg;
            break;
        case 'v':
            verbose = true;
            break;
        case 'L':
            log_file = optarg;
            break;
        default:
        case 'h':
            printHelp = true;
            break;
        }
    }
    if (argc != 1 + optind || printHelp) {
        return printUsage();
    }

    // 日志只写stderr和日志文件，stdout留给正文
    if (!initialize(log_file, true, verbose ? Logger::Level::DEBUG : Logger::Level::WARN)) {
        return 1;
    }

    int status = 1;
    try {
        if (!bytes_arg.empty()) {
            options.max_bytes = parseBytes(bytes_arg);
        }
        if (!sheet_arg.empty()) {
            options.sheet_index = parseSheetIndex(sheet_arg);
        }
        status = run(mode, argv[optind], output, options);
    } catch (const core::XlsTextException& e) {
        APP_DEBUG("{}", e.getDetailedMessage());
        fprintf(stderr, "ERROR: %s\n", e.what());
        status = 1;
    }

    cleanup();
    return status;
}
